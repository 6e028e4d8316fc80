#pragma once

#include <string>
#include <nlohmann/json.hpp>

// Typed lookups into one JSON object. A missing key quietly yields the fallback, a key of
// the wrong type yields it with a warning; nothing throws.
class JsonReader {
  public:
    JsonReader(const nlohmann::json &object, std::string context);

    bool Has(const std::string &key) const;

    int GetInt(const std::string &key, int fallback) const;
    double GetDouble(const std::string &key, double fallback) const;
    std::string GetString(const std::string &key, const std::string &fallback) const;

    // Logs "<context>: <message>" at warning level.
    void Warn(const std::string &message) const;

  private:
    const nlohmann::json *Find(const std::string &key) const;

  private:
    const nlohmann::json &m_Object;
    std::string m_Context;
};
