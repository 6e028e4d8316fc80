#include "json.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <limits>
#include <utility>

// ─────────────────────────────────────
JsonReader::JsonReader(const nlohmann::json &object, std::string context)
    : m_Object(object), m_Context(std::move(context)) {}

// ─────────────────────────────────────
const nlohmann::json *JsonReader::Find(const std::string &key) const {
    if (!m_Object.is_object()) {
        return nullptr;
    }
    const auto it = m_Object.find(key);
    if (it == m_Object.end()) {
        spdlog::debug("{}: '{}' not set, using default", m_Context, key);
        return nullptr;
    }
    return &*it;
}

// ─────────────────────────────────────
bool JsonReader::Has(const std::string &key) const {
    return m_Object.is_object() && m_Object.contains(key);
}

// ─────────────────────────────────────
void JsonReader::Warn(const std::string &message) const {
    spdlog::warn("{}: {}", m_Context, message);
}

// ─────────────────────────────────────
int JsonReader::GetInt(const std::string &key, int fallback) const {
    const nlohmann::json *v = Find(key);
    if (v == nullptr) {
        return fallback;
    }
    if (v->is_number_integer()) {
        const auto n = v->get<long long>();
        if (n >= std::numeric_limits<int>::min() && n <= std::numeric_limits<int>::max()) {
            return static_cast<int>(n);
        }
    } else if (v->is_number()) {
        const double d = v->get<double>();
        if (std::isfinite(d) && std::abs(d) <= std::numeric_limits<int>::max()) {
            spdlog::debug("{}: '{}' truncated from {} to {}", m_Context, key, d,
                          static_cast<int>(d));
            return static_cast<int>(d);
        }
    }
    Warn(fmt::format("'{}' is not an integer ({}), using default {}", key, v->dump(), fallback));
    return fallback;
}

// ─────────────────────────────────────
double JsonReader::GetDouble(const std::string &key, double fallback) const {
    const nlohmann::json *v = Find(key);
    if (v == nullptr) {
        return fallback;
    }
    if (v->is_number()) {
        return v->get<double>();
    }
    Warn(fmt::format("'{}' is not a number ({}), using default {}", key, v->dump(), fallback));
    return fallback;
}

// ─────────────────────────────────────
std::string JsonReader::GetString(const std::string &key, const std::string &fallback) const {
    const nlohmann::json *v = Find(key);
    if (v == nullptr) {
        return fallback;
    }
    if (v->is_string()) {
        return v->get<std::string>();
    }
    Warn(fmt::format("'{}' is not a string ({}), using default '{}'", key, v->dump(), fallback));
    return fallback;
}
