#pragma once

#include <chrono>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "common.hpp"

// Per-label active time, collected only while a block is running.
//
// Enabling (with a name) and accumulated content are separate pieces of state: Disable()
// stops accumulation but keeps the content, Dump(true) clears the content but keeps the
// log enabled under its name.
class ActivityLog {
  public:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        std::string label;
        Clock::time_point start;
        Clock::duration duration{0};
    };

    // One component of an activity path. `total` includes every descendant.
    struct Node {
        std::string name;
        Clock::duration total{0};
        std::vector<Node> children; // first-seen order
    };

    explicit ActivityLog(Clock::duration nominalInterval = std::chrono::seconds(1));

    void Enable(const std::string &name);
    void Disable();
    bool IsEnabled() const {
        return m_Enabled;
    }
    const std::string &Name() const {
        return m_Name;
    }

    // Returns true when the sample was accounted.
    bool Sample(BlockState state, const std::string &title, Clock::time_point now);

    // Labels in first-seen order.
    std::vector<std::pair<std::string, Clock::duration>> Totals() const;
    const std::vector<Entry> &Entries() const {
        return m_Entries;
    }
    // Unnamed root; its total is the whole logged time.
    const Node &Tree() const {
        return m_Root;
    }

    std::string Dump(bool reset);
    void Clear();

    void SetNominalInterval(Clock::duration interval) {
        m_NominalInterval = interval;
    }

  private:
    void AddToTree(const std::vector<std::string> &path, Clock::duration credit);

  private:
    bool m_Enabled = false;
    std::string m_Name;

    std::vector<std::string> m_Order;
    std::unordered_map<std::string, Clock::duration> m_Totals;
    std::vector<Entry> m_Entries;
    Node m_Root;

    bool m_HasLastSample = false;
    Clock::time_point m_LastSampleAt{};
    Clock::duration m_NominalInterval;
};
