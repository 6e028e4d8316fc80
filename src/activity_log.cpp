#include "activity_log.hpp"

#include "classifier.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <ctime>

namespace {
static double Seconds(ActivityLog::Clock::duration d) {
    return std::chrono::duration<double>(d).count();
}

static std::string WallClockTime(ActivityLog::Clock::time_point steady_tp) {
    auto now_steady = std::chrono::steady_clock::now();
    auto now_system = std::chrono::system_clock::now();
    auto system_tp = now_system + std::chrono::duration_cast<std::chrono::system_clock::duration>(
                                      steady_tp - now_steady);

    const std::time_t t = std::chrono::system_clock::to_time_t(system_tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[16];
    if (std::strftime(buf, sizeof(buf), "%T", &tm) == 0) {
        return "--:--:--";
    }
    return buf;
}

static void RenderNode(const ActivityLog::Node &node, size_t indent, double total_s,
                       std::string &out) {
    const double focus_s = Seconds(node.total);
    const double pcnt = total_s > 0.0 ? 100.0 * focus_s / total_s : 0.0;
    out += fmt::format("{:{}}- [{:6.2f}% {:8.2f}s] {}\n", "", indent, pcnt, focus_s, node.name);
    for (const auto &child : node.children) {
        RenderNode(child, indent + 4, total_s, out);
    }
}
} // namespace

// ─────────────────────────────────────
ActivityLog::ActivityLog(Clock::duration nominalInterval) : m_NominalInterval(nominalInterval) {}

// ─────────────────────────────────────
void ActivityLog::Enable(const std::string &name) {
    Clear();
    m_Enabled = true;
    m_Name = name;
    spdlog::info("ActivityLog: logging enabled as '{}'", m_Name);
}

// ─────────────────────────────────────
void ActivityLog::Disable() {
    m_Enabled = false;
    m_HasLastSample = false;
    spdlog::info("ActivityLog: logging disabled");
}

// ─────────────────────────────────────
void ActivityLog::Clear() {
    m_Order.clear();
    m_Totals.clear();
    m_Entries.clear();
    m_Root = Node{};
    m_HasLastSample = false;
}

// ─────────────────────────────────────
bool ActivityLog::Sample(BlockState state, const std::string &title, Clock::time_point now) {
    if (!m_Enabled || state != RUNNING) {
        m_HasLastSample = false;
        return false;
    }

    const std::vector<std::string> path = ActivityPathFor(title);
    const std::string label = JoinActivityPath(path);
    if (label.empty()) {
        spdlog::debug("ActivityLog: dropping sample with empty title");
        return false;
    }

    Clock::duration credit = m_HasLastSample ? now - m_LastSampleAt : m_NominalInterval;
    if (credit < Clock::duration(0)) {
        credit = Clock::duration(0);
    }
    m_HasLastSample = true;
    m_LastSampleAt = now;

    auto it = m_Totals.find(label);
    if (it == m_Totals.end()) {
        m_Order.push_back(label);
        m_Totals.emplace(label, credit);
    } else {
        it->second += credit;
    }
    AddToTree(path, credit);

    if (!m_Entries.empty() && m_Entries.back().label == label) {
        m_Entries.back().duration += credit;
    } else {
        m_Entries.push_back(Entry{label, now - credit, credit});
    }

    spdlog::debug("ActivityLog: {:.2f}s -> '{}'", Seconds(credit), label);
    return true;
}

// ─────────────────────────────────────
void ActivityLog::AddToTree(const std::vector<std::string> &path, Clock::duration credit) {
    Node *node = &m_Root;
    node->total += credit;
    for (const auto &part : path) {
        auto &children = node->children;
        auto it = std::find_if(children.begin(), children.end(),
                               [&part](const Node &n) { return n.name == part; });
        if (it == children.end()) {
            children.push_back(Node{part, Clock::duration(0), {}});
            node = &children.back();
        } else {
            node = &*it;
        }
        node->total += credit;
    }
}

// ─────────────────────────────────────
std::vector<std::pair<std::string, ActivityLog::Clock::duration>> ActivityLog::Totals() const {
    std::vector<std::pair<std::string, Clock::duration>> out;
    out.reserve(m_Order.size());
    for (const auto &label : m_Order) {
        out.emplace_back(label, m_Totals.at(label));
    }
    return out;
}

// ─────────────────────────────────────
std::string ActivityLog::Dump(bool reset) {
    const double total_s = Seconds(m_Root.total);

    std::string out = fmt::format("task log '{}' ({})\n", m_Name, m_Enabled ? "enabled" : "disabled");
    for (const auto &child : m_Root.children) {
        RenderNode(child, 0, total_s, out);
    }

    if (!m_Entries.empty()) {
        out += "timeline:\n";
        for (const auto &e : m_Entries) {
            out += fmt::format("  {} {:8.2f}s {}\n", WallClockTime(e.start), Seconds(e.duration),
                               e.label);
        }
    }

    if (reset) {
        Clear();
        spdlog::info("ActivityLog: content reset");
    }
    return out;
}
