#include "classifier.hpp"

#include "common.hpp"

#include <regex>
#include <utility>

namespace {
static const char *kQutebrowserSuffix = " - qutebrowser";

static bool Contains(const std::string &haystack, const char *needle) {
    return haystack.find(needle) != std::string::npos;
}

static std::string Trim(const std::string &s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}
} // namespace

// ─────────────────────────────────────
std::vector<std::string> ClassifyWindowTitle(const std::string &title) {
    static const std::regex githubRe(
        R"((?:\[\d{1,2}%\] )?(.*) · (Pull Request|Issue|Discussion) (#\d*) · (.*) - qutebrowser)");
    static const std::regex qutebrowserRe(R"((?:\[\d{1,2}%\] )?(.*) - (qutebrowser))");
    static const std::regex tmuxRe(R"((.*) \(tmux:(.*)/(.*)\))");

    // Work chat, mail and calendar open in the browser
    if (Contains(title, kQutebrowserSuffix)) {
        if (Contains(title, "Rocket.Chat")) {
            return {"Blockstream", "Rocket.Chat"};
        }
        if (Contains(title, "Blockstream Mail")) {
            return {"Blockstream", "Gmail"};
        }
        if (Contains(title, "Blockstream - Calendar")) {
            return {"Blockstream", "Calendar"};
        }
    }

    if (Contains(title, "Notifications - qutebrowser")) {
        return {"Github", "Notifications"};
    }

    std::smatch m;
    if (std::regex_search(title, m, githubRe)) {
        return {"Github", m[4].str(), m[2].str(), m[3].str() + " " + m[1].str()};
    }

    if (std::regex_search(title, m, qutebrowserRe)) {
        return {m[2].str(), m[1].str()};
    }

    if (std::regex_search(title, m, tmuxRe)) {
        return {"tmux", m[2].str(), m[3].str(), m[1].str()};
    }

    return {title};
}

// ─────────────────────────────────────
std::vector<std::string> ActivityPathFor(const std::string &title) {
    const std::string trimmed = Trim(ToValidUtf8(title));
    if (trimmed.empty()) {
        return {};
    }

    std::vector<std::string> path;
    for (const auto &part : ClassifyWindowTitle(trimmed)) {
        std::string p = Trim(part);
        if (!p.empty()) {
            path.push_back(std::move(p));
        }
    }
    return path;
}

// ─────────────────────────────────────
std::string JoinActivityPath(const std::vector<std::string> &path) {
    std::string label;
    for (const auto &p : path) {
        if (!label.empty()) {
            label += " / ";
        }
        label += p;
    }
    return label;
}

// ─────────────────────────────────────
std::string ActivityLabelFor(const std::string &title) {
    return JoinActivityPath(ActivityPathFor(title));
}
