#pragma once

#include <string>
#include <vector>

// Maps a focused-window title to an activity path, outermost component first
// (e.g. {"Github", "owner/repo", "Issue", "#12 Title"}). The rules are fixed.
std::vector<std::string> ClassifyWindowTitle(const std::string &title);

// Classified path of a raw title, made valid UTF-8, with blank components dropped.
// Empty when the title is blank.
std::vector<std::string> ActivityPathFor(const std::string &title);

// ActivityPathFor joined with " / ".
std::string ActivityLabelFor(const std::string &title);
std::string JoinActivityPath(const std::vector<std::string> &path);
