#pragma once

#include <optional>
#include <string>

// Source of the focused-window title. Implementations return within a bounded time;
// std::nullopt means the sample is lost.
class Sampler {
  public:
    virtual ~Sampler() = default;
    virtual std::optional<std::string> CurrentFocusedWindowTitle() = 0;
};
