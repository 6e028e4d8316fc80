#pragma once

#include <cstdint>
#include <optional>
#include <string>

struct Rgb {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
};

// Accepts "#RGB" and "#RRGGBB".
std::optional<Rgb> ParseHexColor(const std::string &text);
std::string ToHexColor(const Rgb &c);

// Blend from `from` to `to` by fraction^exponent; a larger exponent keeps the start
// color longer. The fraction is clamped to [0, 1].
Rgb FadeBetween(const Rgb &from, const Rgb &to, double fraction, double exponent = 2.0);
