#include "color.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

namespace {
static int HexDigit(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    return -1;
}

static std::uint8_t Blend(std::uint8_t a, std::uint8_t b, double lam) {
    const double v = static_cast<double>(a) * (1.0 - lam) + static_cast<double>(b) * lam;
    return static_cast<std::uint8_t>(std::clamp(v, 0.0, 255.0));
}
} // namespace

// ─────────────────────────────────────
std::optional<Rgb> ParseHexColor(const std::string &text) {
    if (text.empty() || text[0] != '#') {
        return std::nullopt;
    }

    int digits[6];
    const std::size_t n = text.size() - 1;
    if (n != 3 && n != 6) {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < n; ++i) {
        digits[i] = HexDigit(text[i + 1]);
        if (digits[i] < 0) {
            return std::nullopt;
        }
    }

    Rgb c;
    if (n == 3) {
        c.r = static_cast<std::uint8_t>(digits[0] * 17);
        c.g = static_cast<std::uint8_t>(digits[1] * 17);
        c.b = static_cast<std::uint8_t>(digits[2] * 17);
    } else {
        c.r = static_cast<std::uint8_t>(digits[0] * 16 + digits[1]);
        c.g = static_cast<std::uint8_t>(digits[2] * 16 + digits[3]);
        c.b = static_cast<std::uint8_t>(digits[4] * 16 + digits[5]);
    }
    return c;
}

// ─────────────────────────────────────
std::string ToHexColor(const Rgb &c) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", c.r, c.g, c.b);
    return buf;
}

// ─────────────────────────────────────
Rgb FadeBetween(const Rgb &from, const Rgb &to, double fraction, double exponent) {
    if (!std::isfinite(fraction)) {
        fraction = 0.0;
    }
    const double lam = std::pow(std::clamp(fraction, 0.0, 1.0), exponent);
    return Rgb{Blend(from.r, to.r, lam), Blend(from.g, to.g, lam), Blend(from.b, to.b, lam)};
}
