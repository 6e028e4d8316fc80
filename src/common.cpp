#include "common.hpp"

// ─────────────────────────────────────
const char *BlockStateName(BlockState state) {
    switch (state) {
    case IDLE:
        return "idle";
    case RUNNING:
        return "running";
    case PAUSED:
        return "paused";
    case COOLDOWN:
        return "cooldown";
    }
    return "unknown";
}

// ─────────────────────────────────────
std::string ToValidUtf8(const std::string &text) {
    static const char kReplacement[] = "\xEF\xBF\xBD";

    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        if (lead < 0x80) {
            out += text[i++];
            continue;
        }

        // Sequence length and the allowed range of the first continuation byte
        size_t len = 0;
        unsigned char lo = 0x80, hi = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            len = 2;
        } else if (lead == 0xE0) {
            len = 3;
            lo = 0xA0;
        } else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) {
            len = 3;
        } else if (lead == 0xED) {
            len = 3;
            hi = 0x9F;
        } else if (lead == 0xF0) {
            len = 4;
            lo = 0x90;
        } else if (lead >= 0xF1 && lead <= 0xF3) {
            len = 4;
        } else if (lead == 0xF4) {
            len = 4;
            hi = 0x8F;
        } else {
            out += kReplacement;
            ++i;
            continue;
        }

        size_t n = 1;
        while (n < len && i + n < text.size()) {
            const auto c = static_cast<unsigned char>(text[i + n]);
            if (c < lo || c > hi) {
                break;
            }
            lo = 0x80;
            hi = 0xBF;
            ++n;
        }

        // One replacement for the whole truncated prefix
        if (n == len) {
            out.append(text, i, len);
        } else {
            out += kReplacement;
        }
        i += n;
    }
    return out;
}
