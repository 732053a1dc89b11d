#include "awlights/core/RgbColor.hpp"

#include <cstdio>

namespace awlights::core {
namespace {

int hexDigitValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool parseChannel(std::string_view pair, std::uint8_t& out) {
    const int hi = hexDigitValue(pair[0]);
    const int lo = hexDigitValue(pair[1]);
    if (hi < 0 || lo < 0) {
        return false;
    }
    out = static_cast<std::uint8_t>((hi << 4) | lo);
    return true;
}

} // namespace

expected<RgbColor> parseColor(std::string_view text) {
    if (!text.empty() && text.front() == '#') {
        text.remove_prefix(1);
    }
    if (text.size() != 6) {
        return fail(std::errc::invalid_argument);
    }

    RgbColor color;
    if (!parseChannel(text.substr(0, 2), color.red)
        || !parseChannel(text.substr(2, 2), color.green)
        || !parseChannel(text.substr(4, 2), color.blue)) {
        return fail(std::errc::invalid_argument);
    }
    return color;
}

std::string toHexString(const RgbColor& color) {
    char text[7];
    std::snprintf(text, sizeof(text), "%02X%02X%02X", color.red, color.green, color.blue);
    return text;
}

} // namespace awlights::core
