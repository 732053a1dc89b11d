#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "awlights/core/Expected.hpp"

namespace awlights::core {

// One zone colour, 8 bits per channel, in the order both firmwares expect.
struct RgbColor {
    std::uint8_t red = 0;
    std::uint8_t green = 0;
    std::uint8_t blue = 0;

    friend bool operator==(const RgbColor& a, const RgbColor& b) {
        return a.red == b.red && a.green == b.green && a.blue == b.blue;
    }
    friend bool operator!=(const RgbColor& a, const RgbColor& b) {
        return !(a == b);
    }
};

constexpr RgbColor RED{0xFF, 0x00, 0x00};
constexpr RgbColor GREEN{0x00, 0xFF, 0x00};
constexpr RgbColor BLUE{0x00, 0x00, 0xFF};
constexpr RgbColor BLACK{0x00, 0x00, 0x00};

/**
 * @brief Parse an "RRGGBB" token, with or without a leading '#'.
 *
 * Case-insensitive. Anything other than exactly six hex digits yields
 * std::errc::invalid_argument.
 */
expected<RgbColor> parseColor(std::string_view text);

/// Upper-case "RRGGBB" without the '#'.
std::string toHexString(const RgbColor& color);

} // namespace awlights::core
