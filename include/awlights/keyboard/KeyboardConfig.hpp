#pragma once

#include "awlights/hid/DeviceLocator.hpp"
#include "awlights/hid/ReportSession.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace awlights::keyboard::config {

/**
 * @brief Constants of the per-key keyboard controller (Darfon, APIv5).
 *
 * Delays are minimum intervals measured on hardware; shortening them makes the
 * firmware drop commands.
 */

// Identity / transport --------------------------------------------------------
constexpr hid::ControllerIdentity KEYBOARD_IDENTITY{"0D62", "BABC", "keyboard"};
constexpr hid::ReportFormat KEYBOARD_REPORT{hid::ReportType::Feature, 0xCC, 64};

// Zones -----------------------------------------------------------------------
constexpr std::size_t KEYBOARD_KEY_COUNT = 0x88;
constexpr std::size_t KEYS_PER_CHUNK = 15;  // 3 header bytes + 15 * 4 fits in 63

// Global effects --------------------------------------------------------------
constexpr std::uint8_t TEMPO_SLOW = 0x07;
constexpr std::uint8_t TEMPO_FAST = 0x05;
constexpr std::uint8_t TEMPO_DISABLED = 0xFE;

// Timing ----------------------------------------------------------------------
constexpr std::chrono::milliseconds RESET_DELAY{50};
constexpr std::chrono::milliseconds DISABLE_EFFECT_DELAY{50};
constexpr std::chrono::milliseconds KEY_CHUNK_DELAY{10};
constexpr std::chrono::milliseconds GLOBAL_EFFECT_DELAY{50};

} // namespace awlights::keyboard::config
