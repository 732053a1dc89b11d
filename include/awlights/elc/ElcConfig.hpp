#pragma once

#include "awlights/hid/DeviceLocator.hpp"
#include "awlights/hid/ReportSession.hpp"

#include <array>
#include <chrono>
#include <cstdint>

namespace awlights::elc::config {

/**
 * @brief Constants of the AW-ELC lighting controller (APIv4), which drives the
 * ring around the lid and the two logos.
 */

// Identity / transport --------------------------------------------------------
constexpr hid::ControllerIdentity ELC_IDENTITY{"187C", "0550", "AW-ELC"};
constexpr hid::ReportFormat ELC_REPORT{hid::ReportType::Output, 0x03, 33};

// Zones -----------------------------------------------------------------------
constexpr std::array<std::uint8_t, 10> RING_ZONES{
    0x0A, 0x0B, 0x0C, 0x0D, 0x0E, 0x0F, 0x10, 0x11, 0x12, 0x13};
constexpr std::array<std::uint8_t, 2> LOGO_ZONES{0x00, 0x01};

// Timing ----------------------------------------------------------------------
constexpr std::chrono::milliseconds SEND_DELAY{20};          // after every report
constexpr std::chrono::milliseconds LOGO_SETTLE_DELAY{50};   // after committing the ring

} // namespace awlights::elc::config
