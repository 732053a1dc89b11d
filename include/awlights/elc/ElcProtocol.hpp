// ElcProtocol.hpp
// -----------------------------------------------------------------------------
// Payload builders for the AW-ELC controller. The controller stores animations
// rather than live colours: a "user" animation drives the ring, while the logos
// are driven by "power" animations, one per firmware power state. An animation
// is built by selecting zones and pushing action blocks between a start and a
// save/play command.

#pragma once

#include "awlights/core/ByteBuffer.hpp"
#include "awlights/core/RgbColor.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace awlights::elc::protocol {

enum class Opcode : std::uint8_t {
    UserAnimation = 0x21,
    PowerAnimation = 0x22,
    SelectZones = 0x23,
    AddAction = 0x24
};

enum class AnimationOp : std::uint8_t {
    Start = 0x01,
    Save = 0x02,
    Play = 0x03,
    Remove = 0x04,
    PlayAll = 0x05
};

// Power states the logo animation must be saved for.
enum class PowerState : std::uint8_t {
    AcSleep = 0x5B,
    AcCharged = 0x5C,
    AcCharging = 0x5D,
    DcSleep = 0x5E,
    DcOn = 0x5F,
    DcLow = 0x60
};

constexpr std::array<PowerState, 6> POWER_STATES{
    PowerState::AcSleep, PowerState::AcCharged, PowerState::AcCharging,
    PowerState::DcSleep, PowerState::DcOn, PowerState::DcLow};

// Action block effect codes.
enum class ActionEffect : std::uint8_t {
    Color = 0x00,
    Pulse = 0x01,
    Morph = 0x02
};

constexpr std::size_t ACTION_BLOCK_SIZE = 8;
constexpr std::size_t MAX_MORPH_COLORS = 3;

/// Animation id addressed by user-animation commands.
constexpr std::uint8_t USER_ANIMATION_ID = 0xFF;

/// [0x21, 0x00, op, 0x00, 0xFF]
core::ByteBuffer userAnimationCommand(AnimationOp op);

/// [0x22, 0x00, op, 0x00, state]
core::ByteBuffer powerAnimationCommand(AnimationOp op, PowerState state);

/// [0x23, 0x01, 0x00, count, zones...]
core::ByteBuffer selectZonesCommand(const std::vector<std::uint8_t>& zones);

/// [0x24, action...]
core::ByteBuffer addActionCommand(const core::ByteBuffer& action);

/// [0x00, 0x07, 0xD0, 0x00, 0xFA, r, g, b]
core::ByteBuffer staticAction(const core::RgbColor& color);

/**
 * @brief One [0x02, 0x07, 0xCF, 0x00, 0x64, r, g, b] block per colour.
 *
 * Only the first MAX_MORPH_COLORS colours are used; the rest are dropped.
 */
core::ByteBuffer morphAction(const std::vector<core::RgbColor>& colors);

/// [0x01, 0x07, 0xDC, 0x00, 0x64, r, g, b]. Pulse supports one colour only.
core::ByteBuffer pulseAction(const core::RgbColor& color);

} // namespace awlights::elc::protocol
