// KeyboardProtocol.hpp
// -----------------------------------------------------------------------------
// Payload builders for the keyboard controller. Each function returns one
// report payload without the 0xCC report id; FeatureReportSession frames it.
// Keeping the byte layout here lets tests check the wire format without a
// device or any of the inter-command delays.

#pragma once

#include "awlights/core/ByteBuffer.hpp"
#include "awlights/core/Expected.hpp"
#include "awlights/core/RgbColor.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace awlights::keyboard::protocol {

enum class Opcode : std::uint8_t {
    Effect = 0x80,
    Commit = 0x8B,
    Keys = 0x8C,
    Reset = 0x94
};

// Effect type byte of an Opcode::Effect command.
enum class EffectType : std::uint8_t {
    Disabled = 0x01,
    Morph = 0x02,   // breathe, morph and spectrum
    Wave = 0x03,
    Pulse = 0x08
};

// Largest colour list an effect command can carry in a 63 byte payload.
constexpr std::size_t MAX_EFFECT_COLORS = 18;

/// [0x94]: clears the firmware-side animation state.
core::ByteBuffer resetCommand();

/// [0x80, 0x01, 0xFE, 0, 0, 1, 1, 1]: stops the running global effect.
core::ByteBuffer disableEffectCommand();

/**
 * @brief Colour @p count keys starting at zero-based @p firstKey.
 *
 * [0x8C, 0x02, 0x00] followed by (key + 1, r, g, b) per key; the firmware
 * numbers keys from 1.
 */
core::ByteBuffer keyChunkCommand(std::size_t firstKey, std::size_t count,
                                 const core::RgbColor& color);

/// [0x8C, 0x13]: applies the key colours sent so far.
core::ByteBuffer commitKeysCommand();

/**
 * @brief [0x80, type, tempo, 0, 0, 1, 1, 1, count - 1, rgb...].
 *
 * No 3-colour cap here: every colour passed is encoded. An empty list or more
 * than MAX_EFFECT_COLORS yields std::errc::invalid_argument.
 */
expected<core::ByteBuffer> globalEffectCommand(EffectType type, std::uint8_t tempo,
                                               const std::vector<core::RgbColor>& colors);

/// [0x8B, 0x01, 0xFF]: makes the programmed state live.
core::ByteBuffer commitCommand();

} // namespace awlights::keyboard::protocol
