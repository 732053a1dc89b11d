#include "awlights/elc/ElcProtocol.hpp"

#include <algorithm>

namespace awlights::elc::protocol {
namespace {

constexpr std::uint8_t MODE_COLOR = 0xD0;
constexpr std::uint8_t MODE_MORPH = 0xCF;
constexpr std::uint8_t MODE_PULSE = 0xDC;
constexpr std::uint8_t DURATION_COLOR = 0xFA;
constexpr std::uint8_t DURATION_ANIMATED = 0x64;

template <typename Enum>
inline std::uint8_t byteOf(Enum value) noexcept {
    return static_cast<std::uint8_t>(value);
}

void appendActionBlock(core::ByteBuffer& buffer, ActionEffect effect, std::uint8_t mode,
                       std::uint8_t duration, const core::RgbColor& color) {
    buffer.appendBytes({byteOf(effect), 0x07, mode, 0x00, duration});
    buffer.appendColor(color);
}

} // namespace

core::ByteBuffer userAnimationCommand(AnimationOp op) {
    return core::ByteBuffer{byteOf(Opcode::UserAnimation), 0x00, byteOf(op), 0x00,
                            USER_ANIMATION_ID};
}

core::ByteBuffer powerAnimationCommand(AnimationOp op, PowerState state) {
    return core::ByteBuffer{byteOf(Opcode::PowerAnimation), 0x00, byteOf(op), 0x00,
                            byteOf(state)};
}

core::ByteBuffer selectZonesCommand(const std::vector<std::uint8_t>& zones) {
    core::ByteBuffer buffer{byteOf(Opcode::SelectZones), 0x01, 0x00,
                            static_cast<std::uint8_t>(zones.size())};
    buffer.appendBytes(zones);
    return buffer;
}

core::ByteBuffer addActionCommand(const core::ByteBuffer& action) {
    core::ByteBuffer buffer{byteOf(Opcode::AddAction)};
    buffer.appendBytes(action.bytes());
    return buffer;
}

core::ByteBuffer staticAction(const core::RgbColor& color) {
    core::ByteBuffer buffer;
    appendActionBlock(buffer, ActionEffect::Color, MODE_COLOR, DURATION_COLOR, color);
    return buffer;
}

core::ByteBuffer morphAction(const std::vector<core::RgbColor>& colors) {
    core::ByteBuffer buffer;
    const auto used = std::min(colors.size(), MAX_MORPH_COLORS);
    for (std::size_t i = 0; i < used; ++i) {
        appendActionBlock(buffer, ActionEffect::Morph, MODE_MORPH, DURATION_ANIMATED, colors[i]);
    }
    return buffer;
}

core::ByteBuffer pulseAction(const core::RgbColor& color) {
    core::ByteBuffer buffer;
    appendActionBlock(buffer, ActionEffect::Pulse, MODE_PULSE, DURATION_ANIMATED, color);
    return buffer;
}

} // namespace awlights::elc::protocol
