#include "awlights/keyboard/KeyboardProtocol.hpp"

#include "awlights/keyboard/KeyboardConfig.hpp"

namespace awlights::keyboard::protocol {
namespace {

inline std::uint8_t byteOf(Opcode opcode) noexcept {
    return static_cast<std::uint8_t>(opcode);
}

inline std::uint8_t byteOf(EffectType type) noexcept {
    return static_cast<std::uint8_t>(type);
}

// Bytes 3..7 are the same in every effect command.
void appendEffectHeader(core::ByteBuffer& buffer, EffectType type, std::uint8_t tempo) {
    buffer.appendBytes({byteOf(Opcode::Effect), byteOf(type), tempo,
                        0x00, 0x00, 0x01, 0x01, 0x01});
}

} // namespace

core::ByteBuffer resetCommand() {
    return core::ByteBuffer{byteOf(Opcode::Reset)};
}

core::ByteBuffer disableEffectCommand() {
    core::ByteBuffer buffer;
    appendEffectHeader(buffer, EffectType::Disabled, config::TEMPO_DISABLED);
    return buffer;
}

core::ByteBuffer keyChunkCommand(std::size_t firstKey, std::size_t count,
                                 const core::RgbColor& color) {
    core::ByteBuffer buffer;
    buffer.appendBytes({byteOf(Opcode::Keys), 0x02, 0x00});
    for (std::size_t key = firstKey; key < firstKey + count; ++key) {
        buffer.appendUInt8(static_cast<std::uint8_t>(key + 1));
        buffer.appendColor(color);
    }
    return buffer;
}

core::ByteBuffer commitKeysCommand() {
    return core::ByteBuffer{byteOf(Opcode::Keys), 0x13};
}

expected<core::ByteBuffer> globalEffectCommand(EffectType type, std::uint8_t tempo,
                                               const std::vector<core::RgbColor>& colors) {
    if (colors.empty() || colors.size() > MAX_EFFECT_COLORS) {
        return fail(std::errc::invalid_argument);
    }

    core::ByteBuffer buffer;
    appendEffectHeader(buffer, type, tempo);
    buffer.appendUInt8(static_cast<std::uint8_t>(colors.size() - 1));
    for (const auto& color : colors) {
        buffer.appendColor(color);
    }
    return buffer;
}

core::ByteBuffer commitCommand() {
    return core::ByteBuffer{byteOf(Opcode::Commit), 0x01, 0xFF};
}

} // namespace awlights::keyboard::protocol
