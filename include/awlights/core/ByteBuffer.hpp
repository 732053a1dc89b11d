#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

#include "awlights/core/RgbColor.hpp"

namespace awlights::core {

/**
 * @brief Growable byte vector used to assemble report payloads.
 *
 * Payloads are built front to back; the report id byte and the zero padding
 * are added later by the session that frames the report.
 */
class ByteBuffer {
public:
    ByteBuffer();
    ByteBuffer(std::initializer_list<std::uint8_t> bytes);

    void clear();
    void appendUInt8(std::uint8_t value);
    void appendBytes(std::initializer_list<std::uint8_t> bytes);
    void appendBytes(const std::vector<std::uint8_t>& bytes);
    void appendColor(const RgbColor& color);

    const std::uint8_t* data() const { return buffer.data(); }
    std::uint8_t* data() { return buffer.data(); }
    std::size_t size() const { return buffer.size(); }
    bool empty() const { return buffer.empty(); }

    const std::vector<std::uint8_t>& bytes() const { return buffer; }

private:
    std::vector<std::uint8_t> buffer;
};

/// Space separated lower-case hex rendering, e.g. "cc 94 00".
std::string toHexLine(const std::uint8_t* data, std::size_t size);

} // namespace awlights::core
