#include "awlights/core/ByteBuffer.hpp"

#include <iomanip>
#include <sstream>

namespace awlights::core {

ByteBuffer::ByteBuffer() {
    buffer.reserve(64); // largest report payload on either controller
}

ByteBuffer::ByteBuffer(std::initializer_list<std::uint8_t> bytes)
: buffer(bytes) {
}

void ByteBuffer::clear() {
    buffer.clear();
}

void ByteBuffer::appendUInt8(std::uint8_t value) {
    buffer.push_back(value);
}

void ByteBuffer::appendBytes(std::initializer_list<std::uint8_t> bytes) {
    buffer.insert(buffer.end(), bytes.begin(), bytes.end());
}

void ByteBuffer::appendBytes(const std::vector<std::uint8_t>& bytes) {
    buffer.insert(buffer.end(), bytes.begin(), bytes.end());
}

void ByteBuffer::appendColor(const RgbColor& color) {
    buffer.push_back(color.red);
    buffer.push_back(color.green);
    buffer.push_back(color.blue);
}

std::string toHexLine(const std::uint8_t* data, std::size_t size) {
    if (!data || size == 0) {
        return {};
    }

    std::ostringstream os;
    os << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < size; ++i) {
        if (i) os << ' ';
        os << std::setw(2) << static_cast<int>(data[i]);
    }
    return os.str();
}

} // namespace awlights::core
