#include "BlockFraming.h"
#include "CodecErrors.h"

#include <string>

namespace Aapc {

std::size_t blockCountFor(std::size_t input_length) {
    return (input_length + kBlockSize - 1) / kBlockSize;
}

void appendU32BE(ByteBuffer& out, uint32_t value) {
    out.push_back(static_cast<unsigned char>((value >> 24) & 0xFF));
    out.push_back(static_cast<unsigned char>((value >> 16) & 0xFF));
    out.push_back(static_cast<unsigned char>((value >> 8) & 0xFF));
    out.push_back(static_cast<unsigned char>(value & 0xFF));
}

ByteCursor::ByteCursor(const ByteBuffer& data)
    : m_data(data), m_limit(data.size()) {}

uint32_t ByteCursor::readU32BE(const char* field) {
    if (remaining() < 4) {
        throw MalformedInput(std::string("truncated ") + field, m_pos);
    }
    uint32_t value = (static_cast<uint32_t>(m_data[m_pos]) << 24) |
                     (static_cast<uint32_t>(m_data[m_pos + 1]) << 16) |
                     (static_cast<uint32_t>(m_data[m_pos + 2]) << 8) |
                     static_cast<uint32_t>(m_data[m_pos + 3]);
    m_pos += 4;
    return value;
}

unsigned char ByteCursor::readByte(const char* field) {
    if (remaining() < 1) {
        throw MalformedInput(std::string("missing ") + field, m_pos);
    }
    return m_data[m_pos++];
}

void ByteCursor::beginBlock(std::size_t length) {
    const std::size_t available = m_data.size() - m_pos;
    if (length > available) {
        throw MalformedInput("block payload length " + std::to_string(length) +
                             " exceeds remaining " + std::to_string(available) + " bytes", m_pos);
    }
    m_limit = m_pos + length;
}

void ByteCursor::endBlock() {
    m_limit = m_data.size();
}

} // namespace Aapc
