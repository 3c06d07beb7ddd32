#ifndef AAPC_BLOCKFRAMING_H
#define AAPC_BLOCKFRAMING_H

#include <cstddef>
#include <cstdint>

#include "RecordTypes.h"

namespace Aapc {

    // Number of blocks needed for an input of the given length (0 for empty input).
    std::size_t blockCountFor(std::size_t input_length);

    // Appends a 32-bit value in big-endian byte order.
    void appendU32BE(ByteBuffer& out, uint32_t value);

    /**
     * @class ByteCursor
     * @brief Bounds-checked sequential reader over a compressed buffer.
     *
     * Every read verifies that enough bytes remain before indexing and throws
     * MalformedInput otherwise, so a corrupt archive never causes an
     * out-of-range access.
     */
    class ByteCursor {
    public:
        explicit ByteCursor(const ByteBuffer& data);

        // Reads a big-endian 32-bit field; `field` names it in error messages.
        uint32_t readU32BE(const char* field);
        unsigned char readByte(const char* field);

        // Marks the next `length` bytes as the current block's payload.
        // Throws if fewer than `length` bytes remain.
        void beginBlock(std::size_t length);
        // Releases the block limit so framing fields after it can be read.
        void endBlock();
        // True once the cursor has consumed the whole current block.
        bool atBlockEnd() const { return m_pos == m_limit; }

        std::size_t position() const { return m_pos; }
        std::size_t remaining() const { return m_limit - m_pos; }

    private:
        const ByteBuffer& m_data;
        std::size_t m_pos = 0;
        // End of the readable range: the block end while inside a block,
        // otherwise the end of the buffer.
        std::size_t m_limit;
    };

} // namespace Aapc

#endif //AAPC_BLOCKFRAMING_H
