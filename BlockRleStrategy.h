#ifndef AAPC_BLOCKRLESTRATEGY_H
#define AAPC_BLOCKRLESTRATEGY_H

#include <cstddef>
#include <vector>

#include "IEncodingStrategy.h"
#include "RecordTypes.h"

namespace Aapc {

    // Compresses a buffer into the block-framed run-length format.
    // Never fails; empty input produces a block count of 0 and no blocks.
    ByteBuffer compress(const ByteBuffer& data);

    // Reverses compress(). Throws MalformedInput when a declared length or a
    // token operand runs past the end of the buffer.
    ByteBuffer decompress(const ByteBuffer& compressed);

    // Splits data[begin, end) into tokens. Runs are capped at kMaxRun and
    // never extend past `end`.
    std::vector<Token> tokenizeBlock(const ByteBuffer& data, std::size_t begin, std::size_t end);

    // Serialises one token onto the end of a block payload.
    void appendToken(ByteBuffer& out, const Token& token);

    // The codec exposed through the strategy interface.
    class BlockRleStrategy : public IEncodingStrategy {
    public:
        ~BlockRleStrategy() override;
        ByteBuffer encode(const ByteBuffer& data) const override;
        ByteBuffer decode(const ByteBuffer& data) const override;
    };

} // namespace Aapc

#endif //AAPC_BLOCKRLESTRATEGY_H
