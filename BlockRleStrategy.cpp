#include "BlockRleStrategy.h"
#include "BlockFraming.h"
#include "CodecErrors.h"

#include <algorithm>
#include <cstdint>
#include <type_traits>
#include <variant>

namespace Aapc {

namespace {
    inline bool isFlagByte(unsigned char value) {
        return value == kRunFlag || value == kEscapeFlag;
    }

    // Reads one token starting at the cursor; the cursor is limited to the current block.
    Token readToken(ByteCursor& cursor) {
        const unsigned char flag = cursor.readByte("token flag");
        if (flag == kEscapeFlag) {
            return EscapedToken{cursor.readByte("escaped literal value")};
        }
        if (flag == kRunFlag) {
            const unsigned char length = cursor.readByte("run length");
            const unsigned char value = cursor.readByte("run value");
            return RunToken{length, value};
        }
        return LiteralToken{flag};
    }

    void expandToken(ByteBuffer& out, const Token& token) {
        if (const auto* run = std::get_if<RunToken>(&token)) {
            out.insert(out.end(), static_cast<std::size_t>(run->length), run->value);
        } else if (const auto* escaped = std::get_if<EscapedToken>(&token)) {
            out.push_back(escaped->value);
        } else {
            out.push_back(std::get<LiteralToken>(token).value);
        }
    }
}

BlockRleStrategy::~BlockRleStrategy() = default;

std::vector<Token> tokenizeBlock(const ByteBuffer& data, std::size_t begin, std::size_t end) {
    std::vector<Token> tokens;
    std::size_t i = begin;
    while (i < end) {
        const unsigned char current = data[i];
        std::size_t run = 1;
        // Count the repeats, stopping at the one-byte length limit.
        while (i + run < end && data[i + run] == current && run < kMaxRun) {
            ++run;
        }

        if (run >= kMinRun) {
            tokens.push_back(RunToken{static_cast<unsigned char>(run), current});
            i += run;
        } else {
            // Runs of 1 or 2 go out one byte at a time.
            if (isFlagByte(current)) {
                tokens.push_back(EscapedToken{current});
            } else {
                tokens.push_back(LiteralToken{current});
            }
            ++i;
        }
    }
    return tokens;
}

void appendToken(ByteBuffer& out, const Token& token) {
    std::visit([&out](const auto& t) {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, LiteralToken>) {
            out.push_back(t.value);
        } else if constexpr (std::is_same_v<T, EscapedToken>) {
            out.push_back(kEscapeFlag);
            out.push_back(t.value);
        } else if constexpr (std::is_same_v<T, RunToken>) {
            out.push_back(kRunFlag);
            out.push_back(t.length);
            out.push_back(t.value);
        }
    }, token);
}

ByteBuffer compress(const ByteBuffer& data) {
    ByteBuffer output;
    output.reserve(data.size() / 2 + 4);

    const std::size_t block_count = blockCountFor(data.size());
    appendU32BE(output, static_cast<uint32_t>(block_count));

    ByteBuffer payload;
    for (std::size_t block = 0; block < block_count; ++block) {
        const std::size_t begin = block * kBlockSize;
        const std::size_t end = std::min(begin + kBlockSize, data.size());

        payload.clear();
        for (const auto& token : tokenizeBlock(data, begin, end)) {
            appendToken(payload, token);
        }

        appendU32BE(output, static_cast<uint32_t>(payload.size()));
        output.insert(output.end(), payload.begin(), payload.end());
    }
    return output;
}

ByteBuffer decompress(const ByteBuffer& compressed) {
    ByteCursor cursor(compressed);
    const uint32_t block_count = cursor.readU32BE("block count");

    // Sized from the input rather than the declared counts, which are untrusted.
    ByteBuffer output;
    output.reserve(compressed.size() * 2);

    for (uint32_t block = 0; block < block_count; ++block) {
        const uint32_t payload_length = cursor.readU32BE("block length prefix");
        cursor.beginBlock(payload_length);
        while (!cursor.atBlockEnd()) {
            expandToken(output, readToken(cursor));
        }
        cursor.endBlock();
    }
    return output;
}

ByteBuffer BlockRleStrategy::encode(const ByteBuffer& data) const {
    return compress(data);
}

ByteBuffer BlockRleStrategy::decode(const ByteBuffer& data) const {
    return decompress(data);
}

} // namespace Aapc
