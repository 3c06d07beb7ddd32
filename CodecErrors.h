#ifndef AAPC_CODECERRORS_H
#define AAPC_CODECERRORS_H

#include <cstddef>
#include <stdexcept>
#include <string>

namespace Aapc {

    // Raised by the decoder when a declared length or a token operand would
    // read past the end of the buffer.
    class MalformedInput : public std::runtime_error {
    public:
        MalformedInput(const std::string& what, std::size_t offset)
            : std::runtime_error("Malformed input at offset " + std::to_string(offset) + ": " + what),
              m_offset(offset) {}

        // Position in the compressed buffer where the failing read started.
        std::size_t offset() const { return m_offset; }

    private:
        std::size_t m_offset;
    };

    // Raised by the round-trip harness when decoded bytes differ from the input.
    class RoundTripMismatch : public std::runtime_error {
    public:
        explicit RoundTripMismatch(const std::string& name)
            : std::runtime_error("Decompression mismatch for: " + name) {}
    };

} // namespace Aapc

#endif //AAPC_CODECERRORS_H
