#ifndef AAPC_RECORDTYPES_H
#define AAPC_RECORDTYPES_H

#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

namespace Aapc {

    using ByteBuffer = std::vector<unsigned char>;

    // Fixed parameters of the on-disk format.
    constexpr std::size_t kBlockSize = 256 * 1024;
    constexpr std::size_t kMinRun = 3;
    constexpr std::size_t kMaxRun = 255;
    constexpr unsigned char kRunFlag = 254;
    constexpr unsigned char kEscapeFlag = 255;

    // A byte that is neither flag value, stored as itself.
    struct LiteralToken {
        unsigned char value;
    };

    // A flag-valued byte (254 or 255) stored as [255][value].
    struct EscapedToken {
        unsigned char value;
    };

    // [254][length][value]: value repeated length times.
    struct RunToken {
        unsigned char length;
        unsigned char value;
    };

    using Token = std::variant<LiteralToken, EscapedToken, RunToken>;

} // namespace Aapc

#endif //AAPC_RECORDTYPES_H
