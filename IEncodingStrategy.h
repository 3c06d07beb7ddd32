#ifndef AAPC_IENCODINGSTRATEGY_H
#define AAPC_IENCODINGSTRATEGY_H

#include "RecordTypes.h"

namespace Aapc {

// An interface (abstract base class) that all encoding strategies must implement.
class IEncodingStrategy {
public:
    virtual ~IEncodingStrategy() = default;

    // Takes a raw byte buffer and returns the encoded bytes.
    virtual ByteBuffer encode(const ByteBuffer& data) const = 0;
    // Takes encoded bytes and returns the original raw buffer.
    virtual ByteBuffer decode(const ByteBuffer& data) const = 0;
};

} // namespace Aapc

#endif //AAPC_IENCODINGSTRATEGY_H
