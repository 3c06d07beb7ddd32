#ifndef AAPC_ROUNDTRIPHARNESS_H
#define AAPC_ROUNDTRIPHARNESS_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <ostream>
#include <string>

#include "IEncodingStrategy.h"
#include "RecordTypes.h"

namespace Aapc {

    class Timer {
        std::chrono::steady_clock::time_point start;
    public:
        Timer() : start(std::chrono::steady_clock::now()) {}
        double elapsed_seconds() const {
            auto end = std::chrono::steady_clock::now();
            return std::chrono::duration<double>(end - start).count();
        }
    };

    // Sizes and timings of one compress/decompress pass.
    struct RoundTripResult {
        std::string name;
        std::size_t original_size = 0;
        std::size_t compressed_size = 0;
        std::size_t decompressed_size = 0;
        double compress_seconds = 0.0;
        double decompress_seconds = 0.0;
        bool identical = false;

        // compressed / original; 0 for empty input.
        double ratio() const;
        // Original bytes per second; 0 when the pass was too fast to time.
        double compressSpeed() const;
        double decompressSpeed() const;
    };

    // Compresses and decompresses `data` with `codec`, timing both directions.
    // Does not throw on a mismatch; check `identical`.
    RoundTripResult runRoundTrip(const std::string& name, const ByteBuffer& data,
                                 const IEncodingStrategy& codec);

    // About 1 MiB of mixed data: 1024 rounds of a random byte repeated 1-99
    // times followed by 1-49 random bytes. The same seed gives the same bytes.
    ByteBuffer generateTestData(uint32_t seed);

    // "1.234ms" style rendering used by every report line.
    std::string formatDuration(double seconds);

    // Multi-line entry for the folder test log.
    std::string formatLogEntry(const RoundTripResult& result, uint64_t unix_seconds);

    /**
     * @class RoundTripHarness
     * @brief Batch caller of the codec that verifies byte-for-byte round trips.
     *
     * Each run* method prints its report to `out` and throws
     * RoundTripMismatch if the decoded bytes differ from the input.
     * Non-fatal problems (a missing folder) are reported on `err`.
     */
    class RoundTripHarness {
    public:
        RoundTripHarness(const IEncodingStrategy& codec, std::ostream& out, bool verbose,
                         std::ostream& err = std::cerr);

        RoundTripResult runGeneratedTest(uint32_t seed);
        RoundTripResult runFileTest(const std::string& filepath);

        // Tests every regular file in `folder` and writes the joined log
        // entries to `log_path`. Returns the number of files tested.
        std::size_t runFolderTest(const std::string& folder, const std::string& log_path);

    private:
        RoundTripResult verify(const std::string& name, const ByteBuffer& data);
        void printReport(const RoundTripResult& result);

        const IEncodingStrategy& m_codec;
        std::ostream& m_out;
        std::ostream& m_err;
        bool m_verbose;
    };

} // namespace Aapc

#endif //AAPC_ROUNDTRIPHARNESS_H
