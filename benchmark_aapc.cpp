#include <iostream>
#include <algorithm>
#include <iomanip>
#include <random>
#include <string>
#include <utility>
#include <vector>
#include <zlib.h>

#include "BlockRleStrategy.h"
#include "RoundTripHarness.h"

namespace {

using Aapc::ByteBuffer;

ByteBuffer makeLongRuns(std::size_t length) {
    ByteBuffer data;
    data.reserve(length);
    unsigned char value = 0;
    while (data.size() < length) {
        data.insert(data.end(), std::min<std::size_t>(1000, length - data.size()), value);
        value = static_cast<unsigned char>(value + 37);
    }
    return data;
}

ByteBuffer makeRandom(std::size_t length, uint32_t seed) {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dis(0, 255);
    ByteBuffer data(length);
    for (auto& b : data) b = static_cast<unsigned char>(dis(gen));
    return data;
}

ByteBuffer makeText(std::size_t length) {
    static const std::string words[] = {"the ", "quick ", "brown ", "fox ", "jumps ",
                                        "over ", "lazy ", "dog ", "\n", "    "};
    std::mt19937 gen(7);
    std::uniform_int_distribution<int> dis(0, 9);
    ByteBuffer data;
    data.reserve(length);
    while (data.size() < length) {
        const std::string& w = words[dis(gen)];
        data.insert(data.end(), w.begin(), w.end());
    }
    data.resize(length);
    return data;
}

// Alternating 254/255: every byte needs an escape, the codec's worst case.
ByteBuffer makeFlagHeavy(std::size_t length) {
    ByteBuffer data(length);
    for (std::size_t i = 0; i < length; ++i) {
        data[i] = (i % 2 == 0) ? 254 : 255;
    }
    return data;
}

std::size_t zlibSize(const ByteBuffer& data) {
    uLongf dest_len = compressBound(static_cast<uLong>(data.size()));
    ByteBuffer dest(dest_len);
    if (compress2(dest.data(), &dest_len, data.data(), static_cast<uLong>(data.size()),
                  Z_DEFAULT_COMPRESSION) != Z_OK) {
        return 0;
    }
    return dest_len;
}

void printHeader(const std::string& title) {
    std::cout << "\n" << std::string(78, '=') << "\n";
    std::cout << "  " << title << "\n";
    std::cout << std::string(78, '=') << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::size_t length = 4 * 1024 * 1024;
    if (argc > 1) {
        try {
            length = std::stoul(argv[1]);
        } catch (const std::exception&) {
            std::cerr << "Usage: " << argv[0] << " [bytes_per_dataset]\n";
            return 1;
        }
    }

    const std::vector<std::pair<std::string, ByteBuffer>> datasets = {
        {"long runs", makeLongRuns(length)},
        {"mixed runs/noise", Aapc::generateTestData(42)},
        {"random bytes", makeRandom(length, 1234)},
        {"text", makeText(length)},
        {"flag-heavy 254/255", makeFlagHeavy(length)},
    };

    printHeader("AAPC Benchmark");
    std::cout << std::left << std::setw(22) << "Dataset"
              << std::right << std::setw(12) << "Original"
              << std::setw(12) << "AAPC"
              << std::setw(8) << "Ratio"
              << std::setw(12) << "Enc MB/s"
              << std::setw(12) << "Dec MB/s"
              << std::setw(12) << "zlib" << "\n";
    std::cout << std::string(78, '-') << "\n";

    Aapc::BlockRleStrategy codec;
    bool all_identical = true;
    for (const auto& [name, data] : datasets) {
        const Aapc::RoundTripResult result = Aapc::runRoundTrip(name, data, codec);
        all_identical = all_identical && result.identical;

        std::cout << std::left << std::setw(22) << name
                  << std::right << std::setw(12) << result.original_size
                  << std::setw(12) << result.compressed_size
                  << std::fixed << std::setprecision(2) << std::setw(8) << result.ratio()
                  << std::setw(12) << result.compressSpeed() / (1024.0 * 1024.0)
                  << std::setw(12) << result.decompressSpeed() / (1024.0 * 1024.0)
                  << std::setw(12) << zlibSize(data)
                  << (result.identical ? "" : "  MISMATCH") << "\n";
    }

    if (!all_identical) {
        std::cerr << "ERROR: at least one dataset did not round-trip!\n";
        return 1;
    }
    return 0;
}
