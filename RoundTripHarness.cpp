#include "RoundTripHarness.h"
#include "CodecErrors.h"
#include "FileReader.h"
#include "FileWriter.h"

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <random>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;
namespace Aapc {

double RoundTripResult::ratio() const {
    if (original_size == 0) return 0.0;
    return static_cast<double>(compressed_size) / static_cast<double>(original_size);
}

double RoundTripResult::compressSpeed() const {
    return compress_seconds > 0.0 ? original_size / compress_seconds : 0.0;
}

double RoundTripResult::decompressSpeed() const {
    return decompress_seconds > 0.0 ? original_size / decompress_seconds : 0.0;
}

RoundTripResult runRoundTrip(const std::string& name, const ByteBuffer& data,
                             const IEncodingStrategy& codec) {
    RoundTripResult result;
    result.name = name;
    result.original_size = data.size();

    ByteBuffer compressed;
    {
        Timer timer;
        compressed = codec.encode(data);
        result.compress_seconds = timer.elapsed_seconds();
    }
    result.compressed_size = compressed.size();

    ByteBuffer decompressed;
    {
        Timer timer;
        decompressed = codec.decode(compressed);
        result.decompress_seconds = timer.elapsed_seconds();
    }
    result.decompressed_size = decompressed.size();
    result.identical = (decompressed == data);
    return result;
}

ByteBuffer generateTestData(uint32_t seed) {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> byte_dis(0, 255);
    std::uniform_int_distribution<int> run_dis(1, 99);
    std::uniform_int_distribution<int> noise_dis(1, 49);

    ByteBuffer data;
    data.reserve(1024 * 1024);
    for (int round = 0; round < 1024; ++round) {
        const auto repeat_byte = static_cast<unsigned char>(byte_dis(gen));
        data.insert(data.end(), static_cast<std::size_t>(run_dis(gen)), repeat_byte);
        const int noise = noise_dis(gen);
        for (int i = 0; i < noise; ++i) {
            data.push_back(static_cast<unsigned char>(byte_dis(gen)));
        }
    }
    return data;
}

std::string formatDuration(double seconds) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3);
    if (seconds >= 1.0) {
        oss << seconds << "s";
    } else if (seconds >= 1e-3) {
        oss << seconds * 1e3 << "ms";
    } else {
        oss << seconds * 1e6 << "us";
    }
    return oss.str();
}

std::string formatLogEntry(const RoundTripResult& result, uint64_t unix_seconds) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << "Timestamp: " << unix_seconds << "s\n"
        << "File: " << result.name << "\n"
        << "Original Size: " << result.original_size << " bytes\n"
        << "Compressed Size: " << result.compressed_size << " bytes\n"
        << "Ratio: " << result.ratio() << "\n"
        << "Compress Time: " << formatDuration(result.compress_seconds) << "\n"
        << "Compress Speed: " << result.compressSpeed() << " bytes/s\n"
        << "Decompress Time: " << formatDuration(result.decompress_seconds) << "\n"
        << "Decompress Speed: " << result.decompressSpeed() << " bytes/s\n"
        << "---";
    return oss.str();
}

RoundTripHarness::RoundTripHarness(const IEncodingStrategy& codec, std::ostream& out, bool verbose,
                                   std::ostream& err)
    : m_codec(codec), m_out(out), m_err(err), m_verbose(verbose) {}

RoundTripResult RoundTripHarness::verify(const std::string& name, const ByteBuffer& data) {
    RoundTripResult result = runRoundTrip(name, data, m_codec);
    if (!result.identical) {
        throw RoundTripMismatch(name);
    }
    return result;
}

void RoundTripHarness::printReport(const RoundTripResult& result) {
    m_out << std::fixed << std::setprecision(2);
    m_out << "Original size: " << result.original_size << " bytes\n"
          << "Compressed size: " << result.compressed_size << " bytes (ratio: " << result.ratio() << ")\n"
          << "Compression time: " << formatDuration(result.compress_seconds) << "\n"
          << "Decompressed size: " << result.decompressed_size << " bytes\n"
          << "Decompression time: " << formatDuration(result.decompress_seconds) << "\n"
          << "Data is identical." << std::endl;
}

RoundTripResult RoundTripHarness::runGeneratedTest(uint32_t seed) {
    m_out << "Running round trip on generated data (seed " << seed << ")" << std::endl;
    ByteBuffer data = generateTestData(seed);
    if (m_verbose) {
        m_out << "Verbose: Generated test data of " << data.size() << " bytes" << std::endl;
    }
    RoundTripResult result = verify("generated data", data);
    printReport(result);
    return result;
}

RoundTripResult RoundTripHarness::runFileTest(const std::string& filepath) {
    m_out << "Testing with real file: " << filepath << std::endl;
    ByteBuffer data = readFile(filepath);
    if (m_verbose) {
        m_out << "Verbose: Loaded file of " << data.size() << " bytes" << std::endl;
    }
    RoundTripResult result = verify(filepath, data);
    printReport(result);
    return result;
}

std::size_t RoundTripHarness::runFolderTest(const std::string& folder, const std::string& log_path) {
    if (!fs::is_directory(folder)) {
        m_err << "Error: '" << folder << "' folder does not exist or is not a directory." << std::endl;
        return 0;
    }

    // Directory order is unspecified; sort so the log is reproducible.
    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(folder)) {
        if (entry.is_regular_file()) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    std::vector<std::string> log_entries;
    for (const auto& path : files) {
        const std::string file_name = path.filename().string();
        ByteBuffer data = readFile(path.string());
        if (m_verbose) {
            m_out << "Verbose: Processing file " << file_name << " (" << data.size() << " bytes)" << std::endl;
        }

        RoundTripResult result = verify(file_name, data);
        const auto timestamp = static_cast<uint64_t>(std::time(nullptr));
        log_entries.push_back(formatLogEntry(result, timestamp));

        m_out << "Tested " << file_name << " successfully." << std::endl;
    }

    if (log_entries.empty()) {
        m_out << "No files found in '" << folder << "' folder." << std::endl;
        return 0;
    }

    std::string log_content;
    for (std::size_t i = 0; i < log_entries.size(); ++i) {
        if (i > 0) log_content += "\n\n";
        log_content += log_entries[i];
    }
    writeFile(log_path, ByteBuffer(log_content.begin(), log_content.end()));
    m_out << "All tests complete. Log written to '" << log_path << "'." << std::endl;
    return log_entries.size();
}

} // namespace Aapc
