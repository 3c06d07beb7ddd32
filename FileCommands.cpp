#include "FileCommands.h"
#include "BlockRleStrategy.h"
#include "FileReader.h"
#include "FileWriter.h"
#include "RoundTripHarness.h"

#include <iomanip>
#include <random>

#ifndef AAPC_VERSION
#define AAPC_VERSION "unknown"
#endif

namespace Aapc {

FileCommandResult compressFile(const std::string& input, const std::string& output,
                               std::ostream& out, bool verbose) {
    if (verbose) {
        out << "Verbose: Reading input file " << input << std::endl;
    }
    ByteBuffer data = readFile(input);

    Timer timer;
    ByteBuffer compressed = compress(data);
    FileCommandResult result{data.size(), compressed.size(), timer.elapsed_seconds()};

    if (verbose) {
        out << "Verbose: Writing compressed output to " << output << std::endl;
    }
    writeFile(output, compressed);

    const double ratio = data.empty() ? 0.0 : static_cast<double>(compressed.size()) / data.size();
    out << "Compressed " << input << " (" << result.input_size << " bytes) to "
        << output << " (" << result.output_size << " bytes) in "
        << formatDuration(result.seconds) << ". Ratio: "
        << std::fixed << std::setprecision(2) << ratio << std::endl;
    return result;
}

FileCommandResult decompressFile(const std::string& input, const std::string& output,
                                 std::ostream& out, bool verbose) {
    if (verbose) {
        out << "Verbose: Reading compressed input " << input << std::endl;
    }
    ByteBuffer compressed = readFile(input);

    Timer timer;
    ByteBuffer data = decompress(compressed);
    FileCommandResult result{compressed.size(), data.size(), timer.elapsed_seconds()};

    if (verbose) {
        out << "Verbose: Writing decompressed output to " << output << std::endl;
    }
    writeFile(output, data);

    out << "Decompressed " << input << " (" << result.input_size << " bytes) to "
        << output << " (" << result.output_size << " bytes) in "
        << formatDuration(result.seconds) << "." << std::endl;
    return result;
}

int runCommand(const CliOptions& options, const std::string& program,
               std::ostream& out, std::ostream& err) {
    try {
        BlockRleStrategy codec;
        RoundTripHarness harness(codec, out, options.verbose, err);

        switch (options.command) {
            case Command::Help:
                out << usageText(program);
                break;
            case Command::Version:
                out << "aapc " << AAPC_VERSION << std::endl;
                break;
            case Command::Compress:
                compressFile(options.input, options.output, out, options.verbose);
                break;
            case Command::Decompress:
                decompressFile(options.input, options.output, out, options.verbose);
                break;
            case Command::Test:
                if (options.test_file) {
                    harness.runFileTest(*options.test_file);
                } else {
                    harness.runGeneratedTest(std::random_device{}());
                }
                break;
            case Command::TestFolder:
                harness.runFolderTest(options.folder, options.log_path);
                break;
        }
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

} // namespace Aapc
