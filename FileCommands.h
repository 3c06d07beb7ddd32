#ifndef AAPC_FILECOMMANDS_H
#define AAPC_FILECOMMANDS_H

#include <cstddef>
#include <ostream>
#include <string>

#include "CliOptions.h"

namespace Aapc {

    // Sizes and time of one file-to-file command.
    struct FileCommandResult {
        std::size_t input_size = 0;
        std::size_t output_size = 0;
        double seconds = 0.0;
    };

    // Reads `input`, compresses it and writes `output`, then prints
    // "Compressed <in> (<n> bytes) to <out> (<m> bytes) in <t>. Ratio: <r>".
    // Either path may end in ".gz". I/O failures throw std::runtime_error.
    FileCommandResult compressFile(const std::string& input, const std::string& output,
                                   std::ostream& out, bool verbose);

    // Reverse of compressFile. A corrupt archive throws MalformedInput before
    // anything is written, so `output` is never created for it.
    FileCommandResult decompressFile(const std::string& input, const std::string& output,
                                     std::ostream& out, bool verbose);

    // Runs one parsed command line. Reports go to `out`, failures to `err`
    // as "Error: <what>". Returns the process exit status: 0 on success,
    // 1 when the command failed.
    int runCommand(const CliOptions& options, const std::string& program,
                   std::ostream& out, std::ostream& err);

} // namespace Aapc

#endif //AAPC_FILECOMMANDS_H
