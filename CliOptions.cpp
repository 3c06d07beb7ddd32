#include "CliOptions.h"

#include <cstdlib>

namespace Aapc {

namespace {
    Command parseCommand(const std::string& word) {
        if (word == "compress") return Command::Compress;
        if (word == "decompress") return Command::Decompress;
        if (word == "test") return Command::Test;
        if (word == "test-folder") return Command::TestFolder;
        throw CliError("Unknown command: " + word);
    }

    // Value following an option such as --dir; throws if it is missing.
    const std::string& optionValue(const std::vector<std::string>& args, std::size_t& i) {
        if (i + 1 >= args.size()) {
            throw CliError("Missing value for " + args[i]);
        }
        return args[++i];
    }
}

CliOptions parseCliOptions(int argc, const char* const argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i] ? argv[i] : "");
    }
    return parseCliOptions(args);
}

CliOptions parseCliOptions(const std::vector<std::string>& args) {
    CliOptions options;
    if (const char* dir = std::getenv("AAPC_TEST_DATA_DIR")) {
        if (*dir) options.folder = dir;
    }

    bool have_command = false;
    std::vector<std::string> positional;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            options.command = Command::Help;
            return options;
        } else if (arg == "--version") {
            options.command = Command::Version;
            return options;
        } else if (arg == "--dir") {
            options.folder = optionValue(args, i);
        } else if (arg == "--log") {
            options.log_path = optionValue(args, i);
        } else if (arg.rfind("--", 0) == 0) {
            throw CliError("Unknown option: " + arg);
        } else if (!have_command) {
            options.command = parseCommand(arg);
            have_command = true;
        } else {
            positional.push_back(arg);
        }
    }

    if (!have_command) {
        throw CliError("No command given");
    }

    switch (options.command) {
        case Command::Compress:
        case Command::Decompress:
            if (positional.size() != 2) {
                throw CliError("Expected <input> <output>");
            }
            options.input = positional[0];
            options.output = positional[1];
            break;
        case Command::Test:
            if (positional.size() > 1) {
                throw CliError("test takes at most one file");
            }
            if (!positional.empty()) options.test_file = positional[0];
            break;
        case Command::TestFolder:
            if (!positional.empty()) {
                throw CliError("test-folder takes no positional arguments");
            }
            break;
        default:
            break;
    }
    return options;
}

std::string usageText(const std::string& program) {
    return "Usage:\n"
           "  " + program + " [--verbose] compress <input> <output>\n"
           "  " + program + " [--verbose] decompress <input> <output>\n"
           "  " + program + " [--verbose] test [file]\n"
           "  " + program + " [--verbose] test-folder [--dir <folder>] [--log <file>]\n"
           "  " + program + " --help | --version\n"
           "Paths ending in .gz are read and written through gzip.\n";
}

} // namespace Aapc
