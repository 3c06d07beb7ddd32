#ifndef AAPC_CLIOPTIONS_H
#define AAPC_CLIOPTIONS_H

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace Aapc {

    enum class Command {
        Compress,
        Decompress,
        Test,
        TestFolder,
        Help,
        Version
    };

    // Everything the command line can configure.
    struct CliOptions {
        Command command = Command::Help;
        bool verbose = false;
        std::string input;
        std::string output;
        // Only for `test`: the real file to round-trip instead of generated data.
        std::optional<std::string> test_file;
        std::string folder = "test_data";
        std::string log_path = "test_log.txt";
    };

    // Thrown for an unusable command line; main() answers with the usage text.
    class CliError : public std::runtime_error {
    public:
        explicit CliError(const std::string& what) : std::runtime_error(what) {}
    };

    // Parses argv (argv[0] is skipped). `--verbose` is accepted anywhere.
    // AAPC_TEST_DATA_DIR overrides the default folder unless --dir is given.
    CliOptions parseCliOptions(int argc, const char* const argv[]);
    CliOptions parseCliOptions(const std::vector<std::string>& args);

    std::string usageText(const std::string& program);

} // namespace Aapc

#endif //AAPC_CLIOPTIONS_H
