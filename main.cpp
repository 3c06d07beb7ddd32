#include <iostream>
#include <string>

#include "CliOptions.h"
#include "FileCommands.h"

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 && argv[0] ? argv[0] : "aapc";

    Aapc::CliOptions options;
    try {
        options = Aapc::parseCliOptions(argc, argv);
    } catch (const Aapc::CliError& e) {
        std::cerr << "Error: " << e.what() << "\n" << Aapc::usageText(program);
        return 2;
    }

    return Aapc::runCommand(options, program, std::cout, std::cerr);
}
