#include <catch2/catch_all.hpp>
#include "../CliOptions.h"

using Aapc::CliOptions;
using Aapc::Command;

TEST_CASE("Command line parsing", "[cli]") {

    SECTION("compress takes input and output") {
        CliOptions o = Aapc::parseCliOptions({"compress", "in.bin", "out.aapc"});
        REQUIRE(o.command == Command::Compress);
        REQUIRE(o.input == "in.bin");
        REQUIRE(o.output == "out.aapc");
        REQUIRE_FALSE(o.verbose);
    }

    SECTION("--verbose is global") {
        REQUIRE(Aapc::parseCliOptions({"--verbose", "decompress", "a", "b"}).verbose);
        CliOptions o = Aapc::parseCliOptions({"decompress", "a", "--verbose", "b"});
        REQUIRE(o.verbose);
        REQUIRE(o.command == Command::Decompress);
        REQUIRE(o.output == "b");
    }

    SECTION("test with and without a file") {
        REQUIRE_FALSE(Aapc::parseCliOptions({"test"}).test_file.has_value());
        REQUIRE(Aapc::parseCliOptions({"test", "real.dat"}).test_file == std::string("real.dat"));
    }

    SECTION("test-folder overrides") {
        CliOptions o = Aapc::parseCliOptions({"test-folder", "--dir", "corpus", "--log", "run.log"});
        REQUIRE(o.command == Command::TestFolder);
        REQUIRE(o.folder == "corpus");
        REQUIRE(o.log_path == "run.log");
        REQUIRE(Aapc::parseCliOptions({"test-folder"}).log_path == "test_log.txt");
    }

    SECTION("help and version short-circuit") {
        REQUIRE(Aapc::parseCliOptions({"--help"}).command == Command::Help);
        REQUIRE(Aapc::parseCliOptions({"compress", "--version"}).command == Command::Version);
    }

    SECTION("argv form skips the program name") {
        const char* argv[] = {"aapc", "test", "--verbose"};
        CliOptions o = Aapc::parseCliOptions(3, argv);
        REQUIRE(o.command == Command::Test);
        REQUIRE(o.verbose);
    }

    SECTION("invalid command lines") {
        REQUIRE_THROWS_AS(Aapc::parseCliOptions(std::vector<std::string>{}), Aapc::CliError);
        REQUIRE_THROWS_AS(Aapc::parseCliOptions({"squash", "a", "b"}), Aapc::CliError);
        REQUIRE_THROWS_AS(Aapc::parseCliOptions({"compress", "only_input"}), Aapc::CliError);
        REQUIRE_THROWS_AS(Aapc::parseCliOptions({"test", "a", "b"}), Aapc::CliError);
        REQUIRE_THROWS_AS(Aapc::parseCliOptions({"test-folder", "--dir"}), Aapc::CliError);
        REQUIRE_THROWS_AS(Aapc::parseCliOptions({"compress", "a", "b", "--fast"}), Aapc::CliError);
    }
}
