#include <catch2/catch_all.hpp>
#include "../BlockRleStrategy.h"

using Aapc::ByteBuffer;

TEST_CASE("Encoder output format", "[codec][encode]") {

    SECTION("Empty input is a zero block count and nothing else") {
        REQUIRE(Aapc::compress({}) == ByteBuffer{0, 0, 0, 0});
        REQUIRE(Aapc::decompress(ByteBuffer{0, 0, 0, 0}).empty());
    }

    SECTION("Plain bytes are stored as themselves") {
        ByteBuffer expected{0, 0, 0, 1, 0, 0, 0, 3, 'a', 'b', 'c'};
        REQUIRE(Aapc::compress({'a', 'b', 'c'}) == expected);
    }

    SECTION("Flag bytes are escaped") {
        REQUIRE(Aapc::compress({254}) == ByteBuffer{0, 0, 0, 1, 0, 0, 0, 2, 255, 254});
        REQUIRE(Aapc::compress({255}) == ByteBuffer{0, 0, 0, 1, 0, 0, 0, 2, 255, 255});
    }

    SECTION("A run of three flag bytes uses a run token") {
        REQUIRE(Aapc::compress({254, 254, 254}) == ByteBuffer{0, 0, 0, 1, 0, 0, 0, 3, 254, 3, 254});
        REQUIRE(Aapc::compress({255, 255, 255}) == ByteBuffer{0, 0, 0, 1, 0, 0, 0, 3, 254, 3, 255});
    }

    SECTION("Two equal bytes stay literals") {
        REQUIRE(Aapc::compress({7, 7}) == ByteBuffer{0, 0, 0, 1, 0, 0, 0, 2, 7, 7});
        REQUIRE(Aapc::compress({255, 255}) == ByteBuffer{0, 0, 0, 1, 0, 0, 0, 4, 255, 255, 255, 255});
    }

    SECTION("255 equal bytes make exactly one run token") {
        ByteBuffer input(255, 'A');
        REQUIRE(Aapc::compress(input) == ByteBuffer{0, 0, 0, 1, 0, 0, 0, 3, 254, 255, 'A'});
    }

    SECTION("256 equal bytes split into a full run and a literal") {
        ByteBuffer input(256, 'A');
        REQUIRE(Aapc::compress(input) == ByteBuffer{0, 0, 0, 1, 0, 0, 0, 4, 254, 255, 'A', 'A'});
    }

    SECTION("Runs mixed with literals") {
        ByteBuffer input{1, 2, 2, 2, 2, 3, 254, 9, 9, 9};
        ByteBuffer expected{0, 0, 0, 1, 0, 0, 0, 10, 1, 254, 4, 2, 3, 255, 254, 254, 3, 9};
        REQUIRE(Aapc::compress(input) == expected);
    }
}

TEST_CASE("Block splitting", "[codec][blocks]") {

    SECTION("Exactly one block size is one block") {
        ByteBuffer input(Aapc::kBlockSize, 0x42);
        auto encoded = Aapc::compress(input);
        REQUIRE(ByteBuffer(encoded.begin(), encoded.begin() + 4) == ByteBuffer{0, 0, 0, 1});
        REQUIRE(Aapc::decompress(encoded) == input);
    }

    SECTION("A run crossing the block boundary is cut at the boundary") {
        ByteBuffer input(Aapc::kBlockSize + 1, 9);
        auto encoded = Aapc::compress(input);

        // First block: 1028 runs of 255 plus one run of 4, i.e. 1029 run tokens.
        const std::size_t first_payload = 1029 * 3;
        REQUIRE(encoded.size() == 4 + 4 + first_payload + 4 + 1);
        REQUIRE(ByteBuffer(encoded.begin(), encoded.begin() + 4) == ByteBuffer{0, 0, 0, 2});
        REQUIRE(ByteBuffer(encoded.begin() + 4, encoded.begin() + 8) == ByteBuffer{0, 0, 0x0C, 0x0F});

        const std::size_t second = 8 + first_payload;
        REQUIRE(encoded[second - 3] == 254);
        REQUIRE(encoded[second - 2] == 4);
        REQUIRE(ByteBuffer(encoded.begin() + second, encoded.end()) == ByteBuffer{0, 0, 0, 1, 9});

        REQUIRE(Aapc::decompress(encoded) == input);
    }

    SECTION("Lengths around the block size round-trip") {
        for (std::size_t length : {Aapc::kBlockSize - 1, Aapc::kBlockSize, Aapc::kBlockSize + 1,
                                   2 * Aapc::kBlockSize}) {
            ByteBuffer input(length);
            for (std::size_t i = 0; i < length; ++i) {
                input[i] = static_cast<unsigned char>((i / 5) * 31);
            }
            REQUIRE(Aapc::decompress(Aapc::compress(input)) == input);
        }
    }
}

TEST_CASE("Tokenizer", "[codec][tokens]") {

    SECTION("Long runs are capped at 255") {
        ByteBuffer input(600, 'z');
        auto tokens = Aapc::tokenizeBlock(input, 0, input.size());
        REQUIRE(tokens.size() == 3);
        REQUIRE(std::get<Aapc::RunToken>(tokens[0]).length == 255);
        REQUIRE(std::get<Aapc::RunToken>(tokens[1]).length == 255);
        REQUIRE(std::get<Aapc::RunToken>(tokens[2]).length == 90);
    }

    SECTION("A leftover of two after a capped run becomes two literals") {
        ByteBuffer input(257, 254);
        auto tokens = Aapc::tokenizeBlock(input, 0, input.size());
        REQUIRE(tokens.size() == 3);
        REQUIRE(std::holds_alternative<Aapc::RunToken>(tokens[0]));
        REQUIRE(std::holds_alternative<Aapc::EscapedToken>(tokens[1]));
        REQUIRE(std::holds_alternative<Aapc::EscapedToken>(tokens[2]));
    }

    SECTION("Runs stop at the end of the range") {
        ByteBuffer input(10, 5);
        auto tokens = Aapc::tokenizeBlock(input, 2, 4);
        REQUIRE(tokens.size() == 2);
        REQUIRE(std::get<Aapc::LiteralToken>(tokens[0]).value == 5);
    }

    SECTION("Token serialisation") {
        ByteBuffer out;
        Aapc::appendToken(out, Aapc::LiteralToken{17});
        Aapc::appendToken(out, Aapc::EscapedToken{255});
        Aapc::appendToken(out, Aapc::RunToken{42, 0});
        REQUIRE(out == ByteBuffer{17, 255, 255, 254, 42, 0});
    }
}

TEST_CASE("Compression size", "[codec][size]") {

    SECTION("Highly repetitive input shrinks substantially") {
        ByteBuffer input(300000, 0);
        auto encoded = Aapc::compress(input);
        REQUIRE(encoded.size() * 50 < input.size());
        REQUIRE(Aapc::decompress(encoded) == input);
    }

    SECTION("Alternating flag bytes at most double plus framing") {
        ByteBuffer input(100000);
        for (std::size_t i = 0; i < input.size(); ++i) {
            input[i] = (i % 2 == 0) ? 254 : 255;
        }
        auto encoded = Aapc::compress(input);
        REQUIRE(encoded.size() == 2 * input.size() + 8);
        REQUIRE(Aapc::decompress(encoded) == input);
    }

    SECTION("Bytes without repeats or flags cost only the framing") {
        ByteBuffer input;
        for (int i = 0; i < 254; ++i) input.push_back(static_cast<unsigned char>(i));
        REQUIRE(Aapc::compress(input).size() == input.size() + 8);
    }
}

TEST_CASE("BlockRleStrategy through the interface", "[codec][strategy]") {
    Aapc::BlockRleStrategy strategy;
    const Aapc::IEncodingStrategy& codec = strategy;

    ByteBuffer original;
    for (int i = 0; i < 5000; ++i) {
        original.push_back(static_cast<unsigned char>((i * i) % 7 == 0 ? 255 : i % 13));
    }

    SECTION("Encode matches the free function") {
        REQUIRE(codec.encode(original) == Aapc::compress(original));
    }

    SECTION("Encode and Decode returns original bytes") {
        REQUIRE(codec.decode(codec.encode(original)) == original);
    }
}
