#include <catch2/catch_all.hpp>
#include "../BlockFraming.h"
#include "../CodecErrors.h"

using Aapc::ByteBuffer;

TEST_CASE("Block count", "[framing]") {
    REQUIRE(Aapc::blockCountFor(0) == 0);
    REQUIRE(Aapc::blockCountFor(1) == 1);
    REQUIRE(Aapc::blockCountFor(Aapc::kBlockSize) == 1);
    REQUIRE(Aapc::blockCountFor(Aapc::kBlockSize + 1) == 2);
    REQUIRE(Aapc::blockCountFor(3 * Aapc::kBlockSize) == 3);
}

TEST_CASE("Big-endian fields", "[framing]") {
    ByteBuffer out;
    Aapc::appendU32BE(out, 0x01020304u);
    Aapc::appendU32BE(out, 262144u);
    REQUIRE(out == ByteBuffer{1, 2, 3, 4, 0, 4, 0, 0});

    Aapc::ByteCursor cursor(out);
    REQUIRE(cursor.readU32BE("first") == 0x01020304u);
    REQUIRE(cursor.readU32BE("second") == 262144u);
    REQUIRE(cursor.remaining() == 0);
}

TEST_CASE("ByteCursor block limits", "[framing]") {
    ByteBuffer data{10, 20, 30, 40};
    Aapc::ByteCursor cursor(data);

    SECTION("Reads stop at the block end") {
        cursor.beginBlock(2);
        REQUIRE(cursor.readByte("a") == 10);
        REQUIRE(cursor.readByte("b") == 20);
        REQUIRE(cursor.atBlockEnd());
        REQUIRE_THROWS_AS(cursor.readByte("c"), Aapc::MalformedInput);

        cursor.endBlock();
        REQUIRE(cursor.remaining() == 2);
        REQUIRE(cursor.readByte("c") == 30);
    }

    SECTION("A block longer than the data is rejected") {
        REQUIRE_THROWS_AS(cursor.beginBlock(5), Aapc::MalformedInput);
    }

    SECTION("Failed reads do not move the cursor") {
        cursor.beginBlock(3);
        REQUIRE_THROWS_AS(cursor.readU32BE("field"), Aapc::MalformedInput);
        REQUIRE(cursor.position() == 0);
    }
}
