/**
 * @file test_byte_buffer.cpp
 * @brief Unit tests for the little-endian payload codec.
 */

#include <catch2/catch_test_macros.hpp>

#include <modbridge/core/byte_buffer.hpp>

using namespace modbridge::core;

// =============================================================================
// Layout
// =============================================================================

TEST_CASE("ByteWriter writes little-endian integers", "[core][bytes]") {
    ByteWriter w;
    w.write_u16(0x1234);
    w.write_u32(0xAABBCCDD);

    auto data = w.data();
    REQUIRE(data.size() == 6);
    REQUIRE(data[0] == 0x34);
    REQUIRE(data[1] == 0x12);
    REQUIRE(data[2] == 0xDD);
    REQUIRE(data[5] == 0xAA);
}

TEST_CASE("f32 layout matches string.pack(\"<f\")", "[core][bytes]") {
    // 1.0f is 0x3F800000
    ByteWriter w;
    w.write_f32(1.0f);

    auto data = w.data();
    REQUIRE(data.size() == 4);
    REQUIRE(data[0] == 0x00);
    REQUIRE(data[1] == 0x00);
    REQUIRE(data[2] == 0x80);
    REQUIRE(data[3] == 0x3F);
}

TEST_CASE("ByteReader reads what ByteWriter wrote", "[core][bytes]") {
    ByteWriter w;
    w.write_i32(-7);
    w.write_f64(2.5);
    w.write_bool(true);
    w.write_string("mod");

    auto bytes = w.take();
    ByteReader r(bytes);
    REQUIRE(r.read_i32() == -7);
    REQUIRE(r.read_f64() == 2.5);
    REQUIRE(r.read_bool());
    REQUIRE(r.read_string() == "mod");
    REQUIRE(r.at_end());
    REQUIRE_NOTHROW(r.expect_end());
}

// =============================================================================
// Malformed input
// =============================================================================

TEST_CASE("ByteReader rejects malformed payloads", "[core][bytes]") {
    SECTION("truncated") {
        std::uint8_t raw[] = {0x01, 0x02};
        ByteReader r(raw);
        REQUIRE_THROWS_AS(r.read_u32(), ByteBufferError);
    }

    SECTION("bool out of range") {
        std::uint8_t raw[] = {0x02};
        ByteReader r(raw);
        REQUIRE_THROWS_AS(r.read_bool(), ByteBufferError);
    }

    SECTION("trailing bytes") {
        std::uint8_t raw[] = {0x01, 0x00, 0xFF};
        ByteReader r(raw);
        REQUIRE(r.read_u16() == 1);
        REQUIRE(r.remaining() == 1);
        REQUIRE_THROWS_AS(r.expect_end(), ByteBufferError);
    }

    SECTION("string longer than payload") {
        std::uint8_t raw[] = {0x10, 0x00, 'a'};
        ByteReader r(raw);
        REQUIRE_THROWS_AS(r.read_string(), ByteBufferError);
    }
}
