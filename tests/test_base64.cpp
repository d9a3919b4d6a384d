#include <catch2/catch_test_macros.hpp>
#include "core/base64.hpp"
#include "core/utf16.hpp"

#include <string>
#include <vector>

using namespace tracesdk;

namespace {

std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // anonymous namespace

// ============================================================================
// Base64
// ============================================================================

TEST_CASE("Base64: encodes with padding", "[base64]") {
    CHECK(base64::encode(bytes_of("")) == "");
    CHECK(base64::encode(bytes_of("f")) == "Zg==");
    CHECK(base64::encode(bytes_of("fo")) == "Zm8=");
    CHECK(base64::encode(bytes_of("foo")) == "Zm9v");
    CHECK(base64::encode(bytes_of("foobar")) == "Zm9vYmFy");
}

TEST_CASE("Base64: strict decode accepts canonical input", "[base64]") {
    auto decoded = base64::decode_strict("Zm9vYg==");
    REQUIRE(decoded.has_value());
    CHECK(*decoded == bytes_of("foob"));
}

TEST_CASE("Base64: strict decode rejects malformed input", "[base64]") {
    CHECK_FALSE(base64::decode_strict("Zm9vYg=").has_value());   // length not multiple of 4
    CHECK_FALSE(base64::decode_strict("Zm9v!A==").has_value());  // foreign character
    CHECK_FALSE(base64::decode_strict("Zm===").has_value());
    CHECK_FALSE(base64::decode_strict("Z===").has_value());      // three padding chars
    CHECK_FALSE(base64::decode_strict("Zm=v").has_value());      // padding in the middle
}

TEST_CASE("Base64: lenient decode skips line breaks", "[base64]") {
    CHECK(base64::decode("Zm9v\nYmFy") == bytes_of("foobar"));
}

// ============================================================================
// UTF-16LE conversion
// ============================================================================

TEST_CASE("Utf16: ASCII becomes little-endian code units", "[utf16]") {
    auto bytes = utf16::from_utf8("{a}");
    REQUIRE(bytes.has_value());
    CHECK(*bytes == std::vector<uint8_t>{'{', 0, 'a', 0, '}', 0});
}

TEST_CASE("Utf16: non-ASCII text and surrogate pairs", "[utf16]") {
    // U+00E9, U+20AC, U+1F600
    const std::string text = "\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80";
    auto bytes = utf16::from_utf8(text);
    REQUIRE(bytes.has_value());
    CHECK(*bytes == std::vector<uint8_t>{0xE9, 0x00, 0xAC, 0x20, 0x3D, 0xD8, 0x00, 0xDE});
    CHECK(base64::encode(*bytes) == "6QCsID3YAN4=");

    auto back = utf16::to_utf8(*bytes);
    REQUIRE(back.has_value());
    CHECK(*back == text);
}

TEST_CASE("Utf16: rejects malformed UTF-8", "[utf16]") {
    CHECK_FALSE(utf16::from_utf8("\xC3").has_value());              // truncated
    CHECK_FALSE(utf16::from_utf8("\x80").has_value());              // stray continuation
    CHECK_FALSE(utf16::from_utf8("\xC0\xAF").has_value());          // overlong
    CHECK_FALSE(utf16::from_utf8("\xED\xA0\x80").has_value());      // encoded surrogate
    CHECK_FALSE(utf16::from_utf8("\xF4\x90\x80\x80").has_value());  // above U+10FFFF
}

TEST_CASE("Utf16: rejects odd length and unpaired surrogates", "[utf16]") {
    CHECK_FALSE(utf16::to_utf8({0x41}).has_value());
    CHECK_FALSE(utf16::to_utf8({0x3D, 0xD8}).has_value());
    CHECK_FALSE(utf16::to_utf8({0x00, 0xDE, 0x41, 0x00}).has_value());
}
