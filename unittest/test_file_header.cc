//
// File header decoding
//

#include <doctest/doctest.h>
#include <oskar/file_header.hh>
#include <oskar/exceptions.hh>
#include <algorithm>
#include <sstream>
#include "test_utils.hh"

using namespace oskar;

TEST_CASE("file header - well formed header") {
    auto bytes = make_header(2, 0x00020001, 1);
    REQUIRE(bytes.size() == header_size);

    auto header = parse_header(bytes.data(), bytes.size());

    CHECK(header.magic == header_magic);
    CHECK(header.version == 2);
    CHECK(header.is_little_endian == 1);
    CHECK(header.void_ptr_size == 8);
    CHECK(header.int_size == 4);
    CHECK(header.long_size == 8);
    CHECK(header.float_size == 4);
    CHECK(header.double_size == 8);
    CHECK(header.app_version == 0x00020001);
    CHECK(header.app_version_string() == "2.0.1");
    CHECK(header.expects_crc());
    CHECK(header.writer_byte_order() == byte_order::little);
}

TEST_CASE("file header - fields round trip") {
    for (std::uint8_t version : {0, 1, 2, 3, 255}) {
        for (std::uint32_t app : {0u, 0x00020B07u, 0xFFFFFFFFu}) {
            auto bytes = make_header(version, app, 0);
            auto header = parse_header(bytes.data(), bytes.size());
            CHECK(header.version == version);
            CHECK(header.app_version == app);
            CHECK(header.is_little_endian == 0);
            CHECK(header.writer_byte_order() == byte_order::big);
            CHECK(header.expects_crc() == (version >= 2));
        }
    }
}

TEST_CASE("file header - numeric fields ignore the endianness flag") {
    // The flag describes the writer, the header itself is always little-endian
    auto bytes = make_header(2, 0x01020304, 0);
    auto header = parse_header(bytes.data(), bytes.size());
    CHECK(header.app_version == 0x01020304);
}

TEST_CASE("file header - bad signature") {
    SUBCASE("wrong text") {
        auto bytes = make_header();
        bytes[0] = std::byte{'X'};
        CHECK_THROWS_AS(parse_header(bytes.data(), bytes.size()), format_error);
    }
    SUBCASE("missing terminator") {
        auto bytes = make_header();
        bytes[8] = std::byte{'!'};
        CHECK_THROWS_AS(parse_header(bytes.data(), bytes.size()), format_error);
    }
    SUBCASE("other container format") {
        auto bytes = make_header();
        auto riff = bytes_of("RIFF");
        std::copy(riff.begin(), riff.end(), bytes.begin());
        CHECK_THROWS_AS(parse_header(bytes.data(), bytes.size()), format_error);
    }
}

TEST_CASE("file header - reserved bytes must be zero") {
    for (std::size_t pos = 20; pos < header_size; ++pos) {
        auto bytes = make_header();
        bytes[pos] = std::byte{1};
        CHECK_THROWS_AS(parse_header(bytes.data(), bytes.size()), format_error);
    }
}

TEST_CASE("file header - error message names the offending byte") {
    auto bytes = make_header();
    bytes[42] = std::byte{0x7F};
    try {
        parse_header(bytes.data(), bytes.size());
        FAIL("expected format_error");
    } catch (const format_error& e) {
        CHECK(std::string(e.what()).find("42") != std::string::npos);
    }
}

TEST_CASE("file header - short input") {
    auto bytes = make_header();
    CHECK_THROWS_AS(parse_header(bytes.data(), 63), truncated_file_error);
    CHECK_THROWS_AS(parse_header(bytes.data(), 0), truncated_file_error);
    // Both are parse errors
    CHECK_THROWS_AS(parse_header(bytes.data(), 10), parse_error);
}

TEST_CASE("file header - stream output") {
    auto bytes = make_header(2, 0x00020001);
    auto header = parse_header(bytes.data(), bytes.size());

    std::ostringstream oss;
    oss << header;
    CHECK(oss.str() == "file_header{version=2, little_endian=1, "
                       "sizes(void*,int,long,float,double)=(8,4,8,4,8), app_version=2.0.1}");
}
