//
// Schema driven decoding of fixed little-endian blocks
//

#include <doctest/doctest.h>
#include <oskar/layout.hh>
#include <oskar/exceptions.hh>
#include <oskar/file_header.hh>
#include <oskar/tag.hh>
#include <sstream>
#include <stdexcept>
#include "test_utils.hh"

using namespace oskar;

namespace {
    const std::array<field_spec, 5> sample_fields{{
        {"id",      2, field_kind::ascii},
        {"small",   1, field_kind::unsigned_int},
        {"medium",  2, field_kind::unsigned_int},
        {"large",   8, field_kind::unsigned_int},
        {"padding", 3, field_kind::raw},
    }};
    const layout sample_layout(sample_fields);

    bytes_t sample_block() {
        bytes_t block = bytes_of("ID");
        put_le(block, 0xAB, 1);
        put_le(block, 0x1234, 2);
        put_le(block, 0x0102030405060708ULL, 8);
        put_le(block, 0, 3);
        return block;
    }
}

TEST_CASE("layout - schema") {
    CHECK(sample_layout.field_count() == 5);
    CHECK(sample_layout.byte_size() == 16);
    CHECK(header_layout().byte_size() == header_size);
    CHECK(tag_layout().byte_size() == tag_size);
    CHECK(tag_layout().field_count() == 10);
}

TEST_CASE("layout - decode") {
    auto block = sample_block();
    auto values = decode_layout(sample_layout, block.data(), block.size());

    REQUIRE(values.size() == 5);
    CHECK(values.text("id") == "ID");
    CHECK(values.number("small") == 0xAB);
    CHECK(values.number("medium") == 0x1234);
    CHECK(values.number("large") == 0x0102030405060708ULL);
    CHECK(values.raw("padding").size() == 3);
    CHECK(values.raw("medium") == bytes_t{std::byte{0x34}, std::byte{0x12}});

    std::size_t expected_offset = 0;
    for (const auto& value : values) {
        CHECK(value.offset == expected_offset);
        expected_offset += value.spec->width;
    }
}

TEST_CASE("layout - longer input is fine") {
    auto block = sample_block();
    block.push_back(std::byte{0xFF});
    auto values = decode_layout(sample_layout, block.data(), block.size());
    CHECK(values.number("large") == 0x0102030405060708ULL);
}

TEST_CASE("layout - text stops at NUL") {
    const std::array<field_spec, 1> fields{{{"name", 6, field_kind::ascii}}};
    const layout schema(fields);

    auto block = bytes_of(std::string("ab\0cd\0", 6));
    auto values = decode_layout(schema, block.data(), block.size());
    CHECK(values.text("name") == "ab");
    CHECK(values.raw("name").size() == 6);
}

TEST_CASE("layout - errors") {
    auto block = sample_block();
    CHECK_THROWS_AS(decode_layout(sample_layout, block.data(), 15), truncated_file_error);

    auto values = decode_layout(sample_layout, block.data(), block.size());
    CHECK_THROWS_AS(values.number("missing"), std::out_of_range);
    CHECK_THROWS_AS(values.text(""), std::out_of_range);
}

TEST_CASE("layout - print") {
    auto block = sample_block();
    auto values = decode_layout(sample_layout, block.data(), block.size());

    std::ostringstream oss;
    print_layout(oss, values);
    CHECK(oss.str() ==
          "  id='ID'\n"
          "  small=171\n"
          "  medium=4660\n"
          "  large=72623859790382856\n"
          "  padding=[3 bytes, zero]\n");
}

TEST_CASE("layout - print header fields") {
    auto header = make_header(2, 0x00020001);
    auto values = decode_layout(header_layout(), header.data(), header.size());

    std::ostringstream oss;
    print_layout(oss, values, "");
    CHECK(oss.str() ==
          "magic='OSKARBIN'\n"
          "version=2\n"
          "is_little_endian=1\n"
          "void_ptr_size=8\n"
          "int_size=4\n"
          "long_size=8\n"
          "float_size=4\n"
          "double_size=8\n"
          "app_version=131073\n"
          "reserved=[44 bytes, zero]\n");
}

TEST_CASE("layout - print non-zero raw field") {
    auto block = sample_block();
    block.back() = std::byte{1};
    auto values = decode_layout(sample_layout, block.data(), block.size());

    std::ostringstream oss;
    print_layout(oss, values);
    CHECK(oss.str().find("padding=[3 bytes]") != std::string::npos);
}
