//
// Tag decoding and the data type sanity check
//

#include <doctest/doctest.h>
#include <oskar/tag.hh>
#include <oskar/exceptions.hh>
#include <sstream>
#include "test_utils.hh"

using namespace oskar;

TEST_CASE("tag - fields") {
    tag_fields f;
    f.chunk_flags = chunk_flag::crc32c;
    f.data_type = data_type::double_type | data_type::complex;
    f.payload_size = 0x0102030405060708ULL;
    f.group_id = 7;
    f.tag_id = 42;
    f.user_index = 0xA0B0C0D0;
    f.element_size = 16;
    auto bytes = make_tag(f);
    REQUIRE(bytes.size() == tag_size);

    auto t = parse_tag(bytes.data(), bytes.size());

    CHECK(t.marker0 == 'T');
    CHECK(t.marker1 == 'B');
    CHECK(t.marker2 == 'G');
    CHECK(t.has_valid_marker());
    CHECK(t.payload_element_size == 16);
    CHECK(t.chunk_flags == chunk_flag::crc32c);
    CHECK(t.payload_data_type == (data_type::double_type | data_type::complex));
    CHECK(t.group_id == 7);
    CHECK(t.tag_id == 42);
    CHECK(t.user_index == 0xA0B0C0D0);
    CHECK(t.payload_size == 0x0102030405060708ULL);
}

TEST_CASE("tag - chunk flag predicates") {
    tag t;
    CHECK_FALSE(t.is_payload_big_endian());
    CHECK_FALSE(t.uses_crc32c());
    CHECK_FALSE(t.is_extended());
    CHECK(t.payload_byte_order() == byte_order::little);

    t.chunk_flags = chunk_flag::big_endian;
    CHECK(t.is_payload_big_endian());
    CHECK(t.payload_byte_order() == byte_order::big);

    t.chunk_flags = chunk_flag::crc32c;
    CHECK(t.uses_crc32c());
    CHECK_FALSE(t.is_payload_big_endian());

    t.chunk_flags = chunk_flag::extended;
    CHECK(t.is_extended());

    t.chunk_flags = 0xFF;
    CHECK(t.is_payload_big_endian());
    CHECK(t.uses_crc32c());
    CHECK(t.is_extended());
}

TEST_CASE("tag - data type predicates") {
    tag t;
    t.payload_data_type = data_type::char_type;
    CHECK(t.is_char());
    CHECK_FALSE(t.is_int());

    t.payload_data_type = data_type::int_type;
    CHECK(t.is_int());

    t.payload_data_type = data_type::float_type | data_type::matrix;
    CHECK(t.is_float());
    CHECK(t.is_matrix());
    CHECK_FALSE(t.is_complex());

    t.payload_data_type = data_type::double_type | data_type::complex | data_type::matrix;
    CHECK(t.is_double());
    CHECK(t.is_complex());
    CHECK(t.is_matrix());
    CHECK(t.is_sane());
}

TEST_CASE("tag - population count") {
    CHECK(population_count(0) == 0);
    CHECK(population_count(1) == 1);
    CHECK(population_count(0b1010'1010) == 4);
    CHECK(population_count(0xFF) == 8);
    static_assert(population_count(0b0000'1001) == 2);
}

TEST_CASE("tag - sanity holds exactly for one base bit and clear reserved bits") {
    int sane_count = 0;
    for (int value = 0; value < 256; ++value) {
        auto b = static_cast<std::uint8_t>(value);

        int base_bits = 0;
        for (int bit = 0; bit < 4; ++bit) {
            base_bits += (b >> bit) & 1;
        }
        bool reserved_clear = (b & 0x10) == 0 && (b & 0x80) == 0;
        bool expected = base_bits == 1 && reserved_clear;

        tag t;
        t.payload_data_type = b;
        CAPTURE(value);
        CHECK(t.is_sane() == expected);
        CHECK(is_sane_data_type(b) == expected);
        sane_count += expected ? 1 : 0;
    }
    // 4 base types x complex x matrix
    CHECK(sane_count == 16);
}

TEST_CASE("tag - reserved bit with char type is not sane") {
    tag t;
    t.payload_data_type = 0b1000'0001;
    CHECK(t.is_char());
    CHECK_FALSE(t.is_sane());
}

TEST_CASE("tag - markers") {
    tag_fields f;
    f.marker1 = 'A';
    auto legacy = make_tag(f);
    CHECK(parse_tag(legacy.data(), legacy.size()).has_valid_marker());

    auto bytes = make_tag(tag_fields{});
    bytes[0] = std::byte{'X'};
    auto t = parse_tag(bytes.data(), bytes.size());
    CHECK(t.marker0 == 'X');
    CHECK_FALSE(t.has_valid_marker());
}

TEST_CASE("tag - short input") {
    auto bytes = make_tag(tag_fields{});
    CHECK_THROWS_AS(parse_tag(bytes.data(), 19), truncated_file_error);
    CHECK_NOTHROW(parse_tag(bytes.data(), 20));
}

TEST_CASE("tag - stream output") {
    tag_fields f;
    f.data_type = data_type::int_type;
    f.chunk_flags = chunk_flag::crc32c;
    f.payload_size = 12;
    f.group_id = 3;
    f.tag_id = 4;
    f.user_index = 5;
    f.element_size = 4;
    auto bytes = make_tag(f);

    std::ostringstream oss;
    oss << parse_tag(bytes.data(), bytes.size());
    CHECK(oss.str() == "tag{group=3, tag=4, index=5, type=0x2, flags=0x40, element_size=4, payload_size=12}");
}
