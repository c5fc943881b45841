//
// Record tag decoding.
//

#include <oskar/tag.hh>
#include <oskar/exceptions.hh>
#include <oskar/layout.hh>
#include <ostream>

namespace oskar {

    namespace {
        const std::array<field_spec, 10> tag_fields{{
            {"marker0",              1, field_kind::ascii},
            {"marker1",              1, field_kind::ascii},
            {"marker2",              1, field_kind::ascii},
            {"payload_element_size", 1, field_kind::unsigned_int},
            {"chunk_flags",          1, field_kind::unsigned_int},
            {"payload_data_type",    1, field_kind::unsigned_int},
            {"group_id",             1, field_kind::unsigned_int},
            {"tag_id",               1, field_kind::unsigned_int},
            {"user_index",           4, field_kind::unsigned_int},
            {"payload_size",         8, field_kind::unsigned_int},
        }};

        char as_char(const std::vector<std::byte>& raw) {
            return static_cast<char>(raw.front());
        }
    }

    const layout& tag_layout() {
        static const layout schema(tag_fields);
        return schema;
    }

    tag parse_tag(const std::byte* data, std::size_t size) {
        const layout& schema = tag_layout();

        THROW_TRUNCATED_IF(size < tag_size, "Tag needs ", tag_size, " bytes, only ", size, " available");

        auto values = decode_layout(schema, data, size);

        tag t;
        t.marker0 = as_char(values.raw("marker0"));
        t.marker1 = as_char(values.raw("marker1"));
        t.marker2 = as_char(values.raw("marker2"));
        t.payload_element_size = static_cast<std::uint8_t>(values.number("payload_element_size"));
        t.chunk_flags = static_cast<std::uint8_t>(values.number("chunk_flags"));
        t.payload_data_type = static_cast<std::uint8_t>(values.number("payload_data_type"));
        t.group_id = static_cast<std::uint8_t>(values.number("group_id"));
        t.tag_id = static_cast<std::uint8_t>(values.number("tag_id"));
        t.user_index = static_cast<std::uint32_t>(values.number("user_index"));
        t.payload_size = values.number("payload_size");
        return t;
    }

    std::ostream& operator<<(std::ostream& os, const tag& t) {
        os << "tag{group=" << static_cast<unsigned>(t.group_id)
           << ", tag=" << static_cast<unsigned>(t.tag_id)
           << ", index=" << t.user_index
           << ", type=0x" << std::hex << static_cast<unsigned>(t.payload_data_type)
           << ", flags=0x" << static_cast<unsigned>(t.chunk_flags) << std::dec
           << ", element_size=" << static_cast<unsigned>(t.payload_element_size)
           << ", payload_size=" << t.payload_size << '}';
        return os;
    }

} // namespace oskar
