//
// File header decoding.
//

#include <oskar/file_header.hh>
#include <oskar/exceptions.hh>
#include <oskar/layout.hh>
#include <algorithm>
#include <ostream>
#include <sstream>

namespace oskar {

    namespace {
        const std::array<field_spec, 10> header_fields{{
            {"magic",            magic_size, field_kind::ascii},
            {"version",          1,  field_kind::unsigned_int},
            {"is_little_endian", 1,  field_kind::unsigned_int},
            {"void_ptr_size",    1,  field_kind::unsigned_int},
            {"int_size",         1,  field_kind::unsigned_int},
            {"long_size",        1,  field_kind::unsigned_int},
            {"float_size",       1,  field_kind::unsigned_int},
            {"double_size",      1,  field_kind::unsigned_int},
            {"app_version",      4,  field_kind::unsigned_int},
            {"reserved",         44, field_kind::raw},
        }};
        static_assert(magic_size + 7 + 4 + 44 == header_size);

        std::string printable(const std::vector<std::byte>& raw) {
            std::ostringstream oss;
            for (std::byte b : raw) {
                auto c = std::to_integer<unsigned char>(b);
                if (c >= 32 && c <= 126) {
                    oss << static_cast<char>(c);
                } else {
                    oss << "\\x" << std::hex << static_cast<unsigned>(c) << std::dec;
                }
            }
            return oss.str();
        }
    }

    const layout& header_layout() {
        static const layout schema(header_fields);
        return schema;
    }

    file_header parse_header(const std::byte* data, std::size_t size) {
        const layout& schema = header_layout();

        THROW_TRUNCATED_IF(size < header_size,
                           "File header needs ", header_size, " bytes, only ", size, " available");

        auto values = decode_layout(schema, data, size);

        const auto& magic = values.raw("magic");
        bool magic_ok = std::equal(magic.begin(), magic.end(), header_magic.begin(),
                                   [](std::byte b, char c) { return b == static_cast<std::byte>(c); });
        THROW_FORMAT_IF(!magic_ok, "Bad file signature '", printable(magic), "', expected 'OSKARBIN'");

        const auto& reserved = values.raw("reserved");
        auto nonzero = std::find_if(reserved.begin(), reserved.end(),
                                    [](std::byte b) { return b != std::byte{0}; });
        THROW_FORMAT_IF(nonzero != reserved.end(),
                        "Reserved header byte at offset ",
                        header_size - reserved.size() + static_cast<std::size_t>(nonzero - reserved.begin()),
                        " is not zero");

        file_header header;
        std::copy_n(header_magic.begin(), magic_size, header.magic.begin());
        header.version = static_cast<std::uint8_t>(values.number("version"));
        header.is_little_endian = static_cast<std::uint8_t>(values.number("is_little_endian"));
        header.void_ptr_size = static_cast<std::uint8_t>(values.number("void_ptr_size"));
        header.int_size = static_cast<std::uint8_t>(values.number("int_size"));
        header.long_size = static_cast<std::uint8_t>(values.number("long_size"));
        header.float_size = static_cast<std::uint8_t>(values.number("float_size"));
        header.double_size = static_cast<std::uint8_t>(values.number("double_size"));
        header.app_version = static_cast<std::uint32_t>(values.number("app_version"));
        return header;
    }

    std::string file_header::app_version_string() const {
        std::ostringstream oss;
        oss << ((app_version >> 16) & 0xFF) << '.'
            << ((app_version >> 8) & 0xFF) << '.'
            << (app_version & 0xFF);
        return oss.str();
    }

    std::ostream& operator<<(std::ostream& os, const file_header& header) {
        os << "file_header{version=" << static_cast<unsigned>(header.version)
           << ", little_endian=" << static_cast<unsigned>(header.is_little_endian)
           << ", sizes(void*,int,long,float,double)=("
           << static_cast<unsigned>(header.void_ptr_size) << ','
           << static_cast<unsigned>(header.int_size) << ','
           << static_cast<unsigned>(header.long_size) << ','
           << static_cast<unsigned>(header.float_size) << ','
           << static_cast<unsigned>(header.double_size) << ')'
           << ", app_version=" << header.app_version_string() << '}';
        return os;
    }

} // namespace oskar
