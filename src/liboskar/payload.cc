//
// Payload decoding: UTF-8 text or flat sequences of numbers.
//

#include <oskar/payload.hh>
#include <oskar/byte_order.hh>
#include <oskar/exceptions.hh>
#include <oskar/tag.hh>
#include <oskar/type_descriptor.hh>
#include <ostream>
#include <type_traits>

namespace oskar {

    namespace {
        template<typename T>
        std::vector<T> decode_numbers(const std::byte* data, std::size_t size, byte_order bo) {
            std::vector<T> values(size / sizeof(T));
            for (std::size_t i = 0; i < values.size(); ++i) {
                values[i] = load<T>(data + i * sizeof(T), bo);
            }
            return values;
        }

        std::string decode_text(const std::byte* data, std::size_t size) {
            if (!is_valid_utf8(data, size)) {
                THROW_DECODE("Char payload of ", size, " bytes is not valid UTF-8");
            }

            // C producers write the terminating NUL
            while (size > 0 && data[size - 1] == std::byte{0}) {
                --size;
            }

            std::string text;
            text.reserve(size);
            for (std::size_t i = 0; i < size; ++i) {
                text.push_back(std::to_integer<char>(data[i]));
            }
            return text;
        }
    }

    bool is_valid_utf8(const std::byte* data, std::size_t size) {
        std::size_t i = 0;
        while (i < size) {
            auto c = std::to_integer<unsigned char>(data[i]);
            if (c < 0x80) {
                ++i;
                continue;
            }

            std::size_t extra;
            std::uint32_t code_point;
            std::uint32_t min_value;
            if ((c & 0xE0) == 0xC0) {
                extra = 1;
                code_point = c & 0x1F;
                min_value = 0x80;
            } else if ((c & 0xF0) == 0xE0) {
                extra = 2;
                code_point = c & 0x0F;
                min_value = 0x800;
            } else if ((c & 0xF8) == 0xF0) {
                extra = 3;
                code_point = c & 0x07;
                min_value = 0x10000;
            } else {
                return false;
            }

            if (size - i <= extra) {
                return false;
            }
            for (std::size_t k = 1; k <= extra; ++k) {
                auto cont = std::to_integer<unsigned char>(data[i + k]);
                if ((cont & 0xC0) != 0x80) {
                    return false;
                }
                code_point = (code_point << 6) | (cont & 0x3F);
            }

            if (code_point < min_value || code_point > 0x10FFFF ||
                (code_point >= 0xD800 && code_point <= 0xDFFF)) {
                return false;
            }
            i += extra + 1;
        }
        return true;
    }

    decoded_value decode_payload(const tag& t, const std::byte* data, std::size_t size) {
        auto type = type_descriptor::from_tag(t);

        if (type.base() == element_type::char_type) {
            return decode_text(data, size);
        }

        const std::size_t element_size = type.element_size();
        THROW_DECODE_IF(size % element_size != 0,
                        "Payload of ", size, " bytes is not a multiple of the ", element_size,
                        " byte element size (", type.describe(), ")");

        const byte_order bo = t.payload_byte_order();
        switch (type.base()) {
            case element_type::int32:
                return decode_numbers<std::int32_t>(data, size, bo);
            case element_type::float32:
                return decode_numbers<float>(data, size, bo);
            case element_type::float64:
                return decode_numbers<double>(data, size, bo);
            case element_type::char_type:
                break;
        }
        THROW_DECODE("Unhandled element type ", to_string(type.base()));
    }

    std::size_t value_count(const decoded_value& value) {
        return std::visit([](const auto& v) { return v.size(); }, value);
    }

    void print_value(std::ostream& os, const decoded_value& value, std::size_t max_values) {
        std::visit([&os, max_values](const auto& v) {
            using value_t = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<value_t, std::string>) {
                os << '"' << v << '"';
            } else {
                os << '[';
                for (std::size_t i = 0; i < v.size() && i < max_values; ++i) {
                    if (i > 0) {
                        os << ", ";
                    }
                    os << v[i];
                }
                if (v.size() > max_values) {
                    os << ", ... (" << v.size() << " values)";
                }
                os << ']';
            }
        }, value);
    }

} // namespace oskar
