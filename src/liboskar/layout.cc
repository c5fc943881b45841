//
// Generic decoding of fixed-size little-endian blocks.
//

#include <oskar/layout.hh>
#include <oskar/exceptions.hh>
#include <algorithm>
#include <ostream>
#include <stdexcept>

namespace oskar {

    std::size_t layout::byte_size() const {
        std::size_t total = 0;
        for (const auto& field : *this) {
            total += field.width;
        }
        return total;
    }

    layout_values decode_layout(const layout& schema, const std::byte* data, std::size_t size) {
        const std::size_t required = schema.byte_size();
        THROW_TRUNCATED_IF(size < required, "Need ", required, " bytes, only ", size, " available");

        std::vector<field_value> values;
        values.reserve(schema.field_count());

        std::size_t offset = 0;
        for (const auto& spec : schema) {
            field_value value;
            value.spec = &spec;
            value.offset = offset;
            value.raw.assign(data + offset, data + offset + spec.width);

            if (spec.kind == field_kind::unsigned_int) {
                // Little-endian, any width up to 8 bytes
                for (std::size_t i = std::min<std::size_t>(spec.width, 8); i > 0; --i) {
                    value.number = (value.number << 8) | std::to_integer<std::uint64_t>(value.raw[i - 1]);
                }
            }

            offset += spec.width;
            values.push_back(std::move(value));
        }

        return layout_values(std::move(values));
    }

    const field_value& layout_values::find(std::string_view name) const {
        auto it = std::find_if(m_values.begin(), m_values.end(), [name](const field_value& v) {
            return v.spec->name == name;
        });
        if (it == m_values.end()) {
            throw std::out_of_range("No field named '" + std::string(name) + "'");
        }
        return *it;
    }

    std::uint64_t layout_values::number(std::string_view name) const {
        return find(name).number;
    }

    std::string layout_values::text(std::string_view name) const {
        const auto& raw = find(name).raw;
        std::string result;
        for (std::byte b : raw) {
            if (b == std::byte{0}) {
                break;
            }
            result.push_back(static_cast<char>(b));
        }
        return result;
    }

    const std::vector<std::byte>& layout_values::raw(std::string_view name) const {
        return find(name).raw;
    }

    void print_layout(std::ostream& os, const layout_values& values, std::string_view indent) {
        for (const auto& value : values) {
            os << indent << value.spec->name << '=';
            switch (value.spec->kind) {
                case field_kind::ascii:
                    os << '\'' << values.text(value.spec->name) << '\'';
                    break;
                case field_kind::unsigned_int:
                    os << value.number;
                    break;
                case field_kind::raw: {
                    bool zero = std::all_of(value.raw.begin(), value.raw.end(),
                                            [](std::byte b) { return b == std::byte{0}; });
                    os << '[' << value.raw.size() << " bytes" << (zero ? ", zero" : "") << ']';
                    break;
                }
            }
            os << '\n';
        }
    }

} // namespace oskar
