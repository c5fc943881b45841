//
// Interpretation of the payload data type bit field.
//

#include <oskar/type_descriptor.hh>
#include <oskar/exceptions.hh>
#include <oskar/tag.hh>

namespace oskar {

    const char* to_string(element_type type) {
        switch (type) {
            case element_type::char_type:
                return "char";
            case element_type::int32:
                return "int";
            case element_type::float32:
                return "float";
            case element_type::float64:
                return "double";
        }
        return "unknown";
    }

    type_descriptor::type_descriptor(std::uint8_t payload_data_type)
        : m_bits(payload_data_type)
        , m_base(element_type::char_type)
        , m_complex((payload_data_type & data_type::complex) != 0)
        , m_matrix((payload_data_type & data_type::matrix) != 0) {
        if (!is_sane_data_type(payload_data_type)) {
            THROW_TYPE_DESCRIPTOR("Payload data type 0x", std::hex, static_cast<unsigned>(payload_data_type),
                                  std::dec, " must have exactly one base type bit set and bits 4 and 7 clear");
        }

        if (payload_data_type & data_type::char_type) {
            m_base = element_type::char_type;
        } else if (payload_data_type & data_type::int_type) {
            m_base = element_type::int32;
        } else if (payload_data_type & data_type::float_type) {
            m_base = element_type::float32;
        } else {
            m_base = element_type::float64;
        }
    }

    type_descriptor type_descriptor::from_tag(const tag& t) {
        return type_descriptor(t.payload_data_type);
    }

    std::size_t type_descriptor::base_size() const {
        switch (m_base) {
            case element_type::char_type:
                return 1;
            case element_type::int32:
            case element_type::float32:
                return 4;
            case element_type::float64:
                return 8;
        }
        return 1;
    }

    std::size_t type_descriptor::shape_multiplier() const {
        return (m_complex ? 2 : 1) * (m_matrix ? 4 : 1);
    }

    std::string type_descriptor::describe() const {
        std::string text = std::to_string(base_size()) + " byte " + to_string(m_base) + " type";
        if (m_complex) {
            text += ", complex";
        }
        if (m_matrix) {
            text += ", 2x2 matrix";
        }
        return text;
    }

} // namespace oskar
