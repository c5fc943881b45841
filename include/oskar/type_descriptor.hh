/**
 * @file type_descriptor.hh
 * @brief Semantic element type and shape of a payload
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <oskar/export_oskar.h>

namespace oskar {

    struct tag;

    /**
     * @enum element_type
     * @brief Base scalar type of a payload
     */
    enum class element_type {
        char_type, ///< 1 byte character (UTF-8 text)
        int32,     ///< 4 byte signed integer
        float32,   ///< 4 byte IEEE float
        float64    ///< 8 byte IEEE double
    };

    OSKAR_EXPORT const char* to_string(element_type type);

    /**
     * @class type_descriptor
     * @brief Interpretation of a sane payload data type bit field
     *
     * A complex element is a (real, imaginary) pair and a matrix element
     * is a 2x2 block [a, b, c, d] in row-major order. A complex matrix is
     * stored matrix-major with every cell a (real, imaginary) pair:
     * [a_re, a_im, b_re, b_im, c_re, c_im, d_re, d_im].
     */
    class OSKAR_EXPORT type_descriptor {
    public:
        /**
         * @brief Validate and interpret a data type bit field
         * @throws invalid_type_descriptor_error if the field is not sane
         */
        explicit type_descriptor(std::uint8_t payload_data_type);

        /// Same as the bit field constructor, using tag.payload_data_type
        static type_descriptor from_tag(const tag& t);

        [[nodiscard]] element_type base() const { return m_base; }
        [[nodiscard]] bool is_complex() const { return m_complex; }
        [[nodiscard]] bool is_matrix() const { return m_matrix; }

        /// Byte width of one scalar: 1, 4 or 8
        [[nodiscard]] std::size_t base_size() const;

        /// Scalars per element: 1, 2 (complex), 4 (matrix) or 8 (both)
        [[nodiscard]] std::size_t shape_multiplier() const;

        /// Byte width of one element, base_size() * shape_multiplier()
        [[nodiscard]] std::size_t element_size() const { return base_size() * shape_multiplier(); }

        /// e.g. "8 byte double type, complex, 2x2 matrix"
        [[nodiscard]] std::string describe() const;

        [[nodiscard]] std::uint8_t bits() const { return m_bits; }

    private:
        std::uint8_t m_bits;
        element_type m_base;
        bool m_complex;
        bool m_matrix;
    };

} // namespace oskar
