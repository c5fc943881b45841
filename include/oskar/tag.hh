/**
 * @file tag.hh
 * @brief The fixed 20-byte header preceding every payload
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <oskar/export_oskar.h>
#include <oskar/byte_order.hh>
#include <oskar/layout.hh>

namespace oskar {

    /// Size of a tag in bytes
    inline constexpr std::size_t tag_size = 20;

    /// Size of the CRC32C trailer at the end of a checksummed payload
    inline constexpr std::size_t crc_size = 4;

    /**
     * @brief Bits of tag::chunk_flags
     */
    namespace chunk_flag {
        inline constexpr std::uint8_t big_endian = 0b0001'0000;
        inline constexpr std::uint8_t crc32c     = 0b0100'0000;
        inline constexpr std::uint8_t extended   = 0b1000'0000;
    }

    /**
     * @brief Bits of tag::payload_data_type
     */
    namespace data_type {
        inline constexpr std::uint8_t char_type   = 0b0000'0001;
        inline constexpr std::uint8_t int_type    = 0b0000'0010;
        inline constexpr std::uint8_t float_type  = 0b0000'0100;
        inline constexpr std::uint8_t double_type = 0b0000'1000;
        inline constexpr std::uint8_t complex     = 0b0010'0000;
        inline constexpr std::uint8_t matrix      = 0b0100'0000;

        inline constexpr std::uint8_t base_mask     = 0b0000'1111;
        inline constexpr std::uint8_t reserved_mask = 0b1001'0000;
    }

    /// Number of set bits in a byte
    constexpr int population_count(std::uint8_t value) {
        int count = 0;
        while (value) {
            value &= static_cast<std::uint8_t>(value - 1);
            ++count;
        }
        return count;
    }

    /**
     * @brief Sanity of a payload data type bit field
     *
     * Exactly one base type bit (0..3) must be set and the reserved
     * bits 4 and 7 must be clear.
     */
    constexpr bool is_sane_data_type(std::uint8_t type) {
        return (type & data_type::reserved_mask) == 0 &&
               population_count(static_cast<std::uint8_t>(type & data_type::base_mask)) == 1;
    }

    /**
     * @struct tag
     * @brief Decoded record tag
     */
    struct tag {
        char marker0 = 'T';
        char marker1 = 'B';
        char marker2 = 'G';
        std::uint8_t payload_element_size = 0;
        std::uint8_t chunk_flags = 0;
        std::uint8_t payload_data_type = 0;
        std::uint8_t group_id = 0;
        std::uint8_t tag_id = 0;
        std::uint32_t user_index = 0;
        std::uint64_t payload_size = 0;   ///< Includes extended names and the CRC trailer

        [[nodiscard]] bool is_payload_big_endian() const { return (chunk_flags & chunk_flag::big_endian) != 0; }
        [[nodiscard]] bool uses_crc32c() const { return (chunk_flags & chunk_flag::crc32c) != 0; }
        [[nodiscard]] bool is_extended() const { return (chunk_flags & chunk_flag::extended) != 0; }

        [[nodiscard]] bool is_char() const { return (payload_data_type & data_type::char_type) != 0; }
        [[nodiscard]] bool is_int() const { return (payload_data_type & data_type::int_type) != 0; }
        [[nodiscard]] bool is_float() const { return (payload_data_type & data_type::float_type) != 0; }
        [[nodiscard]] bool is_double() const { return (payload_data_type & data_type::double_type) != 0; }
        [[nodiscard]] bool is_complex() const { return (payload_data_type & data_type::complex) != 0; }
        [[nodiscard]] bool is_matrix() const { return (payload_data_type & data_type::matrix) != 0; }

        [[nodiscard]] bool is_sane() const { return is_sane_data_type(payload_data_type); }

        /// 'T', 'A' or 'B', 'G' as written by every known producer
        [[nodiscard]] bool has_valid_marker() const {
            return marker0 == 'T' && (marker1 == 'A' || marker1 == 'B') && marker2 == 'G';
        }

        [[nodiscard]] byte_order payload_byte_order() const {
            return is_payload_big_endian() ? byte_order::big : byte_order::little;
        }
    };

    /**
     * @brief Decode a tag
     * @param data Start of the tag bytes
     * @param size Bytes available at data
     * @throws truncated_file_error if fewer than tag_size bytes are available
     */
    OSKAR_EXPORT tag parse_tag(const std::byte* data, std::size_t size);

    /// Field schema of a tag, for generic field-by-field access and printing
    OSKAR_EXPORT const layout& tag_layout();

    OSKAR_EXPORT std::ostream& operator<<(std::ostream& os, const tag& t);

} // namespace oskar
