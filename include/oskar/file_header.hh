/**
 * @file file_header.hh
 * @brief The fixed 64-byte preamble of an OSKAR binary file
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <oskar/export_oskar.h>
#include <oskar/byte_order.hh>
#include <oskar/layout.hh>

namespace oskar {

    /// Size of the file header in bytes
    inline constexpr std::size_t header_size = 64;

    /// Size of the magic signature at offset 0
    inline constexpr std::size_t magic_size = 9;

    /// Signature identifying the format, including its terminating NUL
    inline constexpr std::array<char, magic_size> header_magic{'O', 'S', 'K', 'A', 'R', 'B', 'I', 'N', '\0'};

    /// First format version whose records carry CRC32C trailers
    inline constexpr std::uint8_t first_crc_version = 2;

    /**
     * @struct file_header
     * @brief Decoded file header
     *
     * All multi-byte fields of the header are little-endian regardless of
     * is_little_endian, which describes the writer's host.
     */
    struct file_header {
        std::array<char, magic_size> magic{};
        std::uint8_t version = 0;
        std::uint8_t is_little_endian = 1;
        std::uint8_t void_ptr_size = 0;
        std::uint8_t int_size = 0;
        std::uint8_t long_size = 0;
        std::uint8_t float_size = 0;
        std::uint8_t double_size = 0;
        std::uint32_t app_version = 0;

        /// True when records of this file are expected to carry checksums
        [[nodiscard]] bool expects_crc() const { return version >= first_crc_version; }

        /// Byte order of the host that wrote the file
        [[nodiscard]] byte_order writer_byte_order() const {
            return is_little_endian ? byte_order::little : byte_order::big;
        }

        /// Producing application's version as "major.minor.patch"
        [[nodiscard]] std::string app_version_string() const;
    };

    /**
     * @brief Parse the file header
     * @param data Start of the header bytes
     * @param size Bytes available at data
     * @throws truncated_file_error if fewer than header_size bytes are available
     * @throws format_error on magic mismatch or non-zero reserved bytes
     */
    OSKAR_EXPORT file_header parse_header(const std::byte* data, std::size_t size);

    /// Field schema of the header, for generic field-by-field access and printing
    OSKAR_EXPORT const layout& header_layout();

    OSKAR_EXPORT std::ostream& operator<<(std::ostream& os, const file_header& header);

} // namespace oskar
