/**
 * @file payload.hh
 * @brief Conversion of raw payload bytes to text or numbers
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <variant>
#include <vector>
#include <oskar/export_oskar.h>

namespace oskar {

    struct tag;

    /**
     * @typedef decoded_value
     * @brief Decoded payload: text for char payloads, otherwise a flat
     *        sequence of scalars in file order
     */
    using decoded_value = std::variant<
        std::string,
        std::vector<std::int32_t>,
        std::vector<float>,
        std::vector<double>
    >;

    /**
     * @brief Decode a payload
     * @param t Tag describing the payload; must be sane
     * @param data Payload bytes without extended names and without CRC trailer
     * @param size Number of bytes at data
     * @throws invalid_type_descriptor_error if the tag's type bits are not sane
     * @throws decode_error if size is not a multiple of the element size, or
     *         if a char payload is not valid UTF-8
     *
     * Trailing NUL terminators of char payloads are dropped.
     */
    OSKAR_EXPORT decoded_value decode_payload(const tag& t, const std::byte* data, std::size_t size);

    inline decoded_value decode_payload(const tag& t, const std::vector<std::byte>& payload) {
        return decode_payload(t, payload.data(), payload.size());
    }

    /// True if the bytes form well-formed UTF-8 (no overlongs, surrogates or values above U+10FFFF)
    OSKAR_EXPORT bool is_valid_utf8(const std::byte* data, std::size_t size);

    /// Number of scalars (or characters) held by a decoded value
    OSKAR_EXPORT std::size_t value_count(const decoded_value& value);

    /**
     * @brief Print a decoded value, abbreviating after max_values scalars
     */
    OSKAR_EXPORT void print_value(std::ostream& os, const decoded_value& value, std::size_t max_values = 8);

} // namespace oskar
