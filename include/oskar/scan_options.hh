/**
 * @file scan_options.hh
 * @brief Options controlling how an OSKAR binary file is scanned
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>
#include <limits>

namespace oskar {

    /**
     * @struct scan_options
     * @brief Configuration options for scanning OSKAR binary files
     */
    struct scan_options {
        /**
         * @brief Strict scanning mode
         *
         * When true, a checksum mismatch or an oversized payload aborts the
         * scan. When false, both are reported through on_warning and the
         * record is still produced (with record::checksum_ok cleared for a
         * mismatch).
         */
        bool strict = true;

        /**
         * @brief Verify CRC32C trailers of records that carry one
         */
        bool verify_checksums = true;

        /**
         * @brief Maximum allowed payload size in bytes
         *
         * Unlimited by default; set it to bound memory use on untrusted input.
         */
        std::uint64_t max_payload_size = std::numeric_limits<std::uint64_t>::max();

        /**
         * @typedef warning_handler
         * @param offset File offset of the record the warning is about
         * @param category One of "checksum", "element_size", "tag_marker", "size_limit"
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace oskar
