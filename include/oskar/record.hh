/**
 * @file record.hh
 * @brief A decoded tag/payload pair
 */

#pragma once

#include <cstdint>
#include <string>
#include <oskar/tag.hh>
#include <oskar/payload.hh>

namespace oskar {

    /**
     * @struct record
     * @brief One decoded record of an OSKAR binary file
     *
     * Once produced, a record is independent of the iterator that read it
     * and may be moved out and kept.
     */
    struct record {
        oskar::tag tag;                   ///< Tag as read from the file
        std::uint64_t file_offset = 0;    ///< Offset of the tag from the start of the file header
        std::string group_name;           ///< Extended tags only
        std::string tag_name;             ///< Extended tags only
        decoded_value value;              ///< Decoded payload
        bool checksum_ok = true;          ///< False only for tolerated mismatches in non-strict mode

        /// Number of bytes this record occupies in the file
        [[nodiscard]] std::uint64_t total_size() const { return tag_size + tag.payload_size; }

        template<typename T>
        [[nodiscard]] const T* get_if() const { return std::get_if<T>(&value); }
    };

} // namespace oskar
