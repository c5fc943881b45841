/**
 * @file crc32c.hh
 * @brief CRC32C (Castagnoli) computation and record checksum verification
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include <oskar/export_oskar.h>

namespace oskar {

    /**
     * @brief CRC32C of a byte range
     * @param data Bytes to checksum
     * @param size Number of bytes
     * @param crc Result of a previous call when checksumming in pieces, 0 to start
     * @return Standard CRC-32C (reflected polynomial 0x82F63B78), e.g.
     *         crc32c("123456789") == 0xE3069283
     */
    OSKAR_EXPORT std::uint32_t crc32c(const void* data, std::size_t size, std::uint32_t crc = 0);

    /**
     * @brief Check the CRC32C trailer of a record
     * @param version File format version; versions before 2 carry no checksums
     * @param tag_bytes The record's tag as read from the file
     * @param tag_bytes_size Number of tag bytes
     * @param payload Payload bytes including the 4-byte trailer
     * @param payload_size Number of payload bytes
     * @return True if the stored and computed checksums match, or for legacy versions
     *
     * The checksum covers the tag followed by the payload without its
     * trailer; the trailer holds it as a little-endian uint32.
     */
    OSKAR_EXPORT bool verify_checksum(std::uint8_t version,
                                      const std::byte* tag_bytes, std::size_t tag_bytes_size,
                                      const std::byte* payload, std::size_t payload_size);

    inline bool verify_checksum(std::uint8_t version,
                                const std::vector<std::byte>& tag_bytes,
                                const std::vector<std::byte>& payload) {
        return verify_checksum(version, tag_bytes.data(), tag_bytes.size(), payload.data(), payload.size());
    }

    /**
     * @brief Throwing variant of verify_checksum()
     * @throws checksum_mismatch_error if the checksums differ
     * @throws format_error if the payload is too short to hold a trailer
     */
    OSKAR_EXPORT void check_checksum(std::uint8_t version,
                                     const std::byte* tag_bytes, std::size_t tag_bytes_size,
                                     const std::byte* payload, std::size_t payload_size);

    /// The stored trailer value of a checksummed payload
    OSKAR_EXPORT std::uint32_t stored_checksum(const std::byte* payload, std::size_t payload_size);

} // namespace oskar
