//
// CRC32C (Castagnoli), table driven.
//

#include <oskar/crc32c.hh>
#include <oskar/byte_order.hh>
#include <oskar/exceptions.hh>
#include <oskar/file_header.hh>
#include <oskar/tag.hh>
#include <array>

namespace oskar {

    namespace {
        constexpr std::uint32_t castagnoli_reflected = 0x82F63B78u;

        constexpr std::array<std::uint32_t, 256> make_table() {
            std::array<std::uint32_t, 256> table{};
            for (std::uint32_t i = 0; i < 256; ++i) {
                std::uint32_t crc = i;
                for (int bit = 0; bit < 8; ++bit) {
                    crc = (crc & 1u) ? (crc >> 1) ^ castagnoli_reflected : crc >> 1;
                }
                table[i] = crc;
            }
            return table;
        }

        constexpr auto crc_table = make_table();

        // CRC of the tag followed by the payload without its trailer
        std::uint32_t record_checksum(const std::byte* tag_bytes, std::size_t tag_bytes_size,
                                      const std::byte* payload, std::size_t payload_size) {
            return crc32c(payload, payload_size - crc_size, crc32c(tag_bytes, tag_bytes_size));
        }
    }

    std::uint32_t crc32c(const void* data, std::size_t size, std::uint32_t crc) {
        const auto* bytes = static_cast<const unsigned char*>(data);
        crc = ~crc;
        for (std::size_t i = 0; i < size; ++i) {
            crc = crc_table[(crc ^ bytes[i]) & 0xFFu] ^ (crc >> 8);
        }
        return ~crc;
    }

    std::uint32_t stored_checksum(const std::byte* payload, std::size_t payload_size) {
        THROW_FORMAT_IF(payload_size < crc_size,
                        "Payload of ", payload_size, " bytes is too short for a CRC32C trailer");
        return load<std::uint32_t>(payload + payload_size - crc_size, byte_order::little);
    }

    bool verify_checksum(std::uint8_t version,
                         const std::byte* tag_bytes, std::size_t tag_bytes_size,
                         const std::byte* payload, std::size_t payload_size) {
        if (version < first_crc_version) {
            return true;
        }

        std::uint32_t stored = stored_checksum(payload, payload_size);
        return stored == record_checksum(tag_bytes, tag_bytes_size, payload, payload_size);
    }

    void check_checksum(std::uint8_t version,
                        const std::byte* tag_bytes, std::size_t tag_bytes_size,
                        const std::byte* payload, std::size_t payload_size) {
        if (version < first_crc_version) {
            return;
        }

        std::uint32_t stored = stored_checksum(payload, payload_size);
        std::uint32_t computed = record_checksum(tag_bytes, tag_bytes_size, payload, payload_size);
        if (stored != computed) {
            THROW_CHECKSUM("CRC32C mismatch: stored 0x", std::hex, stored, ", computed 0x", computed);
        }
    }

} // namespace oskar
