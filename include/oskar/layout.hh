/**
 * @file layout.hh
 * @brief Declarative description of fixed-size little-endian records
 *
 * The file header and the record tag are both fixed blocks of
 * little-endian fields. Each is described by an ordered schema of
 * field_spec entries and decoded by one generic routine, decode_layout().
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <oskar/export_oskar.h>

namespace oskar {

    /**
     * @enum field_kind
     * @brief How the bytes of a field are interpreted
     */
    enum class field_kind {
        ascii,        ///< Characters, displayed up to the first NUL
        unsigned_int, ///< Little-endian unsigned integer of 1 to 8 bytes
        raw           ///< Opaque bytes (e.g. reserved areas)
    };

    /**
     * @struct field_spec
     * @brief One entry of a layout schema
     */
    struct field_spec {
        std::string_view name;
        std::size_t width;
        field_kind kind;
    };

    /**
     * @class layout
     * @brief Non-owning view of an ordered schema
     */
    class layout {
    public:
        template<std::size_t N>
        explicit layout(const std::array<field_spec, N>& fields)
            : m_fields(fields.data()), m_count(N) {}

        [[nodiscard]] const field_spec* begin() const { return m_fields; }
        [[nodiscard]] const field_spec* end() const { return m_fields + m_count; }
        [[nodiscard]] std::size_t field_count() const { return m_count; }

        /// Total byte width of all fields
        [[nodiscard]] std::size_t byte_size() const;

    private:
        const field_spec* m_fields;
        std::size_t m_count;
    };

    /**
     * @struct field_value
     * @brief Decoded value of one field
     */
    struct field_value {
        const field_spec* spec = nullptr;
        std::size_t offset = 0;         ///< Offset of the field inside the block
        std::uint64_t number = 0;       ///< Set for unsigned_int fields
        std::vector<std::byte> raw;     ///< Exact bytes of the field
    };

    /**
     * @class layout_values
     * @brief Result of decode_layout(), addressable by field name
     */
    class OSKAR_EXPORT layout_values {
    public:
        layout_values() = default;
        explicit layout_values(std::vector<field_value> values)
            : m_values(std::move(values)) {}

        /// Value of an unsigned_int field; throws std::out_of_range for unknown names
        [[nodiscard]] std::uint64_t number(std::string_view name) const;

        /// Characters of a field up to the first NUL
        [[nodiscard]] std::string text(std::string_view name) const;

        /// Exact bytes of a field
        [[nodiscard]] const std::vector<std::byte>& raw(std::string_view name) const;

        [[nodiscard]] auto begin() const { return m_values.begin(); }
        [[nodiscard]] auto end() const { return m_values.end(); }

        [[nodiscard]] std::size_t size() const { return m_values.size(); }

    private:
        const field_value& find(std::string_view name) const;

        std::vector<field_value> m_values;
    };

    /**
     * @brief Decode a fixed-size block against a schema
     * @param schema Ordered field description
     * @param data Start of the block
     * @param size Number of bytes available at data
     * @return Decoded field values in schema order
     * @throws truncated_file_error if size is smaller than schema.byte_size()
     */
    OSKAR_EXPORT layout_values decode_layout(const layout& schema, const std::byte* data, std::size_t size);

    /**
     * @brief Print every field as "name=value", one per line, indented
     *
     * Raw fields are summarised as their width and whether they are all zero.
     */
    OSKAR_EXPORT void print_layout(std::ostream& os, const layout_values& values, std::string_view indent = "  ");

} // namespace oskar
