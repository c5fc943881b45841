//
// Forward scan over the records of an OSKAR binary file.
//

#include <oskar/record_iterator.hh>
#include <oskar/crc32c.hh>
#include <oskar/exceptions.hh>
#include <oskar/type_descriptor.hh>
#include <array>
#include "input.hh"

namespace oskar {

    namespace {
        // Extended names are NUL padded to their declared length
        std::string read_name(const std::byte* data, std::size_t size) {
            std::string name;
            for (std::size_t i = 0; i < size && data[i] != std::byte{0}; ++i) {
                name.push_back(std::to_integer<char>(data[i]));
            }
            return name;
        }
    }

    std::unique_ptr<record_iterator> record_iterator::open(const std::filesystem::path& path,
                                                           const scan_options& options) {
        return std::unique_ptr<record_iterator>(
            new record_iterator(std::make_unique<file_reader>(path), options));
    }

    std::unique_ptr<record_iterator> record_iterator::open(std::istream& stream,
                                                           const scan_options& options) {
        return std::unique_ptr<record_iterator>(
            new record_iterator(std::make_unique<stream_reader>(stream), options));
    }

    std::unique_ptr<record_iterator> record_iterator::open(const std::byte* data, std::size_t size,
                                                           const scan_options& options) {
        return std::unique_ptr<record_iterator>(
            new record_iterator(std::make_unique<memory_reader>(data, size), options));
    }

    record_iterator::record_iterator(std::unique_ptr<reader_base> reader, const scan_options& options)
        : m_reader(std::move(reader))
        , m_options(options) {
        m_file_size = m_reader->size();

        std::array<std::byte, header_size> buffer{};
        std::size_t actual = m_reader->read(buffer.data(), buffer.size());
        m_header = parse_header(buffer.data(), actual);
        m_offset = header_size;

        m_ended = false;
    }

    record_iterator::~record_iterator() = default;

    void record_iterator::start() {
        if (!m_started) {
            m_started = true;
            advance();
        }
    }

    void record_iterator::next() {
        start();
        if (m_ended) {
            return;
        }
        advance();
    }

    void record_iterator::advance() {
        try {
            if (!read_next_record()) {
                m_ended = true;
            }
        } catch (...) {
            // The scan cannot resume after any failure
            m_ended = true;
            throw;
        }
    }

    void record_iterator::warn(std::uint64_t offset, std::string_view category, const std::string& message) const {
        if (m_options.on_warning) {
            m_options.on_warning(offset, category, message);
        }
    }

    bool record_iterator::read_next_record() {
        const std::uint64_t offset = m_offset;

        m_tag_bytes.resize(tag_size);
        const std::size_t tag_read = m_reader->read(m_tag_bytes.data(), tag_size);

        // End of file exactly at a tag boundary
        if (tag_read == 0) {
            return false;
        }

        THROW_TRUNCATED_IF(tag_read < tag_size,
                           "Only ", tag_read, " bytes left at offset ", offset,
                           ", a tag needs ", tag_size);

        tag t = parse_tag(m_tag_bytes.data(), m_tag_bytes.size());

        if (!t.has_valid_marker()) {
            warn(offset, "tag_marker",
                 build_error_msg("Tag at offset ", offset, " has unexpected marker '",
                                 t.marker0, t.marker1, t.marker2, "'"));
        }

        // Sources of known size are checked before anything is allocated
        if (m_file_size) {
            const std::uint64_t available = *m_file_size - offset - tag_size;
            THROW_TRUNCATED_IF(t.payload_size > available,
                               "Record at offset ", offset, " declares ", t.payload_size,
                               " payload bytes but only ", available, " remain");
        }

        if (t.payload_size > m_options.max_payload_size) {
            if (m_options.strict) {
                THROW_FORMAT("Record at offset ", offset, " has payload size ", t.payload_size,
                             " bytes, which exceeds maximum allowed size of ",
                             m_options.max_payload_size, " bytes");
            }
            warn(offset, "size_limit",
                 build_error_msg("Payload size ", t.payload_size, " exceeds maximum ",
                                 m_options.max_payload_size));
        }

        if (!t.is_sane()) {
            THROW_TYPE_DESCRIPTOR("Record at offset ", offset, " has invalid payload data type 0x",
                                  std::hex, static_cast<unsigned>(t.payload_data_type));
        }
        const auto type = type_descriptor::from_tag(t);

        const std::uint64_t payload_read = m_reader->read_up_to(m_payload, t.payload_size);
        THROW_TRUNCATED_IF(payload_read < t.payload_size,
                           "Record at offset ", offset, " declares ", t.payload_size,
                           " payload bytes but only ", payload_read, " remain");
        std::size_t data_size = m_payload.size();

        bool checksum_ok = true;
        if (t.uses_crc32c()) {
            THROW_FORMAT_IF(data_size < crc_size,
                            "Record at offset ", offset, " has a CRC32C flag but only ",
                            data_size, " payload bytes");
            if (m_options.verify_checksums) {
                checksum_ok = verify_checksum(m_header.version,
                                              m_tag_bytes.data(), m_tag_bytes.size(),
                                              m_payload.data(), m_payload.size());
                if (!checksum_ok) {
                    if (m_options.strict) {
                        THROW_CHECKSUM("CRC32C mismatch in record at offset ", offset,
                                       " (group ", static_cast<unsigned>(t.group_id),
                                       ", tag ", static_cast<unsigned>(t.tag_id),
                                       ", index ", t.user_index, ")");
                    }
                    warn(offset, "checksum",
                         build_error_msg("CRC32C mismatch in record at offset ", offset));
                }
            }
            data_size -= crc_size;
        }

        std::string group_name;
        std::string tag_name;
        std::size_t name_size = 0;
        if (t.is_extended()) {
            name_size = std::size_t(t.group_id) + t.tag_id;
            THROW_FORMAT_IF(name_size > data_size,
                            "Extended tag at offset ", offset, " needs ", name_size,
                            " bytes of names but the payload holds ", data_size);
            group_name = read_name(m_payload.data(), t.group_id);
            tag_name = read_name(m_payload.data() + t.group_id, t.tag_id);
        }

        if (type.base() != element_type::char_type && t.payload_element_size != 0 &&
            t.payload_element_size != type.element_size() && t.payload_element_size != type.base_size()) {
            warn(offset, "element_size",
                 build_error_msg("Declared element size ", static_cast<unsigned>(t.payload_element_size),
                                 " does not match ", type.describe()));
        }

        decoded_value value;
        try {
            value = decode_payload(t, m_payload.data() + name_size, data_size - name_size);
        } catch (const decode_error& e) {
            THROW_DECODE("Record at offset ", offset, ": ", e.what());
        }

        m_current.tag = t;
        m_current.file_offset = offset;
        m_current.group_name = std::move(group_name);
        m_current.tag_name = std::move(tag_name);
        m_current.value = std::move(value);
        m_current.checksum_ok = checksum_ok;
        m_offset += tag_size + t.payload_size;
        ++m_records_read;
        return true;
    }

} // namespace oskar
