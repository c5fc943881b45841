//
// Byte sources behind the record iterator.
//

#include <algorithm>
#include <istream>
#include <string>

#include "input.hh"

namespace oskar {
    // stream_reader implementation
    stream_reader::stream_reader(std::istream& is)
        : m_stream(is), m_start(is.tellg()) {}

    std::size_t stream_reader::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst, "Null buffer in read");

        if (size == 0) {
            return 0;
        }

        THROW_IO_UNLESS(m_stream.good(), "Stream in bad state");

        m_stream.read(static_cast<char*>(dst), static_cast<std::streamsize>(size));
        std::size_t bytes_read = static_cast<std::size_t>(m_stream.gcount());

        THROW_IO_IF(m_stream.bad(), "Stream read failed");
        if (m_stream.eof()) {
            // A short read is reported through the count; keep the stream usable
            m_stream.clear();
        }
        return bytes_read;
    }

    std::optional<std::uint64_t> stream_reader::size() const {
        if (m_start == std::streampos(-1)) {
            return std::nullopt;
        }

        auto& stream = const_cast<std::istream&>(m_stream);

        // Save current position
        std::streampos current_pos = stream.tellg();
        if (current_pos == std::streampos(-1)) {
            return std::nullopt;
        }

        stream.seekg(0, std::ios_base::end);
        std::streampos end_pos = stream.tellg();
        if (stream.fail() || end_pos == std::streampos(-1)) {
            stream.clear();
            return std::nullopt;
        }

        // Restore original position
        stream.seekg(current_pos);
        THROW_IO_IF(stream.fail(), "Cannot restore stream position after size query");

        return static_cast<std::uint64_t>(end_pos - m_start);
    }

    // file_reader implementation
    file_reader::file_reader(const std::filesystem::path& path)
        : m_file(path, std::ios::binary), m_reader(m_file) {
        THROW_IO_UNLESS(m_file.is_open(), "Cannot open file '", path.string(), "'");
    }

    // memory_reader implementation
    memory_reader::memory_reader(const std::byte* data, std::size_t size)
        : m_data(data), m_size(size), m_position(0) {
        THROW_IO_IF(!data && size > 0, "Null memory region of ", size, " bytes");
    }

    std::size_t memory_reader::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst, "Null buffer in memory_reader::read");

        std::size_t to_read = std::min(size, m_size - m_position);
        if (to_read == 0) {
            return 0;
        }

        std::copy_n(m_data + m_position, to_read, static_cast<std::byte*>(dst));
        m_position += to_read;
        return to_read;
    }
}
