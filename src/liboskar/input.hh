//
// Byte sources behind the record iterator.
//

#pragma once

#include <iosfwd>
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <vector>

#include <oskar/exceptions.hh>

namespace oskar {

    // Base reader interface
    class reader_base {
        public:
            virtual ~reader_base() = default;

            // Simple interface - throws on error. Sources are read strictly forward.
            virtual std::size_t read(void* dst, std::size_t size) = 0;

            // Bytes between the position reading started at and the end of the source,
            // empty when the source cannot tell (pipes and other forward-only streams)
            virtual std::optional<std::uint64_t> size() const = 0;

            // Read up to size bytes, growing buffer in bounded steps so that a bogus
            // length on a forward-only source fails on the short read, not on allocation.
            // Returns the number of bytes read; buffer holds exactly those.
            std::uint64_t read_up_to(std::vector<std::byte>& buffer, std::uint64_t size) {
                constexpr std::uint64_t step = 1u << 20;

                buffer.clear();
                std::uint64_t total = 0;
                while (total < size) {
                    auto chunk = static_cast<std::size_t>(std::min(step, size - total));
                    buffer.resize(static_cast<std::size_t>(total) + chunk);
                    std::size_t actual = read(buffer.data() + total, chunk);
                    total += actual;
                    if (actual < chunk) {
                        buffer.resize(static_cast<std::size_t>(total));
                        break;
                    }
                }
                return total;
            }
    };

    // Reads from a caller-owned stream
    class stream_reader : public reader_base {
        public:
            explicit stream_reader(std::istream& is);
            ~stream_reader() override = default;

            std::size_t read(void* dst, std::size_t size) override;
            std::optional<std::uint64_t> size() const override;

        protected:
            std::istream& m_stream;
            std::streampos m_start; // -1 for streams without positioning
    };

    // Owns the file it reads; closed when the reader is destroyed
    class file_reader : public reader_base {
        public:
            explicit file_reader(const std::filesystem::path& path);
            ~file_reader() override = default;

            file_reader(const file_reader&) = delete;
            file_reader& operator = (const file_reader&) = delete;

            std::size_t read(void* dst, std::size_t size) override { return m_reader.read(dst, size); }
            std::optional<std::uint64_t> size() const override { return m_reader.size(); }

        private:
            std::ifstream m_file;
            stream_reader m_reader; // bound to m_file, declared after it
    };

    // Reads from a caller-owned memory region
    class memory_reader : public reader_base {
        public:
            memory_reader(const std::byte* data, std::size_t size);
            ~memory_reader() override = default;

            std::size_t read(void* dst, std::size_t size) override;
            std::optional<std::uint64_t> size() const override { return m_size; }

        private:
            const std::byte* m_data;
            std::size_t m_size;
            std::size_t m_position;
    };
}
