/**
 * @file record_iterator.hh
 * @brief Forward-only lazy scan over the records of an OSKAR binary file
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <oskar/export_oskar.h>
#include <oskar/file_header.hh>
#include <oskar/record.hh>
#include <oskar/scan_options.hh>

namespace oskar {

    class reader_base;

    /**
     * @class record_iterator
     * @brief Reads the header once, then one record per next() call
     *
     * Opening reads and validates the file header only. The first record
     * is read on the first call to has_next(), at_end(), current() or
     * next(); each later call to next() reads, verifies and decodes the
     * following one. The scan ends normally when the source is exhausted
     * exactly at a tag boundary. Any error ends the scan and is rethrown to
     * the caller; the iterator then reports at_end(). Records moved out of
     * current() before that stay valid.
     *
     * The iterator owns its source when opened from a path and releases it
     * on destruction. It cannot be rewound; open the source again to rescan.
     */
    class OSKAR_EXPORT record_iterator {
    public:
        /**
         * @brief Open a file by path
         * @throws io_error if the file cannot be opened
         */
        static std::unique_ptr<record_iterator> open(const std::filesystem::path& path,
                                                     const scan_options& options = scan_options{});

        /**
         * @brief Scan a caller-owned stream from its current position
         *
         * The stream must outlive the iterator. It does not need to support
         * seeking; without it, truncation is detected by short reads.
         */
        static std::unique_ptr<record_iterator> open(std::istream& stream,
                                                     const scan_options& options = scan_options{});

        /**
         * @brief Scan a caller-owned memory region (e.g. a mapped file)
         *
         * The region must outlive the iterator.
         */
        static std::unique_ptr<record_iterator> open(const std::byte* data, std::size_t size,
                                                     const scan_options& options = scan_options{});

        ~record_iterator();

        record_iterator(const record_iterator&) = delete;
        record_iterator& operator=(const record_iterator&) = delete;

        /// The file header, valid for the iterator's whole lifetime
        [[nodiscard]] const file_header& header() const { return m_header; }

        /**
         * @brief Current record; only meaningful while has_next() is true
         * @throws parse_error (or a subclass) or io_error if reading the first record fails
         */
        [[nodiscard]] record& current() {
            start();
            return m_current;
        }

        /**
         * @brief Advance to the next record
         * @throws parse_error (or a subclass) or io_error; the scan is over afterwards
         */
        void next();

        [[nodiscard]] bool has_next() {
            start();
            return !m_ended;
        }

        [[nodiscard]] bool at_end() {
            start();
            return m_ended;
        }

        /// Number of records produced so far, including the current one
        [[nodiscard]] std::uint64_t records_read() const { return m_records_read; }

    private:
        record_iterator(std::unique_ptr<reader_base> reader, const scan_options& options);

        // Read the first record unless that already happened
        void start();

        // Read the record starting at the current position; false at clean end of file
        bool read_next_record();

        // read_next_record() with the scan marked as ended if it throws
        void advance();

        void warn(std::uint64_t offset, std::string_view category, const std::string& message) const;

        std::unique_ptr<reader_base> m_reader;
        scan_options m_options;
        file_header m_header;
        record m_current;
        std::optional<std::uint64_t> m_file_size; // empty for forward-only streams
        std::uint64_t m_offset = 0;               // from the start of the header
        std::uint64_t m_records_read = 0;
        bool m_started = false;
        bool m_ended = true;

        // Reused between records
        std::vector<std::byte> m_tag_bytes;
        std::vector<std::byte> m_payload;
    };

} // namespace oskar
