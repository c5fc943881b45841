/**
 * @file parser.hh
 * @brief Convenience entry points built on record_iterator
 */

#pragma once

#include <filesystem>
#include <iosfwd>
#include <utility>
#include <vector>
#include <oskar/handler_registry.hh>
#include <oskar/record_iterator.hh>
#include <oskar/scan_options.hh>

namespace oskar {

    /**
     * @brief Scan an iterator to its end, calling func for each record
     *
     * @tparam Func Callable type accepting record&
     * @return The file header
     */
    template<typename Func>
    file_header for_each_record(record_iterator& it, Func func) {
        while (it.has_next()) {
            func(it.current());
            it.next();
        }
        return it.header();
    }

    /**
     * @brief Call func for each record of a stream
     */
    template<typename Func>
    file_header for_each_record(std::istream& stream, Func func, const scan_options& options = scan_options{}) {
        auto it = record_iterator::open(stream, options);
        return for_each_record(*it, std::move(func));
    }

    /**
     * @brief Call func for each record of a file
     */
    template<typename Func>
    file_header for_each_record(const std::filesystem::path& path, Func func, const scan_options& options = scan_options{}) {
        auto it = record_iterator::open(path, options);
        return for_each_record(*it, std::move(func));
    }

    /**
     * @brief Scan a stream and emit every record to the registered handlers
     *
     * @param stream Input stream containing an OSKAR binary file
     * @param handlers Registry of handlers to process records
     * @param options Scan options
     */
    inline file_header parse(std::istream& stream, const handler_registry& handlers, const scan_options& options = scan_options{}) {
        return for_each_record(stream, [&handlers](const record& rec) {
            handlers.emit(rec);
        }, options);
    }

    inline file_header parse(const std::filesystem::path& path, const handler_registry& handlers, const scan_options& options = scan_options{}) {
        return for_each_record(path, [&handlers](const record& rec) {
            handlers.emit(rec);
        }, options);
    }

    /**
     * @brief Read every record of a file into memory
     *
     * Intended for small files; the scan itself stays one record at a time.
     */
    inline std::pair<file_header, std::vector<record>> read_all(const std::filesystem::path& path,
                                                                const scan_options& options = scan_options{}) {
        std::vector<record> records;
        auto header = for_each_record(path, [&records](record& rec) {
            records.push_back(std::move(rec));
        }, options);
        return {header, std::move(records)};
    }

    inline std::pair<file_header, std::vector<record>> read_all(std::istream& stream,
                                                                const scan_options& options = scan_options{}) {
        std::vector<record> records;
        auto header = for_each_record(stream, [&records](record& rec) {
            records.push_back(std::move(rec));
        }, options);
        return {header, std::move(records)};
    }

} // namespace oskar
