/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the OSKAR reader
 *
 * Every failure raised while reading an OSKAR binary file derives from
 * oskar_error. Format problems derive from parse_error and are further
 * split by kind so callers can react to, e.g., checksum failures alone.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>

namespace oskar {

    /**
     * @class oskar_error
     * @brief Base exception class for all OSKAR reader errors
     */
    class oskar_error : public std::runtime_error {
    public:
        explicit oskar_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief The source could not be opened, read or positioned
     */
    class io_error : public oskar_error {
    public:
        explicit io_error(const std::string& msg)
            : oskar_error(msg) {}
    };

    /**
     * @class parse_error
     * @brief Base class for malformed file contents
     */
    class parse_error : public oskar_error {
    public:
        explicit parse_error(const std::string& msg)
            : oskar_error(msg) {}
    };

    /**
     * @class format_error
     * @brief Bad magic, non-zero reserved bytes, or a structurally invalid record
     */
    class format_error : public parse_error {
    public:
        explicit format_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class invalid_type_descriptor_error
     * @brief The payload data type bit field failed its sanity check
     */
    class invalid_type_descriptor_error : public parse_error {
    public:
        explicit invalid_type_descriptor_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class checksum_mismatch_error
     * @brief Stored and computed CRC32C of a record differ
     */
    class checksum_mismatch_error : public parse_error {
    public:
        explicit checksum_mismatch_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class truncated_file_error
     * @brief The file ends before a declared header, tag or payload
     */
    class truncated_file_error : public parse_error {
    public:
        explicit truncated_file_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class decode_error
     * @brief Payload bytes cannot be interpreted as the declared type
     */
    class decode_error : public parse_error {
    public:
        explicit decode_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    #define THROW_IO(...) \
        throw ::oskar::io_error(::oskar::build_error_msg(__VA_ARGS__))

    #define THROW_FORMAT(...) \
        throw ::oskar::format_error(::oskar::build_error_msg(__VA_ARGS__))

    #define THROW_TYPE_DESCRIPTOR(...) \
        throw ::oskar::invalid_type_descriptor_error(::oskar::build_error_msg(__VA_ARGS__))

    #define THROW_CHECKSUM(...) \
        throw ::oskar::checksum_mismatch_error(::oskar::build_error_msg(__VA_ARGS__))

    #define THROW_TRUNCATED(...) \
        throw ::oskar::truncated_file_error(::oskar::build_error_msg(__VA_ARGS__))

    #define THROW_DECODE(...) \
        throw ::oskar::decode_error(::oskar::build_error_msg(__VA_ARGS__))

    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_FORMAT_IF(condition, ...) \
        do { if (condition) THROW_FORMAT(__VA_ARGS__); } while(0)

    #define THROW_TRUNCATED_IF(condition, ...) \
        do { if (condition) THROW_TRUNCATED(__VA_ARGS__); } while(0)

    #define THROW_DECODE_IF(condition, ...) \
        do { if (condition) THROW_DECODE(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace oskar
