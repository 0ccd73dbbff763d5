/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the compound file reader
 * @author Igor
 * @date 02/09/2025
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout libcfb. Soft end-of-stream is never reported
 * through an exception; see document_stream::eof.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>

namespace cfb {

    /**
     * @class cfb_error
     * @brief Base exception class for all compound file errors
     *
     * All libcfb exceptions derive from this class, making it easy
     * to catch all library errors with a single catch block.
     */
    class cfb_error : public std::runtime_error {
    public:
        explicit cfb_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class closed_stream_error
     * @brief Thrown when a read, skip or query is issued on a closed stream
     */
    class closed_stream_error : public cfb_error {
    public:
        explicit closed_stream_error(const std::string& msg)
            : cfb_error(msg) {}
    };

    /**
     * @class invalid_argument_error
     * @brief Thrown for null destinations, negative offsets or lengths,
     *        and ranges that do not fit the destination buffer
     */
    class invalid_argument_error : public cfb_error {
    public:
        explicit invalid_argument_error(const std::string& msg)
            : cfb_error(msg) {}
    };

    /**
     * @class buffer_underrun_error
     * @brief Thrown when a full read asks for more bytes than the document
     *        declares as remaining
     *
     * Indicates a mismatch between the caller (usually a record parser)
     * and the document, not a damaged container.
     */
    class buffer_underrun_error : public cfb_error {
    public:
        explicit buffer_underrun_error(const std::string& msg)
            : cfb_error(msg) {}
    };

    /**
     * @class unexpected_eof_error
     * @brief Thrown when the block chain ends before the declared document size
     *        or a typed read runs out of bytes
     *
     * Indicates storage corruption rather than a normal stream boundary.
     */
    class unexpected_eof_error : public cfb_error {
    public:
        explicit unexpected_eof_error(const std::string& msg)
            : cfb_error(msg) {}
    };

    /**
     * @class parse_error
     * @brief Exception for structural errors found while opening a document
     *
     * Thrown when the allocation table is inconsistent (loops, indices out
     * of range) or a document violates the configured limits in strict mode.
     */
    class parse_error : public cfb_error {
    public:
        explicit parse_error(const std::string& msg)
            : cfb_error(msg) {}
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

    #define THROW_CLOSED(...) \
        throw ::cfb::closed_stream_error(::cfb::build_error_msg(__VA_ARGS__))

    #define THROW_ARGUMENT(...) \
        throw ::cfb::invalid_argument_error(::cfb::build_error_msg(__VA_ARGS__))

    #define THROW_UNDERRUN(...) \
        throw ::cfb::buffer_underrun_error(::cfb::build_error_msg(__VA_ARGS__))

    #define THROW_EOF(...) \
        throw ::cfb::unexpected_eof_error(::cfb::build_error_msg(__VA_ARGS__))

    #define THROW_PARSE(...) \
        throw ::cfb::parse_error(::cfb::build_error_msg(__VA_ARGS__))

    #define THROW_ARGUMENT_IF(condition, ...) \
        do { if (condition) THROW_ARGUMENT(__VA_ARGS__); } while(0)

    #define THROW_UNDERRUN_IF(condition, ...) \
        do { if (condition) THROW_UNDERRUN(__VA_ARGS__); } while(0)

    #define THROW_EOF_IF(condition, ...) \
        do { if (condition) THROW_EOF(__VA_ARGS__); } while(0)

    #define THROW_PARSE_IF(condition, ...) \
        do { if (condition) THROW_PARSE(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace cfb
