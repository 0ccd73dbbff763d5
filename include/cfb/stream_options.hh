/**
 * @file stream_options.hh
 * @brief Options controlling how documents are opened and validated
 * @author Igor
 * @date 02/09/2025
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace cfb {

    /**
     * @struct stream_options
     * @brief Configuration options for opening documents
     *
     * Controls how strictly the block chain of a document is checked
     * against its declared size, and how non-fatal issues are reported.
     */
    struct stream_options {
        /**
         * @brief Strict validation mode
         *
         * When true, a document whose chain cannot hold its declared size,
         * or whose size exceeds max_document_size, fails to open.
         * When false, a warning is issued and the damage surfaces as
         * unexpected_eof_error only if a read actually reaches it.
         */
        bool strict = true;

        /**
         * @brief Maximum allowed document size in bytes
         *
         * Default is 4GB.
         */
        std::uint64_t max_document_size = std::uint64_t(1) << 32;  // 4GB

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Byte offset inside the document the warning refers to
         * @param category Warning category ("size_limit", "short_chain", "long_chain")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace cfb
