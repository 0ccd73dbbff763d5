/**
 * @file document_stream.hh
 * @brief Sequential/random access stream over a block-chained document
 * @author Igor
 * @date 05/09/2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>
#include <cfb/export_cfb.h>
#include <cfb/block_view.hh>

namespace cfb {

    class document;

    /**
     * @class document_stream
     * @brief Cursor presenting a chain of scattered blocks as one byte stream
     *
     * Byte and bulk reads return eof at the end of the document instead
     * of throwing. Typed reads and read_fully never return a partial
     * result: they throw when the bytes are not there.
     *
     * The stream keeps the view over the block covering the current
     * offset; the view is absent exactly when the offset equals the size
     * (or the chain is damaged, which the next read reports).
     *
     * Not safe for concurrent use. Open one stream per thread instead;
     * streams over the same document share nothing mutable.
     */
    class CFB_EXPORT document_stream {
    public:
        /// Value returned by read() and read(dst, ...) at the end of the document
        static constexpr int eof = -1;

        /**
         * @brief Open a stream over any block resolver
         * @param resolver Maps offsets to block views
         * @param size Declared document size in bytes
         * @throws invalid_argument_error if @p resolver is empty
         */
        document_stream(block_resolver resolver, std::uint64_t size);

        /**
         * @brief Open a stream over a document
         *
         * The document must outlive the stream.
         */
        explicit document_stream(const document& doc);

        // A temporary document would be destroyed while the stream still resolves through it
        document_stream(document&&) = delete;

        /**
         * @brief Closes the stream
         */
        ~document_stream();

        document_stream(const document_stream&) = delete;
        document_stream& operator = (const document_stream&) = delete;

        document_stream(document_stream&&) = default;
        document_stream& operator = (document_stream&&) = default;

        /**
         * @brief Bytes between the current offset and the end of the document
         * @throws closed_stream_error
         */
        [[nodiscard]] std::uint64_t available() const;

        /**
         * @brief Close the stream. Calling it again has no effect.
         */
        void close() noexcept;

        [[nodiscard]] bool closed() const noexcept { return m_closed; }

        /**
         * @brief Remember the current offset for reset()
         *
         * The read limit is accepted for familiarity and ignored: reset()
         * works no matter how many bytes were read since the mark.
         */
        void mark(std::size_t readlimit = 0);

        /**
         * @brief Return to the last mark, or to the start if mark() was never called
         */
        void reset();

        /**
         * @brief Skip up to @p n bytes
         * @return Bytes actually skipped; 0 for negative @p n
         */
        std::int64_t skip(std::int64_t n);

        /**
         * @brief Read one byte
         * @return Byte value 0..255, or eof at the end of the document
         */
        int read();

        /**
         * @brief Read up to @p length bytes into dst[start, start + length)
         * @param dst Destination buffer
         * @param dst_size Size of the destination buffer
         * @return Bytes read, 0 if @p length is 0, eof at the end of the document
         * @throws invalid_argument_error for a null buffer, negative values,
         *         or a range outside the buffer
         */
        std::int64_t read(void* dst, std::size_t dst_size, std::int64_t start, std::int64_t length);

        /**
         * @brief Read up to buf.size() bytes into @p buf
         */
        std::int64_t read(std::vector<std::byte>& buf);

        /**
         * @brief Read exactly @p length bytes into dst[start, start + length)
         * @throws buffer_underrun_error if fewer than @p length bytes remain
         * @throws unexpected_eof_error if the block chain ends early
         */
        void read_fully(void* dst, std::size_t dst_size, std::int64_t start, std::int64_t length);

        /**
         * @brief Fill @p buf completely
         */
        void read_fully(std::vector<std::byte>& buf);

        // Little-endian typed reads. All throw unexpected_eof_error when
        // fewer bytes than the value width remain; the stream is then unchanged.
        std::uint8_t read_ubyte();
        std::int8_t read_byte();
        std::uint16_t read_ushort();
        std::int16_t read_short();
        std::uint32_t read_uint();
        std::int32_t read_int();
        std::int64_t read_long();
        double read_double();

        [[nodiscard]] std::uint64_t offset() const noexcept { return m_offset; }
        [[nodiscard]] std::uint64_t size() const noexcept { return m_size; }

    private:
        void check_open() const;
        void check_range(const void* dst, std::size_t dst_size, std::int64_t start, std::int64_t length) const;
        void copy_to(std::byte* dst, std::size_t length);
        block_view& require_view();
        void refresh();
        void refresh_if_exhausted();
        std::uint64_t read_le(std::size_t width);

        block_resolver m_resolver;
        std::uint64_t m_size;
        std::uint64_t m_offset;
        std::uint64_t m_marked_offset;
        bool m_closed;
        std::optional<block_view> m_view;  // Covers m_offset; absent at the end
    };

} // namespace cfb
