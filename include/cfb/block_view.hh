/**
 * @file block_view.hh
 * @brief Read-only window into one physical block of a compound file
 * @author Igor
 * @date 02/09/2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <cfb/export_cfb.h>

namespace cfb {

    /**
     * @class block_view
     * @brief Window from a read position to the end of one physical block
     *
     * Decoders consume bytes from the front of the window and shrink
     * available() accordingly. All multi-byte values are little-endian.
     * The view does not own the bytes; the block storage must outlive it.
     */
    class CFB_EXPORT block_view {
    public:
        block_view(const std::byte* data, std::size_t available) noexcept
            : m_data(data)
            , m_available(available) {}

        /**
         * @brief Bytes left between the read position and the end of the block
         */
        [[nodiscard]] std::size_t available() const noexcept { return m_available; }

        [[nodiscard]] bool empty() const noexcept { return m_available == 0; }

        /**
         * @brief Read one unsigned byte
         * @throws unexpected_eof_error if the view is exhausted
         */
        std::uint8_t read_ubyte();

        /**
         * @brief Read 2/4/8 byte little-endian unsigned values
         * @throws unexpected_eof_error if fewer bytes remain in the view
         */
        std::uint16_t read_ushort_le();
        std::uint32_t read_int_le();
        std::uint64_t read_long_le();

        /**
         * @brief Read the next @p n bytes (n <= 8) as a little-endian integer
         *
         * Byte i of the window contributes byte[i] << (8 * i). Used to
         * assemble values whose bytes straddle two or more blocks.
         */
        std::uint64_t read_le(std::size_t n);

        /**
         * @brief Copy @p n bytes into @p dst and advance the window
         */
        void read_fully(std::byte* dst, std::size_t n);

        /**
         * @brief Advance the window by @p n bytes without decoding
         */
        void skip(std::size_t n);

        /**
         * @brief Shorten the window to at most @p n bytes
         */
        void truncate(std::size_t n) noexcept {
            if (n < m_available) {
                m_available = n;
            }
        }

    private:
        const std::byte* consume(std::size_t n);

        const std::byte* m_data;
        std::size_t m_available;
    };

    /**
     * @typedef block_resolver
     * @brief Maps a byte offset inside a document to the view covering it
     *
     * Returns std::nullopt when the offset equals the document size. Any
     * other std::nullopt means the block chain is damaged.
     */
    using block_resolver = std::function<std::optional<block_view>(std::uint64_t offset)>;

} // namespace cfb
