/**
 * @file block_storage.hh
 * @brief Container image split into fixed-capacity blocks
 * @author Igor
 * @date 03/09/2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <cfb/export_cfb.h>
#include <cfb/block_view.hh>

namespace cfb {

    /**
     * @class block_storage
     * @brief Non-owning view over a compound file image
     *
     * Block i begins at base_offset + i * block_size. For a regular
     * compound file base_offset equals the header size, which is one block.
     * The image must outlive the storage and every view taken from it.
     */
    class CFB_EXPORT block_storage {
    public:
        /**
         * @param data Start of the container image
         * @param size Image size in bytes
         * @param block_size Capacity of one block
         * @param base_offset Offset of block 0 inside the image
         * @throws invalid_argument_error if block_size is 0 or data is null with a non-zero size
         */
        block_storage(const std::byte* data, std::size_t size, std::size_t block_size,
                      std::uint64_t base_offset = 0);

        [[nodiscard]] std::size_t block_size() const { return m_block_size; }
        [[nodiscard]] std::size_t image_size() const { return m_size; }

        /**
         * @brief Number of blocks that start inside the image
         */
        [[nodiscard]] std::size_t block_count() const;

        /**
         * @brief View over the whole of block @p index
         *
         * A block cut by the end of the image yields a shorter view.
         * A block starting outside the image yields std::nullopt.
         */
        [[nodiscard]] std::optional<block_view> block(std::uint32_t index) const;

    private:
        const std::byte* m_data;
        std::size_t m_size;
        std::size_t m_block_size;
        std::uint64_t m_base_offset;
    };

} // namespace cfb
