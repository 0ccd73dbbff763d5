/**
 * @file bulk_copy.hh
 * @brief Copy an arbitrary byte range out of a chain of block views
 * @author Igor
 * @date 05/09/2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <cfb/export_cfb.h>
#include <cfb/block_view.hh>

namespace cfb {

    /**
     * @typedef block_supplier
     * @brief Returns the view covering the given offset, or nullptr if none exists
     *
     * The returned view stays owned by the supplier; copy_blocks consumes
     * bytes from it in place.
     */
    using block_supplier = std::function<block_view*(std::uint64_t offset)>;

    /**
     * @brief Copy exactly @p length bytes starting at @p offset into @p dst
     * @param dst Destination buffer, at least @p length bytes
     * @param length Number of bytes to copy
     * @param offset Document offset the copy starts at
     * @param limit Declared document size
     * @param next_block Supplier of the view covering an offset
     * @return Offset just past the last copied byte
     * @throws buffer_underrun_error if @p length exceeds limit - offset
     * @throws unexpected_eof_error if the supplier runs out of blocks first
     */
    CFB_EXPORT std::uint64_t copy_blocks(std::byte* dst, std::size_t length,
                                         std::uint64_t offset, std::uint64_t limit,
                                         const block_supplier& next_block);

} // namespace cfb
