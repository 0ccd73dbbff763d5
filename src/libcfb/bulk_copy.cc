//
// Created by igor on 05/09/2025.
//

#include <cfb/bulk_copy.hh>
#include <cfb/exceptions.hh>
#include <algorithm>

namespace cfb {

    std::uint64_t copy_blocks(std::byte* dst, std::size_t length,
                              std::uint64_t offset, std::uint64_t limit,
                              const block_supplier& next_block) {
        THROW_UNDERRUN_IF(offset > limit || length > limit - offset,
                          "Buffer underrun - requested ", length, " bytes but ",
                          (offset > limit ? 0 : limit - offset), " were available");

        if (length == 0) {
            return offset;
        }

        std::size_t remaining = length;
        std::size_t write_pos = 0;

        block_view* view = next_block(offset);
        while (true) {
            // An empty view for an in-range offset would never make progress
            THROW_EOF_IF(!view || view->empty(),
                         "Reached end of document stream unexpectedly at offset ", offset,
                         " with ", remaining, " bytes still to copy");

            const std::size_t chunk = std::min(view->available(), remaining);
            view->read_fully(dst + write_pos, chunk);
            remaining -= chunk;
            write_pos += chunk;
            offset += chunk;

            if (remaining == 0) {
                break;
            }
            view = next_block(offset);
        }

        return offset;
    }

} // namespace cfb
