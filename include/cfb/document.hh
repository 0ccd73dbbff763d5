/**
 * @file document.hh
 * @brief A named entry's content as a chain of blocks
 * @author Igor
 * @date 04/09/2025
 */

#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include <cfb/export_cfb.h>
#include <cfb/block_view.hh>
#include <cfb/block_storage.hh>
#include <cfb/allocation_table.hh>
#include <cfb/stream_options.hh>

namespace cfb {

    /**
     * @class document
     * @brief Binds a block chain and a declared size to block storage
     *
     * The document is the block resolver for its streams: it maps a
     * byte offset to the view over the block that covers it. It is
     * immutable after construction, so any number of streams may be
     * opened over one document.
     */
    class CFB_EXPORT document {
    public:
        /**
         * @brief Create a document from an already resolved chain
         * @param storage Block storage holding the chain's blocks
         * @param chain Block indices in stream order
         * @param size Declared size of the document in bytes
         * @param options Validation options
         * @throws parse_error in strict mode if the size exceeds the limit
         *         or the chain cannot hold the declared size
         */
        document(const block_storage& storage, std::vector<std::uint32_t> chain,
                 std::uint64_t size, const stream_options& options = {});

        /**
         * @brief Walk the allocation table from @p start_block and create the document
         * @throws parse_error on loops or out-of-range indices in the table
         */
        static document open(const block_storage& storage, const allocation_table& table,
                             std::uint32_t start_block, std::uint64_t size,
                             const stream_options& options = {});

        [[nodiscard]] std::uint64_t size() const { return m_size; }
        [[nodiscard]] std::size_t block_size() const { return m_storage.block_size(); }
        [[nodiscard]] const std::vector<std::uint32_t>& chain() const { return m_chain; }

        /**
         * @brief View covering @p offset, clamped to the end of the document
         * @return std::nullopt at offset >= size, or when the chain or the
         *         image ends before the declared size (corruption)
         */
        [[nodiscard]] std::optional<block_view> resolve(std::uint64_t offset) const;

        /**
         * @brief Package resolve() as a block_resolver
         *
         * The returned function refers to this document, which must
         * outlive every stream using it.
         */
        [[nodiscard]] block_resolver resolver() const;

    private:
        void validate(const stream_options& options) const;

        block_storage m_storage;
        std::vector<std::uint32_t> m_chain;
        std::uint64_t m_size;
    };

} // namespace cfb
