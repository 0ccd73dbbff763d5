//
// Created by igor on 04/09/2025.
//

#include <cfb/document.hh>
#include <cfb/exceptions.hh>
#include <algorithm>

namespace cfb {

    document::document(const block_storage& storage, std::vector<std::uint32_t> chain,
                       std::uint64_t size, const stream_options& options)
        : m_storage(storage)
        , m_chain(std::move(chain))
        , m_size(size) {
        validate(options);
    }

    document document::open(const block_storage& storage, const allocation_table& table,
                            std::uint32_t start_block, std::uint64_t size,
                            const stream_options& options) {
        return document(storage, table.follow(start_block), size, options);
    }

    void document::validate(const stream_options& options) const {
        if (m_size > options.max_document_size) {
            if (options.strict) {
                THROW_PARSE("Document size ", m_size, " exceeds maximum allowed size ",
                            options.max_document_size);
            }
            if (options.on_warning) {
                options.on_warning(0, "size_limit",
                                   build_error_msg("Document size ", m_size,
                                                   " exceeds maximum ", options.max_document_size));
            }
        }

        const std::uint64_t bs = m_storage.block_size();
        const std::uint64_t needed = m_size / bs + (m_size % bs != 0 ? 1 : 0);
        const std::uint64_t present = m_chain.size();

        if (present < needed) {
            const std::uint64_t reachable = present * bs;
            if (options.strict) {
                THROW_PARSE("Block chain of ", present, " blocks holds ", reachable,
                            " bytes but document declares ", m_size, " bytes");
            }
            if (options.on_warning) {
                options.on_warning(reachable, "short_chain",
                                   build_error_msg("Block chain ends at offset ", reachable,
                                                   " of ", m_size, "; ", needed - present,
                                                   " blocks missing"));
            }
        } else if (present > needed && options.on_warning) {
            options.on_warning(m_size, "long_chain",
                               build_error_msg("Block chain has ", present, " blocks, ", needed,
                                               " needed for ", m_size, " bytes; ignoring ",
                                               present - needed));
        }
    }

    std::optional<block_view> document::resolve(std::uint64_t offset) const {
        if (offset >= m_size) {
            return std::nullopt;
        }

        const std::uint64_t bs = m_storage.block_size();
        const std::uint64_t index = offset / bs;
        if (index >= m_chain.size()) {
            return std::nullopt;
        }

        auto block = m_storage.block(m_chain[static_cast<std::size_t>(index)]);
        if (!block) {
            return std::nullopt;
        }

        const std::size_t within = static_cast<std::size_t>(offset % bs);
        if (within >= block->available()) {
            // Block cut by the end of the image
            return std::nullopt;
        }
        block->skip(within);
        block->truncate(static_cast<std::size_t>(std::min<std::uint64_t>(block->available(), m_size - offset)));
        return block;
    }

    block_resolver document::resolver() const {
        return [this](std::uint64_t offset) {
            return resolve(offset);
        };
    }

} // namespace cfb
