//
// Created by igor on 03/09/2025.
//

#include <cfb/block_storage.hh>
#include <cfb/exceptions.hh>
#include <algorithm>

namespace cfb {

    block_storage::block_storage(const std::byte* data, std::size_t size, std::size_t block_size,
                                 std::uint64_t base_offset)
        : m_data(data)
        , m_size(size)
        , m_block_size(block_size)
        , m_base_offset(base_offset) {
        THROW_ARGUMENT_IF(m_block_size == 0, "Block size must not be 0");
        THROW_ARGUMENT_IF(!m_data && m_size > 0, "Null image with size ", m_size);
    }

    std::size_t block_storage::block_count() const {
        if (m_base_offset >= m_size) {
            return 0;
        }
        std::uint64_t payload = m_size - m_base_offset;
        return static_cast<std::size_t>((payload + m_block_size - 1) / m_block_size);
    }

    std::optional<block_view> block_storage::block(std::uint32_t index) const {
        std::uint64_t start = m_base_offset + static_cast<std::uint64_t>(index) * m_block_size;
        if (start >= m_size) {
            return std::nullopt;
        }
        std::uint64_t length = std::min<std::uint64_t>(m_block_size, m_size - start);
        return block_view(m_data + start, static_cast<std::size_t>(length));
    }

} // namespace cfb
