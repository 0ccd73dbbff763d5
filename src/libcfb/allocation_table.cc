//
// Created by igor on 03/09/2025.
//

#include <cfb/allocation_table.hh>
#include <cfb/exceptions.hh>

namespace cfb {

    allocation_table::allocation_table(std::vector<std::uint32_t> entries)
        : m_entries(std::move(entries)) {
    }

    std::uint32_t allocation_table::operator[](std::size_t index) const {
        THROW_PARSE_IF(index >= m_entries.size(), "Block index ", index,
                       " outside allocation table of ", m_entries.size(), " entries");
        return m_entries[index];
    }

    void allocation_table::set(std::size_t index, std::uint32_t next) {
        if (index >= m_entries.size()) {
            m_entries.resize(index + 1, free_block);
        }
        m_entries[index] = next;
    }

    void allocation_table::set_chain(const std::vector<std::uint32_t>& chain) {
        if (chain.empty()) {
            return;
        }
        for (std::size_t i = 0; i + 1 < chain.size(); i++) {
            set(chain[i], chain[i + 1]);
        }
        set(chain.back(), end_of_chain);
    }

    std::vector<std::uint32_t> allocation_table::follow(std::uint32_t start) const {
        std::vector<std::uint32_t> chain;
        std::vector<bool> visited(m_entries.size(), false);

        std::uint32_t p = start;
        // Any sentinel ends the walk; a chain cut short by free_block is
        // caught later when the document checks it against its size
        while (!is_sentinel(p)) {
            THROW_PARSE_IF(p >= m_entries.size(), "Chain starting at block ", start,
                           " references block ", p, " outside allocation table of ",
                           m_entries.size(), " entries");
            THROW_PARSE_IF(visited[p], "Loop in chain starting at block ", start,
                           ": block ", p, " visited twice after ", chain.size(), " blocks");
            visited[p] = true;
            chain.push_back(p);
            p = m_entries[p];
        }

        return chain;
    }

} // namespace cfb
