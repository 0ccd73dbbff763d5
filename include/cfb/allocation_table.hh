/**
 * @file allocation_table.hh
 * @brief Index-based block allocation table of a compound file
 * @author Igor
 * @date 03/09/2025
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>
#include <cfb/export_cfb.h>

namespace cfb {

    /**
     * @class allocation_table
     * @brief Flat table of next-block indices
     *
     * Entry i holds the index of the block that follows block i in its
     * chain, or one of the sentinel values below. Chains are walked by
     * index; the table never holds pointers between blocks.
     */
    class CFB_EXPORT allocation_table {
    public:
        static constexpr std::uint32_t difat_block  = 0xFFFFFFFC; ///< Block holds DIFAT data
        static constexpr std::uint32_t fat_block    = 0xFFFFFFFD; ///< Block holds the table itself
        static constexpr std::uint32_t end_of_chain = 0xFFFFFFFE; ///< Last block of a chain
        static constexpr std::uint32_t free_block   = 0xFFFFFFFF; ///< Unallocated block

        allocation_table() = default;
        explicit allocation_table(std::vector<std::uint32_t> entries);

        [[nodiscard]] std::size_t count() const { return m_entries.size(); }

        std::uint32_t operator[](std::size_t index) const;

        /**
         * @brief Set the successor of @p index, growing the table with
         *        free entries if needed
         */
        void set(std::size_t index, std::uint32_t next);

        /**
         * @brief Link the given blocks in order and terminate the chain
         */
        void set_chain(const std::vector<std::uint32_t>& chain);

        /**
         * @brief Walk the chain that starts at @p start
         * @return Block indices in chain order (empty if @p start is end_of_chain)
         * @throws parse_error on loops or indices outside the table
         */
        [[nodiscard]] std::vector<std::uint32_t> follow(std::uint32_t start) const;

        [[nodiscard]] static bool is_sentinel(std::uint32_t value) {
            return value >= difat_block;
        }

    private:
        std::vector<std::uint32_t> m_entries;
    };

} // namespace cfb
