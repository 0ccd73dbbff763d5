//
// Created by igor on 02/09/2025.
//

#include <cfb/block_view.hh>
#include <cfb/endian.hh>
#include <cfb/exceptions.hh>
#include <cstring>

namespace cfb {

    const std::byte* block_view::consume(std::size_t n) {
        THROW_EOF_IF(n > m_available, "Block exhausted: requested ", n,
                     " bytes but only ", m_available, " left in block");
        const std::byte* p = m_data;
        m_data += n;
        m_available -= n;
        return p;
    }

    std::uint8_t block_view::read_ubyte() {
        return std::to_integer<std::uint8_t>(*consume(1));
    }

    std::uint16_t block_view::read_ushort_le() {
        std::uint16_t value;
        std::memcpy(&value, consume(sizeof(value)), sizeof(value));
        return swap16le(value);
    }

    std::uint32_t block_view::read_int_le() {
        std::uint32_t value;
        std::memcpy(&value, consume(sizeof(value)), sizeof(value));
        return swap32le(value);
    }

    std::uint64_t block_view::read_long_le() {
        std::uint64_t value;
        std::memcpy(&value, consume(sizeof(value)), sizeof(value));
        return swap64le(value);
    }

    std::uint64_t block_view::read_le(std::size_t n) {
        THROW_ARGUMENT_IF(n > sizeof(std::uint64_t), "Cannot decode ", n, " bytes into a 64-bit value");
        const std::byte* p = consume(n);
        std::uint64_t value = 0;
        for (std::size_t i = 0; i < n; i++) {
            value |= std::to_integer<std::uint64_t>(p[i]) << (8 * i);
        }
        return value;
    }

    void block_view::read_fully(std::byte* dst, std::size_t n) {
        if (n == 0) {
            return;
        }
        std::memcpy(dst, consume(n), n);
    }

    void block_view::skip(std::size_t n) {
        consume(n);
    }

} // namespace cfb
