//
// Created by igor on 02/09/2025.
//

#pragma once

#include <cstdint>
#include <cstring>

#include <cfb/cfb_config.h>

namespace cfb {
    // Platform endianness detection using CMake-generated config.
    // Only is_little_endian is consulted; is_big_endian is kept for symmetry.
#if LIBCFB_BIG_ENDIAN
    constexpr bool is_big_endian = true;
    constexpr bool is_little_endian = false;
#else
    constexpr bool is_big_endian = false;
    constexpr bool is_little_endian = true;
#endif

    // Byte swapping functions
    inline uint16_t swap16(uint16_t x) {
        return static_cast<uint16_t>((x << 8) | (x >> 8));
    }

    inline uint32_t swap32(uint32_t x) {
        return ((x << 24) | ((x << 8) & 0x00FF0000) |
                ((x >> 8) & 0x0000FF00) | (x >> 24));
    }

    inline uint64_t swap64(uint64_t x) {
        return ((x << 56) |
                ((x << 40) & 0x00FF000000000000ULL) |
                ((x << 24) & 0x0000FF0000000000ULL) |
                ((x << 8) & 0x000000FF00000000ULL) |
                ((x >> 8) & 0x00000000FF000000ULL) |
                ((x >> 24) & 0x0000000000FF0000ULL) |
                ((x >> 40) & 0x000000000000FF00ULL) |
                (x >> 56));
    }

    // Compound files are little-endian throughout
    inline uint16_t swap16le(uint16_t x) {
        return is_little_endian ? x : swap16(x);
    }

    inline uint32_t swap32le(uint32_t x) {
        return is_little_endian ? x : swap32(x);
    }

    inline uint64_t swap64le(uint64_t x) {
        return is_little_endian ? x : swap64(x);
    }

    // Bit reinterpretation of an IEEE-754 double
    inline double double_from_bits(uint64_t bits) {
        double result;
        std::memcpy(&result, &bits, sizeof(result));
        return result;
    }
}
