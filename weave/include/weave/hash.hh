// weave

#pragma once

#include <cstdint>

namespace weave {
    static constexpr uint64_t wvFnvOffsetBasis = 0xcbf2'9ce4'8422'2325ull;
    static constexpr uint64_t wvFnvPrime = 0x0000'0100'0000'01b3ull;

    constexpr uint64_t wvHashFnv1a64(uint8_t const* bytes, uint32_t length, uint64_t hash = wvFnvOffsetBasis) noexcept
    {
        for (uint8_t const* const end = bytes + length; bytes != end; ++bytes)
        {
            hash ^= *bytes;
            hash *= wvFnvPrime;
        }

        return hash;
    }

    constexpr uint64_t wvHashFnv1a64(char const* start, char const* end = nullptr, uint64_t hash = wvFnvOffsetBasis) noexcept
    {
        if (end != nullptr)
        {
            for (; start != end; ++start)
            {
                hash ^= static_cast<uint8_t>(*start);
                hash *= wvFnvPrime;
            }
        }
        else
        {
            for (; *start != '\0'; ++start)
            {
                hash ^= static_cast<uint8_t>(*start);
                hash *= wvFnvPrime;
            }
        }

        return hash;
    }

    // folds a 64-bit value into a running hash, little-endian byte order
    constexpr uint64_t wvHashCombine(uint64_t hash, uint64_t value) noexcept
    {
        for (int shift = 0; shift != 64; shift += 8)
        {
            hash ^= (value >> shift) & 0xffu;
            hash *= wvFnvPrime;
        }
        return hash;
    }
} // namespace weave
