// weave

#pragma once

#include "assert.hh"
#include "utility.hh"

#include <cstdint>

namespace weave {
    // an object addressed by a byte offset from the field itself, so the
    // containing block can be copied or relocated freely
    template <typename T>
    struct wvRelativeObject
    {
        uint32_t offset = 0;

        constexpr explicit operator bool() const noexcept { return offset != 0; }

        T const* get() const noexcept
        {
            WV_ASSERT(offset != 0);
            return reinterpret_cast<T const*>(reinterpret_cast<uintptr_t>(this) + offset);
        }

        T* get() noexcept
        {
            WV_ASSERT(offset != 0);
            return reinterpret_cast<T*>(reinterpret_cast<uintptr_t>(this) + offset);
        }

        T const& operator*() const noexcept { return *get(); }
        T const* operator->() const noexcept { return get(); }

        void assign(uintptr_t block, uint32_t blockOffset) noexcept
        {
            uintptr_t const self = reinterpret_cast<uintptr_t>(this);
            offset = blockOffset - static_cast<uint32_t>(self - block);
        }

        bool validate(uintptr_t block, uint32_t size) const noexcept
        {
            uintptr_t const start = reinterpret_cast<uintptr_t>(this) + offset;
            uintptr_t const end = start + sizeof(T);
            return start < end && block <= start && end <= block + size;
        }
    };

    template <typename T, typename IndexT = uint32_t>
    struct wvRelativeArray
    {
        wvRelativeObject<T> base;
        uint32_t count = 0;

        constexpr explicit operator bool() const noexcept { return count != 0 && base; }

        uint32_t size() const noexcept { return count; }
        bool contains(IndexT index) const noexcept { return static_cast<uint32_t>(index) < count; }

        T* data() noexcept { return count != 0 ? base.get() : nullptr; }
        T const* data() const noexcept { return count != 0 ? base.get() : nullptr; }

        T const& operator[](IndexT index) const noexcept
        {
            WV_ASSERT(static_cast<uint32_t>(index) < count);
            return base.get()[static_cast<uint32_t>(index)];
        }

        T& operator[](IndexT index) noexcept
        {
            WV_ASSERT(static_cast<uint32_t>(index) < count);
            return base.get()[static_cast<uint32_t>(index)];
        }

        T const* begin() const noexcept { return data(); }
        T const* end() const noexcept { return data() + count; }

        T* begin() noexcept { return data(); }
        T* end() noexcept { return data() + count; }

        // reserves space for length items at the end of a block being laid out
        static uint32_t allocate(uint32_t& size, uint32_t length) noexcept
        {
            size = wvAlign(size, alignof(T));
            uint32_t const start = size;
            size += static_cast<uint32_t>(sizeof(T)) * length;
            return start;
        }

        void assign(uintptr_t block, uint32_t blockOffset, uint32_t length) noexcept
        {
            count = length;
            if (length != 0)
                base.assign(block, blockOffset);
            else
                base.offset = 0;
        }

        bool validate(uintptr_t block, uint32_t size) const noexcept
        {
            if (count == 0)
                return true;
            uintptr_t const start = reinterpret_cast<uintptr_t>(this) + base.offset;
            uintptr_t const end = start + count * sizeof(T);
            return start <= end && block <= start && end <= block + size;
        }
    };
} // namespace weave
