// weave

#pragma once

#include "weave/types.hh"

#include "assert.hh"

#include <cstdint>
#include <cstring>
#include <string>

namespace weave {
    constexpr uint32_t wvAlign(uint32_t value, uint32_t alignment) noexcept
    {
        uint32_t const mask = alignment - 1;
        uint32_t const overage = value & mask;
        return overage == 0 ? value : value + (alignment - overage);
    }

    template <typename T, uint32_t Count>
    constexpr uint32_t wvCountOf(T (&)[Count]) noexcept
    {
        return Count;
    }

    template <typename ValueT, typename IndexT = uint32_t>
    class wvEnumerated
    {
    public:
        struct Entry
        {
            IndexT index = 0;
            ValueT& item;
        };

        class Iterator
        {
        public:
            constexpr Iterator(ValueT* items, uint32_t index) noexcept : item_(items), index_(index) {}

            constexpr Iterator& operator++() noexcept
            {
                ++index_;
                ++item_;
                return *this;
            }

            constexpr Entry operator*() const noexcept { return {.index = IndexT(index_), .item = *item_}; }

            constexpr bool operator==(Iterator const&) const noexcept = default;

        private:
            ValueT* item_ = nullptr;
            uint32_t index_ = 0;
        };

        constexpr wvEnumerated(ValueT* items, uint32_t size) noexcept : items_(items), size_(size) {}

        constexpr Iterator begin() const noexcept { return Iterator(items_, 0); }
        constexpr Iterator end() const noexcept { return Iterator(items_ + size_, size_); }

    private:
        ValueT* items_ = nullptr;
        uint32_t size_ = 0;
    };

    template <typename ContainerT>
    constexpr auto wvEnumerate(ContainerT& container) noexcept
    {
        return wvEnumerated{container.data(), container.size()};
    }

    constexpr uint32_t wvNameLen(wvName name) noexcept
    {
        if (name.name == nullptr)
            return 0;

        if (name.nameEnd != nullptr)
            return static_cast<uint32_t>(name.nameEnd - name.name);

        return static_cast<uint32_t>(std::char_traits<char>::length(name.name));
    }

    constexpr bool wvIsNameEmpty(wvName name) noexcept
    {
        if (name.name == nullptr)
            return true;

        if (name.nameEnd != nullptr && name.nameEnd == name.name)
            return true;

        return name.name[0] == '\0';
    }

    constexpr bool wvNameEquals(wvName name, char const* literal) noexcept
    {
        uint32_t const length = wvNameLen(name);
        for (uint32_t index = 0; index != length; ++index)
        {
            if (literal[index] == '\0' || literal[index] != name.name[index])
                return false;
        }
        return literal[length] == '\0';
    }

    inline void wvCopyFloats(float* out_values, float const* values, uint32_t count) noexcept
    {
        if (count != 0)
            std::memcpy(out_values, values, count * sizeof(float));
    }
} // namespace weave
