// weave

#pragma once

#include <compare>
#include <cstdint>

namespace weave {
    static constexpr struct
    {
        constexpr explicit operator uint32_t() const noexcept { return ~uint32_t{0u}; }
    } wvInvalidIndex;

    template <typename DerivedT>
    class wvIndex
    {
    public:
        using underlying_type = uint32_t;

        constexpr explicit wvIndex(underlying_type value) noexcept : value_(value) {}
        constexpr wvIndex(decltype(wvInvalidIndex)) noexcept : value_(invalid_value) {}

        constexpr underlying_type value() const noexcept { return value_; }
        constexpr explicit operator underlying_type() const noexcept { return value_; }

        constexpr std::strong_ordering operator<=>(wvIndex const&) const noexcept = default;
        constexpr bool operator==(wvIndex const&) const noexcept = default;
        constexpr bool operator==(underlying_type rhs) const noexcept { return value_ == rhs; }
        constexpr bool operator==(decltype(wvInvalidIndex)) const noexcept { return value_ == invalid_value; }

        constexpr DerivedT operator+(underlying_type rhs) const noexcept { return DerivedT{value_ + rhs}; }
        constexpr DerivedT& operator++() noexcept
        {
            ++value_;
            return static_cast<DerivedT&>(*this);
        }

    private:
        static constexpr underlying_type invalid_value = ~underlying_type{0};

        underlying_type value_ = invalid_value;
    };
} // namespace weave

// clang-format off
#define WV_DEFINE_INDEX(name) \
    class name final : public wvIndex<class name> { public: using wvIndex::wvIndex; }
// clang-format on
