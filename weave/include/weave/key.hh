// weave

#pragma once

#include <compare>
#include <cstdint>

namespace weave {
    template <typename TagT, typename UnderlyingT>
    class wvKey
    {
    public:
        using underlying_type = UnderlyingT;

        constexpr explicit wvKey(UnderlyingT value) noexcept : value_(value) {}

        constexpr UnderlyingT value() const noexcept { return value_; }

        constexpr std::strong_ordering operator<=>(wvKey const&) const noexcept = default;
        constexpr bool operator==(wvKey const&) const noexcept = default;

    private:
        UnderlyingT value_;
    };

    // clang-format off
#define WV_DEFINE_KEY(name, base) \
    class name final : public wvKey<class name, base> { public: using wvKey::wvKey; };
    // clang-format on

} // namespace weave
