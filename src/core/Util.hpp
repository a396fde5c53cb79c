#ifndef TABLETURF_UTIL_HPP
#define TABLETURF_UTIL_HPP

#include <cstdint>
#include <limits>
#include <optional>
#include <utility>
#include "Types.hpp"

namespace tableturf::core::util
{
    // Signed addition that reports overflow instead of wrapping.
    inline auto CheckedAdd(int64_t const a, int64_t const b) noexcept -> std::optional<int64_t>
    {
        if (b > 0 && a > std::numeric_limits<int64_t>::max() - b) return std::nullopt;
        if (b < 0 && a < std::numeric_limits<int64_t>::min() - b) return std::nullopt;
        return a + b;
    }

    inline auto Narrow32(int64_t const v) noexcept -> std::optional<int32_t>
    {
        if (!std::in_range<int32_t>(v)) return std::nullopt;
        return static_cast<int32_t>(v);
    }

    class DeckIndexUniqueChecker
    {
    public:
        DeckIndexUniqueChecker():
            seen_(0), contains_dup_(false) {}
        auto Add(DeckIndex const d) -> void
        {
            uint32_t const bit = uint32_t{1} << std::to_underlying(d);
            contains_dup_ |= static_cast<bool>(seen_ & bit);
            seen_ |= bit;
        }
        [[nodiscard]]
        auto ContainsDup() const -> bool
        {
            return contains_dup_;
        }
    private:
        uint32_t seen_;
        bool contains_dup_;
    };
}

#endif //TABLETURF_UTIL_HPP
