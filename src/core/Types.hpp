#ifndef TABLETURF_TYPES_HPP
#define TABLETURF_TYPES_HPP

#define TT_ENABLE_TEST_HOOKS true

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <utility>
#include <variant>

namespace tableturf::core::constants
{
    inline constexpr size_t MaxBoardWidth = 26;
    inline constexpr size_t MaxBoardHeight = 26;
    inline constexpr size_t CardWidth = 8;
    inline constexpr size_t DeckSize = 15;
    inline constexpr size_t HandSize = 4;
    inline constexpr uint32_t InitialTurns = 12;
}

namespace tableturf::core
{
    enum class PlayerNum : uint8_t
    {
        P1 = 0,
        P2
    };

    inline constexpr auto Other(PlayerNum const p) noexcept -> PlayerNum
    {
        return p == PlayerNum::P1 ? PlayerNum::P2 : PlayerNum::P1;
    }

    inline constexpr auto Idx(PlayerNum const p) noexcept -> size_t
    {
        return static_cast<size_t>(std::to_underlying(p));
    }

    // Board cell states. OutOfBounds is only produced by lookups.
    struct EmptySpace
    {
        auto operator==(EmptySpace const&) const -> bool = default;
    };

    struct InkSpace
    {
        PlayerNum owner;
        auto operator==(InkSpace const&) const -> bool = default;
    };

    struct SpecialSpace
    {
        PlayerNum owner;
        bool activated{false};
        auto operator==(SpecialSpace const&) const -> bool = default;
    };

    struct WallSpace
    {
        auto operator==(WallSpace const&) const -> bool = default;
    };

    struct OutOfBoundsSpace
    {
        auto operator==(OutOfBoundsSpace const&) const -> bool = default;
    };

    using BoardSpace = std::variant<EmptySpace, InkSpace, SpecialSpace, WallSpace, OutOfBoundsSpace>;

    inline auto IsEmpty(BoardSpace const& s) noexcept -> bool
    {
        return std::holds_alternative<EmptySpace>(s);
    }

    // Ink or special (either state) owned by p
    inline auto IsInkOf(BoardSpace const& s, PlayerNum const p) noexcept -> bool
    {
        if (auto const* ink = std::get_if<InkSpace>(&s)) return ink->owner == p;
        if (auto const* sp = std::get_if<SpecialSpace>(&s)) return sp->owner == p;
        return false;
    }

    inline auto IsSpecialOf(BoardSpace const& s, PlayerNum const p) noexcept -> bool
    {
        auto const* sp = std::get_if<SpecialSpace>(&s);
        return sp && sp->owner == p;
    }

    inline auto IsInactiveSpecialOf(BoardSpace const& s, PlayerNum const p) noexcept -> bool
    {
        auto const* sp = std::get_if<SpecialSpace>(&s);
        return sp && sp->owner == p && !sp->activated;
    }

    enum class InkType : uint8_t
    {
        Normal = 0,
        Special
    };

    using CardSpace = std::optional<InkType>;
    using Grid = std::array<std::array<CardSpace, constants::CardWidth>, constants::CardWidth>;

    enum class HandIndex : uint8_t
    {
        H1 = 0,
        H2,
        H3,
        H4
    };

    enum class DeckIndex : uint8_t
    {
        D1 = 0,
        D2,
        D3,
        D4,
        D5,
        D6,
        D7,
        D8,
        D9,
        D10,
        D11,
        D12,
        D13,
        D14,
        D15
    };

    inline constexpr auto ToDeckIndex(size_t const i) noexcept -> std::optional<DeckIndex>
    {
        if (i >= constants::DeckSize) return std::nullopt;
        return static_cast<DeckIndex>(i);
    }

    // Number of counter-clockwise quarter turns
    enum class Rotation : uint8_t
    {
        Zero = 0,
        One,
        Two,
        Three
    };

    enum class Outcome : uint8_t
    {
        P1Win,
        P2Win,
        Draw
    };

    struct Config
    {
        uint64_t seed{std::random_device{}()};
        uint32_t turns{constants::InitialTurns};
    };
}

#endif //TABLETURF_TYPES_HPP
