#ifndef TABLETURF_BOARD_HPP
#define TABLETURF_BOARD_HPP

#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <utility>
#include <vector>
#include "Types.hpp"
#include "Exception.hpp"

namespace tableturf::core
{
    class Board;

    // An in-bounds coordinate of a particular board. Only Board hands these out.
    class BoardPosition
    {
    public:
        static auto Create(Board const& board, int32_t x, int32_t y)
            -> std::expected<BoardPosition, error::PositionError>;

        auto X() const noexcept -> int32_t { return x_; }
        auto Y() const noexcept -> int32_t { return y_; }

        auto operator==(BoardPosition const&) const -> bool = default;

        friend class Board;
    private:
        BoardPosition(int32_t x, int32_t y) : x_{x}, y_{y} {}

        int32_t x_;
        int32_t y_;
    };

    using BoardWrite = std::pair<BoardPosition, BoardSpace>;

    class Board
    {
    public:
        using Rows = std::vector<std::vector<BoardSpace>>;

        // Throws ConstructionError on no rows, empty rows, ragged rows, or more than 26 in either direction.
        explicit Board(Rows const& rows);

        auto Width() const noexcept -> size_t { return width_; }
        auto Height() const noexcept -> size_t { return height_; }

        // Anything outside the grid, negative included, reads as OutOfBounds.
        auto SpaceAt(int32_t x, int32_t y) const -> BoardSpace;
        auto SpaceAt(BoardPosition const& p) const -> BoardSpace;

        // NW, N, NE, W, E, SW, S, SE
        auto Neighbors(BoardPosition const& p) const -> std::array<BoardSpace, 8>;
        auto IsSurrounded(BoardPosition const& p) const -> bool;
        auto AdjacentToInk(BoardPosition const& p, PlayerNum owner) const -> bool;
        auto AdjacentToSpecial(BoardPosition const& p, PlayerNum owner) const -> bool;

        auto SetSpace(BoardPosition const& p, BoardSpace const& s) -> void;
        // Applied in order, later writes win.
        auto SetInk(std::span<BoardWrite const> writes) -> void;

        auto CountInked(PlayerNum owner) const -> uint32_t;
        // Row-major
        auto SurroundedInactiveSpecials(PlayerNum owner) const -> std::vector<BoardPosition>;

        // anchor + offset with overflow and narrowing checks, then bounds.
        auto AbsolutePosition(int64_t anchor_x, int64_t anchor_y, size_t dx, size_t dy) const
            -> std::expected<BoardPosition, error::PositionError>;

        auto Spaces() const noexcept -> std::span<BoardSpace const> { return spaces_; }

        friend auto operator==(Board const&, Board const&) -> bool = default;
    private:
        auto IndexOf(BoardPosition const& p) const noexcept -> size_t;

        size_t width_;
        size_t height_;
        std::vector<BoardSpace> spaces_;
    };

    // 9 wide, 26 tall, one inactive special per player.
    auto DefaultBoard() -> Board;
}

#endif //TABLETURF_BOARD_HPP
