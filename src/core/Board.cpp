#include "Board.hpp"

#include <algorithm>
#include <format>
#include <ranges>

#include "Util.hpp"

namespace tableturf::core
{
    auto BoardPosition::Create(Board const& board, int32_t const x, int32_t const y)
        -> std::expected<BoardPosition, error::PositionError>
    {
        using error::PositionError;
        using error::PositionErrorCode;
        using error::Coordinate;
        if (x < 0 || static_cast<size_t>(x) >= board.Width())
        {
            return std::unexpected(PositionError{.code = PositionErrorCode::OutOfBounds,
                                                 .coordinate = Coordinate::X,
                                                 .value = x,
                                                 .limit = board.Width()});
        }
        if (y < 0 || static_cast<size_t>(y) >= board.Height())
        {
            return std::unexpected(PositionError{.code = PositionErrorCode::OutOfBounds,
                                                 .coordinate = Coordinate::Y,
                                                 .value = y,
                                                 .limit = board.Height()});
        }
        return BoardPosition{x, y};
    }

    Board::Board(Rows const& rows)
    {
        if (rows.empty())
        {
            TT_THROW(error::Code::Construction, "Board with no rows given");
        }
        if (rows.size() > constants::MaxBoardHeight)
        {
            TT_THROW(error::Code::Construction,
                     std::format("Board of height {} exceeds the maximum of {}", rows.size(), constants::MaxBoardHeight));
        }
        if (rows.front().empty())
        {
            TT_THROW(error::Code::Construction, "Board contains empty rows");
        }
        size_t const width = rows.front().size();
        if (width > constants::MaxBoardWidth)
        {
            TT_THROW(error::Code::Construction,
                     std::format("Board of width {} exceeds the maximum of {}", width, constants::MaxBoardWidth));
        }
        if (std::ranges::any_of(rows, [width](auto const& r) { return r.size() != width; }))
        {
            TT_THROW(error::Code::Construction, "Not all board rows have the same length");
        }

        width_ = width;
        height_ = rows.size();
        spaces_.reserve(width_ * height_);
        for (auto const& row : rows)
        {
            for (BoardSpace const& s : row)
            {
                if (std::holds_alternative<OutOfBoundsSpace>(s))
                {
                    TT_THROW(error::Code::Construction, "Board rows may not contain out-of-bounds spaces");
                }
                spaces_.push_back(s);
            }
        }
    }

    auto Board::IndexOf(BoardPosition const& p) const noexcept -> size_t
    {
        return static_cast<size_t>(p.Y()) * width_ + static_cast<size_t>(p.X());
    }

    auto Board::SpaceAt(int32_t const x, int32_t const y) const -> BoardSpace
    {
        auto const pos = BoardPosition::Create(*this, x, y);
        if (!pos) return OutOfBoundsSpace{};
        return spaces_[IndexOf(*pos)];
    }

    auto Board::SpaceAt(BoardPosition const& p) const -> BoardSpace
    {
        return SpaceAt(p.X(), p.Y());
    }

    auto Board::Neighbors(BoardPosition const& p) const -> std::array<BoardSpace, 8>
    {
        int32_t const x = p.X();
        int32_t const y = p.Y();
        return {
            SpaceAt(x - 1, y - 1), SpaceAt(x, y - 1), SpaceAt(x + 1, y - 1),
            SpaceAt(x - 1, y), SpaceAt(x + 1, y),
            SpaceAt(x - 1, y + 1), SpaceAt(x, y + 1), SpaceAt(x + 1, y + 1)
        };
    }

    auto Board::IsSurrounded(BoardPosition const& p) const -> bool
    {
        return std::ranges::none_of(Neighbors(p), [](BoardSpace const& s) { return IsEmpty(s); });
    }

    auto Board::AdjacentToInk(BoardPosition const& p, PlayerNum const owner) const -> bool
    {
        return std::ranges::any_of(Neighbors(p), [owner](BoardSpace const& s) { return IsInkOf(s, owner); });
    }

    auto Board::AdjacentToSpecial(BoardPosition const& p, PlayerNum const owner) const -> bool
    {
        return std::ranges::any_of(Neighbors(p), [owner](BoardSpace const& s) { return IsSpecialOf(s, owner); });
    }

    auto Board::SetSpace(BoardPosition const& p, BoardSpace const& s) -> void
    {
        TT_ASSERT(!std::holds_alternative<OutOfBoundsSpace>(s), "OutOfBounds is never written to a board");
        TT_ASSERT(static_cast<size_t>(p.X()) < width_ && static_cast<size_t>(p.Y()) < height_,
                  "BoardPosition from a different board");
        spaces_[IndexOf(p)] = s;
    }

    auto Board::SetInk(std::span<BoardWrite const> const writes) -> void
    {
        for (auto const& [pos, space] : writes)
        {
            SetSpace(pos, space);
        }
    }

    auto Board::CountInked(PlayerNum const owner) const -> uint32_t
    {
        return static_cast<uint32_t>(std::ranges::count_if(spaces_, [owner](BoardSpace const& s)
        {
            return IsInkOf(s, owner);
        }));
    }

    auto Board::SurroundedInactiveSpecials(PlayerNum const owner) const -> std::vector<BoardPosition>
    {
        std::vector<BoardPosition> out;
        for (size_t i = 0; i < spaces_.size(); ++i)
        {
            if (!IsInactiveSpecialOf(spaces_[i], owner)) continue;
            BoardPosition const p{static_cast<int32_t>(i % width_), static_cast<int32_t>(i / width_)};
            if (IsSurrounded(p)) out.push_back(p);
        }
        return out;
    }

    auto Board::AbsolutePosition(int64_t const anchor_x, int64_t const anchor_y,
                                 size_t const dx, size_t const dy) const
        -> std::expected<BoardPosition, error::PositionError>
    {
        using error::PositionError;
        using error::PositionErrorCode;
        using error::Coordinate;

        auto resolve = [](int64_t const anchor, size_t const off, Coordinate const c)
            -> std::expected<int32_t, PositionError>
        {
            auto const offset = static_cast<int64_t>(off);
            std::optional<int64_t> const sum = util::CheckedAdd(anchor, offset);
            if (!sum)
            {
                return std::unexpected(PositionError{.code = PositionErrorCode::Overflow,
                                                     .coordinate = c, .value = anchor, .offset = offset});
            }
            std::optional<int32_t> const narrow = util::Narrow32(*sum);
            if (!narrow)
            {
                return std::unexpected(PositionError{.code = PositionErrorCode::Narrowing,
                                                     .coordinate = c, .value = *sum, .offset = offset});
            }
            return *narrow;
        };

        auto const x = resolve(anchor_x, dx, Coordinate::X);
        if (!x) return std::unexpected(x.error());
        auto const y = resolve(anchor_y, dy, Coordinate::Y);
        if (!y) return std::unexpected(y.error());
        return BoardPosition::Create(*this, *x, *y);
    }

    auto DefaultBoard() -> Board
    {
        constexpr size_t width = 9;
        constexpr size_t height = 26;
        Board::Rows rows(height, std::vector<BoardSpace>(width, EmptySpace{}));
        rows[3][4] = SpecialSpace{.owner = PlayerNum::P2, .activated = false};
        rows[22][4] = SpecialSpace{.owner = PlayerNum::P1, .activated = false};
        return Board{rows};
    }
}
