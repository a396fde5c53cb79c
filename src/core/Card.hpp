#ifndef TABLETURF_CARD_HPP
#define TABLETURF_CARD_HPP

#include <cstdint>
#include <memory>
#include <string>
#include "Types.hpp"

namespace tableturf::core
{
    class Card
    {
    public:
        Card() = delete;
        Card(std::string name, uint32_t priority, Grid const& grid, uint32_t special);

        auto Name() const noexcept -> std::string const& { return name_; }
        auto Priority() const noexcept -> uint32_t { return priority_; }
        auto Special() const noexcept -> uint32_t { return special_; }
        auto Cells() const noexcept -> Grid const& { return grid_; }

        ///////////////////////////////////
        Card(Card const&) = delete;
        auto operator=(Card const&) -> Card& = delete;
    private:
        std::string name_;
        uint32_t priority_;
        Grid grid_;
        uint32_t special_;
    };

    inline auto operator==(Card const& a, Card const& b) -> bool
    {
        return a.Name() == b.Name() && a.Priority() == b.Priority() && a.Special() == b.Special()
            && a.Cells() == b.Cells();
    }

    using CardSP = std::shared_ptr<Card const>;

    // One quarter turn counter-clockwise, in place.
    auto RotateCcw(Grid& grid) noexcept -> void;
    auto Rotated(Grid grid, Rotation r) noexcept -> Grid;
}

#endif //TABLETURF_CARD_HPP
