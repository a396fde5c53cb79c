#ifndef TABLETURF_CLASSICRULES_HPP
#define TABLETURF_CLASSICRULES_HPP

#include <vector>
#include "Rules.hpp"

namespace tableturf::core
{
    // A cell both placements cover: (position, P1 ink, P2 ink)
    struct Overlap
    {
        BoardPosition pos;
        InkType p1;
        InkType p2;
    };

    class ClassicRules final : public Rules
    {
    public:
        auto Validate(Board const& board, Player const& player, RawInput const& raw) const -> CheckResult override;
        auto Apply(GameState& game, ValidInput const& in1, ValidInput const& in2) -> void override;
        auto Winner(Board const& board) const -> Outcome override;

        // normal/normal and special/special cells take the given spaces; mixed cells go to the special side.
        static auto ResolveOverlap(std::vector<Overlap> const& overlap,
                                   BoardSpace const& normal_collision,
                                   BoardSpace const& special_collision) -> std::vector<BoardWrite>;
    private:
        static auto Place(GameState& game, ValidInput const& in, PlayerNum p) -> void;
        static auto PlaceBoth(GameState& game, ValidInput const& in1, ValidInput const& in2) -> void;
        static auto UpdateSpecialGauge(GameState& game, PlayerNum p) -> void;
    };
}

#endif //TABLETURF_CLASSICRULES_HPP
