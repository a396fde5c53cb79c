#ifndef TABLETURF_RANDOMAI_HPP
#define TABLETURF_RANDOMAI_HPP

#include <cstdint>
#include <random>
#include <vector>
#include "Actions.hpp"
#include "GameState.hpp"
#include "Types.hpp"

namespace tableturf::core
{
    // Picks uniformly among the legal placements of one random card, or passes when none exist.
    class RandomAI final
    {
    public:
        explicit RandomAI(uint64_t rng_seed);

        auto Play(GameState const& game, PlayerNum me) -> RawInput;

    private:
        template <class Vec>
        auto pick(Vec const& v) -> size_t
        {
            return std::uniform_int_distribution<size_t>{0, v.size() - 1}(rng_);
        }

        auto LegalPlacements(GameState const& game, PlayerNum me, HandIndex h, bool special) const
            -> std::vector<RawInput>;

    private:
        std::mt19937 rng_;
    };
}

#endif //TABLETURF_RANDOMAI_HPP
