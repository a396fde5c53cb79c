#include "RandomAi.hpp"

#include <algorithm>
#include <array>
#include <random>
#include <ranges>

namespace tableturf::core
{
    RandomAI::RandomAI(uint64_t rng_seed):
        rng_(static_cast<std::mt19937::result_type>(rng_seed)) {}

    auto RandomAI::LegalPlacements(GameState const& game, PlayerNum const me, HandIndex const h,
                                   bool const special) const -> std::vector<RawInput>
    {
        Board const& board = game.GetBoard();
        auto const reach = static_cast<int64_t>(constants::CardWidth) - 1;
        std::vector<RawInput> legal;
        for (uint8_t r = 0; r < 4; ++r)
        {
            for (int64_t y = -reach; y < static_cast<int64_t>(board.Height()); ++y)
            {
                for (int64_t x = -reach; x < static_cast<int64_t>(board.Width()); ++x)
                {
                    RawInput const in{
                        .hand_idx = h,
                        .action = PlaceAction{.x = x, .y = y, .special_activated = special,
                                              .rotation = static_cast<Rotation>(r)}
                    };
                    if (game.Validate(me, in).has_value()) legal.push_back(in);
                }
            }
        }
        return legal;
    }

    auto RandomAI::Play(GameState const& game, PlayerNum const me) -> RawInput
    {
        std::array<HandIndex, constants::HandSize> order{HandIndex::H1, HandIndex::H2, HandIndex::H3, HandIndex::H4};
        std::ranges::shuffle(order, rng_);

        Player const& self = game.PlayerAt(me);
        for (HandIndex const h : order)
        {
            bool const can_special = self.Special() >= self.CardAt(h).Special();
            bool const try_special = can_special && std::bernoulli_distribution{0.5}(rng_);

            std::vector<RawInput> legal = LegalPlacements(game, me, h, try_special);
            if (legal.empty() && try_special)
            {
                legal = LegalPlacements(game, me, h, false);
            }
            if (!legal.empty())
            {
                return legal[pick(legal)];
            }
        }
        return RawInput{.hand_idx = order[0], .action = PassAction{}};
    }
}
