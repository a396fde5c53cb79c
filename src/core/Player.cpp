#include "Player.hpp"

#include <format>
#include <utility>

#include "Exception.hpp"

namespace tableturf::core
{
    Player::Player(Hand hand, Deck deck, PlayerNum const num, uint32_t const special) :
        hand_{std::move(hand)},
        deck_{std::move(deck)},
        num_{num},
        special_{special}
    {
    }

    auto Player::CardAt(HandIndex const h) const -> Card const&
    {
        return deck_.At(hand_[h]);
    }

    auto Player::RedrawHand(DrawRng& rng) -> void
    {
        auto [deck, hand] = Deck::Deal(deck_.AllCards(), rng);
        deck_ = std::move(deck);
        hand_ = std::move(hand);
    }

    auto Player::ReplaceCard(HandIndex const h, DrawRng& rng) -> void
    {
        if (std::optional<DeckIndex> const d = deck_.DrawCard(rng))
        {
            hand_.Replace(h, *d);
        }
    }

    auto Player::SpendSpecial(HandIndex const h) -> void
    {
        uint32_t const cost = CardAt(h).Special();
        TT_ASSERT(special_ >= cost,
                  std::format("Special meter underflow: P{} has {} but spends {}", Idx(num_) + 1, special_, cost));
        special_ -= cost;
    }
}
