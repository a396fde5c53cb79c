#ifndef TABLETURF_PLAYER_HPP
#define TABLETURF_PLAYER_HPP

#include <cstdint>
#include "Types.hpp"
#include "Card.hpp"
#include "Deck.hpp"

namespace tableturf::core
{
    class Player
    {
    public:
        Player(Hand hand, Deck deck, PlayerNum num, uint32_t special);

        auto Num() const noexcept -> PlayerNum { return num_; }
        auto CurrentHand() const noexcept -> Hand const& { return hand_; }
        auto OwnDeck() const noexcept -> Deck const& { return deck_; }
        auto Special() const noexcept -> uint32_t { return special_; }

        auto CardAt(HandIndex h) const -> Card const&;

        // Re-deal from the same fifteen cards, every card available again.
        auto RedrawHand(DrawRng& rng) -> void;
        // Leaves the slot alone once the deck is exhausted.
        auto ReplaceCard(HandIndex h, DrawRng& rng) -> void;

        // Pay the cost of the card in slot h. Validation guarantees the meter covers it.
        auto SpendSpecial(HandIndex h) -> void;
        auto GainSpecial(uint32_t amount) -> void { special_ += amount; }

        auto operator==(Player const&) const -> bool = default;
    private:
        Hand hand_;
        Deck deck_;
        PlayerNum num_;
        uint32_t special_;
    };
}

#endif //TABLETURF_PLAYER_HPP
