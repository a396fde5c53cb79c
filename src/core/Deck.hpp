#ifndef TABLETURF_DECK_HPP
#define TABLETURF_DECK_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <random>
#include <span>
#include <utility>
#include "Types.hpp"
#include "Card.hpp"

namespace tableturf::core
{
    // Four distinct references into a deck.
    class Hand
    {
    public:
        using Indices = std::array<DeckIndex, constants::HandSize>;

        // Throws ConstructionError on duplicate indices.
        explicit Hand(Indices const& indices);

        auto operator[](HandIndex const h) const noexcept -> DeckIndex { return indices_[std::to_underlying(h)]; }
        auto Cards() const noexcept -> Indices const& { return indices_; }
        auto Contains(DeckIndex d) const noexcept -> bool;

        // Swap one slot for a deck index not already held.
        auto Replace(HandIndex h, DeckIndex d) -> void;

        auto operator==(Hand const&) const -> bool = default;
    private:
        Indices indices_;
    };

    // Source of randomness for dealing; candidates are always in ascending deck order.
    class DrawRng
    {
    public:
        virtual ~DrawRng() = default;

        virtual auto Draw(std::span<DeckIndex const> candidates) -> std::optional<DeckIndex> = 0;
        virtual auto DrawHand(std::span<DeckIndex const> candidates) -> Hand = 0;
    };

    class DeckRng final : public DrawRng
    {
    public:
        explicit DeckRng(uint64_t seed);

        auto Draw(std::span<DeckIndex const> candidates) -> std::optional<DeckIndex> override;
        auto DrawHand(std::span<DeckIndex const> candidates) -> Hand override;
    private:
        std::mt19937_64 rng_;
    };

    class Deck
    {
    public:
        using Cards = std::array<CardSP, constants::DeckSize>;

        // Deals four cards and marks exactly those unavailable.
        static auto Deal(Cards const& cards, DrawRng& rng) -> std::pair<Deck, Hand>;

        // nullopt once every card has been drawn
        auto DrawCard(DrawRng& rng) -> std::optional<DeckIndex>;

        auto At(DeckIndex d) const -> Card const&;
        auto IsAvailable(DeckIndex d) const noexcept -> bool { return available_[std::to_underlying(d)]; }
        auto AvailableCount() const noexcept -> size_t;
        auto AllCards() const noexcept -> Cards const& { return cards_; }

        auto operator==(Deck const&) const -> bool = default;
    private:
        Deck(Cards const& cards, std::array<bool, constants::DeckSize> const& available);

        Cards cards_;
        std::array<bool, constants::DeckSize> available_;
    };

    // The fifteen starter cards, shared between every deck that uses them.
    auto DefaultDeck() -> Deck::Cards const&;
}

#endif //TABLETURF_DECK_HPP
