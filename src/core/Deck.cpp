#include "Deck.hpp"

#include <algorithm>
#include <format>
#include <memory>
#include <ranges>
#include <string_view>
#include <vector>

#include "Exception.hpp"
#include "Util.hpp"

namespace tableturf::core
{
    Hand::Hand(Indices const& indices) :
        indices_{indices}
    {
        util::DeckIndexUniqueChecker checker;
        for (DeckIndex const d : indices_) checker.Add(d);
        if (checker.ContainsDup())
        {
            TT_THROW(error::Code::Construction,
                     std::format("Failed to create a new Hand since duplicate deck indices were given: [{}, {}, {}, {}]",
                                 std::to_underlying(indices_[0]) + 1, std::to_underlying(indices_[1]) + 1,
                                 std::to_underlying(indices_[2]) + 1, std::to_underlying(indices_[3]) + 1));
        }
    }

    auto Hand::Contains(DeckIndex const d) const noexcept -> bool
    {
        return std::ranges::find(indices_, d) != indices_.end();
    }

    auto Hand::Replace(HandIndex const h, DeckIndex const d) -> void
    {
        TT_ASSERT(!Contains(d), "Replacement card is already in hand");
        indices_[std::to_underlying(h)] = d;
    }

    DeckRng::DeckRng(uint64_t const seed) :
        rng_(seed)
    {
    }

    auto DeckRng::Draw(std::span<DeckIndex const> const candidates) -> std::optional<DeckIndex>
    {
        if (candidates.empty()) return std::nullopt;
        return candidates[std::uniform_int_distribution<size_t>{0, candidates.size() - 1}(rng_)];
    }

    auto DeckRng::DrawHand(std::span<DeckIndex const> const candidates) -> Hand
    {
        TT_ASSERT(candidates.size() >= constants::HandSize, "Not enough cards to deal a hand");
        Hand::Indices picked{};
        std::ranges::sample(candidates, picked.begin(), constants::HandSize, rng_);
        std::ranges::shuffle(picked, rng_);
        return Hand{picked};
    }

    Deck::Deck(Cards const& cards, std::array<bool, constants::DeckSize> const& available) :
        cards_{cards},
        available_{available}
    {
        TT_ASSERT(std::ranges::none_of(cards_, [](CardSP const& c) { return !c; }), "Deck built with a null card");
    }

    auto Deck::Deal(Cards const& cards, DrawRng& rng) -> std::pair<Deck, Hand>
    {
        std::array<DeckIndex, constants::DeckSize> all{};
        for (size_t i = 0; i < all.size(); ++i) all[i] = static_cast<DeckIndex>(i);

        Hand hand = rng.DrawHand(all);
        std::array<bool, constants::DeckSize> available{};
        available.fill(true);
        for (DeckIndex const d : hand.Cards()) available[std::to_underlying(d)] = false;
        return {Deck{cards, available}, std::move(hand)};
    }

    auto Deck::DrawCard(DrawRng& rng) -> std::optional<DeckIndex>
    {
        std::vector<DeckIndex> candidates;
        candidates.reserve(constants::DeckSize);
        for (size_t i = 0; i < available_.size(); ++i)
        {
            if (available_[i]) candidates.push_back(static_cast<DeckIndex>(i));
        }

        std::optional<DeckIndex> const drawn = rng.Draw(candidates);
        if (!drawn) return std::nullopt;
        TT_ASSERT(IsAvailable(*drawn), "Drew a card that is not available");
        available_[std::to_underlying(*drawn)] = false;
        return drawn;
    }

    auto Deck::At(DeckIndex const d) const -> Card const&
    {
        return *cards_[std::to_underlying(d)];
    }

    auto Deck::AvailableCount() const noexcept -> size_t
    {
        return static_cast<size_t>(std::ranges::count(available_, true));
    }

    namespace
    {
        // '.' blank, 'i' ink, 's' special
        auto MakeCard(std::string_view const name, uint32_t const priority, uint32_t const special,
                      std::array<std::string_view, constants::CardWidth> const& rows) -> CardSP
        {
            Grid grid{};
            for (size_t y = 0; y < constants::CardWidth; ++y)
            {
                for (size_t x = 0; x < constants::CardWidth; ++x)
                {
                    char const c = rows[y][x];
                    if (c == 'i') grid[y][x] = InkType::Normal;
                    else if (c == 's') grid[y][x] = InkType::Special;
                }
            }
            return std::make_shared<Card const>(std::string{name}, priority, grid, special);
        }

        auto BuildDefaultDeck() -> Deck::Cards
        {
            return {
                MakeCard("Splattershot", 8, 3, {
                    "........",
                    "........",
                    "..iis...",
                    "..iiii..",
                    "..i.....",
                    "........",
                    "........",
                    "........"}),
                MakeCard("Slosher", 6, 3, {
                    "........",
                    "........",
                    "..i.....",
                    "...si...",
                    "..iii...",
                    "........",
                    "........",
                    "........"}),
                MakeCard("Zapfish", 9, 4, {
                    "........",
                    "........",
                    ".....i..",
                    "...ii...",
                    "...isi..",
                    "..i.ii..",
                    "........",
                    "........"}),
                MakeCard("Blaster", 8, 3, {
                    "........",
                    "........",
                    ".i..is..",
                    "..iiii..",
                    "..i.....",
                    "........",
                    "........",
                    "........"}),
                MakeCard("Splat Dualies", 8, 3, {
                    "........",
                    "........",
                    "..iiii..",
                    "..is....",
                    ".ii.....",
                    "........",
                    "........",
                    "........"}),
                MakeCard("Flooder", 14, 5, {
                    "........",
                    "........",
                    ".isiii..",
                    ".i.i.i..",
                    ".i.i.i..",
                    ".i.i.i..",
                    "........",
                    "........"}),
                MakeCard("Splat Roller", 9, 4, {
                    "........",
                    "........",
                    ".iisii..",
                    "...iii..",
                    "...i....",
                    "........",
                    "........",
                    "........"}),
                MakeCard("Tri-Stringer", 11, 4, {
                    "........",
                    ".isiii..",
                    ".i.i....",
                    ".ii.....",
                    ".i......",
                    ".i......",
                    "........",
                    "........"}),
                MakeCard("Chum", 5, 2, {
                    "........",
                    "........",
                    "...i....",
                    "..si....",
                    "...ii...",
                    "........",
                    "........",
                    "........"}),
                MakeCard("Splat Charger", 8, 3, {
                    "........",
                    "........",
                    "........",
                    "iiiiiii.",
                    "..s.....",
                    "........",
                    "........",
                    "........"}),
                MakeCard("Splatana Wiper", 5, 2, {
                    "........",
                    "...s....",
                    "...i....",
                    "...i....",
                    "...i....",
                    "...i....",
                    "........",
                    "........"}),
                MakeCard("SquidForce", 10, 4, {
                    "........",
                    "...i....",
                    "...i....",
                    ".iiiii..",
                    "...is...",
                    "...i....",
                    "........",
                    "........"}),
                MakeCard("Heavy Splatling", 12, 5, {
                    "........",
                    ".ii.....",
                    ".ii.....",
                    ".ii.....",
                    "..ii....",
                    "...is...",
                    "....ii..",
                    "........"}),
                MakeCard("Splat Bomb", 3, 1, {
                    "........",
                    "........",
                    "........",
                    "....s...",
                    "...ii...",
                    "........",
                    "........",
                    "........"}),
                MakeCard("Marigold", 15, 5, {
                    "........",
                    "...i....",
                    "..iii...",
                    ".i.i.i..",
                    ".iisii..",
                    "..iii...",
                    "........",
                    "........"}),
            };
        }
    }

    auto DefaultDeck() -> Deck::Cards const&
    {
        static Deck::Cards const cards = BuildDefaultDeck();
        return cards;
    }
}
