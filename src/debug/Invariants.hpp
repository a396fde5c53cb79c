#ifndef TABLETURF_INVARIANTS_HPP
#define TABLETURF_INVARIANTS_HPP

#include <format>
#include <utility>
#include <variant>

#include "../core/Exception.hpp"
#include "../core/GameState.hpp"
#include "../core/Types.hpp"

namespace tableturf::core::debug
{
    // A second layer of checks over a whole GameState, run between turns by the self-play tests.
    // Violations throw AssertionError.
    inline auto CheckInvariants(GameState const& g, uint32_t start_turns = constants::InitialTurns) -> void
    {
#if TT_ENABLE_TEST_HOOKS == false
        (void)g;
        (void)start_turns;
#else
        // 1) Board dimensions stay inside the format limits and nothing stored reads as OutOfBounds
        Board const& b = g.GetBoard();
        TT_ASSERT(b.Width() > 0 && b.Width() <= constants::MaxBoardWidth, "board width out of range");
        TT_ASSERT(b.Height() > 0 && b.Height() <= constants::MaxBoardHeight, "board height out of range");
        TT_ASSERT(b.Spaces().size() == b.Width() * b.Height(), "board storage does not match its size");
        for (BoardSpace const& s : b.Spaces())
        {
            TT_ASSERT(!std::holds_alternative<OutOfBoundsSpace>(s), "OutOfBounds stored on the board");
        }

        // 2) Turn counter never exceeds where it started
        TT_ASSERT(g.TurnsLeft() <= start_turns,
                  std::format("turns_left {} above start {}", g.TurnsLeft(), start_turns));

        for (PlayerNum const p : {PlayerNum::P1, PlayerNum::P2})
        {
            Player const& pl = g.PlayerAt(p);
            TT_ASSERT(pl.Num() == p, "player stored in the wrong slot");

            // 3) Held cards are distinct and already taken out of the deck
            Deck const& deck = pl.OwnDeck();
            for (DeckIndex const d : pl.CurrentHand().Cards())
            {
                TT_ASSERT(!deck.IsAvailable(d),
                          std::format("P{} holds card {} that is still in the deck",
                                      static_cast<int>(Idx(p)) + 1, static_cast<int>(std::to_underlying(d)) + 1));
            }

            // 4) At least the hand is missing from the deck
            TT_ASSERT(deck.AvailableCount() <= constants::DeckSize - constants::HandSize,
                      "deck has more cards available than were never dealt");
        }
#endif
    }
}

#endif //TABLETURF_INVARIANTS_HPP
