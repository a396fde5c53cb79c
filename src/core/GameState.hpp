#ifndef TABLETURF_GAMESTATE_HPP
#define TABLETURF_GAMESTATE_HPP

#include <array>
#include <cstdint>
#include <memory>
#include "Types.hpp"
#include "Actions.hpp"
#include "Board.hpp"
#include "Deck.hpp"
#include "Player.hpp"
#include "Rules.hpp"

namespace tableturf::core
{
    class GameState
    {
    public:
        GameState() = delete;
        GameState(Board board,
                  std::array<Player, 2> players,
                  uint32_t turns_left,
                  std::unique_ptr<DrawRng> rng,
                  std::unique_ptr<Rules> rules);

        // Default board, both players dealt from the starter deck (P1 first), meters at zero.
        static auto Fresh(uint32_t turns, std::unique_ptr<DrawRng> rng) -> GameState;

        GameState(GameState const&) = delete;
        auto operator=(GameState const&) -> GameState& = delete;
        GameState(GameState&&) noexcept = default;
        auto operator=(GameState&&) noexcept -> GameState& = default;

        auto Validate(PlayerNum p, RawInput const& raw) const -> Rules::CheckResult;

        // Resolve a full turn, then count it off (never below zero).
        auto Update(ValidInput const& in1, ValidInput const& in2) -> void;

        auto CheckWinner() const -> Outcome;
        auto RedrawHand(PlayerNum p) -> void;

        auto GetBoard() const noexcept -> Board const& { return board_; }
        auto PlayerAt(PlayerNum p) const noexcept -> Player const& { return players_[Idx(p)]; }
        auto TurnsLeft() const noexcept -> uint32_t { return turns_left_; }

        // Compares observable state only; the rng and rules are not part of it.
        friend auto operator==(GameState const& a, GameState const& b) -> bool
        {
            return a.board_ == b.board_ && a.players_ == b.players_ && a.turns_left_ == b.turns_left_;
        }

        //allows class to directly access private data on an instance
        friend class ClassicRules;
    private:
        auto MutablePlayer(PlayerNum p) noexcept -> Player& { return players_[Idx(p)]; }

        Board board_;
        std::array<Player, 2> players_;
        uint32_t turns_left_;
        std::unique_ptr<DrawRng> rng_;
        std::unique_ptr<Rules> rules_;
    };
}

#endif //TABLETURF_GAMESTATE_HPP
