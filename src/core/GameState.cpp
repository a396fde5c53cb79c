#include "GameState.hpp"

#include <utility>

#include "ClassicRules.hpp"
#include "Exception.hpp"

namespace tableturf::core
{
    GameState::GameState(Board board,
                         std::array<Player, 2> players,
                         uint32_t const turns_left,
                         std::unique_ptr<DrawRng> rng,
                         std::unique_ptr<Rules> rules) :
        board_{std::move(board)},
        players_{std::move(players)},
        turns_left_{turns_left},
        rng_{std::move(rng)},
        rules_{std::move(rules)}
    {
        TT_ASSERT(rng_ != nullptr, "GameState needs a DrawRng");
        TT_ASSERT(rules_ != nullptr, "GameState needs Rules");
        TT_ASSERT(players_[0].Num() == PlayerNum::P1 && players_[1].Num() == PlayerNum::P2,
                  "Players must be ordered P1, P2");
    }

    auto GameState::Fresh(uint32_t const turns, std::unique_ptr<DrawRng> rng) -> GameState
    {
        TT_ASSERT(rng != nullptr, "GameState needs a DrawRng");
        auto [deck1, hand1] = Deck::Deal(DefaultDeck(), *rng);
        auto [deck2, hand2] = Deck::Deal(DefaultDeck(), *rng);
        return GameState{
            DefaultBoard(),
            {
                Player{std::move(hand1), std::move(deck1), PlayerNum::P1, 0},
                Player{std::move(hand2), std::move(deck2), PlayerNum::P2, 0}
            },
            turns,
            std::move(rng),
            std::make_unique<ClassicRules>()
        };
    }

    auto GameState::Validate(PlayerNum const p, RawInput const& raw) const -> Rules::CheckResult
    {
        return rules_->Validate(board_, PlayerAt(p), raw);
    }

    auto GameState::Update(ValidInput const& in1, ValidInput const& in2) -> void
    {
        rules_->Apply(*this, in1, in2);
        if (turns_left_ > 0)
        {
            --turns_left_;
        }
    }

    auto GameState::CheckWinner() const -> Outcome
    {
        return rules_->Winner(board_);
    }

    auto GameState::RedrawHand(PlayerNum const p) -> void
    {
        MutablePlayer(p).RedrawHand(*rng_);
    }
}
