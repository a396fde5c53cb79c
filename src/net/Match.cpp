#include "net/Match.hpp"

#include <format>
#include <print>
#include <type_traits>
#include <utility>

#include "core/Exception.hpp"

namespace
{
    using namespace tableturf;

    auto Checked(net::Match::GameFactory factory) -> net::Match::GameFactory
    {
        TT_ASSERT(static_cast<bool>(factory), "Match needs a game factory");
        return factory;
    }

    auto Tag(core::PlayerNum const p) -> int
    {
        return static_cast<int>(core::Idx(p)) + 1;
    }
}

namespace tableturf::net
{
    Match::Match(std::array<ClientId, 2> ids, GameFactory factory) :
        ids_{std::move(ids)},
        factory_{Checked(std::move(factory))},
        game_{factory_()}
    {
        TT_ASSERT(ids_[0] != ids_[1], "a client cannot play against itself");
    }

    auto Match::OpponentId(ClientId const& id) const -> ClientId const&
    {
        return ids_[core::Idx(core::Other(PlayerOf(id)))];
    }

    auto Match::PlayerOf(ClientId const& id) const -> core::PlayerNum
    {
        if (id == ids_[0]) return core::PlayerNum::P1;
        if (id == ids_[1]) return core::PlayerNum::P2;
        TT_THROW(core::error::Code::Assertion,
                 std::format("client {} is not part of match {} vs {}", id, ids_[0], ids_[1]));
    }

    auto Match::HandleMessage(core::PlayerNum const player, std::string_view const text,
                              Sender& own, Sender& opponent) -> void
    {
        state_ = std::visit([&]<typename Phase>(Phase const& phase) -> ProtocolState
        {
            if constexpr (std::is_same_v<Phase, RedrawPhase>)
            {
                auto const choice = DecodeChoice(text);
                if (!choice)
                {
                    std::print("[Match] P{} redraw answer dropped: {}\n", Tag(player), choice.error().message);
                    return phase;
                }
                return OnRedraw(phase, player, *choice, own, opponent);
            }
            else if constexpr (std::is_same_v<Phase, BattlePhase>)
            {
                auto const raw = DecodeRawInput(text);
                if (!raw)
                {
                    std::print("[Match] P{} input dropped: {}\n", Tag(player), raw.error().message);
                    return phase;
                }
                auto valid = game_.Validate(player, *raw);
                if (!valid)
                {
                    std::print("[Match] P{} invalid input: {}\n", Tag(player), core::error::describe(valid.error()));
                    return phase;
                }
                return OnInput(phase, player, std::move(*valid), own, opponent);
            }
            else if constexpr (std::is_same_v<Phase, RematchPhase>)
            {
                auto const choice = DecodeChoice(text);
                if (!choice)
                {
                    std::print("[Match] P{} rematch answer dropped: {}\n", Tag(player), choice.error().message);
                    return phase;
                }
                return OnRematch(phase, player, *choice, own, opponent);
            }
            else
            {
                return phase;
            }
        }, state_);
    }

    auto Match::OnRedraw(RedrawPhase phase, core::PlayerNum const player, bool const choice,
                         Sender& own, Sender& opponent) -> ProtocolState
    {
        phase.choices[core::Idx(player)] = choice;
        if (!phase.choices[0] || !phase.choices[1])
        {
            return phase;
        }

        for (core::PlayerNum const p : {core::PlayerNum::P1, core::PlayerNum::P2})
        {
            if (*phase.choices[core::Idx(p)]) game_.RedrawHand(p);
        }
        SendPair(player,
                 EncodeRedraw(game_.PlayerAt(player)), own,
                 EncodeRedraw(game_.PlayerAt(core::Other(player))), opponent);
        return BattlePhase{};
    }

    auto Match::OnInput(BattlePhase phase, core::PlayerNum const player, core::ValidInput input,
                        Sender& own, Sender& opponent) -> ProtocolState
    {
        // a second answer before the turn resolves replaces the first
        phase.inputs[core::Idx(player)] = std::move(input);
        if (!phase.inputs[0] || !phase.inputs[1])
        {
            return phase;
        }

        game_.Update(*phase.inputs[0], *phase.inputs[1]);
        if (game_.TurnsLeft() != 0)
        {
            SendGameStates(player, own, opponent);
            return BattlePhase{};
        }

        core::Outcome const outcome = game_.CheckWinner();
        std::print("[Match] {} vs {} finished: {}\n", ids_[0], ids_[1],
                   outcome == core::Outcome::Draw ? "draw" : outcome == core::Outcome::P1Win ? "P1 wins" : "P2 wins");
        SendPair(player,
                 EncodeGameEnd(OutcomeFor(outcome, player)), own,
                 EncodeGameEnd(OutcomeFor(outcome, core::Other(player))), opponent);
        return RematchPhase{};
    }

    auto Match::OnRematch(RematchPhase phase, core::PlayerNum const player, bool const choice,
                          Sender& own, Sender& opponent) -> ProtocolState
    {
        phase.choices[core::Idx(player)] = choice;
        if (phase.choices[0] == false || phase.choices[1] == false)
        {
            return EndPhase{};
        }
        if (!phase.choices[0] || !phase.choices[1])
        {
            return phase;
        }

        game_ = factory_();
        SendGameStates(player, own, opponent);
        return RedrawPhase{};
    }

    auto Match::SendGameStates(core::PlayerNum const player, Sender& own, Sender& opponent) const -> void
    {
        core::Board const& board = game_.GetBoard();
        SendPair(player,
                 EncodeGameState(board, game_.PlayerAt(player)), own,
                 EncodeGameState(board, game_.PlayerAt(core::Other(player))), opponent);
    }

    auto Match::SendPair(core::PlayerNum const player, std::string const& own_text, Sender& own,
                         std::string const& opp_text, Sender& opponent) const -> void
    {
        if (auto const r = own.Send(own_text); !r)
        {
            std::print("[Match] send to {} failed: {}\n", Id(player), r.error().message);
        }
        if (auto const r = opponent.Send(opp_text); !r)
        {
            std::print("[Match] send to {} failed: {}\n", Id(core::Other(player)), r.error().message);
        }
    }
}
