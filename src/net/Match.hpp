#ifndef TABLETURF_MATCH_HPP
#define TABLETURF_MATCH_HPP

#include <array>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "core/Types.hpp"
#include "core/Actions.hpp"
#include "core/GameState.hpp"
#include "net/Codec.hpp"
#include "net/Sender.hpp"

namespace tableturf::net
{
    using ClientId = std::string;

    // true = redraw my hand
    struct RedrawPhase
    {
        std::array<std::optional<bool>, 2> choices{};

        auto operator==(RedrawPhase const&) const -> bool = default;
    };

    struct BattlePhase
    {
        std::array<std::optional<core::ValidInput>, 2> inputs{};

        auto operator==(BattlePhase const&) const -> bool = default;
    };

    // true = play again
    struct RematchPhase
    {
        std::array<std::optional<bool>, 2> choices{};

        auto operator==(RematchPhase const&) const -> bool = default;
    };

    // Terminal. The lobby tears the match down once it sees this.
    struct EndPhase
    {
        auto operator==(EndPhase const&) const -> bool = default;
    };

    using ProtocolState = std::variant<RedrawPhase, BattlePhase, RematchPhase, EndPhase>;

    // One match between two clients. Not thread safe: callers serialise HandleMessage per match.
    class Match
    {
    public:
        using GameFactory = std::function<core::GameState()>;

        Match(std::array<ClientId, 2> ids, GameFactory factory);

        // `own` belongs to `player`, `opponent` to the other side. Bad input is logged and dropped.
        auto HandleMessage(core::PlayerNum player, std::string_view text, Sender& own, Sender& opponent) -> void;

        auto IsOver() const noexcept -> bool { return std::holds_alternative<EndPhase>(state_); }
        auto OpponentId(ClientId const& id) const -> ClientId const&;
        auto PlayerOf(ClientId const& id) const -> core::PlayerNum;
        auto Id(core::PlayerNum p) const noexcept -> ClientId const& { return ids_[core::Idx(p)]; }

        auto State() const noexcept -> ProtocolState const& { return state_; }
        auto Game() const noexcept -> core::GameState const& { return game_; }

    private:
        auto OnRedraw(RedrawPhase phase, core::PlayerNum player, bool choice, Sender& own, Sender& opponent)
            -> ProtocolState;
        auto OnInput(BattlePhase phase, core::PlayerNum player, core::ValidInput input, Sender& own, Sender& opponent)
            -> ProtocolState;
        auto OnRematch(RematchPhase phase, core::PlayerNum player, bool choice, Sender& own, Sender& opponent)
            -> ProtocolState;

        auto SendGameStates(core::PlayerNum player, Sender& own, Sender& opponent) const -> void;
        auto SendPair(core::PlayerNum player, std::string const& own_text, Sender& own,
                      std::string const& opp_text, Sender& opponent) const -> void;

    private:
        std::array<ClientId, 2> ids_;
        GameFactory factory_;
        core::GameState game_;
        ProtocolState state_{RedrawPhase{}};
    };
}

#endif //TABLETURF_MATCH_HPP
