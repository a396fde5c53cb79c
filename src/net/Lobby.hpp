#ifndef TABLETURF_LOBBY_HPP
#define TABLETURF_LOBBY_HPP

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>

#include "core/Types.hpp"
#include "net/Match.hpp"
#include "net/Sender.hpp"

namespace tableturf::net
{
    using MatchId = uint64_t;

    struct IdleStatus
    {
        auto operator==(IdleStatus const&) const -> bool = default;
    };

    struct JoiningStatus
    {
        auto operator==(JoiningStatus const&) const -> bool = default;
    };

    struct InGameStatus
    {
        MatchId match{};
        core::PlayerNum player{};

        auto operator==(InGameStatus const&) const -> bool = default;
    };

    using ClientStatus = std::variant<IdleStatus, JoiningStatus, InGameStatus>;

    // Pairs connected clients into matches and routes their messages. Safe to call from the network thread(s).
    class Lobby
    {
    public:
        // Seeded deck rngs with cfg.turns per match.
        explicit Lobby(core::Config const& cfg);
        explicit Lobby(Match::GameFactory factory);

        auto Connect(ClientId const& id, std::shared_ptr<Sender> sender) -> void;
        auto Disconnect(ClientId const& id) -> void;
        auto OnMessage(ClientId const& id, std::string_view text) -> void;

        auto StatusOf(ClientId const& id) const -> std::optional<ClientStatus>;
        auto MatchCount() const -> size_t;

    private:
        struct Client
        {
            ClientStatus status{IdleStatus{}};
            std::shared_ptr<Sender> sender;
        };

        // A match and the lock its messages are handled under. The lobby mutex is never
        // held while a slot is locked, so one match's turn does not stall the others.
        struct Slot
        {
            explicit Slot(Match m) : match{std::move(m)} {}

            std::mutex mtx;
            Match match;
        };

        // What a message needs once the lobby mutex is released.
        struct Route
        {
            MatchId match{};
            core::PlayerNum player{};
            std::shared_ptr<Slot> slot;
            std::shared_ptr<Sender> own;
            std::shared_ptr<Sender> opponent;
        };

        auto Join(ClientId const& id) -> void;
        auto FindRoute(ClientId const& id, InGameStatus const& where) const -> std::optional<Route>;
        auto Close(Route const& route) -> void;

    private:
        mutable std::mutex mtx_;
        Match::GameFactory factory_;
        std::unordered_map<ClientId, Client> clients_;
        std::unordered_map<MatchId, std::shared_ptr<Slot>> matches_;
        std::deque<ClientId> waiting_;
        MatchId next_match_{1};
    };
}

#endif //TABLETURF_LOBBY_HPP
