#include "net/Lobby.hpp"

#include <algorithm>
#include <format>
#include <print>
#include <utility>

#include "core/Deck.hpp"
#include "core/Exception.hpp"
#include "core/GameState.hpp"
#include "net/Codec.hpp"

namespace
{
    using namespace tableturf;

    auto SeededFactory(core::Config const& cfg) -> net::Match::GameFactory
    {
        struct Seeds
        {
            std::mutex mtx;
            std::mt19937_64 rng;
        };
        auto seeds = std::make_shared<Seeds>();
        seeds->rng.seed(cfg.seed);

        return [seeds, turns = cfg.turns]()
        {
            uint64_t seed = 0;
            {
                std::lock_guard<std::mutex> lock(seeds->mtx);
                seed = seeds->rng();
            }
            return core::GameState::Fresh(turns, std::make_unique<core::DeckRng>(seed));
        };
    }

    auto Trim(std::string_view text) -> std::string_view
    {
        auto const is_space = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };
        while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
        while (!text.empty() && is_space(text.back())) text.remove_suffix(1);
        return text;
    }

    auto SendOrLog(net::Sender& sender, net::ClientId const& id, std::string_view text) -> void
    {
        if (auto const r = sender.Send(text); !r)
        {
            std::print("[Lobby] send to {} failed: {}\n", id, r.error().message);
        }
    }
}

namespace tableturf::net
{
    Lobby::Lobby(core::Config const& cfg) :
        factory_{SeededFactory(cfg)} {}

    Lobby::Lobby(Match::GameFactory factory) :
        factory_{std::move(factory)}
    {
        TT_ASSERT(static_cast<bool>(factory_), "Lobby needs a game factory");
    }

    auto Lobby::Connect(ClientId const& id, std::shared_ptr<Sender> sender) -> void
    {
        TT_ASSERT(sender != nullptr, "client connected without a sender");
        std::lock_guard<std::mutex> lock(mtx_);
        auto const [it, inserted] = clients_.try_emplace(id, Client{.status = IdleStatus{}, .sender = std::move(sender)});
        if (!inserted)
        {
            TT_THROW(core::error::Code::Protocol, std::format("client {} is already connected", id));
        }
        std::print("[Lobby] {} connected ({} online)\n", id, clients_.size());
    }

    auto Lobby::Disconnect(ClientId const& id) -> void
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto const it = clients_.find(id);
        if (it == clients_.end())
        {
            return;
        }

        if (std::holds_alternative<JoiningStatus>(it->second.status))
        {
            std::erase(waiting_, id);
        }
        else if (auto const* in_game = std::get_if<InGameStatus>(&it->second.status))
        {
            auto const slot = matches_.find(in_game->match);
            if (slot != matches_.end())
            {
                ClientId const opponent = slot->second->match.Id(core::Other(in_game->player));
                if (auto const opp = clients_.find(opponent); opp != clients_.end())
                {
                    SendOrLog(*opp->second.sender, opponent, "leave");
                    opp->second.status = IdleStatus{};
                }
                matches_.erase(slot);
                std::print("[Lobby] match {} abandoned by {}\n", in_game->match, id);
            }
        }
        clients_.erase(it);
        std::print("[Lobby] {} disconnected ({} online)\n", id, clients_.size());
    }

    auto Lobby::OnMessage(ClientId const& id, std::string_view const text) -> void
    {
        std::string_view const msg = Trim(text);
        if (msg == "ping")
        {
            return;
        }

        std::optional<Route> route;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            auto const it = clients_.find(id);
            if (it == clients_.end())
            {
                std::print("[Lobby] message from unknown client {}\n", id);
                return;
            }

            ClientStatus const status = it->second.status;
            if (std::holds_alternative<IdleStatus>(status))
            {
                if (msg == "join") Join(id);
                return;
            }
            auto const* in_game = std::get_if<InGameStatus>(&status);
            if (!in_game)
            {
                return;
            }
            route = FindRoute(id, *in_game);
        }
        if (!route)
        {
            return;
        }

        bool over = false;
        {
            std::lock_guard<std::mutex> match_lock(route->slot->mtx);
            // a message queued behind the one that ended the match
            if (route->slot->match.IsOver())
            {
                return;
            }
            route->slot->match.HandleMessage(route->player, msg, *route->own, *route->opponent);
            over = route->slot->match.IsOver();
        }
        if (over)
        {
            Close(*route);
        }
    }

    auto Lobby::StatusOf(ClientId const& id) const -> std::optional<ClientStatus>
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto const it = clients_.find(id);
        if (it == clients_.end()) return std::nullopt;
        return it->second.status;
    }

    auto Lobby::MatchCount() const -> size_t
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return matches_.size();
    }

    auto Lobby::Join(ClientId const& id) -> void
    {
        if (waiting_.empty())
        {
            clients_.at(id).status = JoiningStatus{};
            waiting_.push_back(id);
            std::print("[Lobby] {} waiting for an opponent\n", id);
            return;
        }

        ClientId const opponent = waiting_.front();
        waiting_.pop_front();

        MatchId const mid = next_match_++;
        auto slot = std::make_shared<Slot>(Match({id, opponent}, factory_));
        core::GameState const& game = slot->match.Game();

        Client& p1 = clients_.at(id);
        Client& p2 = clients_.at(opponent);
        SendOrLog(*p1.sender, id, EncodeGameState(game.GetBoard(), game.PlayerAt(core::PlayerNum::P1)));
        SendOrLog(*p2.sender, opponent, EncodeGameState(game.GetBoard(), game.PlayerAt(core::PlayerNum::P2)));
        p1.status = InGameStatus{.match = mid, .player = core::PlayerNum::P1};
        p2.status = InGameStatus{.match = mid, .player = core::PlayerNum::P2};

        matches_.emplace(mid, std::move(slot));
        std::print("[Lobby] match {} started: {} vs {}\n", mid, id, opponent);
    }

    auto Lobby::FindRoute(ClientId const& id, InGameStatus const& where) const -> std::optional<Route>
    {
        auto const it = matches_.find(where.match);
        if (it == matches_.end())
        {
            std::print("[Lobby] {} points at missing match {}\n", id, where.match);
            return std::nullopt;
        }

        std::shared_ptr<Slot> const& slot = it->second;
        ClientId const opponent = slot->match.OpponentId(id);
        return Route{
            .match = where.match,
            .player = where.player,
            .slot = slot,
            .own = clients_.at(id).sender,
            .opponent = clients_.at(opponent).sender
        };
    }

    auto Lobby::Close(Route const& route) -> void
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto const it = matches_.find(route.match);
        // already torn down by a disconnect
        if (it == matches_.end() || it->second != route.slot)
        {
            return;
        }

        for (core::PlayerNum const p : {core::PlayerNum::P1, core::PlayerNum::P2})
        {
            ClientId const& c = route.slot->match.Id(p);
            auto const client = clients_.find(c);
            if (client == clients_.end())
            {
                continue;
            }
            SendOrLog(*client->second.sender, c, "leave");
            client->second.status = IdleStatus{};
        }
        matches_.erase(it);
        std::print("[Lobby] match {} closed\n", route.match);
    }
}
