// File: src/TableturfServerMain.cpp
//
// Match server over WebSocket++ (no TLS) + Asio.
// Every connection gets a client id and is handed to the lobby, which pairs clients
// that send "join" and routes all further text frames to their match.

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <format>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <print>
#include <string>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/Exception.hpp"
#include "core/Types.hpp"
#include "net/Lobby.hpp"
#include "net/WsSender.hpp"

namespace
{
    using tableturf::net::WsServer;
    using tableturf::net::Hdl;

    struct CmdLine
    {
        std::uint16_t port{9002};
        tableturf::core::Config game{};
    };

    CmdLine parse_args(int argc, char** argv)
    {
        CmdLine c{};
        for (int i = 1; i < argc; ++i)
        {
            std::string key = argv[i];
            auto read_u64 = [&](std::uint64_t& dst)
            {
                if (i + 1 < argc)
                {
                    dst = std::strtoull(argv[++i], nullptr, 10);
                }
            };
            auto read_u32 = [&](std::uint32_t& dst)
            {
                if (i + 1 < argc)
                {
                    dst = static_cast<std::uint32_t>(std::strtoul(argv[++i], nullptr, 10));
                }
            };
            auto read_u16 = [&](std::uint16_t& dst)
            {
                if (i + 1 < argc)
                {
                    dst = static_cast<std::uint16_t>(std::strtoul(argv[++i], nullptr, 10));
                }
            };

            if (key == "--port") { read_u16(c.port); }
            else if (key == "--seed") { read_u64(c.game.seed); }
            else if (key == "--turns") { read_u32(c.game.turns); }
            else
            {
                std::print("[Server] Ignoring unknown option {}\n", key);
            }
        }
        if (c.game.turns == 0)
        {
            c.game.turns = tableturf::core::constants::InitialTurns;
        }
        return c;
    }

    auto run(CmdLine const& cfg) -> void
    {
        std::print("[Server] Booting on port {} | seed {} | {} turns per game\n",
                   cfg.port, cfg.game.seed, cfg.game.turns);

        auto server = std::make_shared<WsServer>();
        server->clear_access_channels(websocketpp::log::alevel::all);
        server->set_access_channels(websocketpp::log::alevel::connect |
            websocketpp::log::alevel::disconnect);
        server->init_asio();
        server->set_reuse_addr(true);

        tableturf::net::Lobby lobby(cfg.game);

        // Map hdl -> client id
        std::mutex map_mx;
        std::map<Hdl, tableturf::net::ClientId, std::owner_less<Hdl>> hdl_to_client;
        std::uint64_t next_client = 1;

        auto const client_of = [&](Hdl const& hdl) -> std::optional<tableturf::net::ClientId>
        {
            std::lock_guard<std::mutex> g(map_mx);
            auto it = hdl_to_client.find(hdl);
            if (it == hdl_to_client.end())
            {
                return std::nullopt;
            }
            return it->second;
        };

        server->set_open_handler([&](Hdl hdl)
        {
            tableturf::net::ClientId id;
            {
                std::lock_guard<std::mutex> g(map_mx);
                id = std::format("client-{}", next_client++);
                hdl_to_client[hdl] = id;
            }
            lobby.Connect(id, std::make_shared<tableturf::net::WsSender>(server, hdl));
        });

        server->set_close_handler([&](Hdl hdl)
        {
            std::optional<tableturf::net::ClientId> id;
            {
                std::lock_guard<std::mutex> g(map_mx);
                auto it = hdl_to_client.find(hdl);
                if (it != hdl_to_client.end())
                {
                    id = it->second;
                    hdl_to_client.erase(it);
                }
            }
            if (id.has_value())
            {
                lobby.Disconnect(*id);
            }
        });

        server->set_message_handler([&](Hdl hdl, WsServer::message_ptr msg)
        {
            // Only text frames are valid
            if (msg->get_opcode() != websocketpp::frame::opcode::text)
            {
                std::print("[Server] Ignoring non-text frame from client\n");
                return;
            }

            std::optional<tableturf::net::ClientId> const id = client_of(hdl);
            if (!id.has_value())
            {
                return;
            }
            lobby.OnMessage(*id, msg->get_payload());
        });

        websocketpp::lib::error_code ec;
        server->listen(cfg.port, ec);
        if (ec)
        {
            TT_THROW(tableturf::core::error::Code::Network,
                     std::format("could not listen on port {}: {}", cfg.port, ec.message()));
        }
        server->start_accept(ec);
        if (ec)
        {
            TT_THROW(tableturf::core::error::Code::Network, std::format("could not accept: {}", ec.message()));
        }
        server->run();
    }
} // anon

int main(int argc, char** argv)
{
    CmdLine const cfg = parse_args(argc, argv);
    try
    {
        run(cfg);
    }
    catch (tableturf::core::OmegaException<tableturf::core::error::Code> const& e)
    {
        std::print("[Server] Fatal: {}\n", e);
        return 1;
    }
    catch (std::exception const& e)
    {
        std::print("[Server] Fatal: {}\n", e.what());
        return 1;
    }
    return 0;
}
