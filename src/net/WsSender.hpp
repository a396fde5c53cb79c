//
// WsSender.hpp
// Text-frame Sender over one WebSocket++ connection
//

#ifndef TABLETURF_WSSENDER_HPP
#define TABLETURF_WSSENDER_HPP

#include <memory>
#include <string_view>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "net/Sender.hpp"

namespace tableturf::net
{
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using Hdl      = websocketpp::connection_hdl;

    class WsSender final : public Sender
    {
    public:
        WsSender(std::weak_ptr<WsServer> ep, Hdl hdl);

        auto Send(std::string_view text) -> std::expected<void, SendError> override;

    private:
        std::weak_ptr<WsServer> ep_;
        Hdl                     hdl_;
    };
}

#endif // TABLETURF_WSSENDER_HPP
