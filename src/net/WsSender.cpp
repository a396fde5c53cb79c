//
// WsSender.cpp
//

#include "net/WsSender.hpp"

#include <string>
#include <utility>

namespace tableturf::net
{
    WsSender::WsSender(std::weak_ptr<WsServer> ep, Hdl hdl)
        : ep_{std::move(ep)}
          , hdl_{std::move(hdl)}
    {
    }

    auto WsSender::Send(std::string_view const text) -> std::expected<void, SendError>
    {
        auto ep_sp = ep_.lock();
        if (!ep_sp)
        {
            return std::unexpected(SendError{"server endpoint is gone"});
        }

        websocketpp::lib::error_code ec;
        ep_sp->send(hdl_, std::string{text}, websocketpp::frame::opcode::text, ec);
        if (ec)
        {
            return std::unexpected(SendError{ec.message()});
        }
        return {};
    }
}
