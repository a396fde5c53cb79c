#ifndef TABLETURF_SENDER_HPP
#define TABLETURF_SENDER_HPP

#include <expected>
#include <string>
#include <string_view>

namespace tableturf::net
{
    struct SendError
    {
        std::string message;
    };

    // Outbound text channel to one client. One attempt per call, no retries.
    class Sender
    {
    public:
        virtual ~Sender() = default;

        virtual auto Send(std::string_view text) -> std::expected<void, SendError> = 0;
    };
}

#endif //TABLETURF_SENDER_HPP
