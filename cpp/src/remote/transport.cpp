// src/remote/transport.cpp
#include "remote/transport.hpp"

namespace lgtv::remote
{

RemoteStatus Transport::send(std::string text)
{
    return send_for(std::move(text), kDefaultSendTimeout);
}

std::optional<std::string> Transport::receive()
{
    constexpr std::chrono::milliseconds kPollInterval(500);
    while (true)
    {
        auto frame = receive_for(kPollInterval);
        if (frame.is_ok())
        {
            return std::move(frame).content();
        }
        if (frame.error() != RemoteErrc::Timeout)
        {
            return std::nullopt;
        }
    }
}

} // namespace lgtv::remote
