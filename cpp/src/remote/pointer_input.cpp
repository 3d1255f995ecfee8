// src/remote/pointer_input.cpp
#include "lgtv_service.hpp"
#include "remote/pointer_input.hpp"
#include "remote/websocket_transport.hpp"

#include <thread>

namespace lgtv::remote
{

namespace
{

constexpr const char *kPointerSocketUri = "ssap://com.webos.service.networkinput/getPointerInputSocket";
constexpr const char *kClickFrame = "type:click\n\n\n";

struct ButtonName
{
    std::string_view name;
    std::string_view wire; ///< Empty for click, which has its own frame.
};

constexpr ButtonName kButtons[] = {
    {"up", "UP"},
    {"down", "DOWN"},
    {"left", "LEFT"},
    {"right", "RIGHT"},
    {"click", ""},
    {"back", "BACK"},
    {"enter", "ENTER"},
    {"home", "HOME"},
    {"exit", "EXIT"},
    {"red", "RED"},
    {"green", "GREEN"},
    {"yellow", "YELLOW"},
    {"blue", "BLUE"},
    {"channel_up", "CHANNELUP"},
    {"channel_down", "CHANNELDOWN"},
    {"volume_up", "VOLUMEUP"},
    {"volume_down", "VOLUMEDOWN"},
    {"play", "PLAY"},
    {"pause", "PAUSE"},
    {"stop", "STOP"},
    {"rewind", "REWIND"},
    {"fast_forward", "FASTFORWARD"},
    {"asterisk", "ASTERISK"},
};

} // namespace

RemoteResult<PointerInputSocket> PointerInputSocket::open(RemoteSession &session,
                                                          UrlConnector connector,
                                                          std::chrono::milliseconds timeout)
{
    auto reply = session.call(kPointerSocketUri);
    if (reply.is_error())
    {
        return RemoteResult<PointerInputSocket>::propagate(reply);
    }
    const auto &payload = reply.content();
    auto path = payload.find("socketPath");
    if (path == payload.end() || !path->is_string())
    {
        return RemoteResult<PointerInputSocket>::error(RemoteErrc::ProtocolError, 0,
                                                       "getPointerInputSocket returned no socketPath");
    }
    if (!connector)
    {
        connector = &WebSocketTransport::connect_url;
    }
    LOGGER_DEBUG("PointerInputSocket: connecting to {}", path->get<std::string>());
    auto transport = connector(path->get<std::string>(), timeout);
    if (transport.is_error())
    {
        return RemoteResult<PointerInputSocket>::propagate(transport);
    }
    return RemoteResult<PointerInputSocket>::ok(PointerInputSocket(std::move(transport).content()));
}

PointerInputSocket::PointerInputSocket(TransportPtr transport) : m_transport(std::move(transport)) {}

PointerInputSocket::~PointerInputSocket()
{
    close();
}

const std::vector<std::string> &PointerInputSocket::button_names()
{
    static const std::vector<std::string> names = []
    {
        std::vector<std::string> out;
        for (const auto &button : kButtons)
        {
            out.emplace_back(button.name);
        }
        return out;
    }();
    return names;
}

std::optional<std::string> PointerInputSocket::button_frame(std::string_view name)
{
    for (const auto &button : kButtons)
    {
        if (format_tools::iequals(button.name, name))
        {
            if (button.wire.empty())
            {
                return std::string(kClickFrame);
            }
            return fmt::format("type:button\nname:{}\n\n", button.wire);
        }
    }
    return std::nullopt;
}

RemoteStatus PointerInputSocket::send_button(std::string_view name)
{
    if (!m_transport)
    {
        return RemoteStatus::error(RemoteErrc::TransportClosed, 0, "pointer socket is closed");
    }
    auto frame = button_frame(name);
    if (!frame)
    {
        return RemoteStatus::error(RemoteErrc::InvalidPayload, 0,
                                   fmt::format("unknown button '{}'", name));
    }
    return m_transport->send(std::move(*frame));
}

RemoteStatus PointerInputSocket::send_buttons(const std::vector<std::string> &names)
{
    bool first = true;
    for (const auto &name : names)
    {
        if (!button_frame(name))
        {
            LOGGER_WARN("PointerInputSocket: skipping unknown button '{}'", name);
            continue;
        }
        if (!first)
        {
            std::this_thread::sleep_for(kButtonInterval);
        }
        first = false;
        auto sent = send_button(name);
        if (sent.is_error())
        {
            return sent;
        }
    }
    return RemoteStatus::ok();
}

RemoteStatus PointerInputSocket::click()
{
    return send_button("click");
}

void PointerInputSocket::close()
{
    if (m_transport)
    {
        m_transport->close();
        m_transport.reset();
    }
}

} // namespace lgtv::remote
