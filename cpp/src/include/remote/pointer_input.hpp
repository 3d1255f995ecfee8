#pragma once
/**
 * @file pointer_input.hpp
 * @brief Remote-control buttons over the TV's pointer input socket.
 *
 * The socket is a second WebSocket whose URL the main session hands out. Frames are
 * plain "key:value" lines, not JSON.
 */
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lgtv_core_export.h"
#include "remote/remote_session.hpp"
#include "remote/transport.hpp"

namespace lgtv::remote
{

class LGTV_CORE_EXPORT PointerInputSocket
{
  public:
    using UrlConnector =
        std::function<RemoteResult<TransportPtr>(std::string_view url, std::chrono::milliseconds)>;

    static constexpr std::chrono::milliseconds kButtonInterval{100};

    /**
     * @brief Asks the session for the socket path and connects to it.
     * @param connector Empty -> WebSocketTransport::connect_url.
     */
    static RemoteResult<PointerInputSocket> open(RemoteSession &session, UrlConnector connector = {},
                                                 std::chrono::milliseconds timeout =
                                                     std::chrono::milliseconds(5000));

    explicit PointerInputSocket(TransportPtr transport);
    ~PointerInputSocket();

    PointerInputSocket(PointerInputSocket &&) noexcept = default;
    PointerInputSocket &operator=(PointerInputSocket &&) noexcept = default;

    /// @brief InvalidPayload for an unknown button name.
    RemoteStatus send_button(std::string_view name);

    /// @brief Sends each known button `kButtonInterval` apart; unknown names are skipped.
    RemoteStatus send_buttons(const std::vector<std::string> &names);

    RemoteStatus click();
    void close();

    /// @brief Accepted (lower-case) button names.
    static const std::vector<std::string> &button_names();

    /// @brief The wire frame for a button, std::nullopt if the name is unknown.
    static std::optional<std::string> button_frame(std::string_view name);

  private:
    TransportPtr m_transport;
};

} // namespace lgtv::remote
