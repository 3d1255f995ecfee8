#pragma once
/**
 * @file websocket_transport.hpp
 * @brief WebSocket transport (plain on 3000, TLS on 3001) built on Boost.Beast.
 *
 * A connected transport owns one io_context and one I/O thread. The stream is only
 * touched from that thread: inbound messages are read continuously into an internal
 * queue consumed by `receive_for()`, and `send_for()` posts the write and waits for it
 * to complete until its deadline.
 */
#include <memory>
#include <string_view>

#include "lgtv_core_export.h"
#include "remote/transport.hpp"

namespace lgtv::remote
{

class LGTV_CORE_EXPORT WebSocketTransport final : public Transport
{
  public:
    class Impl;

    /**
     * @brief Connects and completes the WebSocket upgrade within `options.timeout`.
     * @return Unreachable (resolve/connect/upgrade failed), TlsFailure or ConnectTimeout
     *         on failure.
     */
    static RemoteResult<TransportPtr> connect(const ConnectOptions &options);

    /// @brief Connects to a `ws://host:port/path` or `wss://...` URL.
    static RemoteResult<TransportPtr> connect_url(std::string_view url,
                                                  std::chrono::milliseconds timeout);

    /// @brief The factory sessions use by default.
    static TransportFactory factory();

    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport &) = delete;
    WebSocketTransport &operator=(const WebSocketTransport &) = delete;

    RemoteStatus send_for(std::string text, std::chrono::milliseconds timeout) override;
    RemoteResult<std::string> receive_for(std::chrono::milliseconds timeout) override;
    void close() override;
    bool is_open() const override;
    std::string peer() const override;

  private:
    // Only connect() can name this, so only connect() can construct a transport.
    struct ConnectedTag
    {
        explicit ConnectedTag() = default;
    };

  public:
    WebSocketTransport(ConnectedTag, std::unique_ptr<Impl> impl);

  private:
    std::unique_ptr<Impl> pImpl;
};

} // namespace lgtv::remote
