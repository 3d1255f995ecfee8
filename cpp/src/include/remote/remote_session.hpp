#pragma once
/**
 * @file remote_session.hpp
 * @brief One authenticated connection to a TV: calls, subscriptions and the credential.
 *
 * Usage:
 * @code
 * SessionOptions options;
 * options.host = "192.168.1.20";
 * options.client_key = stored_key;
 * auto session = RemoteSession::connect(options);
 * if (session.is_ok()) {
 *     auto volume = session.content().call("ssap://audio/setVolume", {{"volume", 25}});
 * }
 * @endcode
 *
 * `disconnect()` (or destruction) closes the connection; every call still waiting fails
 * with TransportClosed and every subscription reaches end-of-stream.
 */
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "lgtv_core_export.h"
#include "remote/endpoint.hpp"
#include "remote/handshake.hpp"
#include "remote/subscription_registry.hpp"
#include "remote/transport.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace lgtv::remote
{

struct SessionOptions
{
    std::string host;
    uint16_t port{0}; ///< 0 -> 3000, or 3001 when encrypted.
    bool encrypted{false};
    std::optional<std::string> client_key;
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds call_timeout{10000};
    HandshakeOptions handshake;
    SubscriptionOptions subscription;
    /// Empty -> WebSocketTransport.
    TransportFactory transport_factory;
    /// nullptr -> EndpointCatalog::builtin().
    const EndpointCatalog *catalog{nullptr};
    /// Sees every handshake transition; AwaitingConfirmation means the TV shows a prompt.
    Handshake::StateObserver on_handshake_state;
};

class LGTV_CORE_EXPORT RemoteSession
{
  public:
    /**
     * @brief Opens the transport and registers with the TV.
     * @return Unreachable / TlsFailure / ConnectTimeout, PairingRejected, PairingTimeout,
     *         ProtocolError, Timeout or TransportClosed on failure.
     */
    static RemoteResult<RemoteSession> connect(SessionOptions options);

    ~RemoteSession();
    RemoteSession(RemoteSession &&) noexcept;
    RemoteSession &operator=(RemoteSession &&) noexcept;
    RemoteSession(const RemoteSession &) = delete;
    RemoteSession &operator=(const RemoteSession &) = delete;

    /// @brief Validates the endpoint and payload, then waits for the response payload.
    RemoteResult<Json> call(std::string_view uri, Json payload = nullptr);
    RemoteResult<Json> call(std::string_view uri, Json payload, std::chrono::milliseconds timeout);

    RemoteResult<Subscription> subscribe(std::string_view uri, Json payload = nullptr);
    void unsubscribe(Subscription &subscription);

    /// @brief The client key in effect; persist it to skip the pairing prompt next time.
    const std::string &current_credential() const;

    /// @brief True when the TV issued a key different from the one passed in.
    bool credential_changed() const;

    HandshakeState handshake_state() const;
    const std::string &host() const;
    bool is_connected() const;
    size_t active_subscriptions() const;

    /// @brief Idempotent; safe while other threads are inside call().
    void disconnect();

  private:
    struct Impl;
    explicit RemoteSession(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> pImpl;
};

} // namespace lgtv::remote

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
