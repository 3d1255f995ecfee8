// src/remote/remote_session.cpp
#include "lgtv_service.hpp"
#include "remote/remote_session.hpp"
#include "remote/websocket_transport.hpp"

namespace lgtv::remote
{

struct RemoteSession::Impl
{
    SessionOptions options;
    const EndpointCatalog *catalog{nullptr};
    TransportPtr transport;
    std::string credential;
    bool credential_changed{false};
    HandshakeState handshake_state{HandshakeState::Init};
    std::unique_ptr<RequestCorrelator> correlator;
    std::unique_ptr<SubscriptionRegistry> registry;
    std::atomic<bool> disconnected{false};

    /// Parses and validates at the call boundary.
    RemoteStatus prepare(std::string_view uri, Json payload, std::optional<Endpoint> &endpoint,
                         std::optional<Payload> &body) const
    {
        auto parsed = Endpoint::parse(uri);
        if (parsed.is_error())
        {
            return RemoteStatus::propagate(parsed);
        }
        auto wrapped = Payload::from_json(std::move(payload));
        if (wrapped.is_error())
        {
            return RemoteStatus::propagate(wrapped);
        }
        auto valid = catalog->validate(parsed.content(), wrapped.content());
        if (valid.is_error())
        {
            return valid;
        }
        endpoint.emplace(std::move(parsed).content());
        body.emplace(std::move(wrapped).content());
        return RemoteStatus::ok();
    }
};

RemoteSession::RemoteSession(std::unique_ptr<Impl> impl) : pImpl(std::move(impl)) {}

RemoteSession::~RemoteSession()
{
    if (pImpl)
    {
        disconnect();
    }
}

RemoteSession::RemoteSession(RemoteSession &&) noexcept = default;
RemoteSession &RemoteSession::operator=(RemoteSession &&other) noexcept
{
    if (this != &other)
    {
        if (pImpl)
        {
            disconnect();
        }
        pImpl = std::move(other.pImpl);
    }
    return *this;
}

RemoteResult<RemoteSession> RemoteSession::connect(SessionOptions options)
{
    if (options.host.empty())
    {
        return RemoteResult<RemoteSession>::error(RemoteErrc::Unreachable, 0, "no host given");
    }
    auto impl = std::make_unique<Impl>();
    impl->catalog = options.catalog != nullptr ? options.catalog : &EndpointCatalog::builtin();
    if (!options.transport_factory)
    {
        options.transport_factory = WebSocketTransport::factory();
    }

    ConnectOptions connect_options;
    connect_options.host = options.host;
    connect_options.port = options.port;
    connect_options.encrypted = options.encrypted;
    connect_options.timeout = options.connect_timeout;

    auto transport = options.transport_factory(connect_options);
    if (transport.is_error())
    {
        return RemoteResult<RemoteSession>::propagate(transport);
    }
    impl->transport = std::move(transport).content();

    Handshake handshake(options.handshake);
    if (options.on_handshake_state)
    {
        handshake.set_state_observer(options.on_handshake_state);
    }
    auto key = handshake.run(*impl->transport, options.client_key);
    impl->handshake_state = handshake.state();
    if (key.is_error())
    {
        impl->transport->close();
        return RemoteResult<RemoteSession>::propagate(key);
    }
    impl->credential = std::move(key).content();
    impl->credential_changed = !options.client_key || *options.client_key != impl->credential;
    if (impl->credential_changed)
    {
        LOGGER_INFO("RemoteSession: {} issued a new client key", options.host);
    }

    impl->correlator = std::make_unique<RequestCorrelator>(impl->transport);
    impl->registry = std::make_unique<SubscriptionRegistry>(*impl->correlator, options.subscription);
    impl->correlator->start();
    impl->options = std::move(options);
    LOGGER_INFO("RemoteSession: connected to {}", impl->transport->peer());
    return RemoteResult<RemoteSession>::ok(RemoteSession(std::move(impl)));
}

RemoteResult<Json> RemoteSession::call(std::string_view uri, Json payload)
{
    return call(uri, std::move(payload), pImpl->options.call_timeout);
}

RemoteResult<Json> RemoteSession::call(std::string_view uri, Json payload,
                                       std::chrono::milliseconds timeout)
{
    if (pImpl->disconnected.load(std::memory_order_acquire))
    {
        return RemoteResult<Json>::error(RemoteErrc::TransportClosed, 0, "session is disconnected");
    }
    std::optional<Endpoint> endpoint;
    std::optional<Payload> body;
    auto ready = pImpl->prepare(uri, std::move(payload), endpoint, body);
    if (ready.is_error())
    {
        return RemoteResult<Json>::propagate(ready);
    }
    return pImpl->correlator->call(*endpoint, *body, timeout);
}

RemoteResult<Subscription> RemoteSession::subscribe(std::string_view uri, Json payload)
{
    if (pImpl->disconnected.load(std::memory_order_acquire))
    {
        return RemoteResult<Subscription>::error(RemoteErrc::TransportClosed, 0,
                                                 "session is disconnected");
    }
    std::optional<Endpoint> endpoint;
    std::optional<Payload> body;
    auto ready = pImpl->prepare(uri, std::move(payload), endpoint, body);
    if (ready.is_error())
    {
        return RemoteResult<Subscription>::propagate(ready);
    }
    if (const auto *schema = pImpl->catalog->find(endpoint->uri()); schema && !schema->subscribable)
    {
        LOGGER_DEBUG("RemoteSession: {} is not known to push updates", endpoint->uri());
    }
    return pImpl->registry->subscribe(*endpoint, *body);
}

void RemoteSession::unsubscribe(Subscription &subscription)
{
    pImpl->registry->unsubscribe(subscription);
}

const std::string &RemoteSession::current_credential() const
{
    return pImpl->credential;
}

bool RemoteSession::credential_changed() const
{
    return pImpl->credential_changed;
}

HandshakeState RemoteSession::handshake_state() const
{
    return pImpl->handshake_state;
}

const std::string &RemoteSession::host() const
{
    return pImpl->options.host;
}

bool RemoteSession::is_connected() const
{
    return !pImpl->disconnected.load(std::memory_order_acquire) && !pImpl->correlator->is_closed();
}

size_t RemoteSession::active_subscriptions() const
{
    return pImpl->registry->active_count();
}

void RemoteSession::disconnect()
{
    if (pImpl->disconnected.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }
    LOGGER_INFO("RemoteSession: disconnecting from {}", pImpl->options.host);
    pImpl->correlator->shutdown();
}

} // namespace lgtv::remote
