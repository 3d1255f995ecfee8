// src/remote/subscription_registry.cpp
#include "lgtv_service.hpp"
#include "remote/subscription_registry.hpp"

namespace lgtv::remote
{

struct SubscriptionState
{
    SubscriptionState(std::string id_, std::string endpoint_, size_t capacity)
        : id(std::move(id_)), endpoint(std::move(endpoint_)), channel(capacity)
    {
    }

    const std::string id;
    const std::string endpoint;
    Json initial;
    utils::BoundedChannel<Json> channel;
};

// ============================================================================
// Subscription
// ============================================================================

Subscription::Subscription(std::shared_ptr<SubscriptionState> state) : m_state(std::move(state)) {}

const std::string &Subscription::id() const
{
    if (!m_state)
    {
        throw std::logic_error("Subscription::id() on an empty handle");
    }
    return m_state->id;
}

const std::string &Subscription::endpoint() const
{
    if (!m_state)
    {
        throw std::logic_error("Subscription::endpoint() on an empty handle");
    }
    return m_state->endpoint;
}

const Json &Subscription::initial() const
{
    if (!m_state)
    {
        throw std::logic_error("Subscription::initial() on an empty handle");
    }
    return m_state->initial;
}

std::optional<Json> Subscription::next()
{
    return m_state ? m_state->channel.pop() : std::nullopt;
}

std::optional<Json> Subscription::next_for(std::chrono::milliseconds timeout)
{
    return m_state ? m_state->channel.pop_for(timeout) : std::nullopt;
}

bool Subscription::ended() const
{
    return !m_state || m_state->channel.is_drained();
}

uint64_t Subscription::dropped() const
{
    return m_state ? m_state->channel.dropped() : 0;
}

Subscription::Iterator::Iterator(Subscription *owner) : m_owner(owner)
{
    ++*this;
}

Subscription::Iterator &Subscription::Iterator::operator++()
{
    m_current = m_owner ? m_owner->next() : std::nullopt;
    return *this;
}

// ============================================================================
// SubscriptionRegistry
// ============================================================================

SubscriptionRegistry::SubscriptionRegistry(RequestCorrelator &correlator,
                                           SubscriptionOptions options)
    : m_correlator(correlator), m_options(options)
{
    m_correlator.set_unmatched_route([this](wire::InboundFrame &frame) { return deliver(frame); });
    m_correlator.add_close_listener([this] { close_all(); });
}

SubscriptionRegistry::~SubscriptionRegistry()
{
    close_all();
}

RemoteResult<Subscription> SubscriptionRegistry::subscribe(const Endpoint &endpoint,
                                                           const Payload &payload)
{
    const std::string id = m_correlator.next_id("sub");
    auto state = std::make_shared<SubscriptionState>(id, endpoint.uri(), m_options.capacity);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_active.emplace(id, state);
    }
    auto guard = basics::make_scope_guard(
        [this, &id, &state]
        {
            take(id);
            state->channel.close();
        });

    auto ack = m_correlator.exchange(wire::FrameType::Subscribe, id, endpoint, payload,
                                     m_options.ack_timeout);
    if (ack.is_error())
    {
        LOGGER_WARN("SubscriptionRegistry: subscribe to {} failed: {}", endpoint.uri(),
                    describe_error(ack));
        return RemoteResult<Subscription>::propagate(ack);
    }
    state->initial = std::move(ack).content();
    guard.dismiss();
    LOGGER_DEBUG("SubscriptionRegistry: subscribed to {} (id {})", endpoint.uri(), id);
    return RemoteResult<Subscription>::ok(Subscription(state));
}

void SubscriptionRegistry::unsubscribe(Subscription &subscription)
{
    if (!subscription.valid())
    {
        return;
    }
    // Ids restart in every session; a handle from another registry must not match.
    auto state = take(subscription.id(), subscription.m_state.get());
    if (!state)
    {
        return; // already ended, or not ours
    }
    state->channel.close();

    wire::OutboundFrame frame;
    frame.type = wire::FrameType::Unsubscribe;
    frame.id = state->id;
    frame.uri = state->endpoint;
    auto sent = m_correlator.send_only(frame);
    if (sent.is_error())
    {
        LOGGER_DEBUG("SubscriptionRegistry: unsubscribe frame for {} not sent: {}", state->id,
                     describe_error(sent));
    }
    LOGGER_DEBUG("SubscriptionRegistry: unsubscribed {} (id {})", state->endpoint, state->id);
}

bool SubscriptionRegistry::deliver(wire::InboundFrame &frame)
{
    std::shared_ptr<SubscriptionState> state;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_active.find(frame.id);
        if (it == m_active.end())
        {
            return false;
        }
        state = it->second;
    }

    if (auto fault = wire::protocol_fault(frame))
    {
        LOGGER_WARN("SubscriptionRegistry: {} (id {}) ended by the TV: {} {}", state->endpoint,
                    state->id, fault->code, fault->message);
        take(state->id);
        state->channel.close();
        return true;
    }
    if (state->channel.push(std::move(frame.payload)))
    {
        LOGGER_WARN("SubscriptionRegistry: {} (id {}) is full; dropped oldest event ({} so far)",
                    state->endpoint, state->id, state->channel.dropped());
    }
    return true;
}

void SubscriptionRegistry::close_all()
{
    std::map<std::string, std::shared_ptr<SubscriptionState>> ended;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ended.swap(m_active);
    }
    for (auto &[id, state] : ended)
    {
        state->channel.close();
    }
    if (!ended.empty())
    {
        LOGGER_DEBUG("SubscriptionRegistry: ended {} subscription(s)", ended.size());
    }
}

size_t SubscriptionRegistry::active_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active.size();
}

std::shared_ptr<SubscriptionState> SubscriptionRegistry::take(const std::string &id,
                                                               const SubscriptionState *owner)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_active.find(id);
    if (it == m_active.end() || (owner != nullptr && it->second.get() != owner))
    {
        return nullptr;
    }
    auto state = std::move(it->second);
    m_active.erase(it);
    return state;
}

} // namespace lgtv::remote
