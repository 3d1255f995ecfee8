#pragma once
/**
 * @file subscription_registry.hpp
 * @brief Long-lived subscriptions: one bounded event channel per subscription id.
 */
#include <chrono>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "lgtv_core_export.h"
#include "remote/endpoint.hpp"
#include "remote/request_correlator.hpp"
#include "utils/bounded_channel.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace lgtv::remote
{

struct SubscriptionOptions
{
    /// Events buffered per subscription; the oldest is dropped beyond this.
    size_t capacity{64};
    std::chrono::milliseconds ack_timeout{10000};
};

struct SubscriptionState;

/**
 * @class Subscription
 * @brief Consumer handle of one subscription.
 *
 * The sequence ends (next() returns std::nullopt) after unsubscribe, after the TV
 * reports an error for the subscription, or when the session closes. Events still
 * buffered at that point are delivered first.
 */
class LGTV_CORE_EXPORT Subscription
{
  public:
    class Iterator
    {
      public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Json;
        using difference_type = std::ptrdiff_t;

        Iterator() = default;
        explicit Iterator(Subscription *owner);

        const Json &operator*() const { return *m_current; }
        const Json *operator->() const { return &*m_current; }
        Iterator &operator++();
        void operator++(int) { ++*this; }

        friend bool operator==(const Iterator &it, std::default_sentinel_t) noexcept
        {
            return !it.m_current.has_value();
        }

      private:
        Subscription *m_owner{nullptr};
        std::optional<Json> m_current;
    };

    Subscription() = default;
    explicit Subscription(std::shared_ptr<SubscriptionState> state);

    bool valid() const noexcept { return static_cast<bool>(m_state); }
    const std::string &id() const;
    const std::string &endpoint() const;

    /// @brief Payload of the acknowledgement (the current value at subscribe time).
    const Json &initial() const;

    /// @brief Blocks for the next event; std::nullopt at end-of-stream.
    std::optional<Json> next();

    /// @brief std::nullopt on timeout or end-of-stream; tell them apart with ended().
    std::optional<Json> next_for(std::chrono::milliseconds timeout);

    /// @brief The sequence is over and every buffered event has been consumed.
    bool ended() const;

    /// @brief Events evicted because the consumer fell behind.
    uint64_t dropped() const;

    Iterator begin() { return Iterator(this); }
    std::default_sentinel_t end() const noexcept { return {}; }

  private:
    friend class SubscriptionRegistry;

    std::shared_ptr<SubscriptionState> m_state;
};

/**
 * @class SubscriptionRegistry
 * @brief Owns live subscriptions and receives their event frames from the correlator.
 */
class LGTV_CORE_EXPORT SubscriptionRegistry
{
  public:
    SubscriptionRegistry(RequestCorrelator &correlator, SubscriptionOptions options = {});
    ~SubscriptionRegistry();

    SubscriptionRegistry(const SubscriptionRegistry &) = delete;
    SubscriptionRegistry &operator=(const SubscriptionRegistry &) = delete;

    /// @brief Sends the subscribe frame and waits for its acknowledgement.
    RemoteResult<Subscription> subscribe(const Endpoint &endpoint, const Payload &payload);

    /**
     * @brief Ends the subscription locally and tells the TV, best-effort.
     *
     * The local registration is removed whatever the send result; a failed send is only
     * logged.
     */
    void unsubscribe(Subscription &subscription);

    /// @brief Appends an event frame to its subscription. False if the id is not live.
    bool deliver(wire::InboundFrame &frame);

    /// @brief Ends every sequence; called when the connection closes.
    void close_all();

    size_t active_count() const;

  private:
    /// Removes `id`; with `owner` set, only if that id still belongs to `owner`.
    std::shared_ptr<SubscriptionState> take(const std::string &id,
                                            const SubscriptionState *owner = nullptr);

    RequestCorrelator &m_correlator;
    SubscriptionOptions m_options;
    mutable std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<SubscriptionState>> m_active;
};

} // namespace lgtv::remote

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
