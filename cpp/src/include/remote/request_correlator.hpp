#pragma once
/**
 * @file request_correlator.hpp
 * @brief Matches responses to requests over one authenticated transport.
 *
 * A single reader thread owns the inbound side. Each frame is routed to exactly one
 * of: the pending request with the same id, the unmatched-frame route (subscriptions)
 * or the discard counter. IDs come from a counter owned by the correlator, so they are
 * unique for the lifetime of one session.
 */
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_set>
#include <vector>

#include "lgtv_core_export.h"
#include "remote/endpoint.hpp"
#include "remote/errors.hpp"
#include "remote/transport.hpp"
#include "remote/wire.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace lgtv::remote
{

class LGTV_CORE_EXPORT RequestCorrelator
{
  public:
    /// @brief Returns true if it took the frame.
    using UnmatchedRoute = std::function<bool(wire::InboundFrame &)>;
    using CloseListener = std::function<void()>;

    explicit RequestCorrelator(TransportPtr transport);
    ~RequestCorrelator();

    RequestCorrelator(const RequestCorrelator &) = delete;
    RequestCorrelator &operator=(const RequestCorrelator &) = delete;

    /// @brief Install the route and listeners first; they are not synchronized with the reader.
    void start();

    /// @brief "7" or, with a prefix, "sub_7".
    std::string next_id(std::string_view prefix = {});

    /**
     * @brief Sends a request and waits for its response payload.
     * @return The payload; Timeout, ProtocolError (TV's code and message),
     *         TransportClosed or TransportError.
     */
    RemoteResult<Json> call(const Endpoint &endpoint, const Payload &payload,
                            std::chrono::milliseconds timeout);

    /// @brief Like call() with an explicit frame type and id.
    RemoteResult<Json> exchange(wire::FrameType type, const std::string &id,
                                const Endpoint &endpoint, const Payload &payload,
                                std::chrono::milliseconds timeout);

    /// @brief Writes a frame that expects no response.
    RemoteStatus send_only(const wire::OutboundFrame &frame);

    void set_unmatched_route(UnmatchedRoute route);
    void add_close_listener(CloseListener listener);

    /// @brief Closes the transport and fails every pending request with TransportClosed.
    void shutdown();

    bool is_closed() const;
    size_t pending_count() const;
    uint64_t discarded_count() const;

  private:
    struct PendingSlot;

    void reader_loop();
    void dispatch(wire::InboundFrame &frame);
    void remember_dead_id(const std::string &id);
    void finish_closed();

    TransportPtr m_transport;
    std::thread m_reader;
    std::atomic<uint64_t> m_counter{0};

    mutable std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<PendingSlot>> m_pending;
    std::unordered_set<std::string> m_dead_ids;
    std::deque<std::string> m_dead_order;
    uint64_t m_discarded{0};
    bool m_closed{false};

    std::mutex m_shutdown_mutex;
    bool m_shutdown_requested{false};

    UnmatchedRoute m_route;
    std::vector<CloseListener> m_close_listeners;
};

} // namespace lgtv::remote

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
