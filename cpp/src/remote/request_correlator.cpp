// src/remote/request_correlator.cpp
#include "lgtv_service.hpp"
#include "remote/request_correlator.hpp"

#include <condition_variable>

namespace lgtv::remote
{

namespace
{
// Ids of timed-out requests remembered so their late responses are recognised.
constexpr size_t kMaxDeadIds = 256;
} // namespace

struct RequestCorrelator::PendingSlot
{
    std::condition_variable cv;
    std::optional<RemoteResult<Json>> result;
};

RequestCorrelator::RequestCorrelator(TransportPtr transport) : m_transport(std::move(transport))
{
    if (!m_transport)
    {
        throw std::invalid_argument("RequestCorrelator: transport must not be null");
    }
}

RequestCorrelator::~RequestCorrelator()
{
    shutdown();
}

void RequestCorrelator::start()
{
    if (m_reader.joinable())
    {
        return;
    }
    m_reader = std::thread([this] { reader_loop(); });
}

std::string RequestCorrelator::next_id(std::string_view prefix)
{
    const uint64_t n = m_counter.fetch_add(1, std::memory_order_relaxed) + 1;
    return prefix.empty() ? std::to_string(n) : fmt::format("{}_{}", prefix, n);
}

RemoteResult<Json> RequestCorrelator::call(const Endpoint &endpoint, const Payload &payload,
                                           std::chrono::milliseconds timeout)
{
    return exchange(wire::FrameType::Request, next_id(), endpoint, payload, timeout);
}

RemoteResult<Json> RequestCorrelator::exchange(wire::FrameType type, const std::string &id,
                                               const Endpoint &endpoint, const Payload &payload,
                                               std::chrono::milliseconds timeout)
{
    auto slot = std::make_shared<PendingSlot>();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed)
        {
            return RemoteResult<Json>::error(RemoteErrc::TransportClosed, 0, "session is closed");
        }
        if (!m_pending.emplace(id, slot).second)
        {
            LGTV_PANIC("RequestCorrelator: correlation id '{}' reused", id);
        }
    }

    // The write counts against the call's own deadline.
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    LOGGER_DEBUG("RequestCorrelator: -> {} {} (id {})", wire::to_string(type), endpoint.uri(), id);
    auto sent =
        m_transport->send_for(wire::encode(wire::make_frame(type, id, endpoint, payload)), timeout);

    std::unique_lock<std::mutex> lock(m_mutex);
    if (sent.is_error())
    {
        m_pending.erase(id);
        if (slot->result)
        {
            return std::move(*slot->result);
        }
        if (sent.error() == RemoteErrc::Timeout)
        {
            remember_dead_id(id);
            LOGGER_WARN("RequestCorrelator: {} (id {}) could not be written within {}ms",
                        endpoint.uri(), id, timeout.count());
        }
        return RemoteResult<Json>::propagate(sent);
    }

    slot->cv.wait_until(lock, deadline, [&slot] { return slot->result.has_value(); });
    if (slot->result)
    {
        return std::move(*slot->result);
    }

    // The slot is still registered, so no response can complete it after this point.
    m_pending.erase(id);
    remember_dead_id(id);
    LOGGER_WARN("RequestCorrelator: {} (id {}) timed out after {}ms", endpoint.uri(), id,
                timeout.count());
    return RemoteResult<Json>::error(RemoteErrc::Timeout, 0,
                                     fmt::format("no response to {} within {}ms", endpoint.uri(),
                                                 timeout.count()));
}

RemoteStatus RequestCorrelator::send_only(const wire::OutboundFrame &frame)
{
    if (is_closed())
    {
        return RemoteStatus::error(RemoteErrc::TransportClosed, 0, "session is closed");
    }
    LOGGER_DEBUG("RequestCorrelator: -> {} {} (id {})", wire::to_string(frame.type), frame.uri,
                 frame.id);
    return m_transport->send(wire::encode(frame));
}

void RequestCorrelator::set_unmatched_route(UnmatchedRoute route)
{
    m_route = std::move(route);
}

void RequestCorrelator::add_close_listener(CloseListener listener)
{
    m_close_listeners.push_back(std::move(listener));
}

void RequestCorrelator::reader_loop()
{
    LOGGER_DEBUG("RequestCorrelator: reader started for {}", m_transport->peer());
    while (auto text = m_transport->receive())
    {
        auto decoded = wire::decode(*text);
        if (decoded.is_error())
        {
            LOGGER_WARN("RequestCorrelator: dropping malformed frame: {}", decoded.error_message());
            continue;
        }
        try
        {
            dispatch(decoded.content());
        }
        catch (const std::exception &e)
        {
            LOGGER_ERROR("RequestCorrelator: failed to route frame '{}': {}", decoded.content().id,
                         e.what());
        }
    }
    LOGGER_DEBUG("RequestCorrelator: reader for {} stopped", m_transport->peer());
    finish_closed();
}

void RequestCorrelator::dispatch(wire::InboundFrame &frame)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_pending.find(frame.id);
        if (it != m_pending.end())
        {
            auto slot = std::move(it->second);
            m_pending.erase(it);
            if (auto fault = wire::protocol_fault(frame))
            {
                slot->result.emplace(
                    RemoteResult<Json>::error(RemoteErrc::ProtocolError, fault->code, fault->message));
            }
            else
            {
                slot->result.emplace(RemoteResult<Json>::ok(std::move(frame.payload)));
            }
            slot->cv.notify_one();
            return;
        }
        if (m_dead_ids.count(frame.id) != 0)
        {
            ++m_discarded;
            LOGGER_DEBUG("RequestCorrelator: discarding late response for timed-out id {}", frame.id);
            return;
        }
    }

    if (m_route && m_route(frame))
    {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_discarded;
    LOGGER_DEBUG("RequestCorrelator: discarding unmatched '{}' frame (id '{}')",
                 wire::to_string(frame.type), frame.id);
}

void RequestCorrelator::remember_dead_id(const std::string &id)
{
    if (m_dead_ids.insert(id).second)
    {
        m_dead_order.push_back(id);
        if (m_dead_order.size() > kMaxDeadIds)
        {
            m_dead_ids.erase(m_dead_order.front());
            m_dead_order.pop_front();
        }
    }
}

void RequestCorrelator::finish_closed()
{
    std::map<std::string, std::shared_ptr<PendingSlot>> orphaned;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed)
        {
            return;
        }
        m_closed = true;
        orphaned.swap(m_pending);
        for (auto &[id, slot] : orphaned)
        {
            slot->result.emplace(
                RemoteResult<Json>::error(RemoteErrc::TransportClosed, 0, "connection closed"));
            slot->cv.notify_one();
        }
    }
    if (!orphaned.empty())
    {
        LOGGER_INFO("RequestCorrelator: failed {} pending request(s) on close", orphaned.size());
    }
    for (auto &listener : m_close_listeners)
    {
        listener();
    }
}

void RequestCorrelator::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(m_shutdown_mutex);
        if (m_shutdown_requested)
        {
            return;
        }
        m_shutdown_requested = true;
    }
    m_transport->close();
    if (m_reader.joinable())
    {
        if (m_reader.get_id() == std::this_thread::get_id())
        {
            m_reader.detach();
        }
        else
        {
            m_reader.join();
        }
    }
    finish_closed();
}

bool RequestCorrelator::is_closed() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

size_t RequestCorrelator::pending_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.size();
}

uint64_t RequestCorrelator::discarded_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_discarded;
}

} // namespace lgtv::remote
