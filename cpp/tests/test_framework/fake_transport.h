// tests/test_framework/fake_transport.h
#pragma once
/**
 * @file fake_transport.h
 * @brief In-memory Transport: the test plays the TV by pushing inbound frames and
 *        reading what the client sent.
 */
#include "lgtv_remote.hpp"

#include <condition_variable>
#include <deque>
#include <mutex>

namespace lgtv::tests::helper
{

using Json = nlohmann::json;

class FakeTransport final : public lgtv::remote::Transport
{
  public:
    explicit FakeTransport(std::string peer = "fake-tv:3000");
    ~FakeTransport() override;

    // ── Client side (Transport) ─────────────────────────────────────────────
    lgtv::remote::RemoteStatus send_for(std::string text, std::chrono::milliseconds timeout) override;
    lgtv::remote::RemoteResult<std::string> receive_for(std::chrono::milliseconds timeout) override;
    void close() override;
    bool is_open() const override;
    std::string peer() const override;

    // ── TV side ─────────────────────────────────────────────────────────────
    void push_inbound(std::string text);
    void push_frame(const Json &frame) { push_inbound(frame.dump()); }

    /// @brief Next frame written by the client, parsed; std::nullopt on timeout.
    std::optional<Json> pop_outbound_for(std::chrono::milliseconds timeout);

    /// @brief Every frame the client has written so far.
    std::vector<std::string> sent() const;

    /// @brief Subsequent send() calls fail with TransportError.
    void fail_sends(bool fail);

    /// @brief Writes block as if the peer stopped reading; a write still blocked at its
    ///        deadline returns Timeout and closes the transport.
    void stall_sends(bool stall);

    size_t close_calls() const;

  private:
    const std::string m_peer;
    mutable std::mutex m_mutex;
    std::condition_variable m_inbound_cv;
    std::condition_variable m_outbound_cv;
    std::deque<std::string> m_inbound;
    std::deque<std::string> m_outbound;
    std::vector<std::string> m_sent;
    bool m_open{true};
    bool m_fail_sends{false};
    bool m_stall_sends{false};
    size_t m_close_calls{0};
};

/// @brief Factory returning `transport` once; later calls fail with Unreachable.
lgtv::remote::TransportFactory single_use_factory(std::shared_ptr<FakeTransport> transport);

} // namespace lgtv::tests::helper
