// tests/test_framework/fake_tv.h
#pragma once
/**
 * @file fake_tv.h
 * @brief Scripted TV behind a FakeTransport.
 *
 * A background thread answers the client's frames: registration according to the
 * pairing script, requests from per-URI handlers, subscriptions with an initial
 * payload. Tests push events to live subscriptions with push_event().
 */
#include "fake_transport.h"

#include <atomic>
#include <functional>
#include <map>
#include <set>
#include <thread>

namespace lgtv::tests::helper
{

enum class PairingMode
{
    Accept,      ///< Prompt (without a valid key), then registered.
    Reject,      ///< Prompt, then "403 User denied access".
    IgnorePrompt ///< Prompt, then silence.
};

class FakeTv
{
  public:
    /// @brief Returns the response payload; `{"returnValue": false, ...}` reports a failure.
    using Handler = std::function<Json(const Json &payload)>;

    explicit FakeTv(std::shared_ptr<FakeTransport> transport);
    ~FakeTv();

    FakeTv(const FakeTv &) = delete;
    FakeTv &operator=(const FakeTv &) = delete;

    // ── Script (set before start) ───────────────────────────────────────────
    void set_pairing(PairingMode mode) { m_pairing = mode; }
    /// @brief Keys the TV accepts without a prompt.
    void accept_key(const std::string &key) { m_accepted_keys.insert(key); }
    /// @brief Key handed out after a prompt is accepted.
    void set_issued_key(const std::string &key) { m_issued_key = key; }
    /// @brief A stored key that is not accepted gets an error frame instead of a prompt.
    void set_reject_unknown_keys(bool reject) { m_reject_unknown_keys = reject; }
    void on_request(const std::string &uri, Handler handler);
    void on_subscribe(const std::string &uri, Json initial);
    /// @brief Requests to `uri` are recorded but never answered.
    void drop_requests(const std::string &uri);

    void start();
    void stop();

    // ── Observations ────────────────────────────────────────────────────────
    /// @brief Pushes an event to the live subscription on `uri`. False if there is none.
    bool push_event(const std::string &uri, const Json &payload);

    /// @brief Ends the live subscription on `uri` with an error frame.
    bool end_subscription(const std::string &uri, const std::string &error);

    std::vector<Json> requests() const;
    std::vector<Json> register_frames() const;
    std::set<std::string> unsubscribed_ids() const;
    int prompts_shown() const { return m_prompts.load(); }

  private:
    void serve();
    void handle(const Json &frame);
    void handle_register(const Json &frame);

    std::shared_ptr<FakeTransport> m_transport;
    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::atomic<int> m_prompts{0};

    PairingMode m_pairing{PairingMode::Accept};
    std::set<std::string> m_accepted_keys;
    std::string m_issued_key{"issued-key"};
    bool m_reject_unknown_keys{false};

    mutable std::mutex m_mutex;
    std::map<std::string, Handler> m_handlers;
    std::map<std::string, Json> m_subscribable;
    std::set<std::string> m_dropped;
    std::map<std::string, std::string> m_live_subscriptions; ///< uri -> id
    std::set<std::string> m_unsubscribed;
    std::vector<Json> m_requests;
    std::vector<Json> m_registers;
};

} // namespace lgtv::tests::helper
