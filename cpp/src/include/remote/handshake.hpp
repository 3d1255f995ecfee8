#pragma once
/**
 * @file handshake.hpp
 * @brief Pairing/registration state machine run on a fresh transport.
 *
 * States: Init -> HelloSent -> AwaitingConfirmation -> Authenticated, or Rejected /
 * Failed. A stored client key that the TV refuses is dropped once and registration
 * is retried without it, which puts a pairing prompt on the screen.
 */
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lgtv_core_export.h"
#include "remote/errors.hpp"
#include "remote/transport.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace lgtv::remote
{

enum class HandshakeState
{
    Init,
    HelloSent,
    AwaitingConfirmation,
    Authenticated,
    Rejected,
    Failed
};

LGTV_CORE_EXPORT const char *to_string(HandshakeState state) noexcept;

/// @brief Application identity presented to the TV in the register frame.
struct LGTV_CORE_EXPORT Manifest
{
    std::string app_id{"com.lgtv.remote"};
    std::string vendor_id{"com.lgtv"};
    std::string app_name{"LGTV Remote"};
    std::string vendor_name{"lgtv"};
    std::string app_version{"1.1"};
    std::vector<std::string> permissions = default_permissions();
    /// Optional pre-signed manifest block and signatures, sent verbatim when set.
    nlohmann::json signed_block;
    nlohmann::json signatures;

    static std::vector<std::string> default_permissions();
    nlohmann::json to_json() const;
};

struct HandshakeOptions
{
    Manifest manifest;
    /// Wait for the first answer to a register frame.
    std::chrono::milliseconds hello_timeout{10000};
    /// Wait for the user to answer the pairing prompt.
    std::chrono::milliseconds pairing_timeout{60000};
    bool force_pairing{false};
};

/**
 * @class Handshake
 * @brief Drives one registration exchange; single use.
 *
 * Reads the transport directly, so it must run before anything else consumes frames.
 */
class LGTV_CORE_EXPORT Handshake
{
  public:
    using StateObserver = std::function<void(HandshakeState)>;

    explicit Handshake(HandshakeOptions options = {});

    /**
     * @brief Registers with the TV.
     * @param stored_key Previously issued client key, if any.
     * @return The client key in effect (the stored one or a newly issued one), or
     *         PairingRejected (declined at the prompt) / PairingTimeout / ProtocolError (TV
     *         refused before any prompt) / Timeout / TransportClosed / TransportError.
     */
    RemoteResult<std::string> run(Transport &transport, const std::optional<std::string> &stored_key);

    HandshakeState state() const noexcept { return m_state; }

    /// @brief Number of times a pairing prompt was shown during run().
    int confirmation_prompts() const noexcept { return m_prompts; }

    /// @brief Called on every state transition (from the thread running the handshake).
    void set_state_observer(StateObserver observer) { m_observer = std::move(observer); }

    /// @brief The encoded register frame.
    static std::string build_register_frame(const std::string &id, const HandshakeOptions &options,
                                            const std::optional<std::string> &key);

  private:
    void transition(HandshakeState next);

    HandshakeOptions m_options;
    HandshakeState m_state{HandshakeState::Init};
    int m_prompts{0};
    StateObserver m_observer;
};

} // namespace lgtv::remote

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
