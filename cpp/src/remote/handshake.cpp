// src/remote/handshake.cpp
#include "lgtv_service.hpp"
#include "remote/handshake.hpp"
#include "remote/wire.hpp"

namespace lgtv::remote
{

using Json = nlohmann::json;
using Clock = std::chrono::steady_clock;

const char *to_string(HandshakeState state) noexcept
{
    switch (state)
    {
    case HandshakeState::Init:
        return "Init";
    case HandshakeState::HelloSent:
        return "HelloSent";
    case HandshakeState::AwaitingConfirmation:
        return "AwaitingConfirmation";
    case HandshakeState::Authenticated:
        return "Authenticated";
    case HandshakeState::Rejected:
        return "Rejected";
    case HandshakeState::Failed:
        return "Failed";
    }
    return "Unknown";
}

// ============================================================================
// Manifest
// ============================================================================

std::vector<std::string> Manifest::default_permissions()
{
    return {"LAUNCH",
            "LAUNCH_WEBAPP",
            "APP_TO_APP",
            "CLOSE",
            "TEST_OPEN",
            "TEST_PROTECTED",
            "CONTROL_AUDIO",
            "CONTROL_DISPLAY",
            "CONTROL_INPUT_JOYSTICK",
            "CONTROL_INPUT_MEDIA_RECORDING",
            "CONTROL_INPUT_MEDIA_PLAYBACK",
            "CONTROL_INPUT_TV",
            "CONTROL_POWER",
            "CONTROL_TV_SCREEN",
            "READ_APP_STATUS",
            "READ_CURRENT_CHANNEL",
            "READ_INPUT_DEVICE_LIST",
            "READ_NETWORK_STATE",
            "READ_RUNNING_APPS",
            "READ_TV_CHANNEL_LIST",
            "READ_POWER_STATE",
            "READ_COUNTRY_INFO",
            "READ_SETTINGS",
            "WRITE_NOTIFICATION_TOAST",
            "WRITE_NOTIFICATION_ALERT",
            "WRITE_SETTINGS",
            "CONTROL_INPUT_TEXT",
            "CONTROL_MOUSE_AND_KEYBOARD",
            "READ_INSTALLED_APPS",
            "READ_LGE_SDX",
            "READ_NOTIFICATIONS",
            "SEARCH",
            "READ_UPDATE_INFO",
            "UPDATE_FROM_REMOTE_APP",
            "READ_LGE_TV_INPUT_EVENTS",
            "READ_TV_CURRENT_TIME"};
}

Json Manifest::to_json() const
{
    Json manifest = {
        {"manifestVersion", 1},
        {"appVersion", app_version},
        {"appId", app_id},
        {"vendorId", vendor_id},
        {"localizedAppNames", {{"", app_name}}},
        {"localizedVendorNames", {{"", vendor_name}}},
        {"permissions", permissions},
    };
    if (!signed_block.is_null())
    {
        manifest["signed"] = signed_block;
    }
    if (!signatures.is_null())
    {
        manifest["signatures"] = signatures;
    }
    return manifest;
}

// ============================================================================
// Handshake
// ============================================================================

Handshake::Handshake(HandshakeOptions options) : m_options(std::move(options)) {}

std::string Handshake::build_register_frame(const std::string &id, const HandshakeOptions &options,
                                            const std::optional<std::string> &key)
{
    Json payload = {
        {"forcePairing", options.force_pairing},
        {"pairingType", "PROMPT"},
        {"manifest", options.manifest.to_json()},
    };
    if (key && !key->empty())
    {
        payload["client-key"] = *key;
    }
    wire::OutboundFrame frame;
    frame.type = wire::FrameType::Register;
    frame.id = id;
    frame.payload = std::move(payload);
    return wire::encode(frame);
}

void Handshake::transition(HandshakeState next)
{
    if (next == m_state)
    {
        return;
    }
    LOGGER_DEBUG("Handshake: {} -> {}", to_string(m_state), to_string(next));
    m_state = next;
    if (m_observer)
    {
        m_observer(next);
    }
}

RemoteResult<std::string> Handshake::run(Transport &transport,
                                         const std::optional<std::string> &stored_key)
{
    if (m_state != HandshakeState::Init)
    {
        LGTV_PANIC("Handshake::run called twice (state {})", to_string(m_state));
    }

    std::optional<std::string> key = stored_key;
    if (key && key->empty())
    {
        key.reset();
    }
    int attempt = 0;
    std::string register_id;

    const auto fail = [this](HandshakeState final_state, RemoteErrc err, int code,
                             std::string message)
    {
        transition(final_state);
        LOGGER_WARN("Handshake: {} ({})", message, to_string(err));
        return RemoteResult<std::string>::error(err, code, std::move(message));
    };

    const auto send_register = [&]() -> RemoteStatus
    {
        register_id = fmt::format("register_{}", attempt++);
        auto sent = transport.send_for(build_register_frame(register_id, m_options, key),
                                       m_options.hello_timeout);
        if (sent.is_ok())
        {
            transition(HandshakeState::HelloSent);
        }
        return sent;
    };

    if (auto sent = send_register(); sent.is_error())
    {
        return fail(HandshakeState::Failed, sent.error(), sent.error_code(),
                    "could not send register frame: " + sent.error_message());
    }

    auto deadline = Clock::now() + m_options.hello_timeout;
    while (true)
    {
        const auto now = Clock::now();
        const auto remaining =
            deadline > now ? std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now)
                           : std::chrono::milliseconds(0);
        auto text = transport.receive_for(remaining);
        if (text.is_error())
        {
            if (text.error() == RemoteErrc::Timeout)
            {
                if (m_state == HandshakeState::AwaitingConfirmation)
                {
                    return fail(HandshakeState::Rejected, RemoteErrc::PairingTimeout, 0,
                                fmt::format("pairing prompt not answered within {}ms",
                                            m_options.pairing_timeout.count()));
                }
                return fail(HandshakeState::Failed, RemoteErrc::Timeout, 0,
                            fmt::format("no answer to register within {}ms",
                                        m_options.hello_timeout.count()));
            }
            return fail(HandshakeState::Failed, text.error(), text.error_code(),
                        "connection lost during registration: " + text.error_message());
        }

        auto decoded = wire::decode(text.content());
        if (decoded.is_error())
        {
            LOGGER_WARN("Handshake: ignoring malformed frame: {}", decoded.error_message());
            continue;
        }
        auto &frame = decoded.content();
        if (!frame.id.empty() && frame.id != register_id)
        {
            LOGGER_DEBUG("Handshake: ignoring frame for id '{}'", frame.id);
            continue;
        }

        switch (frame.type)
        {
        case wire::FrameType::Registered:
        {
            auto it = frame.payload.find("client-key");
            std::string issued;
            if (it != frame.payload.end() && it->is_string())
            {
                issued = it->get<std::string>();
            }
            else if (key)
            {
                issued = *key;
            }
            if (issued.empty())
            {
                return fail(HandshakeState::Failed, RemoteErrc::ProtocolError, 0,
                            "registered frame carries no client-key");
            }
            transition(HandshakeState::Authenticated);
            LOGGER_INFO("Handshake: authenticated with {} ({} prompt(s))", transport.peer(),
                        m_prompts);
            return RemoteResult<std::string>::ok(std::move(issued));
        }

        case wire::FrameType::Response:
            if (frame.payload.value("pairingType", std::string()) == "PROMPT")
            {
                ++m_prompts;
                transition(HandshakeState::AwaitingConfirmation);
                LOGGER_INFO("Handshake: waiting for the pairing prompt to be accepted on {}",
                            transport.peer());
                deadline = Clock::now() + m_options.pairing_timeout;
            }
            break;

        case wire::FrameType::Error:
        {
            const auto fault = wire::protocol_fault(frame);
            const int code = fault ? fault->code : 0;
            const std::string message = fault ? fault->message : frame.error;
            if (key && m_state == HandshakeState::HelloSent && attempt == 1)
            {
                LOGGER_WARN("Handshake: stored client key refused ({}); pairing again", message);
                key.reset();
                if (auto sent = send_register(); sent.is_error())
                {
                    return fail(HandshakeState::Failed, sent.error(), sent.error_code(),
                                "could not send register frame: " + sent.error_message());
                }
                deadline = Clock::now() + m_options.hello_timeout;
                break;
            }
            if (m_state == HandshakeState::AwaitingConfirmation)
            {
                return fail(HandshakeState::Rejected, RemoteErrc::PairingRejected, code,
                            "pairing rejected: " + message);
            }
            // No prompt was shown, so nobody declined anything.
            return fail(HandshakeState::Failed, RemoteErrc::ProtocolError, code,
                        "registration refused: " + message);
        }

        default:
            LOGGER_DEBUG("Handshake: ignoring '{}' frame", wire::to_string(frame.type));
            break;
        }
    }
}

} // namespace lgtv::remote
