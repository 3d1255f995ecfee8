#pragma once
/**
 * @file errors.hpp
 * @brief Error taxonomy of the remote-control client.
 *
 * Every fallible operation returns `RemoteResult<T>` (or `RemoteStatus`). The error
 * carries a `RemoteErrc`, a numeric code (the TV's own code for `ProtocolError`,
 * otherwise 0 or a system error value) and a message.
 */
#include <string>

#include <fmt/format.h>

#include "lgtv_core_export.h"
#include "utils/result.hpp"

namespace lgtv::remote
{

enum class RemoteErrc
{
    TransportError,      ///< I/O failure on an established connection.
    Unreachable,         ///< Connect: host could not be resolved or refused the connection.
    TlsFailure,          ///< Connect: TLS negotiation failed.
    ConnectTimeout,      ///< Connect: no connection within the deadline.
    PairingRejected,     ///< The user declined the pairing prompt (or the TV refused).
    PairingTimeout,      ///< Nobody answered the pairing prompt in time.
    Timeout,             ///< A call got no response within its timeout.
    ProtocolError,       ///< The TV answered with an error; code/message are the TV's.
    TransportClosed,     ///< The connection is closed (or was closed while waiting).
    InvalidEndpoint,     ///< Not a ssap:// or luna:// URI.
    InvalidPayload,      ///< Payload failed the endpoint's schema.
    DiscoveryUnavailable ///< No socket could send the SSDP query.
};

LGTV_CORE_EXPORT const char *to_string(RemoteErrc err) noexcept;

/// @brief True for the three connect failures (unreachable, TLS, timeout).
LGTV_CORE_EXPORT bool is_connect_error(RemoteErrc err) noexcept;

template <typename T> using RemoteResult = utils::Result<T, RemoteErrc>;
using RemoteStatus = utils::Status<RemoteErrc>;

/// @brief "ProtocolError(401): insufficient permissions" style description of a failed result.
template <typename R> std::string describe_error(const R &result)
{
    if (result.error_code() != 0)
    {
        return fmt::format("{}({}): {}", to_string(result.error()), result.error_code(),
                           result.error_message());
    }
    if (result.error_message().empty())
    {
        return to_string(result.error());
    }
    return fmt::format("{}: {}", to_string(result.error()), result.error_message());
}

} // namespace lgtv::remote
