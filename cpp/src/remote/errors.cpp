// src/remote/errors.cpp
#include "remote/errors.hpp"

namespace lgtv::remote
{

const char *to_string(RemoteErrc err) noexcept
{
    switch (err)
    {
    case RemoteErrc::TransportError:
        return "TransportError";
    case RemoteErrc::Unreachable:
        return "Unreachable";
    case RemoteErrc::TlsFailure:
        return "TlsFailure";
    case RemoteErrc::ConnectTimeout:
        return "ConnectTimeout";
    case RemoteErrc::PairingRejected:
        return "PairingRejected";
    case RemoteErrc::PairingTimeout:
        return "PairingTimeout";
    case RemoteErrc::Timeout:
        return "Timeout";
    case RemoteErrc::ProtocolError:
        return "ProtocolError";
    case RemoteErrc::TransportClosed:
        return "TransportClosed";
    case RemoteErrc::InvalidEndpoint:
        return "InvalidEndpoint";
    case RemoteErrc::InvalidPayload:
        return "InvalidPayload";
    case RemoteErrc::DiscoveryUnavailable:
        return "DiscoveryUnavailable";
    }
    return "Unknown";
}

bool is_connect_error(RemoteErrc err) noexcept
{
    return err == RemoteErrc::Unreachable || err == RemoteErrc::TlsFailure ||
           err == RemoteErrc::ConnectTimeout;
}

} // namespace lgtv::remote
