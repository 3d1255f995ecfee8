#pragma once
/**
 * @file transport.hpp
 * @brief Abstract message transport: one connection, text frames in and out.
 *
 * The session reads through exactly one thread (the correlator's reader) and writes
 * from any caller thread; implementations must tolerate a concurrent `send()` and
 * `receive_for()` and make `close()` idempotent and callable from any thread. After
 * any I/O failure, or a write that missed its deadline, the transport reports closed.
 */
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "lgtv_core_export.h"
#include "remote/errors.hpp"

namespace lgtv::remote
{

inline constexpr uint16_t kPlainPort = 3000;
inline constexpr uint16_t kTlsPort = 3001;

/// Deadline for writes issued through `Transport::send()`.
inline constexpr std::chrono::milliseconds kDefaultSendTimeout{10000};

struct ConnectOptions
{
    std::string host;
    uint16_t port{0}; ///< 0 -> 3000 (plain) or 3001 (TLS).
    bool encrypted{false};
    std::chrono::milliseconds timeout{5000};
    std::string path{"/"};

    uint16_t effective_port() const noexcept
    {
        return port != 0 ? port : (encrypted ? kTlsPort : kPlainPort);
    }
};

class LGTV_CORE_EXPORT Transport
{
  public:
    virtual ~Transport() = default;

    /**
     * @brief Writes one text frame, waiting at most `timeout` for the write to finish.
     * @return TransportClosed if closed, TransportError on I/O failure. Timeout if the peer
     *         stopped reading; a partly written frame cannot be recovered, so the transport
     *         is closed before this returns.
     */
    virtual RemoteStatus send_for(std::string text, std::chrono::milliseconds timeout) = 0;

    /// @brief `send_for()` with `kDefaultSendTimeout`.
    RemoteStatus send(std::string text);

    /**
     * @brief Waits up to `timeout` for the next inbound text frame.
     * @return The frame; Timeout if none arrived; TransportClosed once the peer or a local
     *         `close()` ended the connection and no frames remain.
     */
    virtual RemoteResult<std::string> receive_for(std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;
    virtual bool is_open() const = 0;

    /// @brief "host:port" of the remote end.
    virtual std::string peer() const = 0;

    /// @brief Blocks until the next frame; std::nullopt once the transport is closed.
    std::optional<std::string> receive();
};

using TransportPtr = std::shared_ptr<Transport>;

/// @brief Creates connected transports; sessions take one so tests can substitute their own.
using TransportFactory = std::function<RemoteResult<TransportPtr>(const ConnectOptions &)>;

} // namespace lgtv::remote
