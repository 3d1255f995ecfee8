#pragma once
/**
 * @file wire.hpp
 * @brief JSON text frames exchanged with the TV.
 *
 * Outbound: `{"type", "id", "uri", "payload"}` with type request, subscribe,
 * unsubscribe or register ("uri" and "payload" omitted when not applicable).
 * Inbound: `{"type", "id", "payload"[, "error"]}` with type response, error or
 * registered.
 */
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "lgtv_core_export.h"
#include "remote/endpoint.hpp"
#include "remote/errors.hpp"

namespace lgtv::remote::wire
{

enum class FrameType
{
    Request,
    Subscribe,
    Unsubscribe,
    Register,
    Response,
    Error,
    Registered,
    Unknown
};

LGTV_CORE_EXPORT const char *to_string(FrameType type) noexcept;
LGTV_CORE_EXPORT FrameType frame_type_from_string(std::string_view name) noexcept;

struct OutboundFrame
{
    FrameType type{FrameType::Request};
    std::string id;
    std::string uri; ///< Empty for register/unsubscribe.
    Json payload;    ///< null -> no "payload" member.
};

struct InboundFrame
{
    FrameType type{FrameType::Unknown};
    std::string id;    ///< Empty when the TV sent no id.
    Json payload;      ///< Always an object (empty when absent).
    std::string error; ///< "error" member of error frames.
};

/// @brief Builds a request/subscribe frame from validated values.
LGTV_CORE_EXPORT OutboundFrame make_frame(FrameType type, std::string id, const Endpoint &endpoint,
                                          const Payload &payload);

LGTV_CORE_EXPORT std::string encode(const OutboundFrame &frame);

/// @brief ProtocolError for text that is not a JSON object or lacks a string "type".
LGTV_CORE_EXPORT RemoteResult<InboundFrame> decode(std::string_view text);

/// @brief Error detail carried by a frame: the TV's numeric code and message.
struct ProtocolFault
{
    int code{0};
    std::string message;
};

/**
 * @brief Extracts the error of an inbound frame, if it reports one.
 *
 * An `error` frame yields its "error" text split into a leading numeric code and a
 * message ("401 insufficient permissions" -> {401, "insufficient permissions"}). A
 * `response` whose payload has `"returnValue": false` yields its errorCode/errorText.
 * Any other frame yields std::nullopt.
 */
LGTV_CORE_EXPORT std::optional<ProtocolFault> protocol_fault(const InboundFrame &frame);

} // namespace lgtv::remote::wire
