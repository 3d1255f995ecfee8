// src/remote/wire.cpp
#include "lgtv_base.hpp"
#include "remote/wire.hpp"

#include <charconv>

namespace lgtv::remote::wire
{

namespace
{

struct TypeName
{
    FrameType type;
    std::string_view name;
};

constexpr TypeName kTypeNames[] = {
    {FrameType::Request, "request"},         {FrameType::Subscribe, "subscribe"},
    {FrameType::Unsubscribe, "unsubscribe"}, {FrameType::Register, "register"},
    {FrameType::Response, "response"},       {FrameType::Error, "error"},
    {FrameType::Registered, "registered"},
};

int parse_error_code(const Json &value)
{
    if (value.is_number_integer())
    {
        return value.get<int>();
    }
    if (value.is_string())
    {
        const auto &text = value.get_ref<const std::string &>();
        int code = 0;
        std::from_chars(text.data(), text.data() + text.size(), code);
        return code;
    }
    return 0;
}

} // namespace

const char *to_string(FrameType type) noexcept
{
    for (const auto &entry : kTypeNames)
    {
        if (entry.type == type)
        {
            return entry.name.data();
        }
    }
    return "unknown";
}

FrameType frame_type_from_string(std::string_view name) noexcept
{
    for (const auto &entry : kTypeNames)
    {
        if (entry.name == name)
        {
            return entry.type;
        }
    }
    return FrameType::Unknown;
}

OutboundFrame make_frame(FrameType type, std::string id, const Endpoint &endpoint,
                         const Payload &payload)
{
    OutboundFrame frame;
    frame.type = type;
    frame.id = std::move(id);
    frame.uri = endpoint.uri();
    if (!payload.empty())
    {
        frame.payload = payload.json();
    }
    return frame;
}

std::string encode(const OutboundFrame &frame)
{
    Json doc = {{"type", to_string(frame.type)}, {"id", frame.id}};
    if (!frame.uri.empty())
    {
        doc["uri"] = frame.uri;
    }
    if (!frame.payload.is_null())
    {
        doc["payload"] = frame.payload;
    }
    return doc.dump();
}

RemoteResult<InboundFrame> decode(std::string_view text)
{
    Json doc = Json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object())
    {
        return RemoteResult<InboundFrame>::error(RemoteErrc::ProtocolError, 0,
                                                 "inbound frame is not a JSON object");
    }
    auto type_it = doc.find("type");
    if (type_it == doc.end() || !type_it->is_string())
    {
        return RemoteResult<InboundFrame>::error(RemoteErrc::ProtocolError, 0,
                                                 "inbound frame has no \"type\"");
    }

    InboundFrame frame;
    frame.type = frame_type_from_string(type_it->get_ref<const std::string &>());
    if (auto id_it = doc.find("id"); id_it != doc.end())
    {
        if (id_it->is_string())
        {
            frame.id = id_it->get<std::string>();
        }
        else if (id_it->is_number_integer())
        {
            frame.id = std::to_string(id_it->get<int64_t>());
        }
    }
    if (auto payload_it = doc.find("payload"); payload_it != doc.end() && payload_it->is_object())
    {
        frame.payload = std::move(*payload_it);
    }
    else
    {
        frame.payload = Json::object();
    }
    if (auto error_it = doc.find("error"); error_it != doc.end())
    {
        frame.error = error_it->is_string() ? error_it->get<std::string>() : error_it->dump();
    }
    return RemoteResult<InboundFrame>::ok(std::move(frame));
}

std::optional<ProtocolFault> protocol_fault(const InboundFrame &frame)
{
    if (frame.type == FrameType::Error)
    {
        ProtocolFault fault;
        std::string_view text = frame.error;
        const auto space = text.find(' ');
        const auto head = text.substr(0, space);
        int code = 0;
        const auto [ptr, ec] = std::from_chars(head.data(), head.data() + head.size(), code);
        if (ec == std::errc() && ptr == head.data() + head.size() && !head.empty())
        {
            fault.code = code;
            fault.message = space == std::string_view::npos
                                ? std::string()
                                : std::string(format_tools::trim_whitespace(text.substr(space + 1)));
        }
        else
        {
            fault.message = std::string(text);
        }
        if (fault.message.empty())
        {
            fault.message = frame.payload.value("errorText", std::string("error"));
        }
        return fault;
    }

    if (frame.type == FrameType::Response)
    {
        auto rv = frame.payload.find("returnValue");
        if (rv != frame.payload.end() && rv->is_boolean() && !rv->get<bool>())
        {
            ProtocolFault fault;
            if (auto code_it = frame.payload.find("errorCode"); code_it != frame.payload.end())
            {
                fault.code = parse_error_code(*code_it);
            }
            fault.message = frame.payload.value("errorText", std::string("request failed"));
            return fault;
        }
    }
    return std::nullopt;
}

} // namespace lgtv::remote::wire
