// src/remote/endpoint.cpp
#include "lgtv_service.hpp"
#include "remote/endpoint.hpp"

#include <algorithm>

namespace lgtv::remote
{

namespace
{

constexpr std::string_view kSchemes[] = {"ssap://", "luna://"};

const char *field_type_name(FieldType type) noexcept
{
    switch (type)
    {
    case FieldType::Boolean:
        return "boolean";
    case FieldType::Integer:
        return "integer";
    case FieldType::String:
        return "string";
    case FieldType::Object:
        return "object";
    case FieldType::Array:
        return "array";
    case FieldType::Any:
        return "any";
    }
    return "any";
}

bool matches_type(const Json &value, FieldType type) noexcept
{
    switch (type)
    {
    case FieldType::Boolean:
        return value.is_boolean();
    case FieldType::Integer:
        return value.is_number_integer();
    case FieldType::String:
        return value.is_string();
    case FieldType::Object:
        return value.is_object();
    case FieldType::Array:
        return value.is_array();
    case FieldType::Any:
        return true;
    }
    return false;
}

// ── Static data: the endpoints the command table and the pointer socket use ──

FieldSpec required(std::string name, FieldType type)
{
    return FieldSpec{std::move(name), type, true, std::nullopt, std::nullopt};
}

FieldSpec optional_field(std::string name, FieldType type)
{
    return FieldSpec{std::move(name), type, false, std::nullopt, std::nullopt};
}

FieldSpec ranged(std::string name, int64_t min, int64_t max)
{
    return FieldSpec{std::move(name), FieldType::Integer, true, min, max};
}

EndpointCatalog make_builtin_catalog()
{
    EndpointCatalog catalog;
    const auto no_payload = [&catalog](const char *uri, bool subscribable = false)
    { catalog.add(EndpointSchema{uri, {}, subscribable, true}); };

    // Power
    no_payload("ssap://system/turnOff");
    no_payload("ssap://com.webos.service.tvpower/power/turnOffScreen");
    no_payload("ssap://com.webos.service.tvpower/power/turnOnScreen");
    no_payload("ssap://com.webos.service.tvpower/power/getPowerState", true);

    // Audio
    catalog.add({"ssap://audio/setMute", {required("mute", FieldType::Boolean)}, false, false});
    catalog.add({"ssap://audio/setVolume", {ranged("volume", 0, 100)}, false, false});
    no_payload("ssap://audio/volumeUp");
    no_payload("ssap://audio/volumeDown");
    no_payload("ssap://audio/getStatus", true);
    no_payload("ssap://audio/getVolume", true);
    no_payload("ssap://com.webos.service.apiadapter/audio/getSoundOutput", true);
    catalog.add({"ssap://audio/changeSoundOutput", {required("output", FieldType::String)}, false,
                 false});

    // TV channels and inputs
    no_payload("ssap://tv/getCurrentChannel", true);
    catalog.add({"ssap://tv/openChannel", {required("channelId", FieldType::String)}, false, true});
    no_payload("ssap://tv/getChannelList");
    no_payload("ssap://tv/channelUp");
    no_payload("ssap://tv/channelDown");
    no_payload("ssap://tv/getExternalInputList");
    catalog.add({"ssap://tv/switchInput", {required("inputId", FieldType::String)}, false, false});

    // Media
    no_payload("ssap://media.controls/play");
    no_payload("ssap://media.controls/pause");
    no_payload("ssap://media.controls/stop");
    no_payload("ssap://media.controls/rewind");
    no_payload("ssap://media.controls/fastForward");

    // Apps
    no_payload("ssap://com.webos.applicationManager/listApps");
    no_payload("ssap://com.webos.applicationManager/listLaunchPoints");
    no_payload("ssap://com.webos.applicationManager/getForegroundAppInfo", true);
    catalog.add({"ssap://system.launcher/launch",
                 {required("id", FieldType::String), optional_field("contentId", FieldType::String),
                  optional_field("params", FieldType::Object)},
                 false,
                 true});
    catalog.add({"ssap://com.webos.applicationManager/launch",
                 {required("id", FieldType::String), optional_field("params", FieldType::Object)},
                 false,
                 true});
    catalog.add({"ssap://system.launcher/close", {required("id", FieldType::String)}, false, true});
    catalog.add({"ssap://system.launcher/open", {required("target", FieldType::String)}, false, true});

    // Notifications
    catalog.add({"ssap://system.notifications/createToast",
                 {required("message", FieldType::String),
                  optional_field("iconData", FieldType::String),
                  optional_field("iconExtension", FieldType::String)},
                 false,
                 true});
    catalog.add({"ssap://system.notifications/createAlert",
                 {required("message", FieldType::String), required("buttons", FieldType::Array)},
                 false,
                 true});
    catalog.add({"ssap://system.notifications/closeAlert", {required("alertId", FieldType::String)},
                 false, false});

    // System and misc
    no_payload("ssap://com.webos.service.update/getCurrentSWInformation");
    no_payload("ssap://system/getSystemInfo");
    no_payload("ssap://api/getServiceList");
    no_payload("ssap://com.webos.service.ime/sendEnterKey");
    no_payload("ssap://com.webos.service.tv.display/set3DOn");
    no_payload("ssap://com.webos.service.tv.display/set3DOff");
    no_payload("ssap://com.webos.service.networkinput/getPointerInputSocket");
    catalog.add({"ssap://settings/getSystemSettings",
                 {required("category", FieldType::String), required("keys", FieldType::Array)},
                 true,
                 true});
    catalog.add({"ssap://settings/setSystemSettings",
                 {required("category", FieldType::String), required("settings", FieldType::Object)},
                 false,
                 true});
    catalog.add({"luna://com.webos.service.eim/setDeviceInfo",
                 {required("id", FieldType::String), required("icon", FieldType::String),
                  required("label", FieldType::String)},
                 false,
                 true});
    return catalog;
}

} // namespace

// ============================================================================
// Endpoint
// ============================================================================

RemoteResult<Endpoint> Endpoint::parse(std::string_view uri)
{
    for (auto scheme : kSchemes)
    {
        if (uri.starts_with(scheme))
        {
            const auto path = uri.substr(scheme.size());
            if (path.empty() || path.front() == '/' || path.find_first_of(" \t\r\n") != std::string_view::npos)
            {
                break;
            }
            return RemoteResult<Endpoint>::ok(Endpoint(std::string(uri), scheme.size()));
        }
    }
    return RemoteResult<Endpoint>::error(RemoteErrc::InvalidEndpoint, 0,
                                         fmt::format("'{}' is not a ssap:// or luna:// URI", uri));
}

std::string_view Endpoint::scheme() const noexcept
{
    return std::string_view(m_uri).substr(0, m_scheme_len - 3);
}

std::string_view Endpoint::path() const noexcept
{
    return std::string_view(m_uri).substr(m_scheme_len);
}

// ============================================================================
// Payload
// ============================================================================

RemoteResult<Payload> Payload::from_json(Json value)
{
    if (value.is_null())
    {
        return RemoteResult<Payload>::ok(Payload());
    }
    if (!value.is_object())
    {
        return RemoteResult<Payload>::error(
            RemoteErrc::InvalidPayload, 0,
            fmt::format("payload must be a JSON object, got {}", value.type_name()));
    }
    return RemoteResult<Payload>::ok(Payload(std::move(value)));
}

const Json &Payload::json() const noexcept
{
    static const Json empty_object = Json::object();
    return m_object ? *m_object : empty_object;
}

// ============================================================================
// EndpointCatalog
// ============================================================================

const EndpointCatalog &EndpointCatalog::builtin()
{
    static const EndpointCatalog catalog = make_builtin_catalog();
    return catalog;
}

void EndpointCatalog::add(EndpointSchema schema)
{
    auto key = schema.uri;
    m_schemas.insert_or_assign(std::move(key), std::move(schema));
}

const EndpointSchema *EndpointCatalog::find(std::string_view uri) const
{
    auto it = m_schemas.find(uri);
    return it == m_schemas.end() ? nullptr : &it->second;
}

RemoteStatus EndpointCatalog::validate(const Endpoint &endpoint, const Payload &payload) const
{
    const auto *schema = find(endpoint.uri());
    if (schema == nullptr)
    {
        return RemoteStatus::ok();
    }

    const Json &obj = payload.json();
    for (const auto &field : schema->fields)
    {
        auto it = obj.find(field.name);
        if (it == obj.end())
        {
            if (field.required)
            {
                return RemoteStatus::error(
                    RemoteErrc::InvalidPayload, 0,
                    fmt::format("{}: missing required field '{}'", endpoint.uri(), field.name));
            }
            continue;
        }
        if (!matches_type(*it, field.type))
        {
            return RemoteStatus::error(RemoteErrc::InvalidPayload, 0,
                                       fmt::format("{}: field '{}' must be {}", endpoint.uri(),
                                                   field.name, field_type_name(field.type)));
        }
        if (field.type == FieldType::Integer)
        {
            const auto value = it->get<int64_t>();
            if ((field.min && value < *field.min) || (field.max && value > *field.max))
            {
                return RemoteStatus::error(
                    RemoteErrc::InvalidPayload, 0,
                    fmt::format("{}: field '{}' = {} is out of range [{}, {}]", endpoint.uri(),
                                field.name, value, field.min.value_or(INT64_MIN),
                                field.max.value_or(INT64_MAX)));
            }
        }
    }

    if (!schema->allow_extra_fields)
    {
        for (const auto &[key, value] : obj.items())
        {
            const bool known = std::any_of(schema->fields.begin(), schema->fields.end(),
                                           [&key](const FieldSpec &f) { return f.name == key; });
            if (!known)
            {
                return RemoteStatus::error(
                    RemoteErrc::InvalidPayload, 0,
                    fmt::format("{}: unexpected field '{}'", endpoint.uri(), key));
            }
        }
    }
    return RemoteStatus::ok();
}

} // namespace lgtv::remote
