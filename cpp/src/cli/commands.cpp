// src/cli/commands.cpp
#include "lgtv_base.hpp"
#include "cli/commands.hpp"

#include <charconv>

namespace lgtv::cli
{

using Json = nlohmann::json;
using remote::RemoteErrc;
using remote::RemoteResult;

namespace
{

RemoteResult<Json> invalid(std::string message)
{
    return RemoteResult<Json>::error(RemoteErrc::InvalidPayload, 0, std::move(message));
}

// ── Payload builders ───────────────────────────────────────────────────────

RemoteResult<Json> build_mute(const Args &args)
{
    if (format_tools::iequals(args[0], "true") || args[0] == "1" ||
        format_tools::iequals(args[0], "on"))
    {
        return RemoteResult<Json>::ok({{"mute", true}});
    }
    if (format_tools::iequals(args[0], "false") || args[0] == "0" ||
        format_tools::iequals(args[0], "off"))
    {
        return RemoteResult<Json>::ok({{"mute", false}});
    }
    return invalid(fmt::format("mute expects true or false, got '{}'", args[0]));
}

RemoteResult<Json> build_volume(const Args &args)
{
    int level = -1;
    const auto &text = args[0];
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), level);
    if (ec != std::errc() || ptr != text.data() + text.size() || level < 0 || level > 100)
    {
        return invalid(fmt::format("setVolume expects 0-100, got '{}'", text));
    }
    return RemoteResult<Json>::ok({{"volume", level}});
}

RemoteResult<Json> build_sound_output(const Args &args)
{
    return RemoteResult<Json>::ok({{"output", args[0]}});
}

RemoteResult<Json> build_channel(const Args &args)
{
    return RemoteResult<Json>::ok({{"channelId", args[0]}});
}

RemoteResult<Json> build_input(const Args &args)
{
    return RemoteResult<Json>::ok({{"inputId", args[0]}});
}

RemoteResult<Json> build_app_id(const Args &args)
{
    return RemoteResult<Json>::ok({{"id", args[0]}});
}

RemoteResult<Json> build_browser(const Args &args)
{
    return RemoteResult<Json>::ok({{"target", args[0]}});
}

RemoteResult<Json> build_youtube(const Args &args)
{
    return RemoteResult<Json>::ok(
        {{"id", "youtube.leanback.v4"},
         {"params", {{"contentTarget", fmt::format("https://www.youtube.com/tv?v={}", args[0])}}}});
}

RemoteResult<Json> build_toast(const Args &args)
{
    return RemoteResult<Json>::ok({{"message", args[0]}});
}

RemoteResult<Json> build_alert(const Args &args)
{
    return RemoteResult<Json>::ok(
        {{"message", args[0]},
         {"buttons",
          Json::array({{{"label", args[1]},
                        {"onClick", "luna://com.webos.service.apiadapter/noOp"},
                        {"params", Json::object()}}})}});
}

RemoteResult<Json> build_close_alert(const Args &args)
{
    return RemoteResult<Json>::ok({{"alertId", args[0]}});
}

RemoteResult<Json> build_picture_query(const Args &)
{
    return RemoteResult<Json>::ok(
        {{"category", "picture"}, {"keys", {"contrast", "backlight", "brightness", "color"}}});
}

constexpr const char *kForegroundApp = "ssap://com.webos.applicationManager/getForegroundAppInfo";

std::vector<CommandSpec> make_table()
{
    using K = CommandKind;
    return {
        {"scan", K::Local, "", 0, 0, "scan", nullptr},
        {"auth", K::Local, "", 2, 2, "auth <host> <name>", nullptr},
        {"setDefault", K::Local, "", 1, 1, "setDefault <name>", nullptr},
        {"on", K::WakeOnLan, "", 0, 0, "on", nullptr},

        {"off", K::Call, "ssap://system/turnOff", 0, 0, "off", nullptr},
        {"screenOff", K::Call, "ssap://com.webos.service.tvpower/power/turnOffScreen", 0, 0,
         "screenOff", nullptr},
        {"screenOn", K::Call, "ssap://com.webos.service.tvpower/power/turnOnScreen", 0, 0,
         "screenOn", nullptr},
        {"getPowerState", K::Call, "ssap://com.webos.service.tvpower/power/getPowerState", 0, 0,
         "getPowerState", nullptr},

        {"mute", K::Call, "ssap://audio/setMute", 1, 1, "mute <true|false>", &build_mute},
        {"setVolume", K::Call, "ssap://audio/setVolume", 1, 1, "setVolume <0-100>", &build_volume},
        {"volumeUp", K::Call, "ssap://audio/volumeUp", 0, 0, "volumeUp", nullptr},
        {"volumeDown", K::Call, "ssap://audio/volumeDown", 0, 0, "volumeDown", nullptr},
        {"audioStatus", K::Call, "ssap://audio/getStatus", 0, 0, "audioStatus", nullptr},
        {"audioVolume", K::Call, "ssap://audio/getVolume", 0, 0, "audioVolume", nullptr},
        {"getSoundOutput", K::Call, "ssap://com.webos.service.apiadapter/audio/getSoundOutput", 0,
         0, "getSoundOutput", nullptr},
        {"setSoundOutput", K::Call, "ssap://audio/changeSoundOutput", 1, 1,
         "setSoundOutput <output>", &build_sound_output},

        {"getTVChannel", K::Call, "ssap://tv/getCurrentChannel", 0, 0, "getTVChannel", nullptr},
        {"setTVChannel", K::Call, "ssap://tv/openChannel", 1, 1, "setTVChannel <channelId>",
         &build_channel},
        {"listChannels", K::Call, "ssap://tv/getChannelList", 0, 0, "listChannels", nullptr},
        {"inputChannelUp", K::Call, "ssap://tv/channelUp", 0, 0, "inputChannelUp", nullptr},
        {"inputChannelDown", K::Call, "ssap://tv/channelDown", 0, 0, "inputChannelDown", nullptr},
        {"listInputs", K::Call, "ssap://tv/getExternalInputList", 0, 0, "listInputs", nullptr},
        {"setInput", K::Call, "ssap://tv/switchInput", 1, 1, "setInput <inputId>", &build_input},

        {"inputMediaPlay", K::Call, "ssap://media.controls/play", 0, 0, "inputMediaPlay", nullptr},
        {"inputMediaPause", K::Call, "ssap://media.controls/pause", 0, 0, "inputMediaPause",
         nullptr},
        {"inputMediaStop", K::Call, "ssap://media.controls/stop", 0, 0, "inputMediaStop", nullptr},
        {"inputMediaRewind", K::Call, "ssap://media.controls/rewind", 0, 0, "inputMediaRewind",
         nullptr},
        {"inputMediaFastForward", K::Call, "ssap://media.controls/fastForward", 0, 0,
         "inputMediaFastForward", nullptr},

        {"listApps", K::Call, "ssap://com.webos.applicationManager/listApps", 0, 0, "listApps",
         nullptr},
        {"listLaunchPoints", K::Call, "ssap://com.webos.applicationManager/listLaunchPoints", 0, 0,
         "listLaunchPoints", nullptr},
        {"startApp", K::Call, "ssap://system.launcher/launch", 1, 1, "startApp <appId>",
         &build_app_id},
        {"closeApp", K::Call, "ssap://system.launcher/close", 1, 1, "closeApp <appId>",
         &build_app_id},
        {"getForegroundAppInfo", K::Call, kForegroundApp, 0, 0, "getForegroundAppInfo", nullptr},
        {"watchForegroundApp", K::Subscribe, kForegroundApp, 0, 0, "watchForegroundApp", nullptr},
        {"openBrowserAt", K::Call, "ssap://system.launcher/open", 1, 1, "openBrowserAt <url>",
         &build_browser},
        {"openYoutubeId", K::Call, "ssap://system.launcher/launch", 1, 1, "openYoutubeId <videoId>",
         &build_youtube},

        {"notification", K::Call, "ssap://system.notifications/createToast", 1, 1,
         "notification <message>", &build_toast},
        {"createAlert", K::Call, "ssap://system.notifications/createAlert", 2, 2,
         "createAlert <message> <button>", &build_alert},
        {"closeAlert", K::Call, "ssap://system.notifications/closeAlert", 1, 1,
         "closeAlert <alertId>", &build_close_alert},

        {"swInfo", K::Call, "ssap://com.webos.service.update/getCurrentSWInformation", 0, 0,
         "swInfo", nullptr},
        {"getSystemInfo", K::Call, "ssap://system/getSystemInfo", 0, 0, "getSystemInfo", nullptr},
        {"listServices", K::Call, "ssap://api/getServiceList", 0, 0, "listServices", nullptr},
        {"sendEnterKey", K::Call, "ssap://com.webos.service.ime/sendEnterKey", 0, 0,
         "sendEnterKey", nullptr},
        {"input3DOn", K::Call, "ssap://com.webos.service.tv.display/set3DOn", 0, 0, "input3DOn",
         nullptr},
        {"input3DOff", K::Call, "ssap://com.webos.service.tv.display/set3DOff", 0, 0, "input3DOff",
         nullptr},
        {"getPictureSettings", K::Call, "ssap://settings/getSystemSettings", 0, 0,
         "getPictureSettings", &build_picture_query},

        {"sendButton", K::PointerButtons, "", 1, -1, "sendButton <button> [<button> ...]",
         nullptr},
    };
}

} // namespace

const std::vector<CommandSpec> &command_table()
{
    static const std::vector<CommandSpec> table = make_table();
    return table;
}

const CommandSpec *find_command(std::string_view verb)
{
    for (const auto &spec : command_table())
    {
        if (spec.verb == verb)
        {
            return &spec;
        }
    }
    return nullptr;
}

RemoteResult<Json> build_payload(const CommandSpec &spec, const Args &args)
{
    const int count = static_cast<int>(args.size());
    if (count < spec.min_args || (spec.max_args >= 0 && count > spec.max_args))
    {
        return invalid(fmt::format("usage: {}", spec.usage));
    }
    if (spec.build == nullptr)
    {
        return RemoteResult<Json>::ok(Json(nullptr));
    }
    return spec.build(args);
}

} // namespace lgtv::cli
