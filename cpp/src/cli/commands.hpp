#pragma once
/**
 * @file commands.hpp
 * @brief Static dispatch table of the command line verbs.
 *
 * Each TV command maps to one fixed endpoint and a builder turning the positional
 * arguments into the request payload. Builders reject malformed arguments with
 * InvalidPayload before anything is sent.
 */
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "remote/errors.hpp"

namespace lgtv::cli
{

using Args = std::vector<std::string>;
using PayloadBuilder = remote::RemoteResult<nlohmann::json> (*)(const Args &args);

enum class CommandKind
{
    Call,           ///< One request, print the response.
    Subscribe,      ///< Print events until interrupted.
    PointerButtons, ///< Button presses over the pointer input socket.
    WakeOnLan,      ///< Magic packet; no session.
    Local           ///< scan / auth / setDefault, handled by main.
};

struct CommandSpec
{
    std::string_view verb;
    CommandKind kind;
    std::string_view endpoint; ///< Empty for WakeOnLan and Local.
    int min_args;
    int max_args; ///< -1: unbounded.
    std::string_view usage;
    PayloadBuilder build; ///< nullptr: no payload.
};

const std::vector<CommandSpec> &command_table();

/// @brief nullptr for an unknown verb.
const CommandSpec *find_command(std::string_view verb);

/// @brief Checks the argument count and runs the builder (null payload when there is none).
remote::RemoteResult<nlohmann::json> build_payload(const CommandSpec &spec, const Args &args);

} // namespace lgtv::cli
