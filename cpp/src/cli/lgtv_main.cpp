/**
 * @file lgtv_main.cpp
 * @brief lgtv: command line remote control for LG webOS TVs.
 *
 * ## Usage
 *
 *     lgtv scan                                  # SSDP discovery, JSON list on stdout
 *     lgtv auth 192.168.1.20 living              # Pair (accept the prompt on the TV) and store
 *     lgtv setDefault living                     # TV used when --name is absent
 *     lgtv on                                    # Wake-on-LAN to the stored MAC
 *     lgtv --name living setVolume 25
 *     lgtv sendButton home down down enter
 *     lgtv watchForegroundApp                    # Prints app changes until Ctrl-C
 *
 * ## Config file
 *
 * See `TvConfigStore::search_paths()`. The key issued by the TV is stored per entry and
 * rewritten whenever the TV hands out a new one.
 */

#include "cli/commands.hpp"
#include "cli/tv_config.hpp"
#include "cli/wake_on_lan.hpp"

#include "lgtv_remote.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <fmt/ranges.h>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

using namespace lgtv::utils;
using lgtv::remote::describe_error;
using lgtv::remote::RemoteErrc;
using Json = nlohmann::json;

// ---------------------------------------------------------------------------
// Global shutdown flag (set by SIGINT/SIGTERM)
// ---------------------------------------------------------------------------

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) noexcept
{
    if (g_shutdown.load(std::memory_order_relaxed))
        std::_Exit(1); // second signal: do not wait for the TV
    g_shutdown.store(true, std::memory_order_relaxed);
}

// ---------------------------------------------------------------------------
// Argument parsing
// ---------------------------------------------------------------------------

namespace
{

struct CliArgs
{
    std::optional<std::string> name;
    bool ssl{false};
    bool debug{false};
    std::string log_file;
    std::chrono::milliseconds timeout{10000};
    std::string command;
    lgtv::cli::Args command_args;
};

void print_usage(const char *prog)
{
    std::cout << "Usage:\n"
              << "  " << prog
              << " [--name N] [--ssl] [--debug] [--log-file PATH] [--timeout MS] <command> [args]\n\n"
              << "Options:\n"
              << "  --name <N>        TV entry to use (default: the one set with setDefault)\n"
              << "  --ssl             Connect over TLS (port 3001)\n"
              << "  --debug           Log protocol traffic\n"
              << "  --log-file <path> Write the log to a file instead of stderr\n"
              << "  --timeout <ms>    Per-call response timeout (default 10000)\n"
              << "  --help            Show this message\n\n"
              << "Commands:\n";
    for (const auto &spec : lgtv::cli::command_table())
    {
        std::cout << "  " << spec.usage << "\n";
    }
    std::cout << "\nButtons: "
              << fmt::format("{}", fmt::join(lgtv::remote::PointerInputSocket::button_names(), ", "))
              << "\n";
}

CliArgs parse_args(int argc, char *argv[])
{
    CliArgs args;
    int i = 1;
    for (; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            std::exit(0);
        }
        if (arg == "--name" && i + 1 < argc)
        {
            args.name = argv[++i];
        }
        else if (arg == "--ssl")
        {
            args.ssl = true;
        }
        else if (arg == "--debug")
        {
            args.debug = true;
        }
        else if (arg == "--log-file" && i + 1 < argc)
        {
            args.log_file = argv[++i];
        }
        else if (arg == "--timeout" && i + 1 < argc)
        {
            char *end = nullptr;
            const long ms = std::strtol(argv[++i], &end, 10);
            if (end == nullptr || *end != '\0' || ms <= 0)
            {
                std::cerr << "Error: --timeout expects a positive number of milliseconds\n";
                std::exit(1);
            }
            args.timeout = std::chrono::milliseconds(ms);
        }
        else if (arg.starts_with("--"))
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(1);
        }
        else
        {
            break;
        }
    }
    if (i >= argc)
    {
        std::cerr << "Error: a command is required\n\n";
        print_usage(argv[0]);
        std::exit(1);
    }
    args.command = argv[i++];
    for (; i < argc; ++i)
    {
        args.command_args.emplace_back(argv[i]);
    }
    return args;
}

void print_json(const Json &j)
{
    std::cout << j.dump(4) << std::endl;
}

/// Distinct wording for the failures a user can act on.
void report_failure(const std::string &host,
                    const lgtv::remote::RemoteResult<lgtv::remote::RemoteSession> &r)
{
    switch (r.error())
    {
    case RemoteErrc::Unreachable:
    case RemoteErrc::ConnectTimeout:
        std::cerr << "Cannot reach the TV at " << host << "; is it on and on the network?\n";
        break;
    case RemoteErrc::TlsFailure:
        std::cerr << "TLS connection to " << host << " failed; try without --ssl\n";
        break;
    case RemoteErrc::PairingRejected:
        std::cerr << "The TV declined the pairing request\n";
        break;
    case RemoteErrc::PairingTimeout:
        std::cerr << "Nobody accepted the pairing prompt on the TV in time\n";
        break;
    default:
        break;
    }
    std::cerr << "Error: " << describe_error(r) << "\n";
}

/// Reverse DNS for the stored entry; empty optional when the address has no name.
std::optional<std::string> reverse_lookup(const std::string &ip)
{
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver(ioc);
    boost::system::error_code ec;
    const auto address = boost::asio::ip::make_address(ip, ec);
    if (ec)
    {
        return std::nullopt;
    }
    const auto results = resolver.resolve(boost::asio::ip::tcp::endpoint(address, 0), ec);
    if (ec || results.empty())
    {
        return std::nullopt;
    }
    auto host = results.begin()->host_name();
    if (host == ip)
    {
        return std::nullopt;
    }
    return host;
}

lgtv::remote::SessionOptions session_options(const CliArgs &args, const std::string &host,
                                             std::optional<std::string> key)
{
    lgtv::remote::SessionOptions options;
    options.host = host;
    options.encrypted = args.ssl;
    options.client_key = std::move(key);
    options.call_timeout = args.timeout;
    options.on_handshake_state = [](lgtv::remote::HandshakeState state)
    {
        if (state == lgtv::remote::HandshakeState::AwaitingConfirmation)
        {
            std::cerr << "Please accept the connection request on the TV\n";
        }
    };
    return options;
}

// ── Local commands ──────────────────────────────────────────────────────────

int run_scan()
{
    auto found = lgtv::remote::SsdpDiscovery::scan();
    if (found.is_error() || found.content().empty())
    {
        if (found.is_error())
        {
            LOGGER_ERROR("Cli: scan failed: {}", describe_error(found));
        }
        print_json({{"result", "failed"}, {"count", 0}});
        return 1;
    }
    Json list = Json::array();
    for (const auto &device : found.content())
    {
        list.push_back(device.to_json());
    }
    print_json({{"result", "ok"}, {"count", list.size()}, {"list", std::move(list)}});
    return 0;
}

int run_auth(const CliArgs &args, lgtv::cli::TvConfigStore &store)
{
    const auto &host = args.command_args[0];
    const auto &name = args.command_args[1];

    auto session = lgtv::remote::RemoteSession::connect(session_options(args, host, std::nullopt));
    if (session.is_error())
    {
        report_failure(host, session);
        return 1;
    }

    lgtv::cli::TvEntry entry;
    entry.name = name;
    entry.ip = host;
    entry.key = session.content().current_credential();
    entry.mac = lgtv::cli::arp_lookup(host);
    entry.hostname = reverse_lookup(host);
    session.content().disconnect();

    store.put_tv(entry);
    auto saved = store.save();
    if (saved.is_error())
    {
        std::cerr << "Error: " << describe_error(saved) << "\n";
        return 1;
    }
    if (!entry.mac)
    {
        std::cerr << "MAC address of " << host << " unknown; the 'on' command will not work\n";
    }
    print_json(entry.to_json());
    return 0;
}

int run_set_default(const CliArgs &args, lgtv::cli::TvConfigStore &store)
{
    auto status = store.set_default(args.command_args[0]);
    if (status.is_ok())
    {
        status = store.save();
    }
    if (status.is_error())
    {
        std::cerr << "Error: " << describe_error(status) << "\n";
        return 1;
    }
    print_json({{"default", args.command_args[0]}});
    return 0;
}

int run_wake(const lgtv::cli::TvEntry &tv)
{
    if (!tv.mac)
    {
        std::cerr << "Error: no MAC address stored for '" << tv.name << "'\n";
        return 1;
    }
    auto sent = lgtv::cli::wake_on_lan(*tv.mac);
    if (sent.is_error())
    {
        std::cerr << "Error: " << describe_error(sent) << "\n";
        return 1;
    }
    return 0;
}

// ── TV commands ─────────────────────────────────────────────────────────────

int run_remote(const CliArgs &args, const lgtv::cli::CommandSpec &spec,
               lgtv::cli::TvConfigStore &store, const lgtv::cli::TvEntry &tv, Json payload)
{
    auto connected = lgtv::remote::RemoteSession::connect(session_options(args, tv.ip, tv.key));
    if (connected.is_error())
    {
        report_failure(tv.ip, connected);
        return 1;
    }
    auto &session = connected.content();

    if (session.credential_changed())
    {
        auto updated = tv;
        updated.key = session.current_credential();
        store.put_tv(updated);
        auto saved = store.save();
        if (saved.is_error())
        {
            LOGGER_WARN("Cli: could not store the new key: {}", describe_error(saved));
        }
    }

    switch (spec.kind)
    {
    case lgtv::cli::CommandKind::Call:
    {
        auto reply = session.call(spec.endpoint, std::move(payload));
        if (reply.is_error())
        {
            std::cerr << "Error: " << describe_error(reply) << "\n";
            return 1;
        }
        print_json(reply.content());
        return 0;
    }
    case lgtv::cli::CommandKind::Subscribe:
    {
        auto subscribed = session.subscribe(spec.endpoint, std::move(payload));
        if (subscribed.is_error())
        {
            std::cerr << "Error: " << describe_error(subscribed) << "\n";
            return 1;
        }
        auto &subscription = subscribed.content();
        print_json(subscription.initial());
        while (!g_shutdown.load(std::memory_order_relaxed) && !subscription.ended())
        {
            if (auto event = subscription.next_for(std::chrono::milliseconds(250)))
            {
                print_json(*event);
            }
        }
        const bool interrupted = !subscription.ended();
        session.unsubscribe(subscription);
        return interrupted ? 0 : 1;
    }
    case lgtv::cli::CommandKind::PointerButtons:
    {
        auto socket = lgtv::remote::PointerInputSocket::open(session);
        if (socket.is_error())
        {
            std::cerr << "Error: " << describe_error(socket) << "\n";
            return 1;
        }
        auto sent = socket.content().send_buttons(args.command_args);
        socket.content().close();
        if (sent.is_error())
        {
            std::cerr << "Error: " << describe_error(sent) << "\n";
            return 1;
        }
        return 0;
    }
    default:
        LOGGER_ERROR("Cli: '{}' is not a TV command", spec.verb);
        return 1;
    }
}

int run(const CliArgs &args)
{
    const auto *spec = lgtv::cli::find_command(args.command);
    if (spec == nullptr)
    {
        std::cerr << "Unknown command: " << args.command << "\n";
        return 1;
    }
    auto payload = lgtv::cli::build_payload(*spec, args.command_args);
    if (payload.is_error())
    {
        std::cerr << "Error: " << payload.error_message() << "\n";
        return 1;
    }

    if (spec->verb == "scan")
    {
        return run_scan();
    }

    auto location = lgtv::cli::TvConfigStore::locate();
    if (location.is_error())
    {
        std::cerr << "Error: " << location.error_message() << "\n";
        return 1;
    }
    lgtv::cli::TvConfigStore store(location.content());
    auto loaded = store.load();
    if (loaded.is_error())
    {
        std::cerr << "Error: " << describe_error(loaded) << "\n";
        return 1;
    }

    if (spec->verb == "auth")
    {
        return run_auth(args, store);
    }
    if (spec->verb == "setDefault")
    {
        return run_set_default(args, store);
    }

    auto tv = store.resolve(args.name);
    if (tv.is_error())
    {
        std::cerr << "Error: " << tv.error_message() << "\n";
        return 1;
    }
    if (spec->kind == lgtv::cli::CommandKind::WakeOnLan)
    {
        return run_wake(tv.content());
    }
    return run_remote(args, *spec, store, tv.content(), std::move(payload).content());
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------

int main(int argc, char *argv[])
{
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Parse arguments ───────────────────────────────────────────────────────
    const CliArgs args = parse_args(argc, argv);

    // ── Lifecycle guard ───────────────────────────────────────────────────────
    LifecycleGuard cli_lifecycle(MakeModDefList(Logger::GetLifecycleModule()));

    auto &logger = Logger::instance();
    logger.set_level(args.debug ? Logger::Level::L_DEBUG : Logger::Level::L_WARNING);
    if (!args.log_file.empty() && !logger.set_logfile(args.log_file))
    {
        std::cerr << "Warning: cannot open log file " << args.log_file << "\n";
    }

    const int rc = run(args);
    logger.flush();
    return rc;
}
