/*******************************************************************************
 * @file discovery.cpp
 * @brief SSDP M-SEARCH over a Boost.Asio UDP socket.
 *
 * One socket sends every query and receives every answer. The scan runs its own
 * io_context on the calling thread until the deadline.
 ******************************************************************************/
#include "lgtv_service.hpp"
#include "remote/discovery.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/multicast.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <algorithm>
#include <array>
#include <functional>
#include <map>

namespace lgtv::remote
{

namespace asio = boost::asio;
using udp = asio::ip::udp;

namespace
{

constexpr size_t kMaxDatagram = 4096;

/// Value of `name: value` header lines, matched case-insensitively.
std::optional<std::string_view> header_value(std::string_view datagram, std::string_view name)
{
    size_t pos = 0;
    while (pos < datagram.size())
    {
        auto end = datagram.find('\n', pos);
        if (end == std::string_view::npos)
        {
            end = datagram.size();
        }
        const auto line = datagram.substr(pos, end - pos);
        pos = end + 1;
        const auto colon = line.find(':');
        if (colon == std::string_view::npos)
        {
            continue;
        }
        if (format_tools::iequals(format_tools::trim_whitespace(line.substr(0, colon)), name))
        {
            return format_tools::trim_whitespace(line.substr(colon + 1));
        }
    }
    return std::nullopt;
}

/// "http://192.168.1.20:1527/desc.xml" -> "192.168.1.20".
std::string host_from_url(std::string_view url)
{
    const auto scheme = url.find("://");
    if (scheme == std::string_view::npos)
    {
        return {};
    }
    auto rest = url.substr(scheme + 3);
    if (!rest.empty() && rest.front() == '[')
    {
        const auto close = rest.find(']');
        return close == std::string_view::npos ? std::string() : std::string(rest.substr(1, close - 1));
    }
    return std::string(rest.substr(0, rest.find_first_of(":/")));
}

} // namespace

nlohmann::json DiscoveredDevice::to_json() const
{
    return {{"address", host},
            {"uuid", uuid.empty() ? nlohmann::json(nullptr) : nlohmann::json(uuid)},
            {"tv_name", name.empty() ? nlohmann::json(nullptr) : nlohmann::json(name)},
            {"location", location},
            {"server", server}};
}

std::string SsdpDiscovery::build_search_request(const ScanOptions &options)
{
    return fmt::format("M-SEARCH * HTTP/1.1\r\n"
                       "HOST: {}:{}\r\n"
                       "MAN: \"ssdp:discover\"\r\n"
                       "MX: {}\r\n"
                       "ST: {}\r\n\r\n",
                       options.target_host, options.target_port, options.mx,
                       options.search_target);
}

std::optional<DiscoveredDevice> SsdpDiscovery::parse_response(std::string_view datagram,
                                                              std::string_view source_host,
                                                              bool require_lg)
{
    const auto first_line = datagram.substr(0, datagram.find('\n'));
    if (!first_line.starts_with("HTTP/1.") || first_line.find(" 200") == std::string_view::npos)
    {
        LOGGER_DEBUG("SsdpDiscovery: ignoring non-200 datagram from {}", source_host);
        return std::nullopt;
    }
    if (require_lg && datagram.find("LG") == std::string_view::npos &&
        !format_tools::icontains(datagram, "webos"))
    {
        LOGGER_DEBUG("SsdpDiscovery: ignoring non-LG responder {}", source_host);
        return std::nullopt;
    }

    DiscoveredDevice device;
    if (auto location = header_value(datagram, "LOCATION"))
    {
        device.location = std::string(*location);
        device.host = host_from_url(*location);
    }
    if (device.host.empty())
    {
        device.host = std::string(source_host);
    }
    if (auto server = header_value(datagram, "SERVER"))
    {
        device.server = std::string(*server);
    }
    if (auto usn = header_value(datagram, "USN"); usn && usn->starts_with("uuid:"))
    {
        const auto id = usn->substr(5);
        device.uuid = std::string(id.substr(0, id.find(':')));
    }
    if (auto name = header_value(datagram, "DLNADeviceName.lge.com"))
    {
        device.name = std::string(*name);
    }
    return device;
}

RemoteResult<std::vector<DiscoveredDevice>> SsdpDiscovery::scan(const ScanOptions &options)
{
    using Devices = std::vector<DiscoveredDevice>;
    const auto unavailable = [](std::string_view what, const boost::system::error_code &ec)
    {
        LOGGER_ERROR("SsdpDiscovery: {}: {}", what, ec.message());
        return RemoteResult<Devices>::error(RemoteErrc::DiscoveryUnavailable, ec.value(),
                                            fmt::format("{}: {}", what, ec.message()));
    };

    boost::system::error_code ec;
    const auto target_address = asio::ip::make_address(options.target_host, ec);
    if (ec)
    {
        return unavailable("invalid discovery target", ec);
    }
    const udp::endpoint target(target_address, options.target_port);

    asio::io_context ioc;
    udp::socket socket(ioc);
    socket.open(target.protocol(), ec);
    if (ec)
    {
        return unavailable("cannot open UDP socket", ec);
    }
    socket.bind(udp::endpoint(target.protocol(), 0), ec);
    if (ec)
    {
        return unavailable("cannot bind UDP socket", ec);
    }
    if (target_address.is_multicast())
    {
        socket.set_option(asio::ip::multicast::hops(2), ec);
        if (ec)
        {
            LOGGER_DEBUG("SsdpDiscovery: multicast TTL not set: {}", ec.message());
        }
    }

    const std::string request = build_search_request(options);
    const int attempts = std::max(options.attempts, 1);
    const auto interval = options.timeout / attempts;
    LOGGER_DEBUG("SsdpDiscovery: searching {}:{} ({} attempt(s), {}ms)", options.target_host,
                 options.target_port, attempts, options.timeout.count());

    std::map<std::string, DiscoveredDevice> found;
    std::array<char, kMaxDatagram> buffer{};
    udp::endpoint sender;
    int sent = 0;
    int sends_tried = 0;
    boost::system::error_code last_send_error;
    asio::steady_timer resend(ioc);

    std::function<void()> send_next = [&]()
    {
        boost::system::error_code send_ec;
        socket.send_to(asio::buffer(request), target, 0, send_ec);
        ++sends_tried;
        if (send_ec)
        {
            last_send_error = send_ec;
            LOGGER_DEBUG("SsdpDiscovery: send failed: {}", send_ec.message());
        }
        else
        {
            ++sent;
        }
        if (sends_tried < attempts)
        {
            resend.expires_after(interval);
            resend.async_wait(
                [&](const boost::system::error_code &wait_ec)
                {
                    if (!wait_ec)
                    {
                        send_next();
                    }
                });
        }
    };

    std::function<void()> receive_next = [&]()
    {
        socket.async_receive_from(
            asio::buffer(buffer), sender,
            [&](const boost::system::error_code &recv_ec, std::size_t length)
            {
                if (recv_ec == asio::error::operation_aborted || !socket.is_open())
                {
                    return;
                }
                if (!recv_ec)
                {
                    const auto source = sender.address().to_string();
                    auto device = parse_response(std::string_view(buffer.data(), length), source,
                                                 options.require_lg);
                    if (device && found.find(device->host) == found.end())
                    {
                        LOGGER_DEBUG("SsdpDiscovery: found {} ({})", device->host, device->name);
                        found.emplace(device->host, std::move(*device));
                    }
                }
                else
                {
                    LOGGER_DEBUG("SsdpDiscovery: receive failed: {}", recv_ec.message());
                }
                receive_next();
            });
    };

    receive_next();
    send_next();
    if (sent == 0 && sends_tried >= attempts)
    {
        // Nothing will ever be sent; drain the pending receive before returning.
        socket.close(ec);
        ioc.run();
        return unavailable("no discovery query could be sent", last_send_error);
    }

    ioc.run_for(options.timeout);
    resend.cancel();
    socket.close(ec);
    ioc.restart();
    ioc.run();

    if (sent == 0)
    {
        return unavailable("no discovery query could be sent", last_send_error);
    }

    Devices devices;
    devices.reserve(found.size());
    for (auto &[host, device] : found)
    {
        devices.push_back(std::move(device));
    }
    LOGGER_INFO("SsdpDiscovery: {} device(s) found", devices.size());
    return RemoteResult<Devices>::ok(std::move(devices));
}

} // namespace lgtv::remote
