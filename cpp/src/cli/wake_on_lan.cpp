// src/cli/wake_on_lan.cpp
#include "lgtv_service.hpp"
#include "cli/wake_on_lan.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>

namespace lgtv::cli
{

namespace asio = boost::asio;
using udp = asio::ip::udp;

std::optional<MacAddress> parse_mac(std::string_view text)
{
    text = format_tools::trim_whitespace(text);
    // Six two-digit groups and five separators.
    if (text.size() != 17)
    {
        return std::nullopt;
    }
    const char separator = text[2];
    if (separator != ':' && separator != '-')
    {
        return std::nullopt;
    }
    MacAddress mac{};
    for (size_t i = 0; i < mac.size(); ++i)
    {
        const auto group = text.substr(i * 3, 2);
        if (i > 0 && text[i * 3 - 1] != separator)
        {
            return std::nullopt;
        }
        unsigned value = 0;
        const auto [ptr, ec] = std::from_chars(group.data(), group.data() + group.size(), value, 16);
        if (ec != std::errc() || ptr != group.data() + group.size())
        {
            return std::nullopt;
        }
        mac[i] = static_cast<uint8_t>(value);
    }
    return mac;
}

std::vector<uint8_t> build_magic_packet(const MacAddress &mac)
{
    std::vector<uint8_t> packet(6, 0xFF);
    packet.reserve(6 + 16 * mac.size());
    for (int i = 0; i < 16; ++i)
    {
        packet.insert(packet.end(), mac.begin(), mac.end());
    }
    return packet;
}

std::optional<std::string> arp_lookup(std::string_view ip, const std::string &table_path)
{
    std::ifstream table(table_path);
    if (!table)
    {
        LOGGER_DEBUG("WakeOnLan: cannot read {}", table_path);
        return std::nullopt;
    }
    std::string line;
    std::getline(table, line); // header
    while (std::getline(table, line))
    {
        std::istringstream fields(line);
        std::string address, hw_type, flags, hw_address;
        if (!(fields >> address >> hw_type >> flags >> hw_address) || address != ip)
        {
            continue;
        }
        // 0x0: incomplete entry.
        if (flags == "0x0" || hw_address == "00:00:00:00:00:00" || !parse_mac(hw_address))
        {
            return std::nullopt;
        }
        std::transform(hw_address.begin(), hw_address.end(), hw_address.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return hw_address;
    }
    return std::nullopt;
}

remote::RemoteStatus wake_on_lan(std::string_view mac_text, const std::string &broadcast,
                                 uint16_t port)
{
    using remote::RemoteErrc;
    using remote::RemoteStatus;

    auto mac = parse_mac(mac_text);
    if (!mac)
    {
        return RemoteStatus::error(RemoteErrc::InvalidPayload, 0,
                                   fmt::format("'{}' is not a MAC address", mac_text));
    }

    boost::system::error_code ec;
    const auto address = asio::ip::make_address_v4(broadcast, ec);
    if (ec)
    {
        return RemoteStatus::error(RemoteErrc::TransportError, ec.value(),
                                   fmt::format("invalid broadcast address '{}'", broadcast));
    }

    asio::io_context ioc;
    udp::socket socket(ioc);
    socket.open(udp::v4(), ec);
    if (!ec)
    {
        socket.set_option(asio::socket_base::broadcast(true), ec);
    }
    if (!ec)
    {
        const auto packet = build_magic_packet(*mac);
        socket.send_to(asio::buffer(packet), udp::endpoint(address, port), 0, ec);
    }
    if (ec)
    {
        LOGGER_ERROR("WakeOnLan: sending to {}:{} failed: {}", broadcast, port, ec.message());
        return RemoteStatus::error(RemoteErrc::TransportError, ec.value(), ec.message());
    }
    LOGGER_INFO("WakeOnLan: magic packet for {} sent to {}:{}", mac_text, broadcast, port);
    return RemoteStatus::ok();
}

} // namespace lgtv::cli
