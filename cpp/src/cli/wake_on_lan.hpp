#pragma once
/**
 * @file wake_on_lan.hpp
 * @brief Wake-on-LAN magic packets for powering the TV on.
 */
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "remote/errors.hpp"

namespace lgtv::cli
{

using MacAddress = std::array<uint8_t, 6>;

/// @brief Accepts "aa:bb:cc:dd:ee:ff" or "aa-bb-cc-dd-ee-ff" (any case).
std::optional<MacAddress> parse_mac(std::string_view text);

/// @brief 6 x 0xFF followed by the MAC repeated 16 times (102 bytes).
std::vector<uint8_t> build_magic_packet(const MacAddress &mac);

/**
 * @brief Hardware address of a neighbour from the kernel ARP table.
 * @return Lower-case "aa:bb:..." text, std::nullopt if the host has no complete entry.
 */
std::optional<std::string> arp_lookup(std::string_view ip,
                                      const std::string &table_path = "/proc/net/arp");

/**
 * @brief Broadcasts the magic packet over UDP.
 * @return InvalidPayload for a malformed MAC, TransportError if the datagram cannot be sent.
 */
remote::RemoteStatus wake_on_lan(std::string_view mac, const std::string &broadcast = "255.255.255.255",
                                 uint16_t port = 9);

} // namespace lgtv::cli
