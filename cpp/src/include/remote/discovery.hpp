#pragma once
/**
 * @file discovery.hpp
 * @brief SSDP discovery of webOS TVs on the local network.
 */
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "lgtv_core_export.h"
#include "remote/errors.hpp"

namespace lgtv::remote
{

struct LGTV_CORE_EXPORT DiscoveredDevice
{
    std::string host;     ///< From LOCATION, else the datagram source address.
    std::string location; ///< LOCATION header (device description URL).
    std::string uuid;
    std::string name;     ///< Friendly name (DLNADeviceName.lge.com), may be empty.
    std::string server;   ///< SERVER header.

    nlohmann::json to_json() const;
};

struct ScanOptions
{
    std::chrono::milliseconds timeout{8000};
    int attempts{4};
    std::string target_host{"239.255.255.250"};
    uint16_t target_port{1900};
    std::string search_target{"urn:schemas-upnp-org:device:MediaRenderer:1"};
    int mx{2};
    /// Drop responders without an LG/webOS signature.
    bool require_lg{true};
};

class LGTV_CORE_EXPORT SsdpDiscovery
{
  public:
    /**
     * @brief Multicasts M-SEARCH `attempts` times across `timeout` and collects answers.
     * @return Devices deduplicated by host and sorted by host (possibly empty), or
     *         DiscoveryUnavailable when the socket cannot be used or no query could be sent.
     */
    static RemoteResult<std::vector<DiscoveredDevice>> scan(const ScanOptions &options = {});

    static std::string build_search_request(const ScanOptions &options);

    /// @brief std::nullopt for anything but a well-formed (LG, if required) 200 response.
    static std::optional<DiscoveredDevice> parse_response(std::string_view datagram,
                                                          std::string_view source_host,
                                                          bool require_lg = true);
};

} // namespace lgtv::remote
