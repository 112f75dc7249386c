#include "pc/rtc_configuration.hpp"

#include <plog/Log.h>

#include <stdexcept>
#include <string>

namespace meshrtc {
namespace {

using json = nlohmann::json;

void ParseIceServer(const json& entry, std::vector<IceServer>& ice_servers) {
    const std::string username = entry.value("username", "");
    const std::string credential = entry.value("credential", "");
    const json& urls = entry.at("urls");
    if (urls.is_string()) {
        ice_servers.emplace_back(urls.get<std::string>(), username, credential);
    } else {
        for (const auto& url : urls) {
            ice_servers.emplace_back(url.get<std::string>(), username, credential);
        }
    }
}

IceTransportPolicy ParseIceTransportPolicy(const std::string& policy) {
    if (policy == "all") {
        return IceTransportPolicy::ALL;
    } else if (policy == "relay") {
        return IceTransportPolicy::RELAY;
    }
    throw std::invalid_argument("Unknown ICE transport policy: " + policy);
}

// Read wider than uint16_t, so that an out of range port is rejected instead of wrapped.
uint16_t ParsePort(const json& j, const char* key, uint16_t default_port) {
    auto it = j.find(key);
    if (it == j.end()) {
        return default_port;
    }
    const auto port = it->get<int64_t>();
    if (port < 1 || port > 65535) {
        throw std::invalid_argument(std::string("Invalid ") + key + ": " + std::to_string(port));
    }
    return static_cast<uint16_t>(port);
}

} // namespace

RtcConfiguration ParseRtcConfiguration(const json& j) {
    RtcConfiguration config;
    if (auto it = j.find("iceServers"); it != j.end()) {
        for (const auto& entry : *it) {
            ParseIceServer(entry, config.ice_servers);
        }
    }
    if (auto it = j.find("iceTransportPolicy"); it != j.end()) {
        config.ice_transport_policy = ParseIceTransportPolicy(it->get<std::string>());
    }
    config.enable_ice_tcp = j.value("enableIceTcp", config.enable_ice_tcp);
    config.port_range_begin = ParsePort(j, "portRangeBegin", config.port_range_begin);
    config.port_range_end = ParsePort(j, "portRangeEnd", config.port_range_end);
    if (auto it = j.find("mtu"); it != j.end() && !it->is_null()) {
        config.mtu = it->get<size_t>();
    }

    ValidateConfiguration(config);

    PLOG_DEBUG << "Parsed RTC configuration with " << config.ice_servers.size()
               << " ICE server(s), policy: " << ToString(config.ice_transport_policy);
    return config;
}

void ValidateConfiguration(const RtcConfiguration& config) {
    if (config.port_range_begin == 0 || config.port_range_begin > config.port_range_end) {
        throw std::invalid_argument("Invalid port range: " + 
                                    std::to_string(config.port_range_begin) + "-" + 
                                    std::to_string(config.port_range_end));
    }
    if (config.ice_transport_policy == IceTransportPolicy::RELAY) {
        bool has_turn_server = false;
        for (const auto& ice_server : config.ice_servers) {
            if (ice_server.type() == IceServer::Type::TURN) {
                has_turn_server = true;
                break;
            }
        }
        if (!has_turn_server) {
            PLOG_WARNING << "Relay-only ICE transport policy without any TURN server.";
        }
    }
}

std::string ToString(IceTransportPolicy policy) {
    switch (policy) {
    case IceTransportPolicy::ALL:
        return "all";
    case IceTransportPolicy::RELAY:
        return "relay";
    default:
        return "";
    }
}

} // namespace meshrtc
