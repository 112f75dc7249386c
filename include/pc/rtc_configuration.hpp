#ifndef _PC_RTC_CONFIGURATION_H_
#define _PC_RTC_CONFIGURATION_H_

#include "base/defines.hpp"
#include "pc/ice_server.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace meshrtc {

constexpr uint16_t kDefaultPortLowerBound = 1024;
constexpr uint16_t kDefaultPortUpperBound = 65535;

// IceTransportPolicy
enum class IceTransportPolicy {
    ALL,
    RELAY
};

// RtcConfiguration
// Shared by every connection created within a room.
struct MESHRTC_CPP_EXPORT RtcConfiguration {
    std::vector<IceServer> ice_servers;
    IceTransportPolicy ice_transport_policy = IceTransportPolicy::ALL;

    bool enable_ice_tcp = false;

    // Port range
    uint16_t port_range_begin = kDefaultPortLowerBound;
    uint16_t port_range_end = kDefaultPortUpperBound;

    // MTU: Maximum Transmission Unit
    std::optional<size_t> mtu = std::nullopt;
};

// Parses the configuration in the shape used by browsers, eg:
// {
//   "iceServers": [{"urls": ["stun:stun.l.google.com:19302"]},
//                  {"urls": "turn:turn.example.org", "username": "u", "credential": "p"}],
//   "iceTransportPolicy": "relay"
// }
// Throws std::invalid_argument on an invalid value, and nlohmann::json::exception
// on a value with an unexpected json type.
MESHRTC_CPP_EXPORT RtcConfiguration ParseRtcConfiguration(const nlohmann::json& json);

// Throws std::invalid_argument if the configuration is inconsistent.
MESHRTC_CPP_EXPORT void ValidateConfiguration(const RtcConfiguration& config);

MESHRTC_CPP_EXPORT std::string ToString(IceTransportPolicy policy);

} // namespace meshrtc

#endif
