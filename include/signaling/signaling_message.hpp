#ifndef _SIGNALING_SIGNALING_MESSAGE_H_
#define _SIGNALING_SIGNALING_MESSAGE_H_

#include "base/defines.hpp"
#include "connection/connection.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace meshrtc {
namespace message_type {

// Outgoing only
constexpr char kJoin[] = "join";
constexpr char kLeave[] = "leave";
constexpr char kDiscoverPeers[] = "discover_peers";
constexpr char kBroadcast[] = "broadcast";
constexpr char kGetLog[] = "get_log";

// Incoming only
constexpr char kPeerJoin[] = "peer_join";
constexpr char kPeerLeave[] = "peer_leave";
constexpr char kPeers[] = "peers";
constexpr char kData[] = "data";
constexpr char kLog[] = "log";

// Both directions
constexpr char kOffer[] = "offer";
constexpr char kAnswer[] = "answer";
constexpr char kCandidate[] = "candidate";

} // namespace message_type

// SignalingMessage
// The envelope of offer, answer, candidate, join and leave.
struct MESHRTC_CPP_EXPORT SignalingMessage {
    std::string room_name;
    // Set in incoming messages.
    std::string src;
    // Set in outgoing messages.
    std::string dst;
    std::string connection_id;
    // Kept as it is on the wire, an unknown type is not an error.
    std::string connection_type;
    nlohmann::json payload;
};

// DiscoverPeersMessage
struct MESHRTC_CPP_EXPORT DiscoverPeersMessage {
    std::string room_name;
    Connection::Type kind = Connection::Type::MEDIA;
};

// PeersMessage
// The response to DiscoverPeersMessage, may include the local peer itself.
struct MESHRTC_CPP_EXPORT PeersMessage {
    std::string room_name;
    Connection::Type kind = Connection::Type::MEDIA;
    std::vector<std::string> peer_ids;
};

// BroadcastMessage
struct MESHRTC_CPP_EXPORT BroadcastMessage {
    std::string room_name;
    nlohmann::json data;
};

// LogRequest
struct MESHRTC_CPP_EXPORT LogRequest {
    std::string room_name;
};

// DataMessage
struct MESHRTC_CPP_EXPORT DataMessage {
    std::string room_name;
    std::string src;
    nlohmann::json data;
};

// Json conversions, found by nlohmann::json through ADL.
// The `from_json` functions throw nlohmann::json::exception if a required key is 
// missing, and std::invalid_argument for an unknown `kind`.
MESHRTC_CPP_EXPORT void to_json(nlohmann::json& j, const SignalingMessage& message);
MESHRTC_CPP_EXPORT void from_json(const nlohmann::json& j, SignalingMessage& message);

MESHRTC_CPP_EXPORT void to_json(nlohmann::json& j, const DiscoverPeersMessage& message);
MESHRTC_CPP_EXPORT void from_json(const nlohmann::json& j, DiscoverPeersMessage& message);

MESHRTC_CPP_EXPORT void to_json(nlohmann::json& j, const PeersMessage& message);
MESHRTC_CPP_EXPORT void from_json(const nlohmann::json& j, PeersMessage& message);

MESHRTC_CPP_EXPORT void to_json(nlohmann::json& j, const BroadcastMessage& message);
MESHRTC_CPP_EXPORT void from_json(const nlohmann::json& j, BroadcastMessage& message);

MESHRTC_CPP_EXPORT void to_json(nlohmann::json& j, const LogRequest& message);
MESHRTC_CPP_EXPORT void from_json(const nlohmann::json& j, LogRequest& message);

MESHRTC_CPP_EXPORT void to_json(nlohmann::json& j, const DataMessage& message);
MESHRTC_CPP_EXPORT void from_json(const nlohmann::json& j, DataMessage& message);

// Serializes `message` to wire text tagged with `type`.
template <typename T>
std::string Serialize(std::string_view type, const T& message) {
    nlohmann::json j = message;
    j["type"] = std::string(type);
    return j.dump();
}

} // namespace meshrtc

#endif
