#include "signaling/signaling_message.hpp"

#include <stdexcept>

namespace meshrtc {
namespace {

using json = nlohmann::json;

json OptionalValue(const json& j, const char* key) {
    auto it = j.find(key);
    return it != j.end() ? *it : json();
}

Connection::Type ParseKind(const json& j) {
    const auto kind = j.at("kind").get<std::string>();
    if (auto type = Connection::TypeFromString(kind)) {
        return *type;
    }
    throw std::invalid_argument("Unknown connection kind: " + kind);
}

} // namespace

// SignalingMessage
void to_json(json& j, const SignalingMessage& message) {
    j = json{{"room_name", message.room_name}};
    if (!message.src.empty()) {
        j["src"] = message.src;
    }
    if (!message.dst.empty()) {
        j["dst"] = message.dst;
    }
    if (!message.connection_id.empty()) {
        j["connection_id"] = message.connection_id;
        j["connection_type"] = message.connection_type;
    }
    if (!message.payload.is_null()) {
        j["payload"] = message.payload;
    }
}

void from_json(const json& j, SignalingMessage& message) {
    j.at("room_name").get_to(message.room_name);
    message.src = j.value("src", "");
    message.dst = j.value("dst", "");
    message.connection_id = j.value("connection_id", "");
    message.connection_type = j.value("connection_type", "");
    message.payload = OptionalValue(j, "payload");
}

// DiscoverPeersMessage
void to_json(json& j, const DiscoverPeersMessage& message) {
    j = json{{"room_name", message.room_name}, 
             {"kind", Connection::ToString(message.kind)}};
}

void from_json(const json& j, DiscoverPeersMessage& message) {
    j.at("room_name").get_to(message.room_name);
    message.kind = ParseKind(j);
}

// PeersMessage
void to_json(json& j, const PeersMessage& message) {
    j = json{{"room_name", message.room_name}, 
             {"kind", Connection::ToString(message.kind)},
             {"peer_ids", message.peer_ids}};
}

void from_json(const json& j, PeersMessage& message) {
    j.at("room_name").get_to(message.room_name);
    message.kind = ParseKind(j);
    j.at("peer_ids").get_to(message.peer_ids);
}

// BroadcastMessage
void to_json(json& j, const BroadcastMessage& message) {
    j = json{{"room_name", message.room_name}, 
             {"data", message.data}};
}

void from_json(const json& j, BroadcastMessage& message) {
    j.at("room_name").get_to(message.room_name);
    message.data = OptionalValue(j, "data");
}

// LogRequest
void to_json(json& j, const LogRequest& message) {
    j = json{{"room_name", message.room_name}};
}

void from_json(const json& j, LogRequest& message) {
    j.at("room_name").get_to(message.room_name);
}

// DataMessage
void to_json(json& j, const DataMessage& message) {
    j = json{{"room_name", message.room_name}, 
             {"src", message.src},
             {"payload", message.data}};
}

void from_json(const json& j, DataMessage& message) {
    j.at("room_name").get_to(message.room_name);
    message.src = j.value("src", "");
    message.data = OptionalValue(j, "payload");
}

} // namespace meshrtc
