#include "connection/connection.hpp"

#include <plog/Log.h>

namespace meshrtc {

Connection::Connection(Type type, std::string remote_peer_id, std::string id) 
    : type_(type),
      remote_peer_id_(std::move(remote_peer_id)),
      id_(std::move(id)) {}

Connection::~Connection() = default;

void Connection::OnOffer(NegotiationCallback callback) {
    offer_callback_ = std::move(callback);
}

void Connection::OnAnswer(NegotiationCallback callback) {
    answer_callback_ = std::move(callback);
}

void Connection::OnCandidate(NegotiationCallback callback) {
    candidate_callback_ = std::move(callback);
}

void Connection::TriggerOffer(const nlohmann::json& offer) {
    if (offer_callback_) {
        offer_callback_(offer);
    } else {
        PLOG_VERBOSE << "No offer callback on connection: " << id_;
    }
}

void Connection::TriggerAnswer(const nlohmann::json& answer) {
    if (answer_callback_) {
        answer_callback_(answer);
    } else {
        PLOG_VERBOSE << "No answer callback on connection: " << id_;
    }
}

void Connection::TriggerCandidate(const nlohmann::json& candidate) {
    if (candidate_callback_) {
        candidate_callback_(candidate);
    } else {
        PLOG_VERBOSE << "No candidate callback on connection: " << id_;
    }
}

std::string Connection::ToString(Type type) {
    switch (type) {
    case Type::DATA:
        return "data";
    case Type::MEDIA:
        return "media";
    default:
        return "unknown";
    }
}

std::optional<Connection::Type> Connection::TypeFromString(std::string_view type) {
    if (type == "data") {
        return Type::DATA;
    } else if (type == "media") {
        return Type::MEDIA;
    }
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& out, Connection::Type type) {
    return out << Connection::ToString(type);
}

} // namespace meshrtc
