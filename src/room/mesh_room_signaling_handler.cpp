#include "room/mesh_room.hpp"

#include <plog/Log.h>

namespace meshrtc {

void MeshRoom::HandleJoin(const SignalingMessage& message) {
    ReleaseDeferredConnections();
    if (is_closed_) {
        PLOG_VERBOSE << "Ignored join of peer: " << message.src << " on closed room: " << name_;
        return;
    }
    PLOG_INFO << "Peer: " << message.src << " joined room: " << name_;
    SignalPeerJoined(message.src);
}

void MeshRoom::HandleLeave(const SignalingMessage& message) {
    ReleaseDeferredConnections();
    if (is_closed_) {
        PLOG_VERBOSE << "Ignored leave of peer: " << message.src << " on closed room: " << name_;
        return;
    }
    auto released = connections_.Release(message.src);
    PLOG_INFO << "Peer: " << message.src << " left room: " << name_;
    SignalPeerLeft(message.src);
    ReleaseConnections(std::move(released));
}

void MeshRoom::HandleOffer(const SignalingMessage& message) {
    ReleaseDeferredConnections();
    if (is_closed_) {
        PLOG_VERBOSE << "Ignored offer on closed room: " << name_;
        return;
    }
    if (message.src == peer_id_) {
        PLOG_WARNING << "Ignored offer sent by the local peer itself, connection: " << message.connection_id;
        return;
    }
    // The offer was retransmitted or the connection was created locally already.
    if (connections_.Get(message.src, message.connection_id)) {
        PLOG_VERBOSE << "Ignored offer of existing connection: " << message.connection_id;
        return;
    }

    auto type = Connection::TypeFromString(message.connection_type);
    if (!type) {
        PLOG_VERBOSE << "Ignored offer with unknown connection type: " << message.connection_type;
        return;
    }

    switch (*type) {
    case Connection::Type::MEDIA: {
        auto options = MakeMediaOptions();
        options.connection_id = message.connection_id;
        options.offer = message.payload;
        if (auto connection = AddMediaConnection(message.src, std::move(options))) {
            SignalCall(connection);
        }
        break;
    }
    case Connection::Type::DATA: {
        auto options = MakeDataOptions();
        options.connection_id = message.connection_id;
        options.offer = message.payload;
        if (auto connection = AddDataConnection(message.src, std::move(options))) {
            SignalConnection(connection);
        }
        break;
    }
    }
}

void MeshRoom::HandleAnswer(const SignalingMessage& message) {
    ReleaseDeferredConnections();
    if (is_closed_) {
        PLOG_VERBOSE << "Ignored answer on closed room: " << name_;
        return;
    }
    if (auto connection = connections_.Get(message.src, message.connection_id)) {
        connection->HandleAnswer(message.payload);
    } else {
        PLOG_VERBOSE << "Dropped answer of unknown connection: " << message.connection_id
                     << " from peer: " << message.src;
    }
}

void MeshRoom::HandleCandidate(const SignalingMessage& message) {
    ReleaseDeferredConnections();
    if (is_closed_) {
        PLOG_VERBOSE << "Ignored candidate on closed room: " << name_;
        return;
    }
    if (auto connection = connections_.Get(message.src, message.connection_id)) {
        connection->HandleCandidate(message.payload);
    } else {
        PLOG_VERBOSE << "Dropped candidate of unknown connection: " << message.connection_id
                     << " from peer: " << message.src;
    }
}

void MeshRoom::HandleData(const DataMessage& message) {
    ReleaseDeferredConnections();
    if (is_closed_) {
        PLOG_VERBOSE << "Ignored data from peer: " << message.src << " on closed room: " << name_;
        return;
    }
    SignalData(message);
}

void MeshRoom::HandleLog(const nlohmann::json& log) {
    ReleaseDeferredConnections();
    if (is_closed_) {
        PLOG_VERBOSE << "Ignored log on closed room: " << name_;
        return;
    }
    SignalLog(log);
}

} // namespace meshrtc
