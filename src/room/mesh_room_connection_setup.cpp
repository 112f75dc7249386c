#include "room/mesh_room.hpp"

#include <plog/Log.h>

namespace meshrtc {

// CallbackScope
class MeshRoom::CallbackScope {
public:
    explicit CallbackScope(MeshRoom* room) : room_(room) {
        ++room_->callback_depth_;
    }
    ~CallbackScope() {
        --room_->callback_depth_;
    }

private:
    MeshRoom* const room_;
};

bool MeshRoom::MakeMediaConnections(const std::vector<std::string>& peer_ids) {
    if (!CheckOpen(__FUNCTION__)) {
        return false;
    }
    for (const auto& peer_id : peer_ids) {
        if (peer_id == peer_id_) {
            continue;
        }
        AddMediaConnection(peer_id, MakeMediaOptions());
    }
    return true;
}

bool MeshRoom::MakeDataConnections(const std::vector<std::string>& peer_ids) {
    if (!CheckOpen(__FUNCTION__)) {
        return false;
    }
    for (const auto& peer_id : peer_ids) {
        if (peer_id == peer_id_) {
            continue;
        }
        AddDataConnection(peer_id, MakeDataOptions());
    }
    return true;
}

// Private methods
MediaConnection::Options MeshRoom::MakeMediaOptions() const {
    MediaConnection::Options options;
    options.rtc_config = rtc_config_;
    options.stream = local_stream_;
    return options;
}

DataConnection::Options MeshRoom::MakeDataOptions() const {
    DataConnection::Options options;
    options.rtc_config = rtc_config_;
    return options;
}

// The connection is registered and wired within the same dispatch it's created in,
// so no answer or candidate replying to it can arrive before it's registered.
MediaConnection* MeshRoom::AddMediaConnection(const std::string& peer_id, MediaConnection::Options options) {
    auto connection = connection_factory_->CreateMediaConnection(peer_id, std::move(options));
    if (!connection) {
        PLOG_ERROR << "Failed to create media connection to peer: " << peer_id;
        return nullptr;
    }
    MediaConnection* media_connection = connection.get();
    connections_.Add(peer_id, std::move(connection));
    SetupMessageHandlers(media_connection);
    PLOG_DEBUG << "Added media connection: " << media_connection->id() << " to peer: " << peer_id;
    return media_connection;
}

DataConnection* MeshRoom::AddDataConnection(const std::string& peer_id, DataConnection::Options options) {
    auto connection = connection_factory_->CreateDataConnection(peer_id, std::move(options));
    if (!connection) {
        PLOG_ERROR << "Failed to create data connection to peer: " << peer_id;
        return nullptr;
    }
    DataConnection* data_connection = connection.get();
    connections_.Add(peer_id, std::move(connection));
    SetupMessageHandlers(data_connection);
    PLOG_DEBUG << "Added data connection: " << data_connection->id() << " to peer: " << peer_id;
    return data_connection;
}

void MeshRoom::SetupMessageHandlers(Connection* connection) {
    // The connection is owned by the room, capturing the raw pointers is safe.
    connection->OnOffer([this, connection](const nlohmann::json& offer) {
        CallbackScope scope(this);
        if (is_closed_) {
            return;
        }
        SignalOffer(MakeSignalingMessage(connection, offer));
    });
    connection->OnAnswer([this, connection](const nlohmann::json& answer) {
        CallbackScope scope(this);
        if (is_closed_) {
            return;
        }
        SignalAnswer(MakeSignalingMessage(connection, answer));
    });
    connection->OnCandidate([this, connection](const nlohmann::json& candidate) {
        CallbackScope scope(this);
        if (is_closed_) {
            return;
        }
        SignalCandidate(MakeSignalingMessage(connection, candidate));
    });
}

void MeshRoom::SetupMessageHandlers(MediaConnection* connection) {
    SetupMessageHandlers(static_cast<Connection*>(connection));
    connection->OnStream([this, remote_peer_id = connection->remote_peer_id()](std::shared_ptr<MediaStream> stream) {
        CallbackScope scope(this);
        if (is_closed_ || !stream) {
            return;
        }
        stream->set_peer_id(remote_peer_id);
        SignalStream(std::move(stream));
    });
}

void MeshRoom::SetupMessageHandlers(DataConnection* connection) {
    SetupMessageHandlers(static_cast<Connection*>(connection));
    connection->OnData([this, remote_peer_id = connection->remote_peer_id()](const nlohmann::json& data) {
        CallbackScope scope(this);
        HandleData(DataMessage{name_, remote_peer_id, data});
    });
}

SignalingMessage MeshRoom::MakeSignalingMessage(const Connection* connection, const nlohmann::json& payload) const {
    SignalingMessage message;
    message.room_name = name_;
    message.dst = connection->remote_peer_id();
    message.connection_id = connection->id();
    message.connection_type = Connection::ToString(connection->type());
    message.payload = payload;
    return message;
}

} // namespace meshrtc
