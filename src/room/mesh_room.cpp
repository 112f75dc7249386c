#include "room/mesh_room.hpp"

#include <plog/Log.h>

#include <stdexcept>

namespace meshrtc {

MeshRoom::MeshRoom(std::string name,
                   std::string peer_id,
                   Options options,
                   ConnectionFactory* connection_factory) 
    : name_(std::move(name)),
      peer_id_(std::move(peer_id)),
      rtc_config_(std::move(options.rtc_config)),
      connection_factory_(connection_factory),
      local_stream_(std::move(options.stream)) {
    if (!connection_factory_) {
        throw std::invalid_argument("A connection factory is required by room: " + name_);
    }
    PLOG_INFO << "Room: " << name_ << " created for peer: " << peer_id_;
}

MeshRoom::~MeshRoom() {
    PLOG_VERBOSE << __FUNCTION__;
    Close();
}

bool MeshRoom::Call(std::shared_ptr<MediaStream> stream) {
    if (!CheckOpen(__FUNCTION__)) {
        return false;
    }
    if (stream) {
        local_stream_ = std::move(stream);
    }
    SignalDiscoverPeers(DiscoverPeersMessage{name_, Connection::Type::MEDIA});
    return true;
}

bool MeshRoom::Connect() {
    if (!CheckOpen(__FUNCTION__)) {
        return false;
    }
    SignalDiscoverPeers(DiscoverPeersMessage{name_, Connection::Type::DATA});
    return true;
}

bool MeshRoom::ReplaceStream(std::shared_ptr<MediaStream> stream) {
    if (!CheckOpen(__FUNCTION__)) {
        return false;
    }
    local_stream_ = std::move(stream);
    for (Connection* connection : connections_.AllConnections()) {
        if (connection->type() == Connection::Type::MEDIA) {
            static_cast<MediaConnection*>(connection)->ReplaceStream(local_stream_);
        }
    }
    return true;
}

bool MeshRoom::SendByTransport(nlohmann::json data) {
    if (!CheckOpen(__FUNCTION__)) {
        return false;
    }
    SignalBroadcastByTransport(BroadcastMessage{name_, std::move(data)});
    return true;
}

bool MeshRoom::SendByDataChannel(nlohmann::json data) {
    if (!CheckOpen(__FUNCTION__)) {
        return false;
    }
    SignalBroadcastByDataChannel(BroadcastMessage{name_, std::move(data)});
    return true;
}

bool MeshRoom::GetLog() {
    if (!CheckOpen(__FUNCTION__)) {
        return false;
    }
    SignalGetLog(LogRequest{name_});
    return true;
}

void MeshRoom::Close() {
    if (is_closed_) {
        return;
    }
    // Mark as closed first, so that any callback fired while closing is dropped.
    is_closed_ = true;

    auto all_connections = connections_.AllConnections();
    PLOG_INFO << "Closing room: " << name_ << " with " << all_connections.size() << " connection(s)";
    for (Connection* connection : all_connections) {
        connection->Close();
    }
    // Close may be called by a slot running inside a callback of one of the
    // connections, which must outlive the callback.
    auto released = connections_.Release();

    SignalClosed();

    ReleaseConnections(std::move(released));
}

// Private methods
bool MeshRoom::CheckOpen(const char* intent) {
    ReleaseDeferredConnections();
    if (is_closed_) {
        PLOG_WARNING << "Rejected " << intent << " on closed room: " << name_;
        return false;
    }
    return true;
}

void MeshRoom::ReleaseConnections(std::vector<std::unique_ptr<Connection>> connections) {
    if (callback_depth_ > 0) {
        for (auto& connection : connections) {
            deferred_connections_.push_back(std::move(connection));
        }
        PLOG_VERBOSE << "Deferred the release of " << deferred_connections_.size() << " connection(s)";
    }
    // Destroyed on return otherwise.
}

void MeshRoom::ReleaseDeferredConnections() {
    if (callback_depth_ == 0 && !deferred_connections_.empty()) {
        PLOG_VERBOSE << "Released " << deferred_connections_.size() << " deferred connection(s)";
        deferred_connections_.clear();
    }
}

} // namespace meshrtc
