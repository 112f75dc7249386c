#include "connection/media_connection.hpp"

#include <plog/Log.h>

namespace meshrtc {

MediaConnection::MediaConnection(std::string remote_peer_id, std::string id) 
    : Connection(Type::MEDIA, std::move(remote_peer_id), std::move(id)) {}

MediaConnection::~MediaConnection() = default;

void MediaConnection::OnStream(StreamCallback callback) {
    stream_callback_ = std::move(callback);
}

void MediaConnection::TriggerStream(std::shared_ptr<MediaStream> stream) {
    if (stream_callback_) {
        stream_callback_(std::move(stream));
    } else {
        PLOG_VERBOSE << "No stream callback on media connection: " << id();
    }
}

} // namespace meshrtc
