#include "connection/media_stream.hpp"

namespace meshrtc {

MediaStream::MediaStream(std::string id) 
    : id_(std::move(id)) {}

MediaStream::~MediaStream() = default;

void MediaStream::set_peer_id(std::string peer_id) {
    peer_id_.emplace(std::move(peer_id));
}

} // namespace meshrtc
