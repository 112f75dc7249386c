#ifndef _CONNECTION_MEDIA_STREAM_H_
#define _CONNECTION_MEDIA_STREAM_H_

#include "base/defines.hpp"

#include <optional>
#include <string>

namespace meshrtc {

// MediaStream
// A handle of a local or remote stream, capture and rendering are done elsewhere.
class MESHRTC_CPP_EXPORT MediaStream {
public:
    explicit MediaStream(std::string id);
    ~MediaStream();

    const std::string id() const { return id_; }

    // The remote peer the stream was received from, unset for a local stream.
    std::optional<std::string> peer_id() const { return peer_id_; }
    void set_peer_id(std::string peer_id);

private:
    const std::string id_;
    std::optional<std::string> peer_id_ = std::nullopt;
};

} // namespace meshrtc

#endif
