#ifndef _CONNECTION_MEDIA_CONNECTION_H_
#define _CONNECTION_MEDIA_CONNECTION_H_

#include "base/defines.hpp"
#include "connection/connection.hpp"
#include "connection/media_stream.hpp"

#include <memory>

namespace meshrtc {

// MediaConnection
class MESHRTC_CPP_EXPORT MediaConnection : public Connection {
public:
    struct Options : public Connection::Options {
        // The local stream to send, nullptr for receive only.
        std::shared_ptr<MediaStream> stream = nullptr;
    };

    using StreamCallback = std::function<void(std::shared_ptr<MediaStream> stream)>;
public:
    ~MediaConnection() override;

    // Replaces the local stream being sent, which may trigger a renegotiation.
    virtual void ReplaceStream(std::shared_ptr<MediaStream> stream) = 0;

    // Remote stream arrived.
    void OnStream(StreamCallback callback);

protected:
    MediaConnection(std::string remote_peer_id, std::string id);

    void TriggerStream(std::shared_ptr<MediaStream> stream);

private:
    StreamCallback stream_callback_ = nullptr;
};

} // namespace meshrtc

#endif
