#ifndef _SIGNALING_SIGNALING_TRANSPORT_H_
#define _SIGNALING_SIGNALING_TRANSPORT_H_

#include "base/defines.hpp"

#include <string>

namespace meshrtc {

// SignalingTransport
// Moves the serialized signaling messages to the relay server, eg: a websocket.
// Incoming messages are handed back through RoomManager::Deliver.
class MESHRTC_CPP_EXPORT SignalingTransport {
public:
    virtual ~SignalingTransport() = default;
    virtual void Send(std::string text) = 0;
};

} // namespace meshrtc

#endif
