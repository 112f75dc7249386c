#ifndef _ROOM_MESH_ROOM_H_
#define _ROOM_MESH_ROOM_H_

#include "base/defines.hpp"
#include "connection/connection_factory.hpp"
#include "connection/media_stream.hpp"
#include "pc/rtc_configuration.hpp"
#include "room/connection_registry.hpp"
#include "signaling/signaling_message.hpp"

#include <nlohmann/json.hpp>
#include <sigslot.h>

#include <memory>
#include <string>
#include <vector>

namespace meshrtc {

// MeshRoom
// Keeps a connection to every other participant of a room. All methods MUST be
// called on the same thread, the one the connections fire their callbacks on.
class MESHRTC_CPP_EXPORT MeshRoom {
public:
    struct Options {
        std::shared_ptr<MediaStream> stream = nullptr;
        RtcConfiguration rtc_config;
    };
public:
    MeshRoom(std::string name,
             std::string peer_id,
             Options options,
             ConnectionFactory* connection_factory);
    ~MeshRoom();

    const std::string name() const { return name_; }
    const std::string peer_id() const { return peer_id_; }
    std::shared_ptr<MediaStream> local_stream() const { return local_stream_; }
    const RtcConfiguration& rtc_config() const { return rtc_config_; }
    const ConnectionRegistry& connections() const { return connections_; }
    bool is_closed() const { return is_closed_; }

    // The intents below return false if the room is closed.

    // Asks for the peers to make media connections with, `stream` replaces
    // the local stream if it's not null.
    bool Call(std::shared_ptr<MediaStream> stream = nullptr);
    // Asks for the peers to make data connections with.
    bool Connect();

    bool MakeMediaConnections(const std::vector<std::string>& peer_ids);
    bool MakeDataConnections(const std::vector<std::string>& peer_ids);

    // Replaces the local stream of the room and of every media connection.
    bool ReplaceStream(std::shared_ptr<MediaStream> stream);

    // Broadcasts `data` through the signaling server.
    bool SendByTransport(nlohmann::json data);
    // Broadcasts `data` through the data connections.
    bool SendByDataChannel(nlohmann::json data);

    bool GetLog();

    // Closes all connections and the room itself.
    void Close();

    // Incoming messages from the signaling transport.
    void HandleJoin(const SignalingMessage& message);
    void HandleLeave(const SignalingMessage& message);
    void HandleOffer(const SignalingMessage& message);
    void HandleAnswer(const SignalingMessage& message);
    void HandleCandidate(const SignalingMessage& message);
    void HandleData(const DataMessage& message);
    void HandleLog(const nlohmann::json& log);

public:
    // Messages to deliver by the signaling transport.
    sigslot::signal1<const DiscoverPeersMessage&> SignalDiscoverPeers;
    sigslot::signal1<const SignalingMessage&> SignalOffer;
    sigslot::signal1<const SignalingMessage&> SignalAnswer;
    sigslot::signal1<const SignalingMessage&> SignalCandidate;
    sigslot::signal1<const BroadcastMessage&> SignalBroadcastByTransport;
    sigslot::signal1<const LogRequest&> SignalGetLog;

    // Handled by the data connections layer.
    sigslot::signal1<const BroadcastMessage&> SignalBroadcastByDataChannel;

    // Room events for the application.
    sigslot::signal1<const std::string&> SignalPeerJoined;
    sigslot::signal1<const std::string&> SignalPeerLeft;
    // Incoming media connection, valid until the remote peer leaves or the room is closed.
    sigslot::signal1<MediaConnection*> SignalCall;
    // Incoming data connection, valid until the remote peer leaves or the room is closed.
    sigslot::signal1<DataConnection*> SignalConnection;
    sigslot::signal1<std::shared_ptr<MediaStream>> SignalStream;
    sigslot::signal1<const DataMessage&> SignalData;
    sigslot::signal1<const nlohmann::json&> SignalLog;
    sigslot::signal0<> SignalClosed;

private:
    // Marks the stack of a connection callback.
    class CallbackScope;

    bool CheckOpen(const char* intent);

    MediaConnection* AddMediaConnection(const std::string& peer_id, MediaConnection::Options options);
    DataConnection* AddDataConnection(const std::string& peer_id, DataConnection::Options options);

    MediaConnection::Options MakeMediaOptions() const;
    DataConnection::Options MakeDataOptions() const;

    void SetupMessageHandlers(Connection* connection);
    void SetupMessageHandlers(MediaConnection* connection);
    void SetupMessageHandlers(DataConnection* connection);

    SignalingMessage MakeSignalingMessage(const Connection* connection, const nlohmann::json& payload) const;

    // Destroys `connections`, or keeps them until the room is entered again if
    // a connection callback is running.
    void ReleaseConnections(std::vector<std::unique_ptr<Connection>> connections);
    void ReleaseDeferredConnections();

private:
    const std::string name_;
    const std::string peer_id_;
    const RtcConfiguration rtc_config_;
    ConnectionFactory* const connection_factory_;

    std::shared_ptr<MediaStream> local_stream_;
    ConnectionRegistry connections_;
    bool is_closed_ = false;

    size_t callback_depth_ = 0;
    std::vector<std::unique_ptr<Connection>> deferred_connections_;

    DISALLOW_COPY_AND_ASSIGN(MeshRoom);
};

} // namespace meshrtc

#endif
