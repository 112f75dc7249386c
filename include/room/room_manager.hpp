#ifndef _ROOM_ROOM_MANAGER_H_
#define _ROOM_ROOM_MANAGER_H_

#include "base/defines.hpp"
#include "connection/connection_factory.hpp"
#include "room/mesh_room.hpp"
#include "signaling/signaling_transport.hpp"

#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace meshrtc {

// RoomManager
// Binds the rooms joined by the local peer to a signaling transport: the outgoing
// messages of a room are serialized and sent, the incoming ones are decoded and 
// routed to the room by name. All the rooms are driven on the loop of `ioc`.
class MESHRTC_CPP_EXPORT RoomManager : public std::enable_shared_from_this<RoomManager> {
public:
    static std::shared_ptr<RoomManager> Create(std::string peer_id,
                                               boost::asio::io_context& ioc,
                                               ConnectionFactory* connection_factory,
                                               SignalingTransport* transport) {
        return std::shared_ptr<RoomManager>(new RoomManager(std::move(peer_id), ioc, connection_factory, transport));
    }
    ~RoomManager();

    const std::string peer_id() const { return peer_id_; }

    // Returns the opened room if it was joined already.
    MeshRoom* JoinRoom(const std::string& room_name, MeshRoom::Options options);
    void LeaveRoom(const std::string& room_name);

    // Returns nullptr if not joined.
    MeshRoom* room(const std::string& room_name) const;
    size_t room_count() const { return rooms_.size(); }

    // Called by the transport on any thread, the message will be 
    // handled on the loop in the order of delivery.
    void Deliver(std::string text);

protected:
    RoomManager(std::string peer_id,
                boost::asio::io_context& ioc,
                ConnectionFactory* connection_factory,
                SignalingTransport* transport);

private:
    class RoomBinding;

    void Dispatch(const std::string& text);
    void DispatchToRoom(MeshRoom* room, const std::string& type, const nlohmann::json& j);

    void Send(std::string text);
    void OnRoomClosed(const std::string& room_name);
    void RemoveClosedRoom(const std::string& room_name);
    void ReleaseReplacedRooms();

private:
    const std::string peer_id_;
    boost::asio::io_context& ioc_;
    ConnectionFactory* const connection_factory_;
    SignalingTransport* const transport_;

    std::unordered_map<std::string, std::unique_ptr<RoomBinding>> rooms_;
    // Closed rooms replaced by a rejoin, released on the loop.
    std::vector<std::unique_ptr<RoomBinding>> replaced_rooms_;

    DISALLOW_COPY_AND_ASSIGN(RoomManager);
};

} // namespace meshrtc

#endif
