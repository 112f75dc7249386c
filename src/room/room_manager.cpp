#include "room/room_manager.hpp"
#include "signaling/signaling_message.hpp"

#include <boost/asio/post.hpp>
#include <plog/Log.h>

#include <stdexcept>

namespace meshrtc {
namespace {

using json = nlohmann::json;

template <typename T>
bool Decode(const json& j, const std::string& type, T& message) {
    try {
        j.get_to(message);
        return true;
    } catch (const json::exception& e) {
        PLOG_WARNING << "Dropped malformed " << type << " message: " << e.what();
    } catch (const std::invalid_argument& e) {
        PLOG_WARNING << "Dropped invalid " << type << " message: " << e.what();
    }
    return false;
}

std::string SerializeRoomMessage(const char* type, const std::string& room_name) {
    return json{{"type", type}, {"room_name", room_name}}.dump();
}

} // namespace

// RoomBinding
class RoomManager::RoomBinding : public sigslot::has_slots<> {
public:
    RoomBinding(RoomManager* manager, std::unique_ptr<MeshRoom> room) 
        : manager_(manager), 
          room_(std::move(room)) {
        room_->SignalDiscoverPeers.connect(this, &RoomBinding::OnDiscoverPeers);
        room_->SignalOffer.connect(this, &RoomBinding::OnOffer);
        room_->SignalAnswer.connect(this, &RoomBinding::OnAnswer);
        room_->SignalCandidate.connect(this, &RoomBinding::OnCandidate);
        room_->SignalBroadcastByTransport.connect(this, &RoomBinding::OnBroadcast);
        room_->SignalGetLog.connect(this, &RoomBinding::OnGetLog);
        room_->SignalClosed.connect(this, &RoomBinding::OnClosed);
    }

    MeshRoom* room() const { return room_.get(); }

private:
    void OnDiscoverPeers(const DiscoverPeersMessage& message) {
        manager_->Send(Serialize(message_type::kDiscoverPeers, message));
    }

    void OnOffer(const SignalingMessage& message) {
        manager_->Send(Serialize(message_type::kOffer, message));
    }

    void OnAnswer(const SignalingMessage& message) {
        manager_->Send(Serialize(message_type::kAnswer, message));
    }

    void OnCandidate(const SignalingMessage& message) {
        manager_->Send(Serialize(message_type::kCandidate, message));
    }

    void OnBroadcast(const BroadcastMessage& message) {
        manager_->Send(Serialize(message_type::kBroadcast, message));
    }

    void OnGetLog(const LogRequest& message) {
        manager_->Send(Serialize(message_type::kGetLog, message));
    }

    void OnClosed() {
        manager_->OnRoomClosed(room_->name());
    }

private:
    RoomManager* const manager_;
    std::unique_ptr<MeshRoom> room_;
};

// RoomManager
RoomManager::RoomManager(std::string peer_id,
                         boost::asio::io_context& ioc,
                         ConnectionFactory* connection_factory,
                         SignalingTransport* transport) 
    : peer_id_(std::move(peer_id)),
      ioc_(ioc),
      connection_factory_(connection_factory),
      transport_(transport) {
    if (!connection_factory_ || !transport_) {
        throw std::invalid_argument("RoomManager requires both a connection factory and a signaling transport.");
    }
}

RoomManager::~RoomManager() {
    PLOG_VERBOSE << __FUNCTION__;
    // A slot of the closed signal may join again, which modifies `rooms_`.
    auto rooms = std::move(rooms_);
    rooms_.clear();
    for (auto& [room_name, binding] : rooms) {
        binding->room()->Close();
    }
    rooms_.clear();
    replaced_rooms_.clear();
}

MeshRoom* RoomManager::JoinRoom(const std::string& room_name, MeshRoom::Options options) {
    if (auto it = rooms_.find(room_name); it != rooms_.end()) {
        if (!it->second->room()->is_closed()) {
            PLOG_WARNING << "Room: " << room_name << " was joined already.";
            return it->second->room();
        }
        // Closed but not removed yet, and may be still emitting if rejoined 
        // by a slot of its closed signal.
        replaced_rooms_.push_back(std::move(it->second));
        rooms_.erase(it);
        boost::asio::post(ioc_, [weak_this = weak_from_this()]() {
            if (auto shared_this = weak_this.lock()) {
                shared_this->ReleaseReplacedRooms();
            }
        });
    }

    auto room = std::make_unique<MeshRoom>(room_name, peer_id_, std::move(options), connection_factory_);
    auto binding = std::make_unique<RoomBinding>(this, std::move(room));
    MeshRoom* joined = binding->room();
    rooms_.emplace(room_name, std::move(binding));

    Send(SerializeRoomMessage(message_type::kJoin, room_name));
    return joined;
}

void RoomManager::LeaveRoom(const std::string& room_name) {
    MeshRoom* joined = room(room_name);
    if (!joined) {
        PLOG_WARNING << "Can not leave room: " << room_name << " which was not joined.";
        return;
    }
    // Sends leave message in OnRoomClosed.
    joined->Close();
}

MeshRoom* RoomManager::room(const std::string& room_name) const {
    auto it = rooms_.find(room_name);
    return it != rooms_.end() ? it->second->room() : nullptr;
}

void RoomManager::Deliver(std::string text) {
    boost::asio::post(ioc_, [weak_this = weak_from_this(), text = std::move(text)]() {
        if (auto shared_this = weak_this.lock()) {
            shared_this->Dispatch(text);
        }
    });
}

// Private methods
void RoomManager::Dispatch(const std::string& text) {
    json j;
    std::string type;
    std::string room_name;
    try {
        j = json::parse(text);
        j.at("type").get_to(type);
        j.at("room_name").get_to(room_name);
    } catch (const json::exception& e) {
        PLOG_WARNING << "Dropped malformed signaling message: " << e.what();
        return;
    }

    MeshRoom* target = room(room_name);
    if (!target || target->is_closed()) {
        PLOG_WARNING << "Dropped " << type << " message of room: " << room_name << " which was not joined.";
        return;
    }
    DispatchToRoom(target, type, j);
}

void RoomManager::DispatchToRoom(MeshRoom* room, const std::string& type, const json& j) {
    if (type == message_type::kOffer || 
        type == message_type::kAnswer || 
        type == message_type::kCandidate ||
        type == message_type::kPeerJoin || 
        type == message_type::kPeerLeave) {
        SignalingMessage message;
        if (!Decode(j, type, message)) {
            return;
        }
        if (type == message_type::kOffer) {
            room->HandleOffer(message);
        } else if (type == message_type::kAnswer) {
            room->HandleAnswer(message);
        } else if (type == message_type::kCandidate) {
            room->HandleCandidate(message);
        } else if (type == message_type::kPeerJoin) {
            room->HandleJoin(message);
        } else {
            room->HandleLeave(message);
        }
    } else if (type == message_type::kPeers) {
        PeersMessage message;
        if (!Decode(j, type, message)) {
            return;
        }
        if (message.kind == Connection::Type::MEDIA) {
            room->MakeMediaConnections(message.peer_ids);
        } else {
            room->MakeDataConnections(message.peer_ids);
        }
    } else if (type == message_type::kData) {
        DataMessage message;
        if (!Decode(j, type, message)) {
            return;
        }
        room->HandleData(message);
    } else if (type == message_type::kLog) {
        auto it = j.find("payload");
        room->HandleLog(it != j.end() ? *it : json());
    } else {
        PLOG_WARNING << "Dropped signaling message with unknown type: " << type;
    }
}

void RoomManager::Send(std::string text) {
    PLOG_VERBOSE << "Send signaling message: " << text;
    transport_->Send(std::move(text));
}

void RoomManager::OnRoomClosed(const std::string& room_name) {
    Send(SerializeRoomMessage(message_type::kLeave, room_name));
    // The room is still emitting, remove it later on the loop.
    boost::asio::post(ioc_, [weak_this = weak_from_this(), room_name]() {
        if (auto shared_this = weak_this.lock()) {
            shared_this->RemoveClosedRoom(room_name);
        }
    });
}

void RoomManager::RemoveClosedRoom(const std::string& room_name) {
    auto it = rooms_.find(room_name);
    // A room with the same name may have been joined again in the meantime.
    if (it != rooms_.end() && it->second->room()->is_closed()) {
        rooms_.erase(it);
        PLOG_DEBUG << "Removed closed room: " << room_name;
    }
}

void RoomManager::ReleaseReplacedRooms() {
    if (!replaced_rooms_.empty()) {
        PLOG_DEBUG << "Released " << replaced_rooms_.size() << " replaced room(s)";
        replaced_rooms_.clear();
    }
}

} // namespace meshrtc
