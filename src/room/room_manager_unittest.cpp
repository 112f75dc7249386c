#include "room/room_manager.hpp"
#include "testing/fake_connection_factory.hpp"
#include "testing/fake_signaling_transport.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <functional>
#include <stdexcept>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

using namespace ::testing;
using json = nlohmann::json;

namespace meshrtc {
namespace test {
namespace {

constexpr char kRoomName[] = "testRoom";
constexpr char kAnotherRoomName[] = "anotherTestRoom";
constexpr char kLocalPeerId[] = "testId";
constexpr char kRemotePeerId[] = "differentTestId";
constexpr char kRemoteConnectionId[] = "remoteConnectionId";

std::string CreatePeersMessage(const std::string& room_name, 
                               const std::string& kind, 
                               std::vector<std::string> peer_ids) {
    return json{{"type", "peers"}, 
                {"room_name", room_name}, 
                {"kind", kind}, 
                {"peer_ids", std::move(peer_ids)}}.dump();
}

std::string CreateSignalMessage(const std::string& type, 
                                const std::string& room_name, 
                                const std::string& connection_id, 
                                const std::string& connection_type, 
                                const json& payload) {
    return json{{"type", type},
                {"room_name", room_name},
                {"src", kRemotePeerId},
                {"connection_id", connection_id},
                {"connection_type", connection_type},
                {"payload", payload}}.dump();
}

std::string CreatePeerMessage(const std::string& type, const std::string& room_name) {
    return json{{"type", type}, {"room_name", room_name}, {"src", kRemotePeerId}}.dump();
}

} // namespace

// RoomManagerTest
class T(RoomManagerTest) : public ::testing::Test, public sigslot::has_slots<> {
public:
    T(RoomManagerTest)() 
        : manager_(RoomManager::Create(kLocalPeerId, ioc_, &factory_, &transport_)) {}

    MeshRoom* JoinRoom(const std::string& room_name = kRoomName) {
        MeshRoom* room = manager_->JoinRoom(room_name, MeshRoom::Options());
        room->SignalPeerJoined.connect(this, &T(RoomManagerTest)::OnPeerJoined);
        room->SignalPeerLeft.connect(this, &T(RoomManagerTest)::OnPeerLeft);
        room->SignalData.connect(this, &T(RoomManagerTest)::OnData);
        room->SignalLog.connect(this, &T(RoomManagerTest)::OnLog);
        room->SignalClosed.connect(this, &T(RoomManagerTest)::OnClosed);
        return room;
    }

    void RunLoop() {
        ioc_.restart();
        ioc_.run();
    }

private:
    void OnPeerJoined(const std::string& peer_id) { events_.push_back("join:" + peer_id); }
    void OnPeerLeft(const std::string& peer_id) { events_.push_back("leave:" + peer_id); }
    void OnData(const DataMessage& message) { data_messages_.push_back(message); }
    void OnLog(const json& log) { logs_.push_back(log); }
    void OnClosed() {
        if (on_closed_) {
            on_closed_();
        }
    }

protected:
    boost::asio::io_context ioc_;
    FakeConnectionFactory factory_;
    FakeSignalingTransport transport_;

    std::vector<std::string> events_;
    std::vector<DataMessage> data_messages_;
    std::vector<json> logs_;
    std::function<void()> on_closed_;

    std::shared_ptr<RoomManager> manager_;
};

MY_TEST_F(RoomManagerTest, CreateWithoutTransport) {
    EXPECT_THROW(RoomManager::Create(kLocalPeerId, ioc_, &factory_, nullptr), std::invalid_argument);
    EXPECT_THROW(RoomManager::Create(kLocalPeerId, ioc_, nullptr, &transport_), std::invalid_argument);
}

MY_TEST_F(RoomManagerTest, JoinRoom) {
    MeshRoom* room = JoinRoom();
    ASSERT_NE(room, nullptr);
    EXPECT_EQ(room->name(), kRoomName);
    EXPECT_EQ(room->peer_id(), kLocalPeerId);
    EXPECT_EQ(manager_->room(kRoomName), room);
    EXPECT_EQ(manager_->room_count(), 1u);

    EXPECT_THAT(transport_.sent_messages(), 
                ElementsAre(json::parse(R"({"type": "join", "room_name": "testRoom"})")));
}

MY_TEST_F(RoomManagerTest, JoinRoomTwice) {
    MeshRoom* room = JoinRoom();
    EXPECT_EQ(manager_->JoinRoom(kRoomName, MeshRoom::Options()), room);
    EXPECT_EQ(manager_->room_count(), 1u);
    EXPECT_EQ(transport_.SentMessagesOf("join").size(), 1u);
}

MY_TEST_F(RoomManagerTest, JoinMultipleRooms) {
    MeshRoom* room = JoinRoom();
    MeshRoom* another_room = JoinRoom(kAnotherRoomName);
    EXPECT_NE(room, another_room);
    EXPECT_EQ(manager_->room_count(), 2u);
    EXPECT_EQ(manager_->room("unknownRoom"), nullptr);
}

MY_TEST_F(RoomManagerTest, SendRoomIntents) {
    MeshRoom* room = JoinRoom();
    transport_.Clear();

    EXPECT_TRUE(room->Call());
    EXPECT_TRUE(room->Connect());
    EXPECT_TRUE(room->SendByTransport(json{{"text", "hello"}}));
    EXPECT_TRUE(room->GetLog());

    EXPECT_THAT(transport_.sent_messages(), ElementsAre(
        json::parse(R"({"type": "discover_peers", "room_name": "testRoom", "kind": "media"})"),
        json::parse(R"({"type": "discover_peers", "room_name": "testRoom", "kind": "data"})"),
        json::parse(R"({"type": "broadcast", "room_name": "testRoom", "data": {"text": "hello"}})"),
        json::parse(R"({"type": "get_log", "room_name": "testRoom"})")));
}

MY_TEST_F(RoomManagerTest, BroadcastByDataChannelIsNotSent) {
    MeshRoom* room = JoinRoom();
    transport_.Clear();

    EXPECT_TRUE(room->SendByDataChannel("x"));
    EXPECT_TRUE(transport_.sent_messages().empty());
}

MY_TEST_F(RoomManagerTest, DeliverPeers) {
    MeshRoom* room = JoinRoom();

    manager_->Deliver(CreatePeersMessage(kRoomName, "media", {kLocalPeerId, kRemotePeerId}));
    // Handled on the loop only.
    EXPECT_EQ(factory_.created_count(), 0u);

    RunLoop();
    EXPECT_THAT(factory_.media_peer_ids(), ElementsAre(kRemotePeerId));
    EXPECT_TRUE(room->connections().Contains(kRemotePeerId));

    manager_->Deliver(CreatePeersMessage(kRoomName, "data", {kRemotePeerId}));
    RunLoop();
    EXPECT_THAT(factory_.data_peer_ids(), ElementsAre(kRemotePeerId));
    EXPECT_EQ(room->connections().ConnectionsOf(kRemotePeerId).size(), 2u);
}

MY_TEST_F(RoomManagerTest, SendOfferOfConnection) {
    JoinRoom();
    manager_->Deliver(CreatePeersMessage(kRoomName, "media", {kRemotePeerId}));
    RunLoop();
    ASSERT_EQ(factory_.media_connections().size(), 1u);
    auto* connection = factory_.media_connections()[0];

    connection->TriggerOffer(json{{"type", "offer"}, {"sdp", "v=0"}});

    auto offers = transport_.SentMessagesOf("offer");
    ASSERT_EQ(offers.size(), 1u);
    EXPECT_EQ(offers[0], json({{"type", "offer"},
                               {"room_name", kRoomName},
                               {"dst", kRemotePeerId},
                               {"connection_id", connection->id()},
                               {"connection_type", "media"},
                               {"payload", {{"type", "offer"}, {"sdp", "v=0"}}}}));
}

MY_TEST_F(RoomManagerTest, DeliverOffer) {
    MeshRoom* room = JoinRoom();
    manager_->Deliver(CreateSignalMessage("offer", kRoomName, kRemoteConnectionId, "data", json{{"sdp", "v=0"}}));
    RunLoop();

    ASSERT_EQ(factory_.data_connections().size(), 1u);
    auto* connection = factory_.data_connections()[0];
    EXPECT_EQ(connection->id(), kRemoteConnectionId);
    EXPECT_EQ(room->connections().Get(kRemotePeerId, kRemoteConnectionId), connection);

    connection->TriggerAnswer(json{{"type", "answer"}});
    auto answers = transport_.SentMessagesOf("answer");
    ASSERT_EQ(answers.size(), 1u);
    EXPECT_EQ(answers[0]["dst"], kRemotePeerId);
    EXPECT_EQ(answers[0]["connection_id"], kRemoteConnectionId);
    EXPECT_EQ(answers[0]["connection_type"], "data");
}

MY_TEST_F(RoomManagerTest, DeliverAnswerAndCandidate) {
    JoinRoom();
    manager_->Deliver(CreatePeersMessage(kRoomName, "media", {kRemotePeerId}));
    RunLoop();
    ASSERT_EQ(factory_.media_connections().size(), 1u);
    auto* connection = factory_.media_connections()[0];

    const json answer = {{"type", "answer"}, {"sdp", "v=0"}};
    const json candidate = {{"candidate", "candidate:1 1 UDP 1 127.0.0.1 5000 typ host"}};
    {
        InSequence s;
        EXPECT_CALL(*connection, HandleAnswer(answer)).Times(1);
        EXPECT_CALL(*connection, HandleCandidate(candidate)).Times(1);
    }

    manager_->Deliver(CreateSignalMessage("answer", kRoomName, connection->id(), "media", answer));
    manager_->Deliver(CreateSignalMessage("candidate", kRoomName, connection->id(), "media", candidate));
    RunLoop();
}

MY_TEST_F(RoomManagerTest, DeliverInOrder) {
    MeshRoom* room = JoinRoom();
    manager_->Deliver(CreatePeerMessage("peer_join", kRoomName));
    manager_->Deliver(CreatePeersMessage(kRoomName, "media", {kRemotePeerId}));
    manager_->Deliver(CreatePeerMessage("peer_leave", kRoomName));
    manager_->Deliver(CreatePeerMessage("peer_join", kRoomName));
    EXPECT_TRUE(events_.empty());

    RunLoop();

    EXPECT_THAT(events_, ElementsAre(std::string("join:") + kRemotePeerId, 
                                     std::string("leave:") + kRemotePeerId,
                                     std::string("join:") + kRemotePeerId));
    EXPECT_EQ(factory_.media_peer_ids().size(), 1u);
    EXPECT_FALSE(room->connections().Contains(kRemotePeerId));
}

MY_TEST_F(RoomManagerTest, DeliverDataAndLog) {
    JoinRoom();
    manager_->Deliver(json({{"type", "data"}, 
                            {"room_name", kRoomName}, 
                            {"src", kRemotePeerId}, 
                            {"payload", {{"text", "hello"}}}}).dump());
    manager_->Deliver(json({{"type", "log"}, 
                            {"room_name", kRoomName}, 
                            {"payload", json::array({"event1"})}}).dump());
    RunLoop();

    ASSERT_EQ(data_messages_.size(), 1u);
    EXPECT_EQ(data_messages_[0].room_name, kRoomName);
    EXPECT_EQ(data_messages_[0].src, kRemotePeerId);
    EXPECT_EQ(data_messages_[0].data["text"], "hello");
    EXPECT_THAT(logs_, ElementsAre(json::array({"event1"})));
}

MY_TEST_F(RoomManagerTest, DropInvalidMessages) {
    MeshRoom* room = JoinRoom();
    transport_.Clear();

    manager_->Deliver("not a json");
    manager_->Deliver(R"({"room_name": "testRoom"})");
    manager_->Deliver(R"({"type": "peers"})");
    manager_->Deliver(R"({"type": "unknown", "room_name": "testRoom"})");
    manager_->Deliver(CreatePeersMessage(kAnotherRoomName, "media", {kRemotePeerId}));
    manager_->Deliver(CreatePeersMessage(kRoomName, "screen", {kRemotePeerId}));
    manager_->Deliver(R"({"type": "peers", "room_name": "testRoom", "kind": "media"})");
    manager_->Deliver(R"({"type": "offer", "room_name": 1})");
    // Still handles the valid one.
    manager_->Deliver(CreatePeersMessage(kRoomName, "data", {kRemotePeerId}));
    RunLoop();

    EXPECT_TRUE(factory_.media_peer_ids().empty());
    EXPECT_THAT(factory_.data_peer_ids(), ElementsAre(kRemotePeerId));
    EXPECT_EQ(room->connections().size(), 1u);
    EXPECT_TRUE(transport_.sent_messages().empty());
}

MY_TEST_F(RoomManagerTest, LeaveRoom) {
    MeshRoom* room = JoinRoom();
    manager_->Deliver(CreatePeersMessage(kRoomName, "media", {kRemotePeerId}));
    RunLoop();
    ASSERT_EQ(factory_.media_connections().size(), 1u);
    EXPECT_CALL(*factory_.media_connections()[0], Close()).Times(1);

    manager_->LeaveRoom(kRoomName);

    EXPECT_TRUE(room->is_closed());
    EXPECT_THAT(transport_.SentMessagesOf("leave"), 
                ElementsAre(json::parse(R"({"type": "leave", "room_name": "testRoom"})")));
    // Removed on the loop.
    EXPECT_EQ(manager_->room(kRoomName), room);

    RunLoop();
    EXPECT_EQ(manager_->room(kRoomName), nullptr);
    EXPECT_EQ(manager_->room_count(), 0u);
}

MY_TEST_F(RoomManagerTest, LeaveUnknownRoom) {
    JoinRoom();
    transport_.Clear();
    manager_->LeaveRoom(kAnotherRoomName);
    EXPECT_TRUE(transport_.sent_messages().empty());
    EXPECT_EQ(manager_->room_count(), 1u);
}

MY_TEST_F(RoomManagerTest, DropMessagesOfLeftRoom) {
    JoinRoom();
    manager_->LeaveRoom(kRoomName);
    manager_->Deliver(CreateSignalMessage("offer", kRoomName, kRemoteConnectionId, "media", json{{"sdp", "v=0"}}));
    RunLoop();

    EXPECT_EQ(factory_.created_count(), 0u);
}

MY_TEST_F(RoomManagerTest, RejoinBeforeRemoved) {
    MeshRoom* room = JoinRoom();
    manager_->LeaveRoom(kRoomName);
    ASSERT_TRUE(room->is_closed());

    MeshRoom* rejoined = JoinRoom();
    ASSERT_NE(rejoined, nullptr);
    EXPECT_FALSE(rejoined->is_closed());
    EXPECT_EQ(transport_.SentMessagesOf("join").size(), 2u);

    // The rejoined room is kept.
    RunLoop();
    EXPECT_EQ(manager_->room(kRoomName), rejoined);
    EXPECT_FALSE(rejoined->is_closed());
}

MY_TEST_F(RoomManagerTest, RejoinInsideClosedSignal) {
    MeshRoom* room = JoinRoom();
    MeshRoom* rejoined = nullptr;
    on_closed_ = [this, &rejoined]() {
        if (!rejoined) {
            rejoined = manager_->JoinRoom(kRoomName, MeshRoom::Options());
        }
    };

    manager_->LeaveRoom(kRoomName);

    ASSERT_NE(rejoined, nullptr);
    EXPECT_NE(rejoined, room);
    EXPECT_FALSE(rejoined->is_closed());
    // The left room is kept alive until the loop runs.
    EXPECT_TRUE(room->is_closed());
    EXPECT_EQ(manager_->room(kRoomName), rejoined);

    std::vector<std::string> sent_types;
    for (const auto& message : transport_.sent_messages()) {
        sent_types.push_back(message["type"].get<std::string>());
    }
    EXPECT_THAT(sent_types, ElementsAre("join", "leave", "join"));

    RunLoop();
    EXPECT_EQ(manager_->room(kRoomName), rejoined);
    EXPECT_FALSE(rejoined->is_closed());
    EXPECT_EQ(manager_->room_count(), 1u);
    on_closed_ = nullptr;
}

MY_TEST_F(RoomManagerTest, DeliverAfterDestroyed) {
    JoinRoom();
    manager_->Deliver(CreatePeersMessage(kRoomName, "media", {kRemotePeerId}));
    manager_.reset();

    RunLoop();
    EXPECT_EQ(factory_.created_count(), 0u);
}

MY_TEST_F(RoomManagerTest, CloseRoomsOnDestruction) {
    MeshRoom* room = JoinRoom();
    JoinRoom(kAnotherRoomName);
    room->MakeDataConnections({kRemotePeerId});
    ASSERT_EQ(factory_.data_connections().size(), 1u);
    EXPECT_CALL(*factory_.data_connections()[0], Close()).Times(1);

    manager_.reset();

    EXPECT_EQ(transport_.SentMessagesOf("leave").size(), 2u);
}

} // namespace test
} // namespace meshrtc
