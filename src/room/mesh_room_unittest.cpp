#include "room/mesh_room.hpp"
#include "testing/fake_connection_factory.hpp"
#include "testing/mock_connection.hpp"

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

constexpr char kRoomName[] = "testMeshRoom";
constexpr char kLocalPeerId[] = "testId";
constexpr char kRemotePeerId[] = "differentTestId";
constexpr char kThirdPeerId[] = "thirdTestId";
constexpr char kLocalStreamId[] = "localStream";
constexpr char kRemoteConnectionId[] = "remoteConnectionId";

SignalingMessage CreateMessage(const std::string& src, 
                               const std::string& connection_id = "", 
                               const std::string& connection_type = "",
                               json payload = json()) {
    SignalingMessage message;
    message.room_name = kRoomName;
    message.src = src;
    message.connection_id = connection_id;
    message.connection_type = connection_type;
    message.payload = std::move(payload);
    return message;
}

} // namespace

// MeshRoomTest
class T(MeshRoomTest) : public ::testing::Test, public sigslot::has_slots<> {
public:
    T(MeshRoomTest)() 
        : local_stream_(std::make_shared<MediaStream>(kLocalStreamId)) {
        MeshRoom::Options options;
        options.stream = local_stream_;
        room_ = std::make_unique<MeshRoom>(kRoomName, kLocalPeerId, std::move(options), &factory_);

        room_->SignalDiscoverPeers.connect(this, &T(MeshRoomTest)::OnDiscoverPeers);
        room_->SignalOffer.connect(this, &T(MeshRoomTest)::OnOffer);
        room_->SignalAnswer.connect(this, &T(MeshRoomTest)::OnAnswer);
        room_->SignalCandidate.connect(this, &T(MeshRoomTest)::OnCandidate);
        room_->SignalBroadcastByTransport.connect(this, &T(MeshRoomTest)::OnBroadcastByTransport);
        room_->SignalBroadcastByDataChannel.connect(this, &T(MeshRoomTest)::OnBroadcastByDataChannel);
        room_->SignalGetLog.connect(this, &T(MeshRoomTest)::OnGetLog);
        room_->SignalPeerJoined.connect(this, &T(MeshRoomTest)::OnPeerJoined);
        room_->SignalPeerLeft.connect(this, &T(MeshRoomTest)::OnPeerLeft);
        room_->SignalCall.connect(this, &T(MeshRoomTest)::OnCall);
        room_->SignalConnection.connect(this, &T(MeshRoomTest)::OnConnection);
        room_->SignalStream.connect(this, &T(MeshRoomTest)::OnStream);
        room_->SignalData.connect(this, &T(MeshRoomTest)::OnData);
        room_->SignalLog.connect(this, &T(MeshRoomTest)::OnLog);
        room_->SignalClosed.connect(this, &T(MeshRoomTest)::OnClosed);
    }

    size_t emitted_count() const {
        return discover_messages_.size() + offer_messages_.size() + answer_messages_.size() + 
               candidate_messages_.size() + transport_broadcasts_.size() + data_channel_broadcasts_.size() +
               log_requests_.size() + joined_peer_ids_.size() + left_peer_ids_.size() + 
               incoming_calls_.size() + incoming_connections_.size() + remote_streams_.size() + 
               data_messages_.size() + logs_.size();
    }

private:
    void OnDiscoverPeers(const DiscoverPeersMessage& message) { discover_messages_.push_back(message); }
    void OnOffer(const SignalingMessage& message) { offer_messages_.push_back(message); }
    void OnAnswer(const SignalingMessage& message) { answer_messages_.push_back(message); }
    void OnCandidate(const SignalingMessage& message) { candidate_messages_.push_back(message); }
    void OnBroadcastByTransport(const BroadcastMessage& message) { transport_broadcasts_.push_back(message); }
    void OnBroadcastByDataChannel(const BroadcastMessage& message) { data_channel_broadcasts_.push_back(message); }
    void OnGetLog(const LogRequest& message) { log_requests_.push_back(message); }
    void OnPeerJoined(const std::string& peer_id) { joined_peer_ids_.push_back(peer_id); }
    void OnPeerLeft(const std::string& peer_id) { left_peer_ids_.push_back(peer_id); }
    void OnCall(MediaConnection* connection) { incoming_calls_.push_back(connection); }
    void OnConnection(DataConnection* connection) { incoming_connections_.push_back(connection); }
    void OnStream(std::shared_ptr<MediaStream> stream) {
        remote_streams_.push_back(std::move(stream));
        if (on_stream_) {
            on_stream_();
        }
    }
    void OnData(const DataMessage& message) {
        data_messages_.push_back(message);
        if (on_data_) {
            on_data_();
        }
    }
    void OnLog(const json& log) { logs_.push_back(log); }
    void OnClosed() { ++closed_count_; }

protected:
    FakeConnectionFactory factory_;
    std::shared_ptr<MediaStream> local_stream_;

    std::vector<DiscoverPeersMessage> discover_messages_;
    std::vector<SignalingMessage> offer_messages_;
    std::vector<SignalingMessage> answer_messages_;
    std::vector<SignalingMessage> candidate_messages_;
    std::vector<BroadcastMessage> transport_broadcasts_;
    std::vector<BroadcastMessage> data_channel_broadcasts_;
    std::vector<LogRequest> log_requests_;
    std::vector<std::string> joined_peer_ids_;
    std::vector<std::string> left_peer_ids_;
    std::vector<MediaConnection*> incoming_calls_;
    std::vector<DataConnection*> incoming_connections_;
    std::vector<std::shared_ptr<MediaStream>> remote_streams_;
    std::vector<DataMessage> data_messages_;
    std::vector<json> logs_;
    size_t closed_count_ = 0;

    // Run by the slots, after recording.
    std::function<void()> on_stream_;
    std::function<void()> on_data_;

    // Destroyed first, the connections it owns are referenced by `factory_`.
    std::unique_ptr<MeshRoom> room_;
};

MY_TEST_F(MeshRoomTest, Construct) {
    EXPECT_EQ(room_->name(), kRoomName);
    EXPECT_EQ(room_->peer_id(), kLocalPeerId);
    EXPECT_EQ(room_->local_stream(), local_stream_);
    EXPECT_FALSE(room_->is_closed());
    EXPECT_TRUE(room_->connections().empty());
    EXPECT_EQ(emitted_count(), 0u);
}

MY_TEST_F(MeshRoomTest, ConstructWithoutFactory) {
    EXPECT_THROW(std::make_unique<MeshRoom>(kRoomName, kLocalPeerId, MeshRoom::Options(), nullptr), std::invalid_argument);
}

MY_TEST_F(MeshRoomTest, CallDiscoversMediaPeers) {
    EXPECT_TRUE(room_->Call());
    ASSERT_EQ(discover_messages_.size(), 1u);
    EXPECT_EQ(discover_messages_[0].room_name, kRoomName);
    EXPECT_EQ(discover_messages_[0].kind, Connection::Type::MEDIA);
    // The local stream is kept without a new one.
    EXPECT_EQ(room_->local_stream(), local_stream_);
}

MY_TEST_F(MeshRoomTest, CallWithStream) {
    auto stream = std::make_shared<MediaStream>("anotherStream");
    EXPECT_TRUE(room_->Call(stream));
    EXPECT_EQ(room_->local_stream(), stream);
    EXPECT_EQ(discover_messages_.size(), 1u);

    EXPECT_TRUE(room_->MakeMediaConnections({kRemotePeerId}));
    ASSERT_EQ(factory_.media_connections().size(), 1u);
    EXPECT_EQ(factory_.media_connections()[0]->options().stream, stream);
}

MY_TEST_F(MeshRoomTest, ConnectDiscoversDataPeers) {
    EXPECT_TRUE(room_->Connect());
    ASSERT_EQ(discover_messages_.size(), 1u);
    EXPECT_EQ(discover_messages_[0].room_name, kRoomName);
    EXPECT_EQ(discover_messages_[0].kind, Connection::Type::DATA);
}

MY_TEST_F(MeshRoomTest, MakeMediaConnections) {
    EXPECT_TRUE(room_->MakeMediaConnections({kLocalPeerId, kRemotePeerId, kThirdPeerId}));

    // Never connects to itself.
    EXPECT_THAT(factory_.media_peer_ids(), ElementsAre(kRemotePeerId, kThirdPeerId));
    ASSERT_EQ(factory_.media_connections().size(), 2u);
    EXPECT_FALSE(room_->connections().Contains(kLocalPeerId));
    EXPECT_EQ(room_->connections().size(), 2u);

    for (auto* connection : factory_.media_connections()) {
        EXPECT_EQ(connection->type(), Connection::Type::MEDIA);
        EXPECT_EQ(connection->options().stream, local_stream_);
        EXPECT_FALSE(connection->options().connection_id.has_value());
        EXPECT_FALSE(connection->options().offer.has_value());
        EXPECT_EQ(room_->connections().Get(connection->remote_peer_id(), connection->id()), connection);
    }
    // Locally created connections are not reported as incoming.
    EXPECT_TRUE(incoming_calls_.empty());
}

MY_TEST_F(MeshRoomTest, MakeDataConnections) {
    EXPECT_TRUE(room_->MakeDataConnections({kRemotePeerId, kLocalPeerId}));

    EXPECT_THAT(factory_.data_peer_ids(), ElementsAre(kRemotePeerId));
    ASSERT_EQ(factory_.data_connections().size(), 1u);
    auto* connection = factory_.data_connections()[0];
    EXPECT_EQ(connection->type(), Connection::Type::DATA);
    EXPECT_FALSE(connection->options().connection_id.has_value());
    EXPECT_THAT(room_->connections().ConnectionsOf(kRemotePeerId), ElementsAre(connection));
    EXPECT_TRUE(incoming_connections_.empty());
}

MY_TEST_F(MeshRoomTest, MakeConnectionsWithEmptyPeers) {
    EXPECT_TRUE(room_->MakeMediaConnections({}));
    EXPECT_TRUE(room_->MakeDataConnections({kLocalPeerId}));
    EXPECT_EQ(factory_.created_count(), 0u);
    EXPECT_TRUE(room_->connections().empty());
}

MY_TEST_F(MeshRoomTest, SkipPeerFailedToConnect) {
    factory_.FailFor(kRemotePeerId);
    EXPECT_TRUE(room_->MakeMediaConnections({kRemotePeerId, kThirdPeerId}));

    EXPECT_THAT(factory_.media_peer_ids(), ElementsAre(kRemotePeerId, kThirdPeerId));
    EXPECT_FALSE(room_->connections().Contains(kRemotePeerId));
    EXPECT_TRUE(room_->connections().Contains(kThirdPeerId));
    EXPECT_EQ(room_->connections().size(), 1u);
}

MY_TEST_F(MeshRoomTest, HandleJoin) {
    room_->HandleJoin(CreateMessage(kRemotePeerId));
    EXPECT_THAT(joined_peer_ids_, ElementsAre(kRemotePeerId));
    // Connections are made on demand only.
    EXPECT_EQ(factory_.created_count(), 0u);
}

MY_TEST_F(MeshRoomTest, HandleLeave) {
    room_->MakeMediaConnections({kRemotePeerId, kThirdPeerId});
    room_->MakeDataConnections({kRemotePeerId});
    auto* media_connection = factory_.media_connections()[0];
    auto* data_connection = factory_.data_connections()[0];
    ASSERT_EQ(media_connection->remote_peer_id(), kRemotePeerId);

    // The connections are forgotten, the remote peer closes its side itself.
    EXPECT_CALL(*media_connection, Close()).Times(0);
    EXPECT_CALL(*data_connection, Close()).Times(0);

    room_->HandleLeave(CreateMessage(kRemotePeerId));

    EXPECT_THAT(left_peer_ids_, ElementsAre(kRemotePeerId));
    EXPECT_FALSE(room_->connections().Contains(kRemotePeerId));
    EXPECT_TRUE(room_->connections().Contains(kThirdPeerId));
    EXPECT_EQ(room_->connections().size(), 1u);
}

MY_TEST_F(MeshRoomTest, HandleLeaveOfUnknownPeer) {
    room_->MakeMediaConnections({kRemotePeerId});
    room_->HandleLeave(CreateMessage(kThirdPeerId));
    EXPECT_THAT(left_peer_ids_, ElementsAre(kThirdPeerId));
    EXPECT_EQ(room_->connections().size(), 1u);
}

MY_TEST_F(MeshRoomTest, HandleMediaOffer) {
    const json offer = {{"type", "offer"}, {"sdp", "v=0"}};
    room_->HandleOffer(CreateMessage(kRemotePeerId, kRemoteConnectionId, "media", offer));

    ASSERT_EQ(factory_.media_connections().size(), 1u);
    auto* connection = factory_.media_connections()[0];
    EXPECT_EQ(connection->id(), kRemoteConnectionId);
    EXPECT_EQ(connection->remote_peer_id(), kRemotePeerId);
    EXPECT_EQ(connection->options().connection_id, std::optional<std::string>(kRemoteConnectionId));
    ASSERT_TRUE(connection->options().offer.has_value());
    EXPECT_EQ(*connection->options().offer, offer);
    EXPECT_EQ(connection->options().stream, local_stream_);

    EXPECT_EQ(room_->connections().Get(kRemotePeerId, kRemoteConnectionId), connection);
    EXPECT_THAT(incoming_calls_, ElementsAre(connection));
    EXPECT_TRUE(incoming_connections_.empty());
}

MY_TEST_F(MeshRoomTest, HandleDataOffer) {
    const json offer = {{"type", "offer"}, {"sdp", "v=0"}};
    room_->HandleOffer(CreateMessage(kRemotePeerId, kRemoteConnectionId, "data", offer));

    ASSERT_EQ(factory_.data_connections().size(), 1u);
    auto* connection = factory_.data_connections()[0];
    EXPECT_EQ(connection->id(), kRemoteConnectionId);
    ASSERT_TRUE(connection->options().offer.has_value());
    EXPECT_EQ(*connection->options().offer, offer);

    EXPECT_EQ(room_->connections().Get(kRemotePeerId, kRemoteConnectionId), connection);
    EXPECT_THAT(incoming_connections_, ElementsAre(connection));
    EXPECT_TRUE(incoming_calls_.empty());
}

MY_TEST_F(MeshRoomTest, HandleRetransmittedOffer) {
    auto offer = CreateMessage(kRemotePeerId, kRemoteConnectionId, "media", json{{"sdp", "v=0"}});
    room_->HandleOffer(offer);
    room_->HandleOffer(offer);

    EXPECT_EQ(factory_.created_count(), 1u);
    EXPECT_EQ(room_->connections().ConnectionsOf(kRemotePeerId).size(), 1u);
    EXPECT_EQ(incoming_calls_.size(), 1u);
}

MY_TEST_F(MeshRoomTest, HandleRetransmittedDataOffer) {
    auto offer = CreateMessage(kRemotePeerId, kRemoteConnectionId, "data", json{{"sdp", "v=0"}});
    room_->HandleOffer(offer);
    room_->HandleOffer(offer);

    EXPECT_EQ(factory_.data_peer_ids().size(), 1u);
    EXPECT_EQ(room_->connections().ConnectionsOf(kRemotePeerId).size(), 1u);
    EXPECT_EQ(incoming_connections_.size(), 1u);
    EXPECT_TRUE(incoming_calls_.empty());
}

MY_TEST_F(MeshRoomTest, IgnoreDataOfferOfLocalConnection) {
    room_->MakeDataConnections({kRemotePeerId});
    ASSERT_EQ(factory_.data_connections().size(), 1u);
    const std::string connection_id = factory_.data_connections()[0]->id();

    room_->HandleOffer(CreateMessage(kRemotePeerId, connection_id, "data"));

    EXPECT_EQ(factory_.created_count(), 1u);
    EXPECT_TRUE(incoming_connections_.empty());
}

MY_TEST_F(MeshRoomTest, IgnoreOfferOfLocalConnection) {
    room_->MakeMediaConnections({kRemotePeerId});
    ASSERT_EQ(factory_.media_connections().size(), 1u);
    const std::string connection_id = factory_.media_connections()[0]->id();

    room_->HandleOffer(CreateMessage(kRemotePeerId, connection_id, "media"));

    EXPECT_EQ(factory_.created_count(), 1u);
    EXPECT_TRUE(incoming_calls_.empty());
}

MY_TEST_F(MeshRoomTest, IgnoreOfferWithUnknownType) {
    room_->HandleOffer(CreateMessage(kRemotePeerId, kRemoteConnectionId, "screen"));
    room_->HandleOffer(CreateMessage(kRemotePeerId, kRemoteConnectionId, ""));

    EXPECT_TRUE(factory_.media_peer_ids().empty());
    EXPECT_TRUE(factory_.data_peer_ids().empty());
    EXPECT_TRUE(room_->connections().empty());
    EXPECT_EQ(emitted_count(), 0u);
}

MY_TEST_F(MeshRoomTest, IgnoreOfferFromItself) {
    room_->HandleOffer(CreateMessage(kLocalPeerId, kRemoteConnectionId, "media"));
    EXPECT_TRUE(factory_.media_peer_ids().empty());
    EXPECT_TRUE(incoming_calls_.empty());
}

MY_TEST_F(MeshRoomTest, IncomingOfferFailedToConnect) {
    factory_.FailFor(kRemotePeerId);
    room_->HandleOffer(CreateMessage(kRemotePeerId, kRemoteConnectionId, "data"));

    EXPECT_THAT(factory_.data_peer_ids(), ElementsAre(kRemotePeerId));
    EXPECT_TRUE(room_->connections().empty());
    EXPECT_TRUE(incoming_connections_.empty());
}

MY_TEST_F(MeshRoomTest, HandleAnswer) {
    room_->MakeMediaConnections({kRemotePeerId, kThirdPeerId});
    auto* connection = factory_.media_connections()[0];
    auto* other_connection = factory_.media_connections()[1];

    const json answer = {{"type", "answer"}, {"sdp", "v=0"}};
    EXPECT_CALL(*connection, HandleAnswer(answer)).Times(1);
    EXPECT_CALL(*other_connection, HandleAnswer(_)).Times(0);

    room_->HandleAnswer(CreateMessage(kRemotePeerId, connection->id(), "media", answer));
}

MY_TEST_F(MeshRoomTest, DropAnswerOfUnknownConnection) {
    room_->MakeMediaConnections({kRemotePeerId});
    auto* connection = factory_.media_connections()[0];
    EXPECT_CALL(*connection, HandleAnswer(_)).Times(0);

    // Unknown connection id.
    room_->HandleAnswer(CreateMessage(kRemotePeerId, "unknownConnectionId", "media", json{{"sdp", "v=0"}}));
    // The connection id belongs to another peer.
    room_->HandleAnswer(CreateMessage(kThirdPeerId, connection->id(), "media", json{{"sdp", "v=0"}}));

    EXPECT_EQ(emitted_count(), 0u);
}

MY_TEST_F(MeshRoomTest, AnswerToOfferSentOnConnecting) {
    room_->MakeMediaConnections({kRemotePeerId});
    auto* connection = factory_.media_connections()[0];

    const json answer = {{"type", "answer"}, {"sdp", "v=0"}};
    EXPECT_CALL(*connection, HandleAnswer(answer)).Times(1);

    // The connection is registered before its offer goes out,
    // so the answer replied to it is never dropped.
    connection->TriggerOffer(json{{"type", "offer"}, {"sdp", "v=0"}});
    ASSERT_EQ(offer_messages_.size(), 1u);
    room_->HandleAnswer(CreateMessage(kRemotePeerId, offer_messages_[0].connection_id, "media", answer));
}

MY_TEST_F(MeshRoomTest, HandleCandidate) {
    room_->MakeDataConnections({kRemotePeerId});
    auto* connection = factory_.data_connections()[0];

    const json candidate = {{"candidate", "candidate:1 1 UDP 2122260223 192.168.1.2 50000 typ host"}, {"sdpMid", "0"}};
    EXPECT_CALL(*connection, HandleCandidate(candidate)).Times(1);
    room_->HandleCandidate(CreateMessage(kRemotePeerId, connection->id(), "data", candidate));
}

MY_TEST_F(MeshRoomTest, DropCandidateOfUnknownConnection) {
    room_->MakeDataConnections({kRemotePeerId});
    auto* connection = factory_.data_connections()[0];
    EXPECT_CALL(*connection, HandleCandidate(_)).Times(0);

    room_->HandleCandidate(CreateMessage(kRemotePeerId, "unknownConnectionId", "data", json{{"candidate", ""}}));
    room_->HandleCandidate(CreateMessage(kThirdPeerId, connection->id(), "data", json{{"candidate", ""}}));
}

MY_TEST_F(MeshRoomTest, ForwardNegotiationOfConnection) {
    room_->MakeMediaConnections({kRemotePeerId});
    auto* connection = factory_.media_connections()[0];

    const json offer = {{"type", "offer"}, {"sdp", "v=0"}};
    const json answer = {{"type", "answer"}, {"sdp", "v=0"}};
    const json candidate = {{"candidate", "candidate:1 1 UDP 1 127.0.0.1 5000 typ host"}};
    connection->TriggerOffer(offer);
    connection->TriggerAnswer(answer);
    connection->TriggerCandidate(candidate);

    ASSERT_EQ(offer_messages_.size(), 1u);
    ASSERT_EQ(answer_messages_.size(), 1u);
    ASSERT_EQ(candidate_messages_.size(), 1u);

    const auto& offer_message = offer_messages_[0];
    EXPECT_EQ(offer_message.room_name, kRoomName);
    EXPECT_EQ(offer_message.dst, kRemotePeerId);
    EXPECT_TRUE(offer_message.src.empty());
    EXPECT_EQ(offer_message.connection_id, connection->id());
    EXPECT_EQ(offer_message.connection_type, "media");
    EXPECT_EQ(offer_message.payload, offer);

    EXPECT_EQ(answer_messages_[0].dst, kRemotePeerId);
    EXPECT_EQ(answer_messages_[0].payload, answer);
    EXPECT_EQ(candidate_messages_[0].dst, kRemotePeerId);
    EXPECT_EQ(candidate_messages_[0].payload, candidate);
}

MY_TEST_F(MeshRoomTest, ForwardNegotiationOfIncomingDataConnection) {
    room_->HandleOffer(CreateMessage(kRemotePeerId, kRemoteConnectionId, "data", json{{"sdp", "v=0"}}));
    ASSERT_EQ(factory_.data_connections().size(), 1u);
    auto* connection = factory_.data_connections()[0];

    connection->TriggerAnswer(json{{"type", "answer"}});
    ASSERT_EQ(answer_messages_.size(), 1u);
    EXPECT_EQ(answer_messages_[0].dst, kRemotePeerId);
    EXPECT_EQ(answer_messages_[0].connection_id, kRemoteConnectionId);
    EXPECT_EQ(answer_messages_[0].connection_type, "data");
}

MY_TEST_F(MeshRoomTest, RemoteStreamIsTaggedWithPeerId) {
    room_->MakeMediaConnections({kRemotePeerId});
    auto* connection = factory_.media_connections()[0];

    auto remote_stream = std::make_shared<MediaStream>("remoteStream");
    connection->TriggerStream(remote_stream);

    ASSERT_EQ(remote_streams_.size(), 1u);
    EXPECT_EQ(remote_streams_[0], remote_stream);
    EXPECT_EQ(remote_streams_[0]->peer_id(), std::optional<std::string>(kRemotePeerId));
}

MY_TEST_F(MeshRoomTest, ForwardDataOfConnection) {
    room_->MakeDataConnections({kRemotePeerId});
    auto* connection = factory_.data_connections()[0];

    connection->TriggerData(json{{"text", "hello"}});

    ASSERT_EQ(data_messages_.size(), 1u);
    EXPECT_EQ(data_messages_[0].room_name, kRoomName);
    EXPECT_EQ(data_messages_[0].src, kRemotePeerId);
    EXPECT_EQ(data_messages_[0].data, json({{"text", "hello"}}));
}

MY_TEST_F(MeshRoomTest, SendByTransport) {
    EXPECT_TRUE(room_->SendByTransport("x"));
    ASSERT_EQ(transport_broadcasts_.size(), 1u);
    EXPECT_EQ(transport_broadcasts_[0].room_name, kRoomName);
    EXPECT_EQ(transport_broadcasts_[0].data, "x");
    EXPECT_TRUE(data_channel_broadcasts_.empty());
}

MY_TEST_F(MeshRoomTest, SendByDataChannel) {
    EXPECT_TRUE(room_->SendByDataChannel(json{{"text", "x"}}));
    ASSERT_EQ(data_channel_broadcasts_.size(), 1u);
    EXPECT_EQ(data_channel_broadcasts_[0].room_name, kRoomName);
    EXPECT_EQ(data_channel_broadcasts_[0].data["text"], "x");
    EXPECT_TRUE(transport_broadcasts_.empty());
}

MY_TEST_F(MeshRoomTest, HandleData) {
    room_->HandleData(DataMessage{kRoomName, kRemotePeerId, "x"});
    ASSERT_EQ(data_messages_.size(), 1u);
    EXPECT_EQ(data_messages_[0].src, kRemotePeerId);
    EXPECT_EQ(data_messages_[0].data, "x");
}

MY_TEST_F(MeshRoomTest, GetLog) {
    EXPECT_TRUE(room_->GetLog());
    ASSERT_EQ(log_requests_.size(), 1u);
    EXPECT_EQ(log_requests_[0].room_name, kRoomName);

    const json log = json::array({"event1", "event2"});
    room_->HandleLog(log);
    EXPECT_THAT(logs_, ElementsAre(log));
}

MY_TEST_F(MeshRoomTest, ReplaceStream) {
    room_->MakeMediaConnections({kRemotePeerId, kThirdPeerId});
    room_->MakeDataConnections({kRemotePeerId});

    auto stream = std::make_shared<MediaStream>("anotherStream");
    for (auto* connection : factory_.media_connections()) {
        EXPECT_CALL(*connection, ReplaceStream(stream)).Times(1);
    }
    EXPECT_TRUE(room_->ReplaceStream(stream));
    EXPECT_EQ(room_->local_stream(), stream);
}

MY_TEST_F(MeshRoomTest, Close) {
    room_->MakeMediaConnections({kRemotePeerId, kThirdPeerId});
    room_->MakeDataConnections({kRemotePeerId});
    auto* media_connection1 = factory_.media_connections()[0];
    auto* media_connection2 = factory_.media_connections()[1];
    auto* data_connection = factory_.data_connections()[0];

    {
        InSequence s;
        // In the order of creation.
        EXPECT_CALL(*media_connection1, Close()).Times(1);
        EXPECT_CALL(*media_connection2, Close()).Times(1);
        EXPECT_CALL(*data_connection, Close()).Times(1);
    }

    room_->Close();

    EXPECT_TRUE(room_->is_closed());
    EXPECT_TRUE(room_->connections().empty());
    EXPECT_EQ(closed_count_, 1u);
}

MY_TEST_F(MeshRoomTest, CloseWithoutConnections) {
    room_->Close();
    EXPECT_TRUE(room_->is_closed());
    EXPECT_EQ(closed_count_, 1u);
}

MY_TEST_F(MeshRoomTest, CloseTwice) {
    room_->MakeDataConnections({kRemotePeerId});
    EXPECT_CALL(*factory_.data_connections()[0], Close()).Times(1);

    room_->Close();
    room_->Close();
    EXPECT_EQ(closed_count_, 1u);

    // Closed already.
    room_.reset();
    EXPECT_EQ(closed_count_, 1u);
}

MY_TEST_F(MeshRoomTest, CloseOnDestruction) {
    room_->MakeMediaConnections({kRemotePeerId});
    EXPECT_CALL(*factory_.media_connections()[0], Close()).Times(1);

    room_.reset();
    EXPECT_EQ(closed_count_, 1u);
}

MY_TEST_F(MeshRoomTest, DropEventsFiredWhileClosing) {
    room_->MakeMediaConnections({kRemotePeerId});
    auto* connection = factory_.media_connections()[0];
    EXPECT_CALL(*connection, Close()).WillOnce([connection]() {
        connection->TriggerCandidate(json{{"candidate", ""}});
        connection->TriggerStream(std::make_shared<MediaStream>("remoteStream"));
    });

    room_->Close();

    EXPECT_TRUE(candidate_messages_.empty());
    EXPECT_TRUE(remote_streams_.empty());
}

MY_TEST_F(MeshRoomTest, ReleaseOnCloseOutsideCallback) {
    room_->MakeDataConnections({kRemotePeerId});
    auto* connection = factory_.data_connections()[0];

    MockFunction<void(const std::string&)> check;
    {
        InSequence s;
        EXPECT_CALL(*connection, Close()).Times(1);
        EXPECT_CALL(*connection, Die()).Times(1);
        EXPECT_CALL(check, Call("closed"));
    }

    room_->Close();
    check.Call("closed");
}

MY_TEST_F(MeshRoomTest, CloseInsideDataCallback) {
    room_->MakeDataConnections({kRemotePeerId});
    auto* connection = factory_.data_connections()[0];
    on_data_ = [this]() { room_->Close(); };

    MockFunction<void(const std::string&)> check;
    {
        InSequence s;
        EXPECT_CALL(*connection, Close()).Times(1);
        // Outlives its own callback.
        EXPECT_CALL(check, Call("callback returned"));
        EXPECT_CALL(*connection, Die()).Times(1);
        EXPECT_CALL(check, Call("room entered"));
    }

    connection->TriggerData(json{{"text", "bye"}});
    check.Call("callback returned");

    EXPECT_TRUE(room_->is_closed());
    EXPECT_TRUE(room_->connections().empty());
    EXPECT_EQ(closed_count_, 1u);
    EXPECT_EQ(data_messages_.size(), 1u);

    // Released once the room is entered again.
    EXPECT_FALSE(room_->Call());
    check.Call("room entered");
}

MY_TEST_F(MeshRoomTest, CloseInsideDataCallbackThenDestroy) {
    room_->MakeDataConnections({kRemotePeerId});
    auto* connection = factory_.data_connections()[0];
    on_data_ = [this]() { room_->Close(); };

    MockFunction<void(const std::string&)> check;
    {
        InSequence s;
        EXPECT_CALL(check, Call("callback returned"));
        EXPECT_CALL(*connection, Die()).Times(1);
    }

    connection->TriggerData(json{{"text", "bye"}});
    check.Call("callback returned");
    room_.reset();
}

MY_TEST_F(MeshRoomTest, LeaveInsideStreamCallback) {
    room_->MakeMediaConnections({kRemotePeerId});
    auto* connection = factory_.media_connections()[0];
    on_stream_ = [this]() { room_->HandleLeave(CreateMessage(kRemotePeerId)); };

    MockFunction<void(const std::string&)> check;
    EXPECT_CALL(*connection, Close()).Times(0);
    {
        InSequence s;
        EXPECT_CALL(check, Call("callback returned"));
        EXPECT_CALL(*connection, Die()).Times(1);
        EXPECT_CALL(check, Call("room entered"));
    }

    connection->TriggerStream(std::make_shared<MediaStream>("remoteStream"));
    check.Call("callback returned");

    EXPECT_FALSE(room_->is_closed());
    EXPECT_FALSE(room_->connections().Contains(kRemotePeerId));
    EXPECT_THAT(left_peer_ids_, ElementsAre(kRemotePeerId));

    room_->HandleJoin(CreateMessage(kThirdPeerId));
    check.Call("room entered");
}

MY_TEST_F(MeshRoomTest, RejectIntentsAfterClose) {
    room_->Close();

    EXPECT_FALSE(room_->Call());
    EXPECT_FALSE(room_->Connect());
    EXPECT_FALSE(room_->MakeMediaConnections({kRemotePeerId}));
    EXPECT_FALSE(room_->MakeDataConnections({kRemotePeerId}));
    EXPECT_FALSE(room_->ReplaceStream(std::make_shared<MediaStream>("anotherStream")));
    EXPECT_FALSE(room_->SendByTransport("x"));
    EXPECT_FALSE(room_->SendByDataChannel("x"));
    EXPECT_FALSE(room_->GetLog());

    EXPECT_EQ(room_->local_stream(), local_stream_);
    EXPECT_EQ(factory_.created_count(), 0u);
    EXPECT_EQ(emitted_count(), 0u);
}

MY_TEST_F(MeshRoomTest, IgnoreMessagesAfterClose) {
    room_->Close();

    room_->HandleJoin(CreateMessage(kRemotePeerId));
    room_->HandleLeave(CreateMessage(kRemotePeerId));
    room_->HandleOffer(CreateMessage(kRemotePeerId, kRemoteConnectionId, "media", json{{"sdp", "v=0"}}));
    room_->HandleOffer(CreateMessage(kRemotePeerId, kRemoteConnectionId, "data", json{{"sdp", "v=0"}}));
    room_->HandleAnswer(CreateMessage(kRemotePeerId, kRemoteConnectionId, "media", json{{"sdp", "v=0"}}));
    room_->HandleCandidate(CreateMessage(kRemotePeerId, kRemoteConnectionId, "media", json{{"candidate", ""}}));
    room_->HandleData(DataMessage{kRoomName, kRemotePeerId, "x"});
    room_->HandleLog(json::array());

    EXPECT_TRUE(factory_.media_peer_ids().empty());
    EXPECT_TRUE(factory_.data_peer_ids().empty());
    EXPECT_EQ(emitted_count(), 0u);
}

MY_TEST_F(MeshRoomTest, CallThenClose) {
    EXPECT_TRUE(room_->Call());
    ASSERT_EQ(discover_messages_.size(), 1u);
    EXPECT_EQ(discover_messages_[0].room_name, kRoomName);
    EXPECT_EQ(discover_messages_[0].kind, Connection::Type::MEDIA);

    EXPECT_TRUE(room_->MakeMediaConnections({kRemotePeerId, kThirdPeerId}));
    ASSERT_EQ(factory_.media_connections().size(), 2u);
    EXPECT_EQ(room_->connections().ConnectionsOf(kRemotePeerId).size(), 1u);
    EXPECT_EQ(room_->connections().ConnectionsOf(kThirdPeerId).size(), 1u);

    for (auto* connection : factory_.media_connections()) {
        EXPECT_CALL(*connection, Close()).Times(1);
    }
    room_->Close();
    EXPECT_EQ(closed_count_, 1u);
}

} // namespace test
} // namespace meshrtc
