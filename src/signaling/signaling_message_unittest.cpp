#include "signaling/signaling_message.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

using json = nlohmann::json;

namespace meshrtc {
namespace test {

MY_TEST(SignalingMessageTest, DecodeOffer) {
    auto j = json::parse(R"({
        "type": "offer",
        "room_name": "testRoom",
        "src": "remoteId",
        "connection_id": "media_1",
        "connection_type": "media",
        "payload": {"type": "offer", "sdp": "v=0"}
    })");

    auto message = j.get<SignalingMessage>();
    EXPECT_EQ(message.room_name, "testRoom");
    EXPECT_EQ(message.src, "remoteId");
    EXPECT_TRUE(message.dst.empty());
    EXPECT_EQ(message.connection_id, "media_1");
    EXPECT_EQ(message.connection_type, "media");
    EXPECT_EQ(message.payload["sdp"], "v=0");
}

MY_TEST(SignalingMessageTest, DecodeWithoutOptionalKeys) {
    auto message = json::parse(R"({"room_name": "testRoom", "src": "remoteId"})").get<SignalingMessage>();
    EXPECT_EQ(message.src, "remoteId");
    EXPECT_TRUE(message.connection_id.empty());
    EXPECT_TRUE(message.connection_type.empty());
    EXPECT_TRUE(message.payload.is_null());
}

MY_TEST(SignalingMessageTest, RoomNameIsRequired) {
    auto j = json::parse(R"({"src": "remoteId"})");
    EXPECT_THROW(j.get<SignalingMessage>(), json::exception);
    EXPECT_THROW(j.get<LogRequest>(), json::exception);
    EXPECT_THROW(j.get<DataMessage>(), json::exception);
}

MY_TEST(SignalingMessageTest, SerializeOutgoingSignal) {
    SignalingMessage message;
    message.room_name = "testRoom";
    message.dst = "remoteId";
    message.connection_id = "data_1";
    message.connection_type = "data";
    message.payload = json{{"candidate", "candidate:1 1 UDP 1 127.0.0.1 5000 typ host"}};

    auto j = json::parse(Serialize(message_type::kCandidate, message));
    EXPECT_EQ(j["type"], "candidate");
    EXPECT_EQ(j["room_name"], "testRoom");
    EXPECT_EQ(j["dst"], "remoteId");
    EXPECT_EQ(j["connection_id"], "data_1");
    EXPECT_EQ(j["connection_type"], "data");
    EXPECT_EQ(j["payload"], message.payload);
    // The server fills the source in.
    EXPECT_FALSE(j.contains("src"));
}

MY_TEST(SignalingMessageTest, SerializeDiscoverPeers) {
    auto j = json::parse(Serialize(message_type::kDiscoverPeers, DiscoverPeersMessage{"testRoom", Connection::Type::DATA}));
    EXPECT_EQ(j, json::parse(R"({"type": "discover_peers", "room_name": "testRoom", "kind": "data"})"));
}

MY_TEST(SignalingMessageTest, DecodePeers) {
    auto message = json::parse(R"({
        "type": "peers",
        "room_name": "testRoom",
        "kind": "media",
        "peer_ids": ["localId", "remoteId"]
    })").get<PeersMessage>();

    EXPECT_EQ(message.room_name, "testRoom");
    EXPECT_EQ(message.kind, Connection::Type::MEDIA);
    EXPECT_EQ(message.peer_ids, std::vector<std::string>({"localId", "remoteId"}));
}

MY_TEST(SignalingMessageTest, RejectUnknownKind) {
    auto j = json::parse(R"({"room_name": "testRoom", "kind": "screen", "peer_ids": []})");
    EXPECT_THROW(j.get<PeersMessage>(), std::invalid_argument);
    EXPECT_THROW(j.get<DiscoverPeersMessage>(), std::invalid_argument);
}

MY_TEST(SignalingMessageTest, DataMessageCarriesPayload) {
    auto j = json::parse(Serialize(message_type::kData, DataMessage{"testRoom", "remoteId", json{{"text", "hello"}}}));
    EXPECT_EQ(j["payload"]["text"], "hello");

    auto message = j.get<DataMessage>();
    EXPECT_EQ(message.src, "remoteId");
    EXPECT_EQ(message.data["text"], "hello");
}

} // namespace test
} // namespace meshrtc
