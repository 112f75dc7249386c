#include "room/connection_registry.hpp"
#include "testing/mock_connection.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

using namespace ::testing;

namespace meshrtc {
namespace test {
namespace {

constexpr char kPeerId1[] = "peerId1";
constexpr char kPeerId2[] = "peerId2";
constexpr char kConnId1[] = "connId1";
constexpr char kConnId2[] = "connId2";
constexpr char kConnId3[] = "connId3";

std::unique_ptr<Connection> CreateConnection(const std::string& peer_id, const std::string& connection_id) {
    return std::make_unique<NiceMock<MockDataConnection>>(peer_id, connection_id, DataConnection::Options());
}

} // namespace

MY_TEST(ConnectionRegistryTest, AddAppendsInOrder) {
    ConnectionRegistry registry;
    EXPECT_TRUE(registry.empty());
    EXPECT_FALSE(registry.Contains(kPeerId1));

    auto* connection1 = registry.Add(kPeerId1, CreateConnection(kPeerId1, kConnId1));
    EXPECT_THAT(registry.ConnectionsOf(kPeerId1), ElementsAre(connection1));

    auto* connection2 = registry.Add(kPeerId1, CreateConnection(kPeerId1, kConnId2));
    EXPECT_THAT(registry.ConnectionsOf(kPeerId1), ElementsAre(connection1, connection2));
    EXPECT_TRUE(registry.Contains(kPeerId1));
    EXPECT_EQ(registry.size(), 2u);
}

MY_TEST(ConnectionRegistryTest, AddNullConnection) {
    ConnectionRegistry registry;
    EXPECT_EQ(registry.Add(kPeerId1, nullptr), nullptr);
    EXPECT_FALSE(registry.Contains(kPeerId1));
}

MY_TEST(ConnectionRegistryTest, RemoveErasesPeerEntirely) {
    ConnectionRegistry registry;
    registry.Add(kPeerId1, CreateConnection(kPeerId1, kConnId1));
    registry.Add(kPeerId1, CreateConnection(kPeerId1, kConnId2));
    registry.Add(kPeerId2, CreateConnection(kPeerId2, kConnId3));

    EXPECT_EQ(registry.Remove(kPeerId1), 2u);
    EXPECT_FALSE(registry.Contains(kPeerId1));
    EXPECT_TRUE(registry.ConnectionsOf(kPeerId1).empty());
    EXPECT_EQ(registry.Get(kPeerId1, kConnId1), nullptr);
    EXPECT_EQ(registry.Get(kPeerId1, kConnId2), nullptr);

    // Other peers are untouched.
    EXPECT_NE(registry.Get(kPeerId2, kConnId3), nullptr);
    EXPECT_EQ(registry.size(), 1u);

    EXPECT_EQ(registry.Remove(kPeerId2), 1u);
    EXPECT_TRUE(registry.empty());
}

MY_TEST(ConnectionRegistryTest, RemoveUnknownPeer) {
    ConnectionRegistry registry;
    registry.Add(kPeerId1, CreateConnection(kPeerId1, kConnId1));
    EXPECT_EQ(registry.Remove(kPeerId2), 0u);
    EXPECT_EQ(registry.size(), 1u);
}

MY_TEST(ConnectionRegistryTest, GetByPeerIdAndConnectionId) {
    ConnectionRegistry registry;
    auto* connection1 = registry.Add(kPeerId1, CreateConnection(kPeerId1, kConnId1));
    auto* connection2 = registry.Add(kPeerId2, CreateConnection(kPeerId2, kConnId2));

    EXPECT_EQ(registry.Get(kPeerId1, kConnId1), connection1);
    EXPECT_EQ(registry.Get(kPeerId2, kConnId2), connection2);

    // The combination doesn't exist.
    EXPECT_EQ(registry.Get(kPeerId1, kConnId2), nullptr);
    EXPECT_EQ(registry.Get(kPeerId2, kConnId1), nullptr);
    EXPECT_EQ(registry.Get("unknown", kConnId1), nullptr);
}

MY_TEST(ConnectionRegistryTest, AllConnectionsInRegistrationOrder) {
    ConnectionRegistry registry;
    EXPECT_TRUE(registry.AllConnections().empty());

    auto* connection1 = registry.Add(kPeerId1, CreateConnection(kPeerId1, kConnId1));
    auto* connection2 = registry.Add(kPeerId2, CreateConnection(kPeerId2, kConnId2));
    auto* connection3 = registry.Add(kPeerId1, CreateConnection(kPeerId1, kConnId3));

    EXPECT_THAT(registry.AllConnections(), ElementsAre(connection1, connection2, connection3));
}

MY_TEST(ConnectionRegistryTest, ClearDestroysConnections) {
    ConnectionRegistry registry;
    auto connection = std::make_unique<MockDataConnection>(kPeerId1, kConnId1, DataConnection::Options());
    // Forgotten, not closed.
    EXPECT_CALL(*connection, Close()).Times(0);
    EXPECT_CALL(*connection, Die()).Times(1);
    registry.Add(kPeerId1, std::move(connection));

    registry.Clear();
    EXPECT_TRUE(registry.empty());
    EXPECT_EQ(registry.size(), 0u);
}

MY_TEST(ConnectionRegistryTest, ReleaseAllInRegistrationOrder) {
    ConnectionRegistry registry;
    auto* connection1 = registry.Add(kPeerId1, CreateConnection(kPeerId1, kConnId1));
    auto* connection2 = registry.Add(kPeerId2, CreateConnection(kPeerId2, kConnId2));
    auto* connection3 = registry.Add(kPeerId1, CreateConnection(kPeerId1, kConnId3));

    auto released = registry.Release();

    EXPECT_TRUE(registry.empty());
    EXPECT_EQ(registry.Get(kPeerId1, kConnId1), nullptr);
    ASSERT_EQ(released.size(), 3u);
    EXPECT_EQ(released[0].get(), connection1);
    EXPECT_EQ(released[1].get(), connection2);
    EXPECT_EQ(released[2].get(), connection3);
}

MY_TEST(ConnectionRegistryTest, ReleaseConnectionsOfPeer) {
    ConnectionRegistry registry;
    auto* connection1 = registry.Add(kPeerId1, CreateConnection(kPeerId1, kConnId1));
    registry.Add(kPeerId2, CreateConnection(kPeerId2, kConnId2));
    auto* connection3 = registry.Add(kPeerId1, CreateConnection(kPeerId1, kConnId3));

    auto released = registry.Release(kPeerId1);

    EXPECT_FALSE(registry.Contains(kPeerId1));
    EXPECT_TRUE(registry.Contains(kPeerId2));
    ASSERT_EQ(released.size(), 2u);
    EXPECT_EQ(released[0].get(), connection1);
    EXPECT_EQ(released[1].get(), connection3);

    EXPECT_TRUE(registry.Release("unknown").empty());
}

} // namespace test
} // namespace meshrtc
