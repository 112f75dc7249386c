#include "pc/ice_server.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

namespace meshrtc {
namespace test {

MY_TEST(IceServerTest, CreateFromStunURL) {
    IceServer ice_server("stun:stun.l.google.com:19302");

    EXPECT_EQ(ice_server.hostname(), "stun.l.google.com");
    EXPECT_EQ(ice_server.port(), 19302);
    EXPECT_EQ(ice_server.type(), IceServer::Type::STUN);
    EXPECT_EQ(ice_server.url(), "stun:stun.l.google.com:19302");
}

MY_TEST(IceServerTest, CreateFromTurnURL) {
    IceServer ice_server("turn:192.158.29.39:3478?transport=udp");

    EXPECT_EQ(ice_server.hostname(), "192.158.29.39");
    EXPECT_EQ(ice_server.port(), 3478);
    EXPECT_EQ(ice_server.type(), IceServer::Type::TURN);
    EXPECT_EQ(ice_server.relay_type(), IceServer::RelayType::TURN_UDP);
}

MY_TEST(IceServerTest, CreateFromTurnTcpURLWithCredentials) {
    IceServer ice_server("turn:turn.example.org?transport=tcp", "user", "secret");

    EXPECT_EQ(ice_server.hostname(), "turn.example.org");
    EXPECT_EQ(ice_server.port(), 3478);
    EXPECT_EQ(ice_server.relay_type(), IceServer::RelayType::TURN_TCP);
    EXPECT_EQ(ice_server.username(), "user");
    EXPECT_EQ(ice_server.credential(), "secret");
    EXPECT_EQ(ice_server.url(), "turn:turn.example.org:3478?transport=tcp");
}

MY_TEST(IceServerTest, TurnsDefaultsToTlsPort) {
    IceServer ice_server("turns:turn.example.org");

    EXPECT_EQ(ice_server.type(), IceServer::Type::TURN);
    EXPECT_EQ(ice_server.relay_type(), IceServer::RelayType::TURN_TLS);
    EXPECT_TRUE(ice_server.is_tls());
    EXPECT_EQ(ice_server.port(), 5349);
    EXPECT_EQ(ice_server.url(), "turns:turn.example.org:5349");
}

MY_TEST(IceServerTest, StunsDefaultsToTlsPort) {
    IceServer ice_server("stuns:stun.example.org");

    EXPECT_EQ(ice_server.type(), IceServer::Type::STUN);
    EXPECT_TRUE(ice_server.is_tls());
    EXPECT_EQ(ice_server.port(), 5349);
    EXPECT_EQ(ice_server.url(), "stuns:stun.example.org:5349");

    IceServer plain_server("stun:stun.example.org");
    EXPECT_FALSE(plain_server.is_tls());
    EXPECT_EQ(plain_server.port(), 3478);
    EXPECT_EQ(plain_server.url(), "stun:stun.example.org:3478");
}

MY_TEST(IceServerTest, RejectInvalidURL) {
    EXPECT_THROW(IceServer("http:example.org:80"), std::invalid_argument);
    EXPECT_THROW(IceServer("stun:stun.l.google.com:port"), std::invalid_argument);
    EXPECT_THROW(IceServer("stun:stun.l.google.com:70000"), std::invalid_argument);
    EXPECT_THROW(IceServer(""), std::invalid_argument);
}

} // namespace test
} // namespace meshrtc
