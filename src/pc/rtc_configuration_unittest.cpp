#include "pc/rtc_configuration.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

namespace meshrtc {
namespace test {

MY_TEST(RtcConfigurationTest, Defaults) {
    RtcConfiguration config = ParseRtcConfiguration(nlohmann::json::object());

    EXPECT_TRUE(config.ice_servers.empty());
    EXPECT_EQ(config.ice_transport_policy, IceTransportPolicy::ALL);
    EXPECT_FALSE(config.enable_ice_tcp);
    EXPECT_EQ(config.port_range_begin, kDefaultPortLowerBound);
    EXPECT_EQ(config.port_range_end, kDefaultPortUpperBound);
    EXPECT_FALSE(config.mtu.has_value());
}

MY_TEST(RtcConfigurationTest, ParseIceServers) {
    auto json = nlohmann::json::parse(R"({
        "iceServers": [
            {"urls": "stun:stun.l.google.com:19302"},
            {"urls": ["turn:turn.example.org?transport=tcp", "turns:turn.example.org"],
             "username": "user",
             "credential": "secret"}
        ],
        "iceTransportPolicy": "relay",
        "mtu": 1200
    })");

    RtcConfiguration config = ParseRtcConfiguration(json);

    ASSERT_EQ(config.ice_servers.size(), 3u);
    EXPECT_EQ(config.ice_servers[0].type(), IceServer::Type::STUN);
    EXPECT_EQ(config.ice_servers[1].relay_type(), IceServer::RelayType::TURN_TCP);
    EXPECT_EQ(config.ice_servers[1].username(), "user");
    EXPECT_EQ(config.ice_servers[2].relay_type(), IceServer::RelayType::TURN_TLS);
    EXPECT_EQ(config.ice_servers[2].credential(), "secret");
    EXPECT_EQ(config.ice_transport_policy, IceTransportPolicy::RELAY);
    ASSERT_TRUE(config.mtu.has_value());
    EXPECT_EQ(*config.mtu, 1200u);
}

MY_TEST(RtcConfigurationTest, ParsePortRange) {
    RtcConfiguration config = ParseRtcConfiguration(nlohmann::json::parse(R"({"portRangeBegin": 1, "portRangeEnd": 65535})"));
    EXPECT_EQ(config.port_range_begin, 1);
    EXPECT_EQ(config.port_range_end, 65535);

    config = ParseRtcConfiguration(nlohmann::json::parse(R"({"portRangeBegin": 50000, "portRangeEnd": 50100})"));
    EXPECT_EQ(config.port_range_begin, 50000);
    EXPECT_EQ(config.port_range_end, 50100);
}

MY_TEST(RtcConfigurationTest, RejectInvalidValues) {
    EXPECT_THROW(ParseRtcConfiguration(nlohmann::json::parse(R"({"iceTransportPolicy": "none"})")), 
                 std::invalid_argument);
    EXPECT_THROW(ParseRtcConfiguration(nlohmann::json::parse(R"({"portRangeBegin": 5000, "portRangeEnd": 4000})")), 
                 std::invalid_argument);
    EXPECT_THROW(ParseRtcConfiguration(nlohmann::json::parse(R"({"portRangeEnd": 70000})")), 
                 std::invalid_argument);
    EXPECT_THROW(ParseRtcConfiguration(nlohmann::json::parse(R"({"portRangeBegin": -1})")), 
                 std::invalid_argument);
    EXPECT_THROW(ParseRtcConfiguration(nlohmann::json::parse(R"({"portRangeBegin": 0})")), 
                 std::invalid_argument);
    EXPECT_THROW(ParseRtcConfiguration(nlohmann::json::parse(R"({"iceServers": [{"urls": "ftp:example.org"}]})")), 
                 std::invalid_argument);
    // Missing urls
    EXPECT_THROW(ParseRtcConfiguration(nlohmann::json::parse(R"({"iceServers": [{"username": "user"}]})")), 
                 nlohmann::json::exception);
}

} // namespace test
} // namespace meshrtc
