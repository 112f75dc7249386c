#include "connection/media_stream.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

namespace meshrtc {
namespace test {

MY_TEST(MediaStreamTest, LocalStreamHasNoPeer) {
    MediaStream stream("localStream");
    EXPECT_EQ(stream.id(), "localStream");
    EXPECT_FALSE(stream.peer_id().has_value());
}

MY_TEST(MediaStreamTest, TagRemoteStream) {
    MediaStream stream("remoteStream");
    stream.set_peer_id("remotePeerId");
    ASSERT_TRUE(stream.peer_id().has_value());
    EXPECT_EQ(*stream.peer_id(), "remotePeerId");
}

} // namespace test
} // namespace meshrtc
