#include "syncmd/network/discovery.hpp"

#include <gtest/gtest.h>

using namespace syncmd::network;
using namespace std::chrono_literals;

TEST(DiscoveryMessageTest, ParsesPrefixedDeviceId) {
    auto id = parse_discovery_message("DISCOVER:laptop", kDiscoverPrefix);
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(*id, "laptop");

    auto reply = parse_discovery_message("RESPOND:server", kRespondPrefix);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(*reply, "server");
}

TEST(DiscoveryMessageTest, RejectsOtherShapes) {
    EXPECT_FALSE(parse_discovery_message("DISCOVER:", kDiscoverPrefix).has_value());
    EXPECT_FALSE(parse_discovery_message("RESPOND:server", kDiscoverPrefix).has_value());
    EXPECT_FALSE(parse_discovery_message("hello", kDiscoverPrefix).has_value());
    EXPECT_FALSE(parse_discovery_message("", kRespondPrefix).has_value());
}

TEST(DiscoveryTest, FindsResponderOnLoopback) {
    DiscoveryResponder responder("server", "127.0.0.1", 0);
    ASSERT_TRUE(responder.start().is_ok());
    ASSERT_NE(responder.port(), 0);

    auto peers = discover_peers("laptop", "127.0.0.1", responder.port(), 500ms);
    ASSERT_TRUE(peers.is_ok());
    ASSERT_EQ(peers.value().size(), 1u);
    EXPECT_EQ(peers.value()[0].device_id, "server");
    EXPECT_EQ(peers.value()[0].address, "127.0.0.1");

    responder.stop();
}

TEST(DiscoveryTest, ResponderIgnoresItsOwnAnnounce) {
    DiscoveryResponder responder("server", "127.0.0.1", 0);
    ASSERT_TRUE(responder.start().is_ok());

    auto peers = discover_peers("server", "127.0.0.1", responder.port(), 200ms);
    ASSERT_TRUE(peers.is_ok());
    EXPECT_TRUE(peers.value().empty());
}

TEST(DiscoveryTest, InvalidTargetIsNetworkError) {
    auto peers = discover_peers("laptop", "not-an-address", 9, 50ms);
    ASSERT_TRUE(peers.is_error());
    EXPECT_EQ(peers.error().kind, syncmd::ErrorKind::Network);
}
