#include <gtest/gtest.h>

#include <boost/asio/ip/address.hpp>
#include <functional>
#include <unordered_set>

#include "h1_client/remote_address.hpp"

using namespace h1_client;
namespace ip = boost::asio::ip;

TEST(RemoteAddressTest, EqualityAndHashFollowIpAndPort) {
    RemoteAddress a(ip::make_address("127.0.0.1"), 80);
    RemoteAddress b(ip::make_address("127.0.0.1"), 80);
    RemoteAddress c(ip::make_address("127.0.0.1"), 81);
    RemoteAddress d(ip::make_address("127.0.0.2"), 80);

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_NE(a, d);
    EXPECT_EQ(std::hash<RemoteAddress>{}(a), std::hash<RemoteAddress>{}(b));

    std::unordered_set<RemoteAddress> set{a, b, c, d};
    EXPECT_EQ(set.size(), 3u);
}

TEST(RemoteAddressTest, ToStringBracketsIpv6) {
    EXPECT_EQ(RemoteAddress(ip::make_address("10.0.0.1"), 8080).to_string(),
              "10.0.0.1:8080");
    EXPECT_EQ(RemoteAddress(ip::make_address("::1"), 443).to_string(),
              "[::1]:443");
}

TEST(RemoteAddressTest, RoundTripsThroughEndpoint) {
    ip::tcp::endpoint ep(ip::make_address("::1"), 9000);
    RemoteAddress addr(ep);
    EXPECT_EQ(addr.to_endpoint(), ep);
}

TEST(PoolKeyTest, ServerNameSeparatesKeysForOneAddress) {
    RemoteAddress a(ip::make_address("192.0.2.7"), 443);
    PoolKey plain{a, ""};
    PoolKey one{a, "one.example"};
    PoolKey two{a, "two.example"};

    EXPECT_FALSE(plain == one);
    EXPECT_FALSE(one == two);
    EXPECT_TRUE(one == (PoolKey{a, "one.example"}));

    std::unordered_set<PoolKey> keys{plain, one, two, PoolKey{a, "one.example"}};
    EXPECT_EQ(keys.size(), 3u);

    EXPECT_EQ(plain.to_string(), "192.0.2.7:443");
    EXPECT_EQ(one.to_string(), "one.example@192.0.2.7:443");
}

TEST(PoolKeyTest, HashMixesEveryServerNameByte) {
    RemoteAddress a(ip::make_address("192.0.2.7"), 443);
    std::hash<PoolKey> h;

    // An empty server name leaves the address hash untouched.
    EXPECT_EQ(h(PoolKey{a, ""}), std::hash<RemoteAddress>{}(a));

    EXPECT_EQ(h(PoolKey{a, "api.example"}), h(PoolKey{a, "api.example"}));
    EXPECT_NE(h(PoolKey{a, "api.example"}), h(PoolKey{a, "apj.example"}));
    EXPECT_NE(h(PoolKey{a, "api.example"}), h(PoolKey{a, "api.exampl"}));
    // Bytes above 0x7f hash as unsigned.
    EXPECT_NE(h(PoolKey{a, "caf\xc3\xa9"}), h(PoolKey{a, "caf"}));
}
