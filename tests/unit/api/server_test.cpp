#include <gtest/gtest.h>

#include "rentwise_api/server.hpp"

namespace rentwise_api {

TEST(ListenAddressTest, ParsesHostAndPort) {
  ListenAddress address = parse_listen_address("127.0.0.1:3030");
  EXPECT_EQ(address.host, "127.0.0.1");
  EXPECT_EQ(address.port, 3030);
}

TEST(ListenAddressTest, EmptyHostBindsAllInterfaces) {
  EXPECT_EQ(parse_listen_address(":8080").host, "0.0.0.0");
}

TEST(ListenAddressTest, RejectsBadPorts) {
  EXPECT_THROW(parse_listen_address("localhost"), std::invalid_argument);
  EXPECT_THROW(parse_listen_address("localhost:"), std::invalid_argument);
  EXPECT_THROW(parse_listen_address("localhost:http"), std::invalid_argument);
  EXPECT_THROW(parse_listen_address("localhost:70000"), std::invalid_argument);
  EXPECT_THROW(parse_listen_address("localhost:0"), std::invalid_argument);
}

}  // namespace rentwise_api
