#include <gtest/gtest.h>

#include "dhcp_server.hpp"

using namespace hvctl::netprov;

static dhcp_message_t make_request(dhcp_message_type_t type, uint8_t last) {
  dhcp_message_t msg;
  msg.op = 1;
  msg.xid = 0xdeadbeef;
  msg.chaddr = {0x26, 0x10, 0x05, 0x00, 0x00, last};
  msg.set_option(dhcp_option_t::message_type,
                 std::string(1, static_cast<char>(type)));
  return msg;
}

TEST(HvctlDhcpTest, Ipv4Formatting) {
  auto ip = parse_ipv4("174.72.0.1");
  ASSERT_TRUE(ip.has_value());
  ASSERT_EQ(ip.value(), 0xae480001u);
  ASSERT_EQ(format_ipv4(ip.value()), "174.72.0.1");
  ASSERT_FALSE(parse_ipv4("174.72.0").has_value());
  ASSERT_EQ(format_mac({0x26, 0x10, 0x05, 0, 0, 0x0a}), "26:10:05:00:00:0a");
}

TEST(HvctlDhcpTest, MessageSurvivesWire) {
  auto msg = make_request(dhcp_message_type_t::discover, 1);
  msg.set_ipv4_option(dhcp_option_t::requested_ip, 0xae480010u);
  auto wire = serialize_dhcp_message(msg);
  ASSERT_GE(wire.size(), 300u);

  auto parsed = parse_dhcp_message(wire);
  ASSERT_TRUE(parsed.has_value());
  ASSERT_EQ(parsed->xid, 0xdeadbeefu);
  ASSERT_EQ(parsed->mac(), msg.mac());
  ASSERT_EQ(parsed->message_type(), dhcp_message_type_t::discover);
  ASSERT_EQ(parsed->ipv4_option(dhcp_option_t::requested_ip), 0xae480010u);
}

TEST(HvctlDhcpTest, RejectsGarbage) {
  ASSERT_FALSE(parse_dhcp_message("short").has_value());
  std::string no_cookie(300, '\0');
  ASSERT_FALSE(parse_dhcp_message(no_cookie).has_value());
}

TEST(HvctlDhcpTest, DiscoverRequestAck) {
  auto handler = make_bridge_dhcp_handler("174.72.0.1");

  auto offer = handler.handle(make_request(dhcp_message_type_t::discover, 1));
  ASSERT_TRUE(offer.has_value());
  ASSERT_EQ(offer->op, 2);
  ASSERT_EQ(offer->message_type(), dhcp_message_type_t::offer);
  ASSERT_EQ(format_ipv4(offer->yiaddr), "174.72.0.2");
  ASSERT_EQ(offer->ipv4_option(dhcp_option_t::router), 0xae480001u);
  ASSERT_EQ(offer->ipv4_option(dhcp_option_t::subnet_mask), 0xffffff00u);

  auto req = make_request(dhcp_message_type_t::request, 1);
  req.set_ipv4_option(dhcp_option_t::requested_ip, offer->yiaddr);
  req.set_ipv4_option(dhcp_option_t::server_id, 0xae480001u);
  auto ack = handler.handle(req);
  ASSERT_TRUE(ack.has_value());
  ASSERT_EQ(ack->message_type(), dhcp_message_type_t::ack);
  ASSERT_EQ(ack->yiaddr, offer->yiaddr);

  // A second client gets the next address
  auto offer2 = handler.handle(make_request(dhcp_message_type_t::discover, 2));
  ASSERT_TRUE(offer2.has_value());
  ASSERT_EQ(format_ipv4(offer2->yiaddr), "174.72.0.3");

  // The first client keeps its lease
  auto again = handler.handle(make_request(dhcp_message_type_t::discover, 1));
  ASSERT_EQ(again->yiaddr, offer->yiaddr);
}

TEST(HvctlDhcpTest, RequestForTakenAddressIsNaked) {
  auto handler = make_bridge_dhcp_handler("174.72.0.1");
  ASSERT_TRUE(handler.pool().acknowledge({1, 2, 3, 4, 5, 6}, 0xae480005u));

  auto req = make_request(dhcp_message_type_t::request, 9);
  req.set_ipv4_option(dhcp_option_t::requested_ip, 0xae480005u);
  auto rep = handler.handle(req);
  ASSERT_TRUE(rep.has_value());
  ASSERT_EQ(rep->message_type(), dhcp_message_type_t::nak);
}

TEST(HvctlDhcpTest, RequestForOtherServerIsIgnored) {
  auto handler = make_bridge_dhcp_handler("174.72.0.1");
  auto req = make_request(dhcp_message_type_t::request, 1);
  req.set_ipv4_option(dhcp_option_t::requested_ip, 0xae480002u);
  req.set_ipv4_option(dhcp_option_t::server_id, 0x0a000001u);
  ASSERT_FALSE(handler.handle(req).has_value());
}

TEST(HvctlDhcpTest, ReleaseFreesAddress) {
  dhcp_lease_pool_t pool(0x0a000002u, 0x0a000003u, std::chrono::seconds(60));
  mac_t a{1, 1, 1, 1, 1, 1};
  mac_t b{2, 2, 2, 2, 2, 2};
  mac_t c{3, 3, 3, 3, 3, 3};
  ASSERT_TRUE(pool.acknowledge(a, 0x0a000002u));
  ASSERT_TRUE(pool.acknowledge(b, 0x0a000003u));
  ASSERT_FALSE(pool.offer(c).has_value());

  pool.release(a);
  ASSERT_EQ(pool.offer(c), 0x0a000002u);
  ASSERT_FALSE(pool.lease_of(a).has_value());
  ASSERT_EQ(pool.lease_of(b), 0x0a000003u);
}

TEST(HvctlDhcpTest, OutOfRangeRejected) {
  dhcp_lease_pool_t pool(0x0a000002u, 0x0a000003u, std::chrono::seconds(60));
  ASSERT_FALSE(pool.acknowledge({1, 1, 1, 1, 1, 1}, 0x0a000009u));
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
