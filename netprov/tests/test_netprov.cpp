#include <mutex>
#include <set>

#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include "exception.hpp"
#include "netprov_client.hpp"
#include "netprov_server.hpp"

class fake_link_manager_t : public hvctl::netprov::link_manager_t {
public:
  bool has_link(const std::string &name) override {
    std::lock_guard lk(m);
    return links.contains(name);
  }

  void create_bridge(const std::string &name) override {
    std::lock_guard lk(m);
    links.insert(name);
  }

  void set_address(const std::string &, const std::string &, int) override {}

  void create_tap(const std::string &name) override {
    std::lock_guard lk(m);
    if (name == fail_on)
      throw hvctl::exception("Operation not permitted");
    links.insert(name);
  }

  void set_link_up(const std::string &name) override {
    std::lock_guard lk(m);
    up.insert(name);
  }

  void add_to_bridge(const std::string &bridge,
                     const std::string &name) override {
    std::lock_guard lk(m);
    attached.insert(bridge + "/" + name);
  }

  void delete_link(const std::string &name) override {
    std::lock_guard lk(m);
    links.erase(name);
    up.erase(name);
  }

  std::mutex m;
  std::set<std::string> links;
  std::set<std::string> up;
  std::set<std::string> attached;
  std::string fail_on;
};

class HvctlNetprovTest : public ::testing::Test {
protected:
  void SetUp() override {
    links = hvctl::create<fake_link_manager_t>();
    links->create_bridge("test-bridge");
    server = hvctl::create<hvctl::netprov::netprov_server_t>(links,
                                                             "test-bridge");
    port = server->start("127.0.0.1", 0);
  }

  void TearDown() override { server->stop(); }

  std::shared_ptr<fake_link_manager_t> links;
  std::shared_ptr<hvctl::netprov::netprov_server_t> server;
  uint16_t port = 0;
};

TEST(HvctlNetprovProtocolTest, JsonShape) {
  nlohmann::json req = hvctl::netprov::create_devices_request_t{"vm1", 2};
  ASSERT_EQ(req["id"], "vm1");
  ASSERT_EQ(req["count"], 2);

  auto devices = nlohmann::json::parse(R"({"devices": ["a-0", "a-1"]})")
                     .get<hvctl::netprov::devices_t>();
  ASSERT_EQ(devices.devices.size(), 2u);
  ASSERT_EQ(devices.devices[1], "a-1");

  auto empty =
      nlohmann::json::parse(R"({"devices": null})").get<hvctl::netprov::devices_t>();
  ASSERT_TRUE(empty.devices.empty());
}

TEST_F(HvctlNetprovTest, CreateAndDelete) {
  hvctl::netprov::netprov_client_t client("127.0.0.1", port);
  auto devices = client.create("vm1", 2);
  ASSERT_EQ(devices.devices,
            (std::vector<std::string>{"vm1-0", "vm1-1"}));
  ASSERT_TRUE(links->has_link("vm1-0"));
  ASSERT_TRUE(links->has_link("vm1-1"));
  ASSERT_TRUE(links->up.contains("vm1-1"));
  ASSERT_TRUE(links->attached.contains("test-bridge/vm1-0"));

  client.remove(devices);
  ASSERT_FALSE(links->has_link("vm1-0"));
  ASSERT_FALSE(links->has_link("vm1-1"));
}

TEST_F(HvctlNetprovTest, CreateManyKeepsOrder) {
  hvctl::netprov::netprov_client_t client("127.0.0.1", port);
  auto devices = client.create("abc", 5);
  ASSERT_EQ(devices.devices.size(), 5u);
  for (int i = 0; i < 5; i++)
    ASSERT_EQ(devices.devices[i], "abc-" + std::to_string(i));
}

TEST_F(HvctlNetprovTest, CreateZeroReturnsEmptyList) {
  hvctl::netprov::netprov_client_t client("127.0.0.1", port);
  auto devices = client.create("idle", 0);
  ASSERT_TRUE(devices.devices.empty());
}

TEST_F(HvctlNetprovTest, DeleteIsIdempotent) {
  hvctl::netprov::netprov_client_t client("127.0.0.1", port);
  auto devices = client.create("vm2", 2);
  links->delete_link("vm2-0");
  ASSERT_NO_THROW(client.remove(devices));
  ASSERT_NO_THROW(client.remove(devices));
  ASSERT_FALSE(links->has_link("vm2-1"));
}

TEST_F(HvctlNetprovTest, OtherMethodsRejected) {
  httplib::Client client("127.0.0.1", port);
  auto res = client.Get("/");
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 400);
  ASSERT_EQ(res->body, "method not available");

  res = client.Put("/", "{}", "application/json");
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 400);
}

TEST_F(HvctlNetprovTest, MalformedBodyRejected) {
  httplib::Client client("127.0.0.1", port);
  auto res = client.Post("/", "{not json", "application/json");
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 400);
  ASSERT_FALSE(res->body.empty());

  res = client.Post("/", R"({"id": "x"})", "application/json");
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 400);

  res = client.Delete("/", "[", "application/json");
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 400);
}

TEST_F(HvctlNetprovTest, MissingBridgeRejected) {
  links->delete_link("test-bridge");
  hvctl::netprov::netprov_client_t client("127.0.0.1", port);
  try {
    client.create("vm3", 1);
    FAIL() << "expected failure";
  } catch (const hvctl::exception_t<hvctl::runtime_error> &e) {
    ASSERT_NE(e.reason().find("test-bridge"), std::string::npos);
  }
  ASSERT_FALSE(links->has_link("vm3-0"));
}

TEST_F(HvctlNetprovTest, FailedCreationRollsBack) {
  links->fail_on = "vm4-1";
  hvctl::netprov::netprov_client_t client("127.0.0.1", port);
  ASSERT_THROW(client.create("vm4", 3), hvctl::exception_t<>);
  ASSERT_FALSE(links->has_link("vm4-0"));
  ASSERT_FALSE(links->has_link("vm4-2"));
}

TEST(HvctlNetprovClientTest, UnreachableHelperIsActionable) {
  // Nothing listens on the discard port
  hvctl::netprov::netprov_client_t client("127.0.0.1", 9);
  try {
    client.create("vm5", 1);
    FAIL() << "expected failure";
  } catch (const hvctl::exception_t<hvctl::runtime_error> &e) {
    ASSERT_NE(e.reason().find("hvctl-nethelper"), std::string::npos);
  }
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
