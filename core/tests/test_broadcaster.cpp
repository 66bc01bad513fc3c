#include <thread>

#include <gtest/gtest.h>

#include "broadcaster.hpp"
#include "exception.hpp"

using namespace std::chrono_literals;

TEST(HvctlBroadcasterTest, RingBufferKeepsMostRecentBytes) {
  hvctl::ring_buffer_t buf(8);
  buf.write("abc");
  ASSERT_EQ(buf.bytes(), "abc");
  buf.write("defgh");
  ASSERT_EQ(buf.bytes(), "abcdefgh");
  buf.write("ij");
  ASSERT_EQ(buf.bytes(), "cdefghij");
  buf.write("0123456789");
  ASSERT_EQ(buf.bytes(), "23456789");
  ASSERT_EQ(buf.total_written(), 20u);
}

TEST(HvctlBroadcasterTest, SnapshotIsFirstMessage) {
  auto console = hvctl::create<hvctl::broadcaster_t>(16);
  console->write("hello ");
  console->write("world");

  auto sub = console->subscribe();
  auto first = sub->recv_for(1s);
  ASSERT_TRUE(first.has_value());
  ASSERT_EQ(first.value(), "hello world");

  console->write("!");
  auto second = sub->recv_for(1s);
  ASSERT_TRUE(second.has_value());
  ASSERT_EQ(second.value(), "!");
}

TEST(HvctlBroadcasterTest, LateSubscriberSeesOnlyLaterWrites) {
  auto console = hvctl::create<hvctl::broadcaster_t>(4);
  console->write("abcdef");

  auto sub = console->subscribe();
  ASSERT_EQ(sub->recv_for(1s).value(), "cdef");

  console->write("x");
  console->write("y");
  ASSERT_EQ(sub->recv_for(1s).value(), "x");
  ASSERT_EQ(sub->recv_for(1s).value(), "y");
  ASSERT_FALSE(sub->try_recv().has_value());
}

TEST(HvctlBroadcasterTest, FullSubscriptionDropsWrites) {
  auto console = hvctl::create<hvctl::broadcaster_t>(1024);
  auto slow = console->subscribe();
  auto fast = console->subscribe();

  // The snapshot takes one slot of each queue
  ASSERT_EQ(fast->recv_for(1s).value(), "");

  const size_t n = hvctl::broadcaster_t::subscription_capacity + 10;
  size_t received = 0;
  for (size_t i = 0; i < n; i++) {
    ASSERT_EQ(console->write(std::to_string(i)), std::to_string(i).size());
    auto chunk = fast->recv_for(1s);
    ASSERT_TRUE(chunk.has_value());
    ASSERT_EQ(chunk.value(), std::to_string(i));
    received++;
  }
  ASSERT_EQ(received, n);

  // slow never read: snapshot plus the first capacity-1 writes
  ASSERT_EQ(slow->recv_for(1s).value(), "");
  for (size_t i = 0; i < hvctl::broadcaster_t::subscription_capacity - 1;
       i++)
    ASSERT_EQ(slow->recv_for(1s).value(), std::to_string(i));
  ASSERT_FALSE(slow->try_recv().has_value());
}

TEST(HvctlBroadcasterTest, CloseEndsEverySubscription) {
  auto console = hvctl::create<hvctl::broadcaster_t>(64);
  auto sub1 = console->subscribe();
  auto sub2 = console->subscribe();
  console->write("bye");
  console->close();
  ASSERT_TRUE(console->closed());
  ASSERT_EQ(console->num_subscriptions(), 0u);

  for (auto sub : {sub1, sub2}) {
    ASSERT_EQ(sub->recv().value(), "");
    ASSERT_EQ(sub->recv().value(), "bye");
    ASSERT_FALSE(sub->recv().has_value());
    ASSERT_TRUE(sub->is_closed());
  }
}

TEST(HvctlBroadcasterTest, WriteAfterCloseFails) {
  auto console = hvctl::create<hvctl::broadcaster_t>(64);
  console->write("abc");
  console->close();
  ASSERT_THROW(console->write("def"),
               hvctl::exception_t<hvctl::end_of_stream>);
  console->close();

  auto late = console->subscribe();
  ASSERT_EQ(late->recv().value(), "abc");
  ASSERT_FALSE(late->recv().has_value());
}

TEST(HvctlBroadcasterTest, SubscriptionCloseUnregisters) {
  auto console = hvctl::create<hvctl::broadcaster_t>(64);
  auto sub = console->subscribe();
  console->write("pending");
  ASSERT_EQ(console->num_subscriptions(), 1u);

  sub->close();
  ASSERT_EQ(console->num_subscriptions(), 0u);
  ASSERT_FALSE(sub->recv().has_value());

  console->write("more");
  ASSERT_FALSE(sub->try_recv().has_value());
}

TEST(HvctlBroadcasterTest, ConcurrentWriterKeepsOrder) {
  auto console = hvctl::create<hvctl::broadcaster_t>(4096);
  auto sub = console->subscribe();
  ASSERT_EQ(sub->recv_for(1s).value(), "");

  std::thread writer{[console] {
    for (int i = 0; i < 50; i++)
      console->write(std::to_string(i) + "\n");
    console->close();
  }};

  std::string all;
  while (auto chunk = sub->recv())
    all += chunk.value();
  writer.join();

  std::string expected;
  for (int i = 0; i < 50; i++)
    expected += std::to_string(i) + "\n";
  ASSERT_EQ(all, expected);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
