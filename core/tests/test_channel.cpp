#include <thread>

#include <gtest/gtest.h>

#include "channel.hpp"
#include "thread.hpp"

using namespace std::chrono_literals;

TEST(HvctlChannelTest, TrySendRejectsWhenFull) {
  auto ch = hvctl::create<hvctl::channel_t<int>>(2);
  ASSERT_TRUE(ch->try_send(1));
  ASSERT_TRUE(ch->try_send(2));
  ASSERT_FALSE(ch->try_send(3));
  ASSERT_EQ(ch->size(), 2u);
  ASSERT_EQ(ch->try_recv().value(), 1);
  ASSERT_EQ(ch->try_recv().value(), 2);
  ASSERT_FALSE(ch->try_recv().has_value());
}

TEST(HvctlChannelTest, ForceSendEvictsOldest) {
  auto ch = hvctl::create<hvctl::channel_t<int>>(2);
  ASSERT_TRUE(ch->force_send(1));
  ASSERT_TRUE(ch->force_send(2));
  ASSERT_TRUE(ch->force_send(3));
  ASSERT_EQ(ch->try_recv().value(), 2);
  ASSERT_EQ(ch->try_recv().value(), 3);
}

TEST(HvctlChannelTest, CloseDrainsThenEnds) {
  auto ch = hvctl::create<hvctl::channel_t<std::string>>(4);
  ch->try_send("a");
  ch->close();
  ch->close();
  ASSERT_FALSE(ch->try_send("b"));
  ASSERT_FALSE(ch->force_send("b"));
  ASSERT_TRUE(ch->is_closed());
  ASSERT_FALSE(ch->is_done());
  ASSERT_EQ(ch->recv().value(), "a");
  ASSERT_FALSE(ch->recv().has_value());
  ASSERT_TRUE(ch->is_done());
}

TEST(HvctlChannelTest, RecvWakesOnSend) {
  auto ch = hvctl::create<hvctl::channel_t<int>>(1);
  hvctl::receiver_t<int> rx(ch);

  std::thread t1{[ch] {
    std::this_thread::sleep_for(10ms);
    ch->try_send(42);
  }};
  auto v = rx.recv_for(1s);
  ASSERT_TRUE(v.has_value());
  ASSERT_EQ(v.value(), 42);
  t1.join();

  ASSERT_FALSE(rx.recv_for(10ms).has_value());
  ASSERT_FALSE(rx.is_closed());
}

TEST(HvctlChannelTest, RecvWakesOnClose) {
  auto ch = hvctl::create<hvctl::channel_t<int>>(1);
  hvctl::receiver_t<int> rx(ch);

  std::thread t1{[ch] {
    std::this_thread::sleep_for(10ms);
    ch->close();
  }};
  ASSERT_FALSE(rx.recv().has_value());
  ASSERT_TRUE(rx.is_done());
  t1.join();
}

TEST(HvctlThreadTest, MonitorReceivesStop) {
  auto monitor = hvctl::create<hvctl::monitor_t>();
  auto stop = hvctl::create<hvctl::stop_t>();
  stop->set_monitor(monitor);
  ASSERT_FALSE(*stop);

  std::thread t1{[stop] {
    std::this_thread::sleep_for(10ms);
    stop->stop();
  }};

  auto signal = monitor->monitor(1s);
  ASSERT_TRUE(signal.has_value());
  ASSERT_EQ(signal.value().who, stop->myname);
  ASSERT_EQ(signal.value().what, "stop");
  ASSERT_TRUE(*stop);
  t1.join();

  ASSERT_FALSE(monitor->monitor(10ms).has_value());
}

TEST(HvctlThreadTest, NotifyWithoutMonitorIsNoop) {
  hvctl::notify_t n("orphan");
  n.notify("anything");
  ASSERT_EQ(n.myname, "orphan");
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
