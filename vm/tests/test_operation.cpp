#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "exception.hpp"
#include "operation.hpp"

using namespace std::chrono_literals;

template <typename T> std::vector<T> drain(hvctl::receiver_t<T> rx) {
  std::vector<T> rv;
  while (auto v = rx.recv_for(1s))
    rv.push_back(*v);
  return rv;
}

TEST(HvctlOperationTest, FinishedFiresOnceUnderConcurrency) {
  auto op = hvctl::create<hvctl::operation_t>();

  std::vector<std::thread> threads;
  for (int i = 0; i < 16; i++)
    threads.emplace_back(
        [op, i]() { op->finished(std::format("failure {}", i)); });
  for (auto &t : threads)
    t.join();

  ASSERT_TRUE(op->is_finished());
  auto errors = drain(op->error());
  ASSERT_EQ(errors.size(), 1u);
  ASSERT_TRUE(errors[0].starts_with("failure "));

  auto logs = drain(op->logs());
  ASSERT_EQ(logs.size(), 1u);
  ASSERT_EQ(logs[0], "Error: " + errors[0]);

  auto status = drain(op->status());
  ASSERT_EQ(status.size(), 1u);
  ASSERT_EQ(status[0], "Failed: " + errors[0]);

  ASSERT_TRUE(op->logs().is_done());
  ASSERT_TRUE(op->status().is_done());
  ASSERT_TRUE(op->error().is_done());
}

TEST(HvctlOperationTest, SuccessClosesStreamsWithoutError) {
  auto op = hvctl::create<hvctl::operation_t>();
  op->update_status("working");
  op->log("detail {}", 1);
  op->finished();
  op->finished("too late");

  ASSERT_FALSE(op->wait().has_value());
  ASSERT_TRUE(drain(op->error()).empty());
  ASSERT_EQ(drain(op->status()), std::vector<std::string>{"working"});
  ASSERT_EQ(drain(op->logs()),
            (std::vector<std::string>{"working", "detail 1"}));
}

TEST(HvctlOperationTest, FullStreamEvictsOldest) {
  auto op = hvctl::create<hvctl::operation_t>();
  for (int i = 0; i < 15; i++)
    op->update_status(std::to_string(i));
  op->finished();

  auto status = drain(op->status());
  ASSERT_EQ(status.size(), hvctl::operation_t::status_capacity);
  ASSERT_EQ(status.front(), "5");
  ASSERT_EQ(status.back(), "14");
  ASSERT_EQ(drain(op->logs()).size(), 15u);
}

TEST(HvctlOperationTest, RunTurnsExceptionIntoError) {
  auto op = hvctl::create<hvctl::operation_t>();
  op->run([](hvctl::operation_t &op) {
    op.update_status("step 1");
    throw hvctl::exception<hvctl::value_error>("bad disk");
  });

  auto err = op->wait();
  ASSERT_TRUE(err.has_value());
  ASSERT_EQ(*err, "bad disk");
  ASSERT_TRUE(op->is_finished());
}

TEST(HvctlOperationTest, RunTurnsForeignThrowIntoError) {
  auto op = hvctl::create<hvctl::operation_t>();
  op->run([](hvctl::operation_t &) { throw 42; });

  auto err = op->wait();
  ASSERT_TRUE(err.has_value());
  ASSERT_EQ(*err, "unknown error");
  ASSERT_TRUE(op->logs().is_done());
  ASSERT_TRUE(op->status().is_done());
}

TEST(HvctlOperationTest, RunFinishesOnReturn) {
  auto op = hvctl::create<hvctl::operation_t>();
  op->run([](hvctl::operation_t &op) { op.log("done"); });
  ASSERT_FALSE(op->wait().has_value());
  ASSERT_THROW(op->run([](hvctl::operation_t &) {}),
               hvctl::exception_t<hvctl::state_error>);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
