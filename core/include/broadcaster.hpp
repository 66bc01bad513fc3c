/**
 * @file broadcaster.hpp
 * @brief Console output fan-out
 * @details
 *
 * One producer writes byte chunks into `broadcaster_t`, which retains the most
 * recent bytes in a `ring_buffer_t` and forwards every chunk to each live
 * `subscription_t`.
 *
 * A new subscription first receives a snapshot of the retained bytes, then
 * every later write in order. Delivery never blocks the producer: when a
 * subscription's queue is full, that write is dropped for that subscription
 * only.
 *
 * ```cpp
 * auto console = hvctl::create<hvctl::broadcaster_t>(4096);
 * auto sub = console->subscribe();
 * console->write("booting\n");
 * while (auto chunk = sub->recv())
 *   std::cout << *chunk;
 * ```
 */
#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>

#include "channel.hpp"
#include "ring_buffer.hpp"

namespace hvctl {

class broadcaster_t;

class subscription_t : public object_t {
public:
  subscription_t(std::shared_ptr<broadcaster_t> owner, size_t id,
                 std::shared_ptr<channel_t<std::string>> inbox)
      : owner_(owner), id_(id), inbox_(inbox) {}

  /**
   * @brief Blocks for the next chunk
   * @return `std::nullopt` once the subscription is closed and drained
   */
  std::optional<std::string> recv() { return inbox_->recv(); }

  std::optional<std::string> recv_for(const duration_t &due) {
    return inbox_->recv_for(due);
  }

  std::optional<std::string> try_recv() { return inbox_->try_recv(); }

  /**
   * @brief Unregisters from the broadcaster and discards pending chunks
   */
  void close();

  bool is_closed() const { return inbox_->is_closed(); }

private:
  friend class broadcaster_t;

  std::weak_ptr<broadcaster_t> owner_;

  size_t id_;

  std::shared_ptr<channel_t<std::string>> inbox_;
};

class broadcaster_t : public object_t {
public:
  static constexpr size_t subscription_capacity = 64;

  explicit broadcaster_t(size_t capacity) : buf_(capacity) {}

  /**
   * @brief Retain `data` and forward it to every subscription
   * @return Number of bytes written
   * @throw exception_t<end_of_stream> after `close()`
   */
  size_t write(std::string_view data);

  std::shared_ptr<subscription_t> subscribe();

  /**
   * @brief Closes every live subscription. Idempotent.
   */
  void close();

  bool closed() const;

  /**
   * @return Currently retained bytes
   */
  std::string bytes() const;

  size_t num_subscriptions() const;

private:
  friend class subscription_t;

  void unsubscribe(size_t id);

  mutable mutex_t m_;

  ring_buffer_t buf_;

  std::map<size_t, std::shared_ptr<channel_t<std::string>>> subs_;

  size_t next_id_ = 0;

  bool closed_ = false;
};

} // namespace hvctl
