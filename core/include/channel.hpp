/**
 * @file channel.hpp
 * @brief Bounded, closable in-process queue
 * @details
 *
 * `channel_t` is a mailbox with a fixed `limit` that can be closed once. After
 * `close()` nothing can be sent, but already queued values can still be
 * received; a receiver sees `std::nullopt` when the channel is closed and
 * drained.
 *
 * Senders never block:
 * - `try_send` rejects the value when the channel is full
 * - `force_send` evicts the oldest queued value to make room
 *
 * `receiver_t` is the read-only end handed out to consumers.
 */
#pragma once

#include <deque>
#include <memory>
#include <optional>

#include "thread.hpp"

namespace hvctl {

template <typename mail_t> class channel_t : public object_t {
public:
  explicit channel_t(size_t limit) : limit(limit) {}

  /**
   * @return false if the channel is full or closed
   */
  bool try_send(mail_t mail) {
    {
      wlock_t lk(m_);
      if (closed_ || q_.size() >= limit)
        return false;
      q_.push_back(std::move(mail));
    }
    cv_.notify_all();
    return true;
  }

  /**
   * @return false if the channel is closed
   */
  bool force_send(mail_t mail) {
    {
      wlock_t lk(m_);
      if (closed_)
        return false;
      while (q_.size() >= limit && !q_.empty())
        q_.pop_front();
      if (limit > 0)
        q_.push_back(std::move(mail));
    }
    cv_.notify_all();
    return true;
  }

  /**
   * @brief Blocks until a value arrives or the channel is closed and drained
   */
  std::optional<mail_t> recv() {
    wlock_t lk(m_);
    cv_.wait(lk, [&] { return !q_.empty() || closed_; });
    return pop_locked();
  }

  /**
   * @return `std::nullopt` on timeout or when closed and drained
   */
  std::optional<mail_t> recv_until(const time_point_t &due) {
    wlock_t lk(m_);
    cv_.wait_until(lk, due, [&] { return !q_.empty() || closed_; });
    return pop_locked();
  }

  std::optional<mail_t> recv_for(const duration_t &due) {
    return recv_until(now() + due);
  }

  std::optional<mail_t> try_recv() {
    wlock_t lk(m_);
    return pop_locked();
  }

  /**
   * @brief Closes the channel. Idempotent.
   */
  void close() {
    {
      wlock_t lk(m_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  /**
   * @brief Discards every queued value
   */
  void drain() {
    wlock_t lk(m_);
    q_.clear();
  }

  bool is_closed() const {
    rlock_t lk(m_);
    return closed_;
  }

  /**
   * @return true once the channel is closed and nothing is left to receive
   */
  bool is_done() const {
    rlock_t lk(m_);
    return closed_ && q_.empty();
  }

  size_t size() const {
    rlock_t lk(m_);
    return q_.size();
  }

  const size_t limit;

private:
  std::optional<mail_t> pop_locked() {
    if (q_.empty())
      return std::nullopt;
    auto rv = std::move(q_.front());
    q_.pop_front();
    return rv;
  }

  mutable mutex_t m_;

  condition_variable_t cv_;

  std::deque<mail_t> q_;

  bool closed_ = false;
};

/**
 * @brief Receive-only view of a `channel_t`
 */
template <typename mail_t> class receiver_t {
public:
  receiver_t() = default;

  explicit receiver_t(std::shared_ptr<channel_t<mail_t>> ch)
      : ch_(std::move(ch)) {}

  std::optional<mail_t> recv() { return ch_->recv(); }

  std::optional<mail_t> recv_for(const duration_t &due) {
    return ch_->recv_for(due);
  }

  std::optional<mail_t> try_recv() { return ch_->try_recv(); }

  bool is_closed() const { return ch_->is_closed(); }

  bool is_done() const { return ch_->is_done(); }

  explicit operator bool() const { return static_cast<bool>(ch_); }

private:
  std::shared_ptr<channel_t<mail_t>> ch_;
};

} // namespace hvctl
