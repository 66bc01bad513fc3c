/**
 * @file thread.hpp
 * @brief Basic building blocks for multithreading
 * @details
 *
 * ## `signal_t`, `monitor_t`, `notify_t`
 *
 * A class of type `notify_t` can generate signals. For example:
 *
 * - A service thread terminating unexpectedly
 * - Program termination (SIGINT/SIGTERM)
 *
 * When such signals occur, `notify_t` can notify this event(signal) to its
 * monitor. A long-running process (such as the network helper) waits on one
 * `monitor_t` for every service it runs:
 *
 * ```cpp
 * {
 *   std::shared_ptr<monitor_t> monitor = hvctl::create<monitor_t>();
 *   stop_t::global_stop.set_monitor(monitor);
 *   while (auto sig = monitor->monitor(100ms)) { ... }
 * }
 * ```
 */
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>

#include "object.hpp"

namespace hvctl {

using mutex_t = std::shared_mutex;

using condition_variable_t = std::condition_variable_any;

using wlock_t = std::unique_lock<mutex_t>;

using rlock_t = std::shared_lock<mutex_t>;

using time_point_t = std::chrono::steady_clock::time_point;

using duration_t = std::chrono::steady_clock::duration;

inline time_point_t now() { return std::chrono::steady_clock::now(); }

/**
 * @brief A simple signal structure representing an event occurrence
 * @details
 * `who` is the name of the emitting `notify_t`, `what` the event.
 */
struct signal_t {
  signal_t(const std::string &who, const std::string &what)
      : who(who), what(what) {}
  std::string who;
  std::string what;
};

class notify_t;

/**
 * @brief A monitor that listens for `signal_t` events from attached `notify_t`
 * @details
 * `notify_t`-derived classes call `notify()` to push a signal into the
 * monitor's internal queue. The `monitor()` method blocks until either a
 * signal is received or the timeout expires.
 *
 * It is thread-safe for multiple `notify_t` to emit signals concurrently.
 */
class monitor_t : public object_t {
public:
  monitor_t() = default;

  /**
   * @brief Waits for a signal until the specified deadline
   * @param due The absolute time point by which a signal should be received
   * @return A signal if one is received before the deadline, `std::nullopt`
   * otherwise
   */
  std::optional<signal_t> monitor(const time_point_t &due);

  std::optional<signal_t> monitor(const duration_t &due) {
    return monitor(now() + due);
  }

private:
  friend class notify_t;

  mutex_t m_;

  condition_variable_t cv_;

  std::deque<signal_t> q_;
};

/**
 * @brief Base class that emits `signal_t` to an attached `monitor_t`
 * @details
 * Each instance gets a unique name used as `signal_t::who`.
 */
class notify_t : public object_t {
public:
  notify_t() : myname(new_name()) {}

  explicit notify_t(const std::string &name) : myname(name) {}

  /**
   * @brief Emits a `signal_t` to the associated monitor
   * @note Does nothing if the monitor is gone
   */
  void notify(const std::string &what);

  /**
   * @brief Assigns a monitor to this notifier
   * @note This will overwrite any previously set monitor
   */
  void set_monitor(std::shared_ptr<monitor_t> monitor);

  const std::string myname;

private:
  static std::atomic<size_t> next_id;

  static std::string new_name() { return std::to_string(next_id++); }

  mutex_t m_;

  std::weak_ptr<monitor_t> monitor_;
};

/**
 * @brief Notifier for stopping a service loop
 * @details
 * `signal_handler` stops the global instance on SIGINT and SIGTERM.
 */
class stop_t : public notify_t {
public:
  stop_t();

  operator bool() const { return exit_.load(); }

  void stop() {
    exit_.store(true);
    notify("stop");
  }

  static void signal_handler(int signum);

  static stop_t global_stop;

private:
  std::atomic_bool exit_;
};

/**
 * @brief Join a worker thread, or detach it when called from the worker itself
 * @details
 * Workers own a reference to the object they serve, so the object's
 * destructor may run on the worker thread.
 */
void join_or_detach(std::thread &t);

} // namespace hvctl
