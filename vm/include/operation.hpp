/**
 * @file operation.hpp
 * @brief Asynchronous unit of work that carries a VM through preparation
 * @details
 *
 * An operation exposes three one-directional streams:
 *
 * - `logs()`: verbose progress (capacity 128)
 * - `status()`: coarse progress (capacity 10)
 * - `error()`: at most one value, the reason preparation failed (capacity 1)
 *
 * Writers never block; a full stream evicts its oldest entry. `finished()`
 * closes all three streams exactly once, so closure is the only reliable
 * completion signal:
 *
 * ```cpp
 * auto op = manager->prepare("firecracker-1", args);
 * auto status = op->status();
 * while (auto line = status.recv())
 *   std::cout << *line << std::endl;
 * if (auto err = op->wait())
 *   throw std::runtime_error(*err);
 * ```
 */
#pragma once

#include <format>
#include <functional>
#include <optional>
#include <string>
#include <thread>

#include "channel.hpp"

namespace hvctl {

class operation_t : public object_t {
public:
  static constexpr size_t logs_capacity = 128;
  static constexpr size_t status_capacity = 10;
  static constexpr size_t error_capacity = 1;

  operation_t();

  ~operation_t();

  receiver_t<std::string> logs() const {
    return receiver_t<std::string>(logs_);
  }

  receiver_t<std::string> status() const {
    return receiver_t<std::string>(status_);
  }

  receiver_t<std::string> error() const {
    return receiver_t<std::string>(error_);
  }

  void log(const std::string &text);

  template <typename... args_t>
  void log(const std::format_string<std::type_identity_t<args_t>...> fmt,
           args_t &&...args) {
    log(std::format(fmt, std::forward<args_t>(args)...));
  }

  /**
   * @brief Write `text` to both the status and the log stream
   */
  void update_status(const std::string &text);

  /**
   * @brief Complete the operation. Only the first call has any effect.
   * @param err Failure reason, or `std::nullopt` on success
   */
  void finished(const std::optional<std::string> &err = std::nullopt);

  bool is_finished() const;

  /**
   * @brief Blocks until the operation finished
   * @return The failure reason, if any
   */
  std::optional<std::string> wait();

  /**
   * @brief Run `task` on the operation's worker thread
   * @details An exception escaping `task` becomes the operation's error.
   * The operation is finished when `task` returns.
   */
  void run(std::function<void(operation_t &)> task);

private:
  std::shared_ptr<channel_t<std::string>> logs_;

  std::shared_ptr<channel_t<std::string>> status_;

  std::shared_ptr<channel_t<std::string>> error_;

  mutable mutex_t m_;

  bool finished_ = false;

  std::optional<std::string> result_;

  std::thread worker_;
};

} // namespace hvctl
