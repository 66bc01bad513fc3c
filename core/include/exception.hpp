#pragma once

#include <exception>
#include <format>
#include <string>

namespace hvctl {

std::string build_errstr(const char *what);

template <typename T>
concept is_exception_reason = requires(T t) {
  requires noexcept(t.what());
  { t.what() } -> std::same_as<const char *>;
} || requires() {
  requires noexcept(T::what());
  { T::what() } -> std::same_as<const char *>;
};

struct runtime_error {
  runtime_error() : errstr_("Internal error") {}

  runtime_error(const std::string &what) : errstr_(what) {}

  const char *what() const noexcept { return errstr_.c_str(); }

  operator std::string() const { return errstr_; }

  std::string errstr_;
};

static_assert(is_exception_reason<runtime_error>);

/**
 * @brief Malformed or host-incompatible configuration
 */
struct value_error {
  value_error() : value_error("Value error") {}

  value_error(const std::string &what) : errstr_(what) {}

  value_error(const std::string &context, const std::string &name)
      : errstr_(std::format("[{}] Value error: {}", context, name)) {}

  value_error(const std::string &context, const std::string &name,
              const std::string &expected, const std::string &actual)
      : errstr_(std::format(
            "[{}] Value error:\n - name: {}\n - expected: {}\n - actual: {}",
            context, name, expected, actual)) {}

  const char *what() const noexcept { return errstr_.c_str(); }

  operator std::string() const { return errstr_; }

  std::string errstr_;
};

static_assert(is_exception_reason<value_error>);

/**
 * @brief Operation not permitted in the current lifecycle state
 */
struct state_error {
  state_error() : errstr_("invalid state") {}

  state_error(const std::string &what) : errstr_(what) {}

  state_error(const std::string &context, const std::string &actual)
      : errstr_(std::format("[{}] invalid state: {}", context, actual)) {}

  const char *what() const noexcept { return errstr_.c_str(); }

  operator std::string() const { return errstr_; }

  std::string errstr_;
};

static_assert(is_exception_reason<state_error>);

/**
 * @brief A resource with the same name is already registered
 */
struct exists_error {
  exists_error(const std::string &what) : errstr_(what) {}

  const char *what() const noexcept { return errstr_.c_str(); }

  operator std::string() const { return errstr_; }

  std::string errstr_;
};

static_assert(is_exception_reason<exists_error>);

struct not_found_error {
  not_found_error(const std::string &what) : errstr_(what) {}

  const char *what() const noexcept { return errstr_.c_str(); }

  operator std::string() const { return errstr_; }

  std::string errstr_;
};

static_assert(is_exception_reason<not_found_error>);

struct end_of_stream {
  static const char *what() noexcept { return "end of stream"; }
};

static_assert(is_exception_reason<end_of_stream>);

struct not_implemented {
  not_implemented();

  not_implemented(const std::string &what);

  const char *what() const noexcept;

  operator std::string() const { return errstr_; }

  std::string errstr_;
};

static_assert(is_exception_reason<not_implemented>);

template <typename T = runtime_error>
  requires is_exception_reason<T>
class exception_t : public std::exception {
public:
  template <typename... TArgs>
  exception_t(TArgs... args) : std::exception() {
    T reason(args...);
    reason_ = reason.what();
    errstr_ = build_errstr(reason_.c_str());
  }

  const char *what() const noexcept override { return errstr_.c_str(); }

  /**
   * @brief The message without decoration or traceback
   */
  const std::string &reason() const noexcept { return reason_; }

private:
  std::string reason_;

  std::string errstr_;
};

template <typename T = runtime_error, typename... TArgs>
exception_t<T> exception(TArgs... args) {
  return exception_t<T>{args...};
}

/**
 * @brief Extract the undecorated message of any exception
 */
std::string reason_of(const std::exception &e);

} // namespace hvctl
