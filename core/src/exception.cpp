#include "exception.hpp"

#include <cpptrace/cpptrace.hpp>
#include <format>

namespace hvctl {

std::string build_errstr(const char *what) {
  auto trace = cpptrace::generate_trace();
  auto &frames = trace.frames;
  while (!frames.empty()) {
    auto front_symbol = frames.at(0).symbol;
    if (front_symbol.starts_with("hvctl::build_errstr") ||
        front_symbol.starts_with("hvctl::exception_t"))
      frames.erase(frames.begin());
    else
      break;
  }
  return std::format("\033[1;31m{}\033[0m\n{}", what, trace.to_string(true));
}

std::string reason_of(const std::exception &e) {
#define HVCTL_REASON_OF(T)                                                     \
  if (auto p = dynamic_cast<const exception_t<T> *>(&e))                       \
    return p->reason();
  HVCTL_REASON_OF(runtime_error)
  HVCTL_REASON_OF(value_error)
  HVCTL_REASON_OF(state_error)
  HVCTL_REASON_OF(exists_error)
  HVCTL_REASON_OF(not_found_error)
  HVCTL_REASON_OF(end_of_stream)
  HVCTL_REASON_OF(not_implemented)
#undef HVCTL_REASON_OF
  return e.what();
}

not_implemented::not_implemented() : errstr_(std::format("Not implemented:")) {}

not_implemented::not_implemented(const std::string &what)
    : errstr_(std::format("Not implemented: {}", what)) {}

const char *not_implemented::what() const noexcept { return errstr_.c_str(); }

} // namespace hvctl
