#include "operation.hpp"

#include "exception.hpp"
#include "logging.hpp"

namespace hvctl {

operation_t::operation_t()
    : logs_(create<channel_t<std::string>>(logs_capacity)),
      status_(create<channel_t<std::string>>(status_capacity)),
      error_(create<channel_t<std::string>>(error_capacity)) {}

operation_t::~operation_t() { join_or_detach(worker_); }

void operation_t::log(const std::string &text) {
  debug(text);
  logs_->force_send(text);
}

void operation_t::update_status(const std::string &text) {
  status_->force_send(text);
  log(text);
}

void operation_t::finished(const std::optional<std::string> &err) {
  wlock_t lk(m_);
  if (finished_)
    return;
  finished_ = true;
  result_ = err;

  if (err) {
    logs_->force_send(std::format("Error: {}", *err));
    status_->force_send(std::format("Failed: {}", *err));
    error_->force_send(*err);
  }
  logs_->close();
  status_->close();
  error_->close();
}

bool operation_t::is_finished() const {
  rlock_t lk(m_);
  return finished_;
}

std::optional<std::string> operation_t::wait() {
  auto err = receiver_t<std::string>(error_);
  while (err.recv())
    ;
  rlock_t lk(m_);
  return result_;
}

void operation_t::run(std::function<void(operation_t &)> task) {
  if (worker_.joinable())
    throw exception<state_error>("operation is already running");

  worker_ = std::thread([self = as<operation_t>(), task = std::move(task)]() {
    try {
      task(*self);
    } catch (const std::exception &e) {
      self->finished(reason_of(e));
      return;
    } catch (...) {
      self->finished("unknown error");
      return;
    }
    self->finished();
  });
}

} // namespace hvctl
