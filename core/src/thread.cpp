#include "thread.hpp"

#include <csignal>

namespace hvctl {

std::optional<signal_t> monitor_t::monitor(const time_point_t &due) {
  wlock_t lk(m_);
  if (cv_.wait_until(lk, due, [&] { return !q_.empty(); })) {
    auto rv = q_.front();
    q_.pop_front();
    return rv;
  } else
    return std::nullopt;
}

std::atomic<size_t> notify_t::next_id = 0;

void notify_t::notify(const std::string &what) {
  std::shared_ptr<monitor_t> monitor;
  {
    rlock_t lk(m_);
    monitor = monitor_.lock();
  }
  if (!monitor)
    return;

  {
    wlock_t lk(monitor->m_);
    monitor->q_.push_back(signal_t(myname, what));
  }
  monitor->cv_.notify_all();
}

void notify_t::set_monitor(std::shared_ptr<monitor_t> monitor) {
  wlock_t lk(m_);
  monitor_ = monitor;
}

stop_t::stop_t() : notify_t() { exit_.store(false); }

void stop_t::signal_handler(int signum) {
  if (signum == SIGINT || signum == SIGTERM)
    global_stop.stop();
}

stop_t stop_t::global_stop;

void join_or_detach(std::thread &t) {
  if (!t.joinable())
    return;
  if (t.get_id() == std::this_thread::get_id())
    t.detach();
  else
    t.join();
}

} // namespace hvctl
