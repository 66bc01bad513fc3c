#include "broadcaster.hpp"

#include "exception.hpp"

namespace hvctl {

void subscription_t::close() {
  if (auto owner = owner_.lock())
    owner->unsubscribe(id_);
  inbox_->close();
  inbox_->drain();
}

size_t broadcaster_t::write(std::string_view data) {
  wlock_t lk(m_);
  if (closed_)
    throw exception<end_of_stream>();

  buf_.write(data);
  for (auto &[id, inbox] : subs_)
    inbox->try_send(std::string(data));
  return data.size();
}

std::shared_ptr<subscription_t> broadcaster_t::subscribe() {
  wlock_t lk(m_);
  auto inbox = create<channel_t<std::string>>(subscription_capacity);
  inbox->try_send(buf_.bytes());
  size_t id = next_id_++;
  if (closed_)
    inbox->close();
  else
    subs_.emplace(id, inbox);
  return create<subscription_t>(as<broadcaster_t>(), id, inbox);
}

void broadcaster_t::close() {
  wlock_t lk(m_);
  if (closed_)
    return;
  for (auto &[id, inbox] : subs_)
    inbox->close();
  subs_.clear();
  closed_ = true;
}

bool broadcaster_t::closed() const {
  rlock_t lk(m_);
  return closed_;
}

std::string broadcaster_t::bytes() const {
  rlock_t lk(m_);
  return buf_.bytes();
}

size_t broadcaster_t::num_subscriptions() const {
  rlock_t lk(m_);
  return subs_.size();
}

void broadcaster_t::unsubscribe(size_t id) {
  wlock_t lk(m_);
  subs_.erase(id);
}

} // namespace hvctl
