#include "registry.hpp"

#include "handle.hpp"

namespace hvctl {

bool active_registry_t::try_insert(const std::string &name,
                                   std::shared_ptr<handle_t> handle) {
  wlock_t lk(m_);
  return handles_.emplace(name, std::move(handle)).second;
}

bool active_registry_t::erase(const std::string &name,
                              const handle_t *handle) {
  wlock_t lk(m_);
  auto it = handles_.find(name);
  if (it == handles_.end() || it->second.get() != handle)
    return false;
  handles_.erase(it);
  return true;
}

std::shared_ptr<handle_t>
active_registry_t::find(const std::string &name) const {
  rlock_t lk(m_);
  auto it = handles_.find(name);
  if (it == handles_.end())
    return nullptr;
  return it->second;
}

std::vector<std::shared_ptr<handle_t>> active_registry_t::snapshot() const {
  rlock_t lk(m_);
  std::vector<std::shared_ptr<handle_t>> rv;
  rv.reserve(handles_.size());
  for (const auto &[name, handle] : handles_)
    rv.push_back(handle);
  return rv;
}

size_t active_registry_t::size() const {
  rlock_t lk(m_);
  return handles_.size();
}

} // namespace hvctl
