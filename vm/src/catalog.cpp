#include "catalog.hpp"

namespace hvctl {

bool memory_catalog_t::insert(const catalog_entry_t &entry) {
  wlock_t lk(m_);
  return entries_.emplace(entry.name, entry).second;
}

std::optional<catalog_entry_t>
memory_catalog_t::find(const std::string &name) {
  rlock_t lk(m_);
  auto it = entries_.find(name);
  if (it == entries_.end())
    return std::nullopt;
  return it->second;
}

bool memory_catalog_t::remove(const std::string &name) {
  wlock_t lk(m_);
  return entries_.erase(name) > 0;
}

std::vector<catalog_entry_t> memory_catalog_t::list() {
  rlock_t lk(m_);
  std::vector<catalog_entry_t> rv;
  rv.reserve(entries_.size());
  for (const auto &[name, entry] : entries_)
    rv.push_back(entry);
  return rv;
}

} // namespace hvctl
