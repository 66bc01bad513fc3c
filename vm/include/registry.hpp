#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "thread.hpp"

namespace hvctl {

class handle_t;

/**
 * @brief Live VMs keyed by name
 * @details Owned by `manager_t`; handles keep a weak reference to it so that
 * `handle_t::close` can release the name. Thread-safe.
 */
class active_registry_t : public object_t {
public:
  /**
   * @return false if `name` is already taken
   */
  bool try_insert(const std::string &name, std::shared_ptr<handle_t> handle);

  /**
   * @brief Remove `name` if it is held by `handle`
   */
  bool erase(const std::string &name, const handle_t *handle);

  std::shared_ptr<handle_t> find(const std::string &name) const;

  std::vector<std::shared_ptr<handle_t>> snapshot() const;

  size_t size() const;

private:
  mutable mutex_t m_;

  std::map<std::string, std::shared_ptr<handle_t>> handles_;
};

} // namespace hvctl
