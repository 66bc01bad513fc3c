#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "thread.hpp"

namespace hvctl {

/**
 * @brief A named virtualizer: backend type plus its opaque configuration
 */
struct catalog_entry_t {
  std::string name;
  std::string type;
  std::string data;
};

/**
 * @brief Keyed store of `catalog_entry_t`, with the name as primary key
 */
class catalog_t : public object_t {
public:
  /**
   * @return false if an entry with the same name already exists
   */
  virtual bool insert(const catalog_entry_t &entry) = 0;

  virtual std::optional<catalog_entry_t> find(const std::string &name) = 0;

  /**
   * @return false if nothing was removed
   */
  virtual bool remove(const std::string &name) = 0;

  /**
   * @return Every entry, sorted by name
   */
  virtual std::vector<catalog_entry_t> list() = 0;
};

class memory_catalog_t : public catalog_t {
public:
  bool insert(const catalog_entry_t &entry) override;

  std::optional<catalog_entry_t> find(const std::string &name) override;

  bool remove(const std::string &name) override;

  std::vector<catalog_entry_t> list() override;

private:
  mutex_t m_;

  std::map<std::string, catalog_entry_t> entries_;
};

} // namespace hvctl
