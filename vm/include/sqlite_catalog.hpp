#pragma once

#include <filesystem>
#include <memory>

#include "catalog.hpp"

struct sqlite3;

namespace hvctl {

/**
 * @brief Catalog persisted in a SQLite database
 * @details
 * Schema:
 *
 * ```sql
 * CREATE TABLE virtualizers (name TEXT PRIMARY KEY, type TEXT, data BLOB);
 * ```
 *
 * One connection per catalog, serialized by the catalog's own lock.
 */
class sqlite_catalog_t : public catalog_t {
public:
  explicit sqlite_catalog_t(const std::filesystem::path &path);

  ~sqlite_catalog_t();

  bool insert(const catalog_entry_t &entry) override;

  std::optional<catalog_entry_t> find(const std::string &name) override;

  bool remove(const std::string &name) override;

  std::vector<catalog_entry_t> list() override;

private:
  void execute(const std::string &sql);

  mutex_t m_;

  sqlite3 *db_ = nullptr;
};

} // namespace hvctl
