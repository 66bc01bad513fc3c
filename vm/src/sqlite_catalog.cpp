#include "sqlite_catalog.hpp"

#include <sqlite3.h>

#include "exception.hpp"
#include "logging.hpp"

namespace hvctl {

namespace {

class statement_t {
public:
  statement_t(sqlite3 *db, const std::string &sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK)
      throw exception<runtime_error>(std::format(
          "failed to prepare statement: {}", sqlite3_errmsg(db)));
  }

  ~statement_t() {
    if (stmt_)
      sqlite3_finalize(stmt_);
  }

  statement_t(const statement_t &) = delete;

  statement_t &operator=(const statement_t &) = delete;

  void bind_text(int index, const std::string &value) {
    if (sqlite3_bind_text(stmt_, index, value.c_str(),
                          static_cast<int>(value.size()),
                          SQLITE_TRANSIENT) != SQLITE_OK)
      throw exception<runtime_error>("failed to bind text parameter");
  }

  void bind_blob(int index, const std::string &value) {
    if (sqlite3_bind_blob(stmt_, index, value.data(),
                          static_cast<int>(value.size()),
                          SQLITE_TRANSIENT) != SQLITE_OK)
      throw exception<runtime_error>("failed to bind blob parameter");
  }

  /**
   * @return true if a row is available
   */
  bool step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW)
      return true;
    if (rc == SQLITE_DONE)
      return false;
    throw exception<runtime_error>(
        std::format("statement execution failed: {}", sqlite3_errmsg(db_)));
  }

  std::string get_text(int col) const {
    auto text = reinterpret_cast<const char *>(sqlite3_column_text(stmt_, col));
    return text ? std::string(text) : std::string();
  }

  std::string get_blob(int col) const {
    auto data = static_cast<const char *>(sqlite3_column_blob(stmt_, col));
    int size = sqlite3_column_bytes(stmt_, col);
    return data ? std::string(data, size) : std::string();
  }

  catalog_entry_t get_entry() const {
    return catalog_entry_t{
        .name = get_text(0), .type = get_text(1), .data = get_blob(2)};
  }

private:
  sqlite3_stmt *stmt_ = nullptr;

  sqlite3 *db_ = nullptr;
};

} // namespace

sqlite_catalog_t::sqlite_catalog_t(const std::filesystem::path &path) {
  int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
  if (sqlite3_open_v2(path.string().c_str(), &db_, flags, nullptr) !=
      SQLITE_OK) {
    std::string what = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw exception<runtime_error>(std::format(
        "failed to open catalog '{}': {}", path.string(), what));
  }
  sqlite3_busy_timeout(db_, 15000);

  execute("PRAGMA foreign_keys = ON");
  execute("PRAGMA secure_delete = ON");
  execute("CREATE TABLE IF NOT EXISTS virtualizers ("
          "name TEXT PRIMARY KEY, type TEXT NOT NULL, data BLOB)");
  debug("catalog opened at {}", path.string());
}

sqlite_catalog_t::~sqlite_catalog_t() {
  if (db_)
    sqlite3_close(db_);
}

void sqlite_catalog_t::execute(const std::string &sql) {
  char *errmsg = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg) != SQLITE_OK) {
    std::string what = errmsg ? errmsg : "unknown error";
    sqlite3_free(errmsg);
    throw exception<runtime_error>(
        std::format("SQL execution failed: {}", what));
  }
}

bool sqlite_catalog_t::insert(const catalog_entry_t &entry) {
  wlock_t lk(m_);
  execute("BEGIN IMMEDIATE TRANSACTION");
  try {
    bool exists;
    {
      statement_t check(db_, "SELECT 1 FROM virtualizers WHERE name = ?");
      check.bind_text(1, entry.name);
      exists = check.step();
    }
    if (exists) {
      execute("ROLLBACK");
      return false;
    }

    statement_t ins(
        db_, "INSERT INTO virtualizers (name, type, data) VALUES (?, ?, ?)");
    ins.bind_text(1, entry.name);
    ins.bind_text(2, entry.type);
    ins.bind_blob(3, entry.data);
    ins.step();
  } catch (const std::exception &) {
    execute("ROLLBACK");
    throw;
  }
  execute("COMMIT");
  return true;
}

std::optional<catalog_entry_t>
sqlite_catalog_t::find(const std::string &name) {
  wlock_t lk(m_);
  statement_t stmt(db_,
                   "SELECT name, type, data FROM virtualizers WHERE name = ?");
  stmt.bind_text(1, name);
  if (!stmt.step())
    return std::nullopt;
  return stmt.get_entry();
}

bool sqlite_catalog_t::remove(const std::string &name) {
  wlock_t lk(m_);
  statement_t stmt(db_, "DELETE FROM virtualizers WHERE name = ?");
  stmt.bind_text(1, name);
  stmt.step();
  return sqlite3_changes(db_) > 0;
}

std::vector<catalog_entry_t> sqlite_catalog_t::list() {
  wlock_t lk(m_);
  statement_t stmt(db_,
                   "SELECT name, type, data FROM virtualizers ORDER BY name");
  std::vector<catalog_entry_t> rv;
  while (stmt.step())
    rv.push_back(stmt.get_entry());
  return rv;
}

} // namespace hvctl
