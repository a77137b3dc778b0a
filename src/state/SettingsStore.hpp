#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

#include <sqlite3.h>

namespace tbl::storage {

// Key/value settings persisted in <config-dir>/settings.db.
class Database {
public:
  explicit Database(std::filesystem::path path);
  ~Database();

  Database(Database const &) = delete;
  Database &operator=(Database const &) = delete;

  bool is_valid() const noexcept { return db_ != nullptr; }
  std::filesystem::path const &path() const noexcept { return path_; }

  std::optional<std::string> get_setting(std::string const &key) const;
  bool set_setting(std::string const &key, std::string const &value);
  bool begin_transaction() const;
  bool commit_transaction() const;
  bool rollback_transaction() const;

private:
  bool ensure_schema() const;
  bool execute(std::string const &sql) const;
  sqlite3_stmt *prepare_cached(std::string const &sql) const;

  std::filesystem::path path_;
  sqlite3 *db_ = nullptr;
  mutable std::unordered_map<std::string, sqlite3_stmt *> stmt_cache_;
};

} // namespace tbl::storage
