#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <sqlite3.h>

namespace fl::storage {

// The single accounting document kept in the `accounting_state` table.
struct StoredDocument {
  int version = 0;
  std::string payload;
  std::int64_t saved_at = 0;
};

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
  bool remove_setting(std::string const &key);
  bool begin_transaction() const;
  bool commit_transaction() const;
  bool rollback_transaction() const;

  std::optional<StoredDocument> load_document() const;
  bool store_document(StoredDocument const &document);
  bool clear_document();

  std::optional<int> schema_version() const;

private:
  bool ensure_schema();
  bool run_migrations();
  bool ensure_schema_version_row() const;
  bool set_schema_version(int version) const;
  bool apply_migration_v1() const;
  bool execute(std::string const &sql) const;
  sqlite3_stmt *prepare_cached(std::string const &sql) const;

  std::filesystem::path path_;
  sqlite3 *db_ = nullptr;
  mutable std::mutex stmt_mutex_;
  mutable std::unordered_map<std::string, sqlite3_stmt *> stmt_cache_;
};

} // namespace fl::storage
