#include "utils/StateStore.hpp"

#include "utils/Log.hpp"

#include <filesystem>
#include <system_error>

namespace fl::storage
{

namespace
{

constexpr int kDatabaseBusyTimeoutMs = 5000;

// Resets and unbinds a cached statement when the caller is done with it.
struct StatementGuard
{
    explicit StatementGuard(sqlite3_stmt *stmt) : stmt_(stmt)
    {
    }
    StatementGuard(StatementGuard const &) = delete;
    StatementGuard &operator=(StatementGuard const &) = delete;
    ~StatementGuard()
    {
        if (stmt_ != nullptr)
        {
            sqlite3_reset(stmt_);
            sqlite3_clear_bindings(stmt_);
        }
    }

    sqlite3_stmt *stmt_;
};

} // namespace

Database::Database(std::filesystem::path path) : path_(std::move(path))
{
    if (path_.empty())
    {
        return;
    }
    auto parent = path_.parent_path();
    if (!parent.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            FL_LOG_WARN("failed to create state directory {}: {}",
                        parent.string(), ec.message());
        }
    }
    int rc = sqlite3_open_v2(path_.string().c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                 SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK)
    {
        FL_LOG_ERROR("failed to open sqlite database {}: {}", path_.string(),
                     sqlite3_errstr(rc));
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }
    char *err_msg = nullptr;
    rc = sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr,
                      &err_msg);
    if (rc != SQLITE_OK && err_msg != nullptr)
    {
        FL_LOG_WARN("failed to enable WAL journal mode: {}", err_msg);
    }
    if (err_msg != nullptr)
    {
        sqlite3_free(err_msg);
    }
    sqlite3_busy_timeout(db_, kDatabaseBusyTimeoutMs);
    if (!ensure_schema())
    {
        FL_LOG_ERROR("state database {} has an unusable schema",
                     path_.string());
        for (auto &entry : stmt_cache_)
        {
            sqlite3_finalize(entry.second);
        }
        stmt_cache_.clear();
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Database::~Database()
{
    for (auto &entry : stmt_cache_)
    {
        if (entry.second != nullptr)
        {
            sqlite3_finalize(entry.second);
        }
    }
    stmt_cache_.clear();
    if (db_)
    {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool Database::ensure_schema()
{
    if (!db_)
    {
        return false;
    }
    constexpr char const *kSchemaVersionSql =
        "CREATE TABLE IF NOT EXISTS schema_version ("
        "id INTEGER PRIMARY KEY CHECK(id = 1),"
        "version INTEGER NOT NULL);";
    if (!execute(kSchemaVersionSql))
    {
        return false;
    }
    return run_migrations();
}

bool Database::execute(std::string const &sql) const
{
    if (!db_)
    {
        return false;
    }
    char *err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK)
    {
        if (err_msg != nullptr)
        {
            FL_LOG_WARN("sqlite error: {}", err_msg);
            sqlite3_free(err_msg);
        }
        return false;
    }
    return true;
}

bool Database::run_migrations()
{
    if (!ensure_schema_version_row())
    {
        return false;
    }
    auto current = schema_version().value_or(0);
    struct Migration
    {
        int version;
        bool (Database::*apply)() const;
    };
    static constexpr Migration kMigrations[] = {
        {1, &Database::apply_migration_v1},
    };
    for (auto const &migration : kMigrations)
    {
        if (current >= migration.version)
        {
            continue;
        }
        if (!(this->*migration.apply)())
        {
            FL_LOG_ERROR("schema migration v{} failed", migration.version);
            return false;
        }
        if (!set_schema_version(migration.version))
        {
            return false;
        }
        current = migration.version;
    }
    return true;
}

bool Database::ensure_schema_version_row() const
{
    constexpr char const *sql =
        "INSERT OR IGNORE INTO schema_version (id, version) VALUES (1, 0);";
    return execute(sql);
}

std::optional<int> Database::schema_version() const
{
    if (!db_)
    {
        return std::nullopt;
    }
    constexpr char const *sql =
        "SELECT version FROM schema_version WHERE id = 1 LIMIT 1;";
    std::lock_guard<std::mutex> lock(stmt_mutex_);
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    StatementGuard guard(stmt);
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        return static_cast<int>(sqlite3_column_int(stmt, 0));
    }
    return std::nullopt;
}

bool Database::set_schema_version(int version) const
{
    if (!db_)
    {
        return false;
    }
    constexpr char const *sql =
        "INSERT OR REPLACE INTO schema_version (id, version) VALUES (1, ?);";
    std::lock_guard<std::mutex> lock(stmt_mutex_);
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    StatementGuard guard(stmt);
    sqlite3_bind_int(stmt, 1, version);
    return sqlite3_step(stmt) == SQLITE_DONE;
}

bool Database::apply_migration_v1() const
{
    constexpr char const *kSettingsSql = "CREATE TABLE IF NOT EXISTS settings ("
                                         "key TEXT PRIMARY KEY,"
                                         "value TEXT NOT NULL);";
    constexpr char const *kAccountingStateSql =
        "CREATE TABLE IF NOT EXISTS accounting_state ("
        "id INTEGER PRIMARY KEY CHECK(id = 1),"
        "version INTEGER NOT NULL,"
        "payload TEXT NOT NULL,"
        "saved_at INTEGER NOT NULL);";
    return execute(kSettingsSql) && execute(kAccountingStateSql);
}

// Callers hold stmt_mutex_.
sqlite3_stmt *Database::prepare_cached(std::string const &sql) const
{
    if (!db_)
    {
        return nullptr;
    }
    auto it = stmt_cache_.find(sql);
    if (it != stmt_cache_.end())
    {
        if (it->second != nullptr)
        {
            sqlite3_reset(it->second);
            sqlite3_clear_bindings(it->second);
        }
        return it->second;
    }
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        FL_LOG_WARN("sqlite prepare failed: {}", sqlite3_errmsg(db_));
        return nullptr;
    }
    stmt_cache_.emplace(sql, stmt);
    return stmt;
}

bool Database::begin_transaction() const
{
    return execute("BEGIN TRANSACTION;");
}

bool Database::commit_transaction() const
{
    return execute("COMMIT;");
}

bool Database::rollback_transaction() const
{
    return execute("ROLLBACK;");
}

std::optional<std::string> Database::get_setting(std::string const &key) const
{
    if (!db_)
    {
        return std::nullopt;
    }
    constexpr char const *sql =
        "SELECT value FROM settings WHERE key = ? LIMIT 1;";
    std::lock_guard<std::mutex> lock(stmt_mutex_);
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    StatementGuard guard(stmt);
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        auto text =
            reinterpret_cast<char const *>(sqlite3_column_text(stmt, 0));
        if (text != nullptr)
        {
            return std::string(text);
        }
    }
    return std::nullopt;
}

bool Database::set_setting(std::string const &key, std::string const &value)
{
    if (!db_)
    {
        return false;
    }
    constexpr char const *sql =
        "INSERT OR REPLACE INTO settings (key, value) VALUES (?, ?);";
    std::lock_guard<std::mutex> lock(stmt_mutex_);
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    StatementGuard guard(stmt);
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
    return sqlite3_step(stmt) == SQLITE_DONE;
}

bool Database::remove_setting(std::string const &key)
{
    if (!db_)
    {
        return false;
    }
    constexpr char const *sql = "DELETE FROM settings WHERE key = ?;";
    std::lock_guard<std::mutex> lock(stmt_mutex_);
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    StatementGuard guard(stmt);
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    return sqlite3_step(stmt) == SQLITE_DONE;
}

std::optional<StoredDocument> Database::load_document() const
{
    if (!db_)
    {
        return std::nullopt;
    }
    constexpr char const *sql = "SELECT version, payload, saved_at FROM "
                                "accounting_state WHERE id = 1 LIMIT 1;";
    std::lock_guard<std::mutex> lock(stmt_mutex_);
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    StatementGuard guard(stmt);
    if (sqlite3_step(stmt) != SQLITE_ROW)
    {
        return std::nullopt;
    }
    StoredDocument document;
    document.version = sqlite3_column_int(stmt, 0);
    if (auto *payload =
            reinterpret_cast<char const *>(sqlite3_column_text(stmt, 1));
        payload != nullptr)
    {
        document.payload = std::string(
            payload, static_cast<std::size_t>(sqlite3_column_bytes(stmt, 1)));
    }
    document.saved_at =
        static_cast<std::int64_t>(sqlite3_column_int64(stmt, 2));
    return document;
}

bool Database::store_document(StoredDocument const &document)
{
    if (!db_)
    {
        return false;
    }
    constexpr char const *sql =
        "INSERT OR REPLACE INTO accounting_state (id, version, payload, "
        "saved_at) VALUES (1, ?, ?, ?);";
    std::lock_guard<std::mutex> lock(stmt_mutex_);
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    StatementGuard guard(stmt);
    sqlite3_bind_int(stmt, 1, document.version);
    sqlite3_bind_text(stmt, 2, document.payload.c_str(),
                      static_cast<int>(document.payload.size()),
                      SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3,
                       static_cast<sqlite3_int64>(document.saved_at));
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE)
    {
        FL_LOG_WARN("accounting state write failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool Database::clear_document()
{
    return execute("DELETE FROM accounting_state;");
}

} // namespace fl::storage
