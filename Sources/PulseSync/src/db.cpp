#include "pulsesync/db.hpp"
#include "pulsesync/log.hpp"
#include <type_traits>

namespace pulsesync {

namespace {

db_error make_error(sqlite3* db, const std::string& context) {
    int code = db ? sqlite3_errcode(db) : SQLITE_NOMEM;
    std::string message = db ? sqlite3_errmsg(db) : "out of memory";
    return db_error(context + ": " + message, code & 0xff);
}

} // anonymous namespace

// ============================================================================
// statement
// ============================================================================

statement::statement(sqlite3* db, const std::string& sql) : db_(db) {
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
        LOG_ERROR("db", "%s in %s", sqlite3_errmsg(db_), sql.c_str());
        throw make_error(db_, "Failed to prepare statement");
    }
}

statement::~statement() {
    sqlite3_finalize(stmt_);
}

void statement::bind(const std::vector<sql_value>& params) {
    int index = 1;
    for (const auto& param : params) {
        int rc = std::visit([&](auto&& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                return sqlite3_bind_null(stmt_, index);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return sqlite3_bind_int64(stmt_, index, v);
            } else {
                return sqlite3_bind_text(stmt_, index, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        }, param);
        if (rc != SQLITE_OK) {
            throw make_error(db_, "Failed to bind parameter " + std::to_string(index));
        }
        ++index;
    }
}

bool statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw make_error(db_, "Statement failed");
}

std::optional<std::string> statement::column_text(int index) const {
    if (sqlite3_column_type(stmt_, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, index));
    int size = sqlite3_column_bytes(stmt_, index);
    return text ? std::string(text, static_cast<size_t>(size)) : std::string();
}

int64_t statement::column_int(int index) const {
    return sqlite3_column_int64(stmt_, index);
}

// ============================================================================
// database
// ============================================================================

database::database(const std::string& path) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        db_error error = make_error(db_, "Failed to open database " + path);
        LOG_ERROR("db", "%s", error.what());
        sqlite3_close(db_);
        db_ = nullptr;
        throw error;
    }

    sqlite3_busy_timeout(db_, 5000);

    // WAL only makes sense for file databases
    if (path != ":memory:" && !path.empty()) {
        execute("PRAGMA journal_mode = WAL");
        execute("PRAGMA synchronous = NORMAL");
    }
}

database::~database() {
    if (db_) {
        sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_TRUNCATE, nullptr, nullptr);
        sqlite3_close(db_);
    }
}

void database::execute(const std::string& sql, const std::vector<sql_value>& params) {
    if (params.empty()) {
        char* errmsg = nullptr;
        if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg) != SQLITE_OK) {
            std::string error = errmsg ? errmsg : "unknown error";
            sqlite3_free(errmsg);
            throw db_error("SQL execution failed: " + error + " (SQL: " + sql + ")",
                           sqlite3_errcode(db_) & 0xff);
        }
        return;
    }

    statement stmt(db_, sql);
    stmt.bind(params);
    while (stmt.step()) {}
}

std::vector<std::string> database::query_column(const std::string& sql,
                                                const std::vector<sql_value>& params) {
    statement stmt(db_, sql);
    stmt.bind(params);

    std::vector<std::string> values;
    while (stmt.step()) {
        if (auto value = stmt.column_text(0)) {
            values.push_back(std::move(*value));
        }
    }
    return values;
}

std::optional<std::string> database::query_value(const std::string& sql,
                                                 const std::vector<sql_value>& params) {
    statement stmt(db_, sql);
    stmt.bind(params);
    if (!stmt.step()) return std::nullopt;
    return stmt.column_text(0);
}

bool database::table_exists(const std::string& name) {
    return query_value("SELECT name FROM sqlite_master WHERE type='table' AND name=?", {name}).has_value();
}

int database::schema_version() {
    statement stmt(db_, "PRAGMA user_version");
    return stmt.step() ? static_cast<int>(stmt.column_int(0)) : 0;
}

void database::set_schema_version(int version) {
    execute("PRAGMA user_version = " + std::to_string(version));
}

void database::begin_transaction() {
    // IMMEDIATE takes the write lock up front; the busy timeout covers contention.
    execute("BEGIN IMMEDIATE");
}

void database::commit() {
    execute("COMMIT");
}

void database::rollback() {
    execute("ROLLBACK");
}

bool database::is_in_transaction() const {
    return sqlite3_get_autocommit(db_) == 0;
}

// ============================================================================
// transaction
// ============================================================================

transaction::transaction(database& db) : db_(db) {
    db_.begin_transaction();
}

transaction::~transaction() {
    if (!completed_ && db_.is_in_transaction()) {
        try {
            db_.rollback();
        } catch (const db_error& e) {
            LOG_ERROR("db", "Rollback failed in transaction guard: %s", e.what());
        }
    }
}

void transaction::commit() {
    db_.commit();
    completed_ = true;
}

} // namespace pulsesync
