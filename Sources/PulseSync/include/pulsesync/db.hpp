#pragma once

#ifdef __cplusplus

#include <sqlite3.h>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace pulsesync {

// Values bound to statement parameters
using sql_value = std::variant<std::nullptr_t, int64_t, std::string>;

class db_error : public std::runtime_error {
public:
    db_error(const std::string& msg, int code = SQLITE_ERROR)
        : std::runtime_error(msg), code_(code) {}

    /// Primary SQLite result code (SQLITE_FULL, SQLITE_BUSY, ...)
    int code() const noexcept { return code_; }

private:
    int code_;
};

// ============================================================================
// statement - prepared statement, finalized on destruction
// ============================================================================

class statement {
public:
    statement(sqlite3* db, const std::string& sql);
    ~statement();

    statement(const statement&) = delete;
    statement& operator=(const statement&) = delete;

    void bind(const std::vector<sql_value>& params);

    // Advances to the next row. Returns false once the statement is done.
    bool step();

    std::optional<std::string> column_text(int index) const;
    int64_t column_int(int index) const;

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

// ============================================================================
// database - one SQLite connection
// ============================================================================

class database {
public:
    explicit database(const std::string& path);
    ~database();

    database(const database&) = delete;
    database& operator=(const database&) = delete;

    void execute(const std::string& sql, const std::vector<sql_value>& params = {});

    // First column of every row, as text (NULL rows are skipped)
    std::vector<std::string> query_column(const std::string& sql,
                                          const std::vector<sql_value>& params = {});

    // First column of the first row, if any
    std::optional<std::string> query_value(const std::string& sql,
                                           const std::vector<sql_value>& params = {});

    bool table_exists(const std::string& name);

    // PRAGMA user_version, used for schema migrations
    int schema_version();
    void set_schema_version(int version);

    void begin_transaction();
    void commit();
    void rollback();
    bool is_in_transaction() const;

private:
    sqlite3* db_ = nullptr;
};

// RAII transaction guard: rolls back unless committed
class transaction {
public:
    explicit transaction(database& db);
    ~transaction();

    void commit();

private:
    database& db_;
    bool completed_ = false;
};

} // namespace pulsesync

#endif // __cplusplus
