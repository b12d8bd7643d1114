#pragma once

#include "types.hpp"
#include "error.hpp"
#include <sqlite3.h>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace trellis {

/// RAII owner of one SQLite connection.
///
/// Table and column names are interpolated into statement text; values are
/// always bound as parameters.
class database {
public:
    /// Opens (creating if needed) the database at `path`. ":memory:" opens an in-memory database.
    explicit database(const std::string& path);
    ~database();

    // Non-copyable
    database(const database&) = delete;
    database& operator=(const database&) = delete;

    // Moveable
    database(database&& other) noexcept;
    database& operator=(database&& other) noexcept;

    // Schema management
    void create_table(const table_schema& schema);
    void ensure_table(const table_schema& schema);
    bool table_exists(const std::string& name) const;

    // Returns map of column_name -> SQL_TYPE (uppercase)
    std::unordered_map<std::string, std::string> get_table_info(const std::string& table) const;

    // CRUD operations
    primary_key_t insert(const std::string& table,
                         const std::vector<std::pair<std::string, column_value_t>>& values);

    /// Inserts a row where every column takes its default value.
    primary_key_t insert_default(const std::string& table);

    /// Returns the number of rows changed.
    int update(const std::string& table,
               primary_key_t id,
               const std::vector<std::pair<std::string, column_value_t>>& values);

    /// Returns the number of rows deleted. Zero is not an error.
    int remove(const std::string& table, primary_key_t id);

    // Query - returns rows as vector of column maps
    using row_t = std::unordered_map<std::string, column_value_t>;
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {}) const;

    /// First column of the first row, or nullopt when the query returns no rows.
    std::optional<column_value_t> query_value(const std::string& sql,
                                              const std::vector<column_value_t>& params = {}) const;

    // Transaction support
    void begin_transaction();
    void commit();
    void rollback();

    // Execute SQL with optional params (for INSERT/UPDATE/DELETE without return)
    void execute(const std::string& sql,
                 const std::vector<column_value_t>& params = {});

    // Online backup API
    void backup_to(const std::string& path);
    void restore_from(const std::string& path);

    const std::string& path() const { return path_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;

    void bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value) const;
    column_value_t extract_column(sqlite3_stmt* stmt, int index) const;
    sqlite3_stmt* prepare(const std::string& sql, const char* what) const;
};

// RAII transaction guard
class transaction {
public:
    explicit transaction(database& db);
    ~transaction();

    transaction(const transaction&) = delete;
    transaction& operator=(const transaction&) = delete;

    void commit();

private:
    database& db_;
    bool completed_ = false;
};

} // namespace trellis
