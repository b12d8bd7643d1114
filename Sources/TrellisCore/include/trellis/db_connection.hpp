#pragma once

#include "db.hpp"
#include "table_config.hpp"
#include "table_field.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace trellis {

template<typename T>
struct table_row;

// ============================================================================
// db_connection
//
// The application's relational connection, held as a resource by the
// context after startup. Row operations address a row by table name and
// row_id; typed reads and writes go through table_field<T>.
//
// Every operation throws no_connection_error once the database has been
// deleted with delete_db().
// ============================================================================

class db_connection {
public:
    /// Opens an in-memory database and runs every table's setup.
    static db_connection open_in_memory(std::vector<table_config> tables);

    /// Opens (creating parent directories as needed) the database file at
    /// `path` and runs every table's setup.
    static db_connection open_from_path(const std::filesystem::path& path, std::vector<table_config> tables);

    /// $XDG_DATA_HOME/<app>/data/data.db, else $HOME/.local/share/<app>/data/data.db.
    static std::filesystem::path default_db_path(const std::string& app_name);

    db_connection(db_connection&&) noexcept = default;
    db_connection& operator=(db_connection&&) noexcept = default;

    bool is_open() const { return db_ != nullptr; }

    /// Path of the backing file, or nullopt for an in-memory connection.
    const std::optional<std::filesystem::path>& db_path() const { return path_; }

    const std::vector<table_config>& tables() const { return tables_; }
    const table_config* find_table(const std::string& name) const;

    /// Closes the connection and removes the backing file (with its -wal and
    /// -shm side files). An in-memory connection is just closed.
    void delete_db();

    // MARK: - Rows

    row_id new_row_in_table(const std::string& table);

    /// Removes a row. Removing a row that does not exist is not an error.
    void remove_row_in_table(const std::string& table, row_id id);

    /// All row ids of a table in insertion order.
    std::vector<row_id> get_table_row_ids(const std::string& table) const;

    // MARK: - Fields

    void set_field_value(const std::string& table, row_id id, const std::string& field,
                         const column_value_t& value);

    template<typename V>
    void set_field_in_table(const std::string& table, row_id id, const std::string& field, const V& value) {
        set_field_value(table, id, field, table_field<V>::to_column_value(value));
    }

    /// Raw stored value. Throws db_error when the row or column does not exist.
    column_value_t get_field_value(const std::string& table, row_id id, const std::string& field) const;

    /// Raw stored value, or nullopt when the row or column does not exist.
    std::optional<column_value_t> try_get_field_value(const std::string& table, row_id id,
                                                      const std::string& field) const;

    template<typename F>
    F get_field_in_table_row(const std::string& table, row_id id, const std::string& field) const {
        if constexpr (detail::is_optional<F>::value) {
            auto value = try_get_field_value(table, id, field);
            if (!value) {
                return std::nullopt;
            }
            return table_field<F>::from_column_value(*value);
        } else {
            return table_field<F>::from_column_value(get_field_value(table, id, field));
        }
    }

    // MARK: - Records

    template<typename Row>
    row_id insert_row(const std::string& table, const Row& record) {
        auto& db = checked_db();
        transaction tx(db);
        row_id id(db.insert(table, table_row<Row>::to_values(record)));
        tx.commit();
        return id;
    }

    template<typename Row>
    void update_row(const std::string& table, row_id id, const Row& record) {
        auto& db = checked_db();
        transaction tx(db);
        db.update(table, id.value, table_row<Row>::to_values(record));
        tx.commit();
    }

    template<typename Row>
    Row get_row(const std::string& table, row_id id) const {
        return table_row<Row>::from_table_row(*this, table, id);
    }

    // MARK: - Backup

    /// Copies the live database into `path`, replacing its contents.
    void backup(const std::filesystem::path& path);

    /// Replaces the live database with the contents of the database file at `path`.
    void restore(const std::filesystem::path& path);

    /// Underlying database. Throws no_connection_error when closed.
    database& db() { return checked_db(); }
    const database& db() const { return checked_db(); }

private:
    db_connection(std::unique_ptr<database> db,
                  std::optional<std::filesystem::path> path,
                  std::vector<table_config> tables);

    void setup_tables();
    database& checked_db() const;

    std::unique_ptr<database> db_;
    std::optional<std::filesystem::path> path_;
    std::vector<table_config> tables_;
};

} // namespace trellis
