#include "trellis/db.hpp"
#include "trellis/log.hpp"
#include <cctype>
#include <sstream>
#include <type_traits>

namespace trellis {

namespace {

// Finalizes a prepared statement on scope exit
struct statement_guard {
    sqlite3_stmt* stmt;
    ~statement_guard() { sqlite3_finalize(stmt); }
};

// Closes a secondary connection on scope exit
struct connection_guard {
    sqlite3* db = nullptr;
    ~connection_guard() { if (db) sqlite3_close(db); }
};

void run_backup(sqlite3* dest, sqlite3* src) {
    sqlite3_backup* backup = sqlite3_backup_init(dest, "main", src, "main");
    if (!backup) {
        throw db_error(sqlite3_errmsg(dest));
    }
    int rc = sqlite3_backup_step(backup, -1);
    sqlite3_backup_finish(backup);
    if (rc != SQLITE_DONE) {
        throw db_error(sqlite3_errmsg(dest));
    }
}

} // namespace

database::database(const std::string& path) : path_(path) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "Failed to open %s: %s", path.c_str(), error.c_str());
        throw db_error("Failed to open database: " + error);
    }

    // Set busy timeout to handle lock contention (5 seconds)
    sqlite3_busy_timeout(db_, 5000);
    LOG_INFO("db", "Opened %s", path.c_str());
}

database::~database() {
    if (db_) {
        sqlite3_close(db_);
        LOG_INFO("db", "Closed %s", path_.c_str());
    }
}

database::database(database&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)) {
    other.db_ = nullptr;
}

database& database::operator=(database&& other) noexcept {
    if (this != &other) {
        if (db_) {
            sqlite3_close(db_);
        }
        db_ = other.db_;
        path_ = std::move(other.path_);
        other.db_ = nullptr;
    }
    return *this;
}

sqlite3_stmt* database::prepare(const std::string& sql, const char* what) const {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("db", "Failed to prepare %s: %s (SQL: %s)", what, error.c_str(), sql.c_str());
        throw db_error(error);
    }
    return stmt;
}

void database::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    if (params.empty()) {
        // Fast path for parameterless statements
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string error = errmsg ? errmsg : "Unknown error";
            sqlite3_free(errmsg);
            LOG_ERROR("db", "SQL execution failed: %s (SQL: %s)", error.c_str(), sql.c_str());
            throw db_error(error);
        }
        return;
    }

    statement_guard guard{prepare(sql, "statement")};
    int index = 1;
    for (const auto& param : params) {
        bind_value(guard.stmt, index++, param);
    }

    int rc = sqlite3_step(guard.stmt);
    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("db", "Execution failed: %s (SQL: %s)", error.c_str(), sql.c_str());
        throw db_error(error);
    }
}

bool database::table_exists(const std::string& name) const {
    return query_value("SELECT name FROM sqlite_master WHERE type='table' AND name=?", {name})
        .has_value();
}

std::unordered_map<std::string, std::string> database::get_table_info(const std::string& table) const {
    std::unordered_map<std::string, std::string> columns;

    // PRAGMA table_info returns: cid, name, type, notnull, dflt_value, pk
    for (auto& row : query("PRAGMA table_info(" + table + ")")) {
        auto* name = std::get_if<std::string>(&row["name"]);
        auto* type = std::get_if<std::string>(&row["type"]);
        if (!name) continue;

        std::string type_str = type ? *type : std::string();
        for (char& c : type_str) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        columns[*name] = type_str;
    }
    return columns;
}

void database::create_table(const table_schema& schema) {
    std::ostringstream sql;
    sql << "CREATE TABLE IF NOT EXISTS " << schema.name
        << " (id INTEGER PRIMARY KEY AUTOINCREMENT";

    for (const auto& col : schema.columns) {
        if (col.name == "id") continue;
        sql << ", " << col.name << " " << sql_type_name(col.type);
    }

    sql << ")";
    execute(sql.str());
}

void database::ensure_table(const table_schema& schema) {
    if (!table_exists(schema.name)) {
        LOG_DEBUG("db", "Creating table %s", schema.name.c_str());
        create_table(schema);
    }
}

void database::bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value) const {
    std::visit([&](auto&& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            sqlite3_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            sqlite3_bind_double(stmt, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            sqlite3_bind_text(stmt, index, v.c_str(), -1, SQLITE_TRANSIENT);
        } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
            if (v.empty()) {
                sqlite3_bind_zeroblob(stmt, index, 0);
            } else {
                sqlite3_bind_blob(stmt, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        }
    }, value);
}

column_value_t database::extract_column(sqlite3_stmt* stmt, int index) const {
    int type = sqlite3_column_type(stmt, index);
    switch (type) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            return std::string(text ? text : "");
        }
        case SQLITE_BLOB: {
            const void* data = sqlite3_column_blob(stmt, index);
            int size = sqlite3_column_bytes(stmt, index);
            const uint8_t* bytes = static_cast<const uint8_t*>(data);
            return std::vector<uint8_t>(bytes, bytes + size);
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

primary_key_t database::insert(const std::string& table,
                               const std::vector<std::pair<std::string, column_value_t>>& values) {
    if (values.empty()) {
        return insert_default(table);
    }

    std::ostringstream sql;
    sql << "INSERT INTO " << table << " (";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) sql << ", ";
        sql << values[i].first;
    }
    sql << ") VALUES (";
    for (size_t i = 0; i < values.size(); ++i) {
        sql << (i > 0 ? ", ?" : "?");
    }
    sql << ")";

    statement_guard guard{prepare(sql.str(), "insert")};
    int index = 1;
    for (const auto& [_, val] : values) {
        bind_value(guard.stmt, index++, val);
    }

    if (sqlite3_step(guard.stmt) != SQLITE_DONE) {
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("db", "Insert into %s failed: %s", table.c_str(), error.c_str());
        throw db_error(error);
    }
    return sqlite3_last_insert_rowid(db_);
}

primary_key_t database::insert_default(const std::string& table) {
    execute("INSERT INTO " + table + " DEFAULT VALUES");
    return sqlite3_last_insert_rowid(db_);
}

int database::update(const std::string& table,
                     primary_key_t id,
                     const std::vector<std::pair<std::string, column_value_t>>& values) {
    if (values.empty()) return 0;

    std::ostringstream sql;
    sql << "UPDATE " << table << " SET ";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) sql << ", ";
        sql << values[i].first << " = ?";
    }
    sql << " WHERE id = ?";

    statement_guard guard{prepare(sql.str(), "update")};
    int index = 1;
    for (const auto& [_, val] : values) {
        bind_value(guard.stmt, index++, val);
    }
    sqlite3_bind_int64(guard.stmt, index, id);

    if (sqlite3_step(guard.stmt) != SQLITE_DONE) {
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("db", "Update of %s failed: %s", table.c_str(), error.c_str());
        throw db_error(error);
    }
    return sqlite3_changes(db_);
}

int database::remove(const std::string& table, primary_key_t id) {
    statement_guard guard{prepare("DELETE FROM " + table + " WHERE id = ?", "delete")};
    sqlite3_bind_int64(guard.stmt, 1, id);

    if (sqlite3_step(guard.stmt) != SQLITE_DONE) {
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("db", "Delete from %s failed: %s", table.c_str(), error.c_str());
        throw db_error(error);
    }
    return sqlite3_changes(db_);
}

std::vector<database::row_t> database::query(const std::string& sql,
                                             const std::vector<column_value_t>& params) const {
    statement_guard guard{prepare(sql, "query")};

    int index = 1;
    for (const auto& param : params) {
        bind_value(guard.stmt, index++, param);
    }

    std::vector<row_t> results;
    int col_count = sqlite3_column_count(guard.stmt);

    int rc;
    while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW) {
        row_t row;
        for (int i = 0; i < col_count; ++i) {
            const char* name = sqlite3_column_name(guard.stmt, i);
            row[name] = extract_column(guard.stmt, i);
        }
        results.push_back(std::move(row));
    }

    if (rc != SQLITE_DONE) {
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("db", "Query failed: %s (SQL: %s)", error.c_str(), sql.c_str());
        throw db_error(error);
    }

    return results;
}

std::optional<column_value_t> database::query_value(const std::string& sql,
                                                    const std::vector<column_value_t>& params) const {
    statement_guard guard{prepare(sql, "query")};

    int index = 1;
    for (const auto& param : params) {
        bind_value(guard.stmt, index++, param);
    }

    int rc = sqlite3_step(guard.stmt);
    if (rc == SQLITE_ROW) {
        return extract_column(guard.stmt, 0);
    }
    if (rc != SQLITE_DONE) {
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("db", "Query failed: %s (SQL: %s)", error.c_str(), sql.c_str());
        throw db_error(error);
    }
    return std::nullopt;
}

void database::begin_transaction() {
    execute("BEGIN IMMEDIATE");
}

void database::commit() {
    execute("COMMIT");
}

void database::rollback() {
    execute("ROLLBACK");
}

void database::backup_to(const std::string& path) {
    connection_guard dest;
    if (sqlite3_open_v2(path.c_str(), &dest.db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr) != SQLITE_OK) {
        std::string error = dest.db ? sqlite3_errmsg(dest.db) : "out of memory";
        throw db_error("Failed to open backup target: " + error);
    }
    run_backup(dest.db, db_);
    LOG_INFO("db", "Backed up %s to %s", path_.c_str(), path.c_str());
}

void database::restore_from(const std::string& path) {
    connection_guard src;
    if (sqlite3_open_v2(path.c_str(), &src.db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
        std::string error = src.db ? sqlite3_errmsg(src.db) : "out of memory";
        throw db_error("Failed to open restore source: " + error);
    }
    run_backup(db_, src.db);
    LOG_INFO("db", "Restored %s from %s", path_.c_str(), path.c_str());
}

// Transaction RAII guard
transaction::transaction(database& db) : db_(db) {
    db_.begin_transaction();
}

transaction::~transaction() {
    if (!completed_) {
        try {
            db_.rollback();
        } catch (const db_error& e) {
            LOG_ERROR("db", "Rollback failed: %s", e.what());
        }
    }
}

void transaction::commit() {
    db_.commit();
    completed_ = true;
}

} // namespace trellis
