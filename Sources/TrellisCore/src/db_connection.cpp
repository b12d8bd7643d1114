#include "trellis/db_connection.hpp"
#include "trellis/log.hpp"
#include <cstdlib>
#include <system_error>

namespace fs = std::filesystem;

namespace trellis {

db_connection::db_connection(std::unique_ptr<database> db,
                             std::optional<fs::path> path,
                             std::vector<table_config> tables)
    : db_(std::move(db)), path_(std::move(path)), tables_(std::move(tables)) {}

db_connection db_connection::open_in_memory(std::vector<table_config> tables) {
    db_connection conn(std::make_unique<database>(":memory:"), std::nullopt, std::move(tables));
    conn.setup_tables();
    return conn;
}

db_connection db_connection::open_from_path(const fs::path& path, std::vector<table_config> tables) {
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw file_error("could not create directory " + path.parent_path().string() + ": " + ec.message());
        }
    }
    db_connection conn(std::make_unique<database>(path.string()), path, std::move(tables));
    conn.setup_tables();
    return conn;
}

fs::path db_connection::default_db_path(const std::string& app_name) {
    fs::path base;
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        base = fs::path(home) / ".local" / "share";
    } else {
        throw file_error("could not determine the data directory (neither XDG_DATA_HOME nor HOME is set)");
    }
    return base / app_name / "data" / "data.db";
}

void db_connection::setup_tables() {
    auto& db = checked_db();
    for (const auto& table : tables_) {
        LOG_DEBUG("db", "Setting up table %s", table.table_name.c_str());
        table.setup(db, table.table_name);
    }
}

database& db_connection::checked_db() const {
    if (!db_) {
        throw no_connection_error();
    }
    return *db_;
}

const table_config* db_connection::find_table(const std::string& name) const {
    for (const auto& table : tables_) {
        if (table.table_name == name) {
            return &table;
        }
    }
    return nullptr;
}

void db_connection::delete_db() {
    checked_db();
    db_.reset();

    if (!path_) {
        LOG_INFO("db", "Closed in-memory database");
        return;
    }

    const std::string base = path_->string();
    for (const std::string& file : {base, base + "-wal", base + "-shm"}) {
        std::error_code ec;
        fs::remove(file, ec);
        if (ec) {
            throw file_error("could not delete " + file + ": " + ec.message());
        }
    }
    LOG_INFO("db", "Deleted database %s", base.c_str());
}

row_id db_connection::new_row_in_table(const std::string& table) {
    return row_id(checked_db().insert_default(table));
}

void db_connection::remove_row_in_table(const std::string& table, row_id id) {
    int removed = checked_db().remove(table, id.value);
    if (removed == 0) {
        LOG_DEBUG("db", "No row %lld in %s to remove", static_cast<long long>(id.value), table.c_str());
    }
}

std::vector<row_id> db_connection::get_table_row_ids(const std::string& table) const {
    std::vector<row_id> ids;
    for (auto& row : checked_db().query("SELECT id FROM " + table + " ORDER BY id")) {
        if (auto* id = std::get_if<int64_t>(&row["id"])) {
            ids.emplace_back(*id);
        }
    }
    return ids;
}

void db_connection::set_field_value(const std::string& table, row_id id, const std::string& field,
                                    const column_value_t& value) {
    checked_db().update(table, id.value, {{field, value}});
}

column_value_t db_connection::get_field_value(const std::string& table, row_id id,
                                              const std::string& field) const {
    auto value = checked_db().query_value("SELECT " + field + " FROM " + table + " WHERE id = ?", {id.value});
    if (!value) {
        throw db_error("Query returned no rows");
    }
    return std::move(*value);
}

std::optional<column_value_t> db_connection::try_get_field_value(const std::string& table, row_id id,
                                                                 const std::string& field) const {
    auto& db = checked_db();
    if (db.get_table_info(table).count(field) == 0) {
        return std::nullopt;
    }
    return db.query_value("SELECT " + field + " FROM " + table + " WHERE id = ?", {id.value});
}

void db_connection::backup(const fs::path& path) {
    auto& db = checked_db();
    if (path.has_parent_path()) {
        std::error_code ec;
        bool found = fs::exists(path.parent_path(), ec);
        if (ec) {
            throw file_error("cannot access " + path.parent_path().string() + ": " + ec.message());
        }
        if (!found) {
            throw file_error("directory does not exist: " + path.parent_path().string());
        }
    }
    db.backup_to(path.string());
}

void db_connection::restore(const fs::path& path) {
    auto& db = checked_db();
    std::error_code ec;
    bool found = fs::exists(path, ec);
    if (ec) {
        throw file_error("cannot access " + path.string() + ": " + ec.message());
    }
    if (!found) {
        throw file_error("file does not exist: " + path.string());
    }
    db.restore_from(path.string());
}

} // namespace trellis
