#include "trellis/db_commands/db_commands_plugin.hpp"
#include "trellis/db_commands/db_info_tab.hpp"
#include "trellis/db_commands/edit_table_tab.hpp"
#include <trellis/log.hpp>
#include <trellis/table_builder.hpp>
#include <trellis/tui/session.hpp>
#include <trellis/tui/tab.hpp>
#include <filesystem>
#include <sstream>

namespace trellis::db_commands {

namespace {

// Debug form of a path: quoted, with quotes and backslashes escaped
std::string quoted(const std::filesystem::path& path) {
    std::ostringstream out;
    out << path;
    return out.str();
}

// MARK: - Handlers

command_response process_new_command(context& ctx, const arg_matches& matches) {
    std::string table = matches.get_string("table");
    row_id id = ctx.connection().new_row_in_table(table);
    return command_response::message(
        "Inserted new row (id: " + id.to_string() + ") in table " + table + ".");
}

command_response process_remove_command(context& ctx, const arg_matches& matches) {
    std::string table = matches.get_string("table");
    row_id id(matches.get_integer("row-id"));
    ctx.connection().remove_row_in_table(table, id);
    return command_response::none();
}

command_response process_set_command(context& ctx, const arg_matches& matches) {
    std::string table = matches.get_string("table");
    row_id id(matches.get_integer("row-id"));
    std::string field = matches.get_string("field");
    std::string value = matches.get_string("value");
    ctx.connection().set_field_in_table(table, id, field, value);
    return command_response::none();
}

command_response process_list_command(context& ctx, const arg_matches& matches) {
    return command_response::message(list_table(ctx.connection(), matches.get_string("table")));
}

command_response process_db_command(context& ctx, const arg_matches& matches) {
    const std::string& sub = matches.subcommand_name();
    const arg_matches* sub_matches = matches.subcommand();

    if (sub == "info") {
        return command_response::message(db_info_text(ctx));
    }
    if (sub == "erase") {
        ctx.connection().delete_db();
        return command_response::none();
    }
    if (sub == "backup" && sub_matches) {
        std::filesystem::path out_file = sub_matches->get_string("out-file");
        ctx.connection().backup(out_file);
        return command_response::message("Database backed up to " + quoted(out_file) + ".");
    }
    if (sub == "restore" && sub_matches) {
        std::filesystem::path file = sub_matches->get_string("file");
        ctx.connection().restore(file);
        return command_response::message("Database restored from " + quoted(file) + ".");
    }
    throw command_error("subcommand not recognized: " + sub);
}

command_response process_edit_command(context& ctx, const arg_matches& matches) {
    std::string table = matches.get_string("table");
    if (!ctx.connection().find_table(table)) {
        throw db_error("table does not exist: " + table);
    }
    auto& sess = tui::open_session(ctx);
    sess.set_tab(ctx, sess.tabs().front().id, std::make_shared<edit_table_tab>(table));
    return command_response::message("Starting TUI session...");
}

} // namespace

std::string db_info_text(const context& ctx) {
    const auto* conn = ctx.get_resource<db_connection>();
    if (!conn) {
        throw no_connection_error();
    }

    if (!conn->is_open()) {
        return "No database connection open.";
    }
    std::string text = "Database connection open.\n";
    if (const auto& path = conn->db_path()) {
        text += "Database path: " + quoted(*path);
    } else {
        text += "No database path (in-memory connection)";
    }
    return text;
}

std::string list_table(const db_connection& conn, const std::string& table) {
    auto ids = conn.get_table_row_ids(table);
    if (ids.empty()) {
        return "No entries in table " + table + ".";
    }

    const table_config* config = conn.find_table(table);
    if (!config) {
        throw db_error("table does not exist: " + table);
    }

    table_builder builder;
    config->push_tabled_header(builder);
    for (row_id id : ids) {
        config->push_tabled_record(builder, conn, table, id);
    }
    return builder.build();
}

void db_commands_plugin::build(context& ctx) {
    ctx.add_command(
        command_def("new", "Add a new row to a table")
            .arg(arg_def::text("table", "Name of the table to add a row in").require()),
        process_new_command);

    ctx.add_command(
        command_def("remove", "Removes a row from a table")
            .alias("rm")
            .arg(arg_def::text("table", "Name of the table to remove a row from").require())
            .arg(arg_def::integer("row-id", "Row ID to remove").require()),
        process_remove_command);

    ctx.add_command(
        command_def("set", "Sets a field in the given table and row.")
            .arg(arg_def::text("table", "Name of the table to modify").require())
            .arg(arg_def::integer("row-id", "Row ID to modify").require())
            .arg(arg_def::text("field", "Name of the field to modify").require())
            .arg(arg_def::text("value", "Value to set the field to").require()),
        process_set_command);

    ctx.add_command(
        command_def("list", "Lists the rows of a table")
            .alias("ls")
            .arg(arg_def::text("table", "Name of the table to list rows from").require()),
        process_list_command);

    ctx.add_command(
        command_def("db", "View and update database configuration")
            .subcommand(command_def("info", "Prints information about the database"))
            .subcommand(command_def("erase", "Erases the database"))
            .subcommand(command_def("backup", "Copies the database to a new file")
                .arg(arg_def::text("out-file", "File path to copy the database to (will be overwritten)").require()))
            .subcommand(command_def("restore", "Restores the database from a given file")
                .arg(arg_def::text("file", "File path to restore the database from").require()))
            .require_subcommand(),
        process_db_command);

    if (ctx.has_resource<tui::tab_catalog>()) {
        tui::register_tab_kind<db_info_tab>(ctx, "Database Info");
        tui::register_tab_kind<edit_table_tab>(ctx, "Edit Table");
        ctx.add_command(
            command_def("edit", "Opens a TUI session editing a table")
                .arg(arg_def::text("table", "Name of the table to edit").require()),
            process_edit_command);
    } else {
        LOG_DEBUG("db_commands", "No tab catalog; skipping TUI tabs");
    }
}

} // namespace trellis::db_commands
