#pragma once

#include <trellis/context.hpp>
#include <string>

namespace trellis::db_commands {

/// Row and database maintenance commands:
///   new, remove|rm, set, list|ls, db {info, erase, backup, restore}
/// and, when tui_plugin ran first, the `edit` command plus the
/// "Database Info" and "Edit Table" tab kinds.
class db_commands_plugin : public plugin {
public:
    void build(context& ctx) override;
};

/// Text of `db info`. Throws no_connection_error before startup.
std::string db_info_text(const context& ctx);

/// `list` output for one table.
std::string list_table(const db_connection& conn, const std::string& table);

} // namespace trellis::db_commands
