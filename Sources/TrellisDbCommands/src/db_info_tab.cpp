#include "trellis/db_commands/db_info_tab.hpp"
#include "trellis/db_commands/db_commands_plugin.hpp"

namespace trellis::db_commands {

std::string db_info_tab::title(context&, tui::tab_id) const {
    return "Database Info";
}

void db_info_tab::render(context& ctx, tui::canvas& out, const tui::rect& area, tui::tab_id) {
    std::string text;
    try {
        text = db_info_text(ctx);
    } catch (const no_connection_error&) {
        text = "No database connection open.";
    }

    int y = area.y;
    size_t start = 0;
    while (start <= text.size() && y < area.y + area.height) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) end = text.size();
        out.put(area.x, y++, std::string_view(text).substr(start, end - start), tui::cell_style::normal, area.width);
        start = end + 1;
    }
}

std::vector<tui::key_bind> db_info_tab::keybinds(context&, tui::tab_id) const {
    return {};
}

void db_info_tab::handle_key(context&, const std::string&, tui::tab_id) {}

} // namespace trellis::db_commands
