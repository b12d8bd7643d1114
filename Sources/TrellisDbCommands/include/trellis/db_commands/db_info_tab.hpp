#pragma once

#include <trellis/tui/tab.hpp>

namespace trellis::db_commands {

/// Shows the `db info` text. Stateless.
class db_info_tab : public tui::tab_impl {
public:
    std::string title(context& ctx, tui::tab_id id) const override;
    void render(context& ctx, tui::canvas& out, const tui::rect& area, tui::tab_id id) override;
    std::vector<tui::key_bind> keybinds(context& ctx, tui::tab_id id) const override;
    void handle_key(context& ctx, const std::string& bind_name, tui::tab_id id) override;
};

} // namespace trellis::db_commands
