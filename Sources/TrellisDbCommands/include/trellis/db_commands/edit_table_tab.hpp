#pragma once

#include <trellis/tui/tab.hpp>
#include <optional>
#include <string>

namespace trellis::db_commands {

struct edit_table_state {
    std::optional<std::string> table;   // nullopt while choosing a table
    size_t table_cursor = 0;
    size_t row = 0;
    size_t column = 0;
    std::optional<std::string> edit_buffer;   // set while a cell is being edited
    std::string message;
};

/// Browses and edits the rows of one registered table.
///
/// Without a table it lists the registered tables to choose from. In the
/// table view, Enter edits the selected cell in text input mode; Enter
/// again writes the value, Esc cancels.
class edit_table_tab : public tui::basic_tab<edit_table_state> {
public:
    edit_table_tab() = default;
    explicit edit_table_tab(std::string table) : initial_table_(std::move(table)) {}

    std::string title(context& ctx, tui::tab_id id) const override;
    void render(context& ctx, tui::canvas& out, const tui::rect& area, tui::tab_id id) override;
    std::vector<tui::key_bind> keybinds(context& ctx, tui::tab_id id) const override;
    void handle_key(context& ctx, const std::string& bind_name, tui::tab_id id) override;
    void handle_text(context& ctx, const tui::key_event& ev, tui::tab_id id) override;

protected:
    edit_table_state initial_state(context& ctx) const override;

private:
    std::optional<std::string> initial_table_;
};

} // namespace trellis::db_commands
