#include "trellis/db_commands/edit_table_tab.hpp"
#include <trellis/table_field.hpp>
#include <trellis/tui/session.hpp>
#include <algorithm>
#include <cerrno>
#include <cstdlib>

namespace trellis::db_commands {

namespace {

constexpr size_t max_column_width = 24;

void set_input_mode(context& ctx, tui::input_mode mode) {
    if (auto* sess = ctx.get_resource<tui::session>()) {
        sess->set_input_mode(mode);
    }
}

std::vector<std::string> table_names(const db_connection& conn) {
    std::vector<std::string> names;
    for (const auto& t : conn.tables()) {
        names.push_back(t.table_name);
    }
    return names;
}

// Converts edited text to a column value; nullopt if it does not parse
std::optional<column_value_t> parse_cell(const std::string& text, column_type type) {
    if (type == column_type::text) {
        return column_value_t(text);
    }
    if (text.empty()) {
        return column_value_t(nullptr);
    }
    if (type == column_type::integer) {
        if (auto parsed = detail::parse_integer(text)) {
            return column_value_t(*parsed);
        }
        return std::nullopt;
    }
    if (type == column_type::real) {
        errno = 0;
        char* end = nullptr;
        double parsed = std::strtod(text.c_str(), &end);
        if (errno != 0 || end != text.c_str() + text.size()) {
            return std::nullopt;
        }
        return column_value_t(parsed);
    }
    return std::nullopt;
}

std::string fit(const std::string& text, size_t width) {
    if (text.size() <= width) {
        return text + std::string(width - text.size(), ' ');
    }
    return text.substr(0, width - 1) + "~";
}

void render_table_chooser(const db_connection& conn, edit_table_state& st,
                          tui::canvas& out, const tui::rect& area) {
    auto names = table_names(conn);
    if (names.empty()) {
        out.put(area.x, area.y, "No tables.", tui::cell_style::normal, area.width);
        return;
    }
    st.table_cursor = std::min(st.table_cursor, names.size() - 1);
    for (size_t i = 0; i < names.size() && static_cast<int>(i) < area.height; ++i) {
        bool highlighted = i == st.table_cursor;
        out.put(area.x, area.y + static_cast<int>(i), (highlighted ? ">" : " ") + names[i],
                highlighted ? tui::cell_style::reverse : tui::cell_style::normal, area.width);
    }
}

void render_table_view(const db_connection& conn, edit_table_state& st,
                       tui::canvas& out, const tui::rect& area) {
    const std::string& table = *st.table;
    const table_config* config = conn.find_table(table);
    if (!config) {
        out.put(area.x, area.y, "table does not exist: " + table, tui::cell_style::normal, area.width);
        return;
    }

    const auto& columns = config->columns();
    auto ids = conn.get_table_row_ids(table);
    if (!ids.empty()) st.row = std::min(st.row, ids.size() - 1);
    if (!columns.empty()) st.column = std::min(st.column, columns.size() - 1);

    std::vector<std::vector<std::string>> rows;
    rows.reserve(ids.size());
    for (row_id id : ids) {
        rows.push_back(config->fields_as_strings(conn, table, id));
    }

    std::vector<size_t> widths;
    for (size_t c = 0; c < columns.size(); ++c) {
        size_t w = columns[c].name.size();
        for (const auto& row : rows) {
            if (c < row.size()) w = std::max(w, row[c].size());
        }
        widths.push_back(std::min(std::max<size_t>(w, 1), max_column_width));
    }

    const int marker = 3;   // ">> " before the selected row
    int x = area.x + marker;
    for (size_t c = 0; c < columns.size(); ++c) {
        out.put(x, area.y, fit(columns[c].name, widths[c]), tui::cell_style::reverse,
                area.x + area.width - x);
        x += static_cast<int>(widths[c]) + 1;
    }

    // Header line, then rows, then the row count and the edit line
    int visible = std::max(area.height - 3, 0);
    size_t offset = visible > 0 && st.row >= static_cast<size_t>(visible) ? st.row - visible + 1 : 0;
    for (int line = 0; line < visible && offset + line < rows.size(); ++line) {
        size_t r = offset + static_cast<size_t>(line);
        int y = area.y + 1 + line;
        if (r == st.row) out.put(area.x, y, ">>");
        x = area.x + marker;
        for (size_t c = 0; c < columns.size(); ++c) {
            const std::string cell = c < rows[r].size() ? rows[r][c] : std::string();
            bool selected = r == st.row && c == st.column;
            out.put(x, y, fit(cell, widths[c]),
                    selected ? tui::cell_style::reverse : tui::cell_style::normal,
                    area.x + area.width - x);
            x += static_cast<int>(widths[c]) + 1;
        }
    }

    int status_y = area.y + area.height - 2;
    out.put(area.x, status_y, std::to_string(ids.size()) + " rows", tui::cell_style::normal, area.width);

    std::string edit_line;
    if (!st.message.empty()) {
        edit_line = st.message;
    } else if (st.edit_buffer && !columns.empty()) {
        edit_line = columns[st.column].name + ": " + *st.edit_buffer + "_";
    }
    out.put(area.x, status_y + 1, edit_line, tui::cell_style::bold, area.width);
}

} // namespace

edit_table_state edit_table_tab::initial_state(context&) const {
    edit_table_state st;
    st.table = initial_table_;
    return st;
}

std::string edit_table_tab::title(context& ctx, tui::tab_id id) const {
    const auto* arena = ctx.get_resource<tui::tab_state_arena<edit_table_state>>();
    const edit_table_state* st = arena ? arena->find(id) : nullptr;
    if (st && st->table) {
        return "Edit Table: " + *st->table;
    }
    return "Edit Table";
}

void edit_table_tab::render(context& ctx, tui::canvas& out, const tui::rect& area, tui::tab_id id) {
    auto& st = state(ctx, id);
    try {
        const db_connection& conn = ctx.connection();
        if (!st.table) {
            render_table_chooser(conn, st, out, area);
        } else {
            render_table_view(conn, st, out, area);
        }
    } catch (const error& e) {
        out.put(area.x, area.y, describe(e), tui::cell_style::normal, area.width);
    }
}

std::vector<tui::key_bind> edit_table_tab::keybinds(context& ctx, tui::tab_id id) const {
    using tui::key_code;
    using tui::key_event;
    std::vector<tui::key_bind> binds = {
        {"move_up", key_event::special(key_code::up), "Move Up"},
        {"move_down", key_event::special(key_code::down), "Move Down"},
    };

    const auto* arena = ctx.get_resource<tui::tab_state_arena<edit_table_state>>();
    const edit_table_state* st = arena ? arena->find(id) : nullptr;
    if (!st || !st->table) {
        binds.push_back({"select", key_event::special(key_code::enter), "Select"});
        return binds;
    }

    binds.push_back({"move_right", key_event::special(key_code::right), "Move Right"});
    binds.push_back({"move_left", key_event::special(key_code::left), "Move Left"});
    binds.push_back({"select", key_event::special(key_code::enter), "Edit"});
    binds.push_back({"back", key_event::special(key_code::escape), "Back"});
    binds.push_back({"new_row", key_event::character('n', tui::key_modifiers::ctrl), "New Row"});
    binds.push_back({"delete_row", key_event::character('d', tui::key_modifiers::ctrl), "Delete Row"});
    return binds;
}

void edit_table_tab::handle_key(context& ctx, const std::string& bind_name, tui::tab_id id) {
    auto& st = state(ctx, id);
    st.message.clear();

    try {
        if (!st.table) {
            auto names = table_names(ctx.connection());
            if (names.empty()) return;
            if (bind_name == "move_up") {
                st.table_cursor = st.table_cursor == 0 ? 0 : st.table_cursor - 1;
            } else if (bind_name == "move_down") {
                st.table_cursor = std::min(st.table_cursor + 1, names.size() - 1);
            } else if (bind_name == "select") {
                st.table = names[std::min(st.table_cursor, names.size() - 1)];
                st.row = 0;
                st.column = 0;
            }
            return;
        }

        auto& conn = ctx.connection();
        const table_config* config = conn.find_table(*st.table);
        if (!config) {
            throw db_error("table does not exist: " + *st.table);
        }
        auto ids = conn.get_table_row_ids(*st.table);
        const size_t column_count = config->columns().size();

        if (bind_name == "move_up") {
            if (st.row > 0) --st.row;
        } else if (bind_name == "move_down") {
            if (st.row + 1 < ids.size()) ++st.row;
        } else if (bind_name == "move_left") {
            if (st.column > 0) --st.column;
        } else if (bind_name == "move_right") {
            if (st.column + 1 < column_count) ++st.column;
        } else if (bind_name == "select") {
            if (ids.empty() || column_count == 0) {
                st.message = "No row selected.";
                return;
            }
            auto current = config->fields_as_strings(conn, *st.table, ids[st.row]);
            st.edit_buffer = st.column < current.size() ? current[st.column] : std::string();
            set_input_mode(ctx, tui::input_mode::text);
        } else if (bind_name == "back") {
            st.table.reset();
            st.edit_buffer.reset();
        } else if (bind_name == "new_row") {
            conn.new_row_in_table(*st.table);
            st.row = ids.size();
        } else if (bind_name == "delete_row") {
            if (!ids.empty()) {
                conn.remove_row_in_table(*st.table, ids[std::min(st.row, ids.size() - 1)]);
                if (st.row > 0 && st.row + 1 >= ids.size()) --st.row;
            }
        }
    } catch (const error& e) {
        st.message = describe(e);
    }
}

void edit_table_tab::handle_text(context& ctx, const tui::key_event& ev, tui::tab_id id) {
    auto& st = state(ctx, id);
    if (!st.edit_buffer || !st.table) {
        set_input_mode(ctx, tui::input_mode::bind);
        return;
    }

    if (ev.code == tui::key_code::escape) {
        st.edit_buffer.reset();
        st.message.clear();
        set_input_mode(ctx, tui::input_mode::bind);
        return;
    }

    if (ev.code == tui::key_code::backspace) {
        if (!st.edit_buffer->empty()) st.edit_buffer->pop_back();
        return;
    }

    if (ev.code == tui::key_code::character && ev.modifiers == tui::key_modifiers::none) {
        st.edit_buffer->push_back(ev.ch);
        st.message.clear();
        return;
    }

    if (ev.code != tui::key_code::enter) {
        return;
    }

    try {
        auto& conn = ctx.connection();
        const table_config* config = conn.find_table(*st.table);
        auto ids = conn.get_table_row_ids(*st.table);
        if (!config || ids.empty() || st.column >= config->columns().size()) {
            throw db_error("no cell selected");
        }
        const auto& column = config->columns()[st.column];
        auto value = parse_cell(*st.edit_buffer, column.type);
        if (!value) {
            st.message = "Invalid value for " + column.name + " (" + sql_type_name(column.type) + ")";
            return;
        }
        conn.set_field_value(*st.table, ids[std::min(st.row, ids.size() - 1)], column.name, *value);
        st.message.clear();
    } catch (const error& e) {
        st.message = describe(e);
    }
    st.edit_buffer.reset();
    set_input_mode(ctx, tui::input_mode::bind);
}

} // namespace trellis::db_commands
