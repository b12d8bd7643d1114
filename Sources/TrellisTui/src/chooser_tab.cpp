#include "trellis/tui/chooser_tab.hpp"
#include "trellis/tui/session.hpp"
#include <algorithm>

namespace trellis::tui {

std::string chooser_tab::title(context&, tab_id) const {
    return "New Tab";
}

void chooser_tab::render(context& ctx, canvas& out, const rect& area, tab_id id) {
    const auto* catalog = ctx.get_resource<tab_catalog>();
    if (!catalog || catalog->empty()) {
        out.put(area.x, area.y, "No creatable tab types.", cell_style::normal, area.width);
        return;
    }

    auto& st = state(ctx, id);
    const auto& kinds = catalog->kinds();
    for (size_t i = 0; i < kinds.size() && static_cast<int>(i) < area.height; ++i) {
        bool highlighted = i == st.selected;
        out.put(area.x, area.y + static_cast<int>(i),
                (highlighted ? "> " : "  ") + kinds[i].name,
                highlighted ? cell_style::reverse : cell_style::normal, area.width);
    }
}

std::vector<key_bind> chooser_tab::keybinds(context& ctx, tab_id) const {
    const auto* catalog = ctx.get_resource<tab_catalog>();
    if (!catalog || catalog->empty()) {
        return {};
    }
    return {
        {"up", key_event::special(key_code::up), "Up"},
        {"down", key_event::special(key_code::down), "Down"},
        {"open", key_event::special(key_code::enter), "Open"}
    };
}

void chooser_tab::handle_key(context& ctx, const std::string& bind_name, tab_id id) {
    const auto* catalog = ctx.get_resource<tab_catalog>();
    if (!catalog || catalog->empty()) return;

    auto& st = state(ctx, id);
    const size_t count = catalog->kinds().size();
    if (bind_name == "up") {
        st.selected = st.selected == 0 ? count - 1 : st.selected - 1;
    } else if (bind_name == "down") {
        st.selected = (st.selected + 1) % count;
    } else if (bind_name == "open") {
        auto* sess = ctx.get_resource<session>();
        if (!sess) return;
        // set_tab destroys this tab's state; nothing below may touch `st`
        auto replacement = catalog->kinds()[std::min(st.selected, count - 1)].create();
        sess->set_tab(ctx, id, std::move(replacement));
    }
}

} // namespace trellis::tui
