#pragma once

#include "tab.hpp"

namespace trellis::tui {

struct chooser_state {
    size_t selected = 0;
};

/// The "new tab" view: lists the catalog and turns itself into the chosen kind.
class chooser_tab : public basic_tab<chooser_state> {
public:
    std::string title(context& ctx, tab_id id) const override;
    void render(context& ctx, canvas& out, const rect& area, tab_id id) override;
    std::vector<key_bind> keybinds(context& ctx, tab_id id) const override;
    void handle_key(context& ctx, const std::string& bind_name, tab_id id) override;
};

} // namespace trellis::tui
