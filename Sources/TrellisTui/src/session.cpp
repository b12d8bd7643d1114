#include "trellis/tui/session.hpp"
#include "trellis/tui/chooser_tab.hpp"
#include <trellis/log.hpp>

namespace trellis::tui {

// ============================================================================
// Tabs
// ============================================================================

tab_id session::add_tab(context& ctx, std::shared_ptr<tab_impl> impl) {
    tab_id id = next_id_++;
    impl->create_state(ctx, id);
    tabs_.push_back(tab_entry{id, std::move(impl)});
    LOG_DEBUG("tui", "Added tab %zu", id);
    return id;
}

void session::set_tab(context& ctx, tab_id id, std::shared_ptr<tab_impl> impl) {
    tab_entry* entry = find(id);
    if (!entry) {
        throw std::logic_error("no tab with id " + std::to_string(id));
    }
    // The outgoing impl may be the caller; keep it alive until we return
    auto previous = std::move(entry->impl);
    previous->destroy_state(ctx, id);
    impl->create_state(ctx, id);
    entry->impl = std::move(impl);
}

tab_id session::new_tab(context& ctx) {
    tab_id id = add_tab<chooser_tab>(ctx);
    selected_ = tabs_.size() - 1;
    return id;
}

void session::close_tab(context& ctx, tab_id id) {
    for (size_t i = 0; i < tabs_.size(); ++i) {
        if (tabs_[i].id != id) continue;

        auto impl = tabs_[i].impl;
        impl->destroy_state(ctx, id);
        tabs_.erase(tabs_.begin() + static_cast<std::ptrdiff_t>(i));

        if (i < selected_) {
            --selected_;
        }
        if (tabs_.empty()) {
            selected_ = 0;
            new_tab(ctx);
        } else if (selected_ >= tabs_.size()) {
            selected_ = tabs_.size() - 1;
        }
        return;
    }
}

void session::clear_tab(context& ctx, tab_id id) {
    set_tab(ctx, id, std::make_shared<chooser_tab>());
}

void session::close_all(context& ctx) {
    for (auto& entry : tabs_) {
        entry.impl->destroy_state(ctx, entry.id);
    }
    tabs_.clear();
    selected_ = 0;
}

void session::select_next() {
    if (tabs_.empty()) return;
    selected_ = (selected_ + 1) % tabs_.size();
}

void session::select_prev() {
    if (tabs_.empty()) return;
    selected_ = selected_ == 0 ? tabs_.size() - 1 : selected_ - 1;
}

bool session::select(tab_id id) {
    for (size_t i = 0; i < tabs_.size(); ++i) {
        if (tabs_[i].id == id) {
            selected_ = i;
            return true;
        }
    }
    return false;
}

const tab_entry* session::selected() const {
    if (tabs_.empty()) return nullptr;
    return &tabs_[selected_];
}

tab_entry* session::find(tab_id id) {
    for (auto& entry : tabs_) {
        if (entry.id == id) return &entry;
    }
    return nullptr;
}

const std::vector<key_bind>& session::global_keybinds() {
    static const std::vector<key_bind> binds = {
        {"quit", key_event::character('q'), "Quit"},
        {"prev_tab", key_event::special(key_code::left, key_modifiers::ctrl), "Prev Tab"},
        {"next_tab", key_event::special(key_code::right, key_modifiers::ctrl), "Next Tab"},
        {"new_tab", key_event::character('t', key_modifiers::ctrl), "New Tab"},
        {"close_tab", key_event::character('w', key_modifiers::ctrl), "Close Tab"},
        {"clear_tab", key_event::character('e', key_modifiers::ctrl), "Clear Tab"},
    };
    return binds;
}

// ============================================================================
// Key dispatch
// ============================================================================

namespace {

void run_global_bind(context& ctx, session& sess, const std::string& name) {
    const tab_entry* sel = sess.selected();
    if (name == "quit") {
        sess.request_quit();
    } else if (name == "prev_tab") {
        sess.select_prev();
    } else if (name == "next_tab") {
        sess.select_next();
    } else if (name == "new_tab") {
        sess.new_tab(ctx);
    } else if (name == "close_tab" && sel) {
        sess.close_tab(ctx, sel->id);
    } else if (name == "clear_tab" && sel) {
        sess.clear_tab(ctx, sel->id);
    }
}

} // namespace

key_dispatch handle_key_event(context& ctx, const key_event& ev) {
    auto* sess = ctx.get_resource<session>();
    if (!sess) {
        return key_dispatch::unrecognized;
    }

    const tab_entry* sel = sess->selected();

    if (sess->mode() == input_mode::text) {
        if (!sel) {
            sess->set_input_mode(input_mode::bind);
            return key_dispatch::unrecognized;
        }
        auto impl = sel->impl;
        impl->handle_text(ctx, ev, sel->id);
        return key_dispatch::text;
    }

    for (const auto& bind : session::global_keybinds()) {
        if (bind.matches(ev)) {
            run_global_bind(ctx, *sess, bind.name);
            return key_dispatch::global;
        }
    }

    if (sel) {
        // Copies: the handler may replace or close this tab
        auto impl = sel->impl;
        tab_id id = sel->id;
        for (const auto& bind : impl->keybinds(ctx, id)) {
            if (bind.matches(ev)) {
                impl->handle_key(ctx, bind.name, id);
                return key_dispatch::tab;
            }
        }
    }

    return key_dispatch::unrecognized;
}

// ============================================================================
// Rendering
// ============================================================================

namespace {

// Wraps keybind labels into footer lines that fit `width`
std::vector<std::vector<const key_bind*>> layout_footer(const std::vector<key_bind>& binds, int width) {
    std::vector<std::vector<const key_bind*>> lines(1);
    int width_so_far = 0;
    for (const auto& bind : binds) {
        int w = static_cast<int>(bind.display_text().size());
        if (width_so_far + w + 1 < width || lines.back().empty()) {
            width_so_far += w + 1;
            lines.back().push_back(&bind);
        } else {
            width_so_far = w + 1;
            lines.push_back({&bind});
        }
    }
    return lines;
}

} // namespace

void render_session(context& ctx, canvas& out) {
    out.clear();
    auto* sess = ctx.get_resource<session>();
    if (!sess || out.height() < 3) return;

    // Header: tab titles, selected one highlighted
    int x = 0;
    const auto& tabs = sess->tabs();
    for (size_t i = 0; i < tabs.size(); ++i) {
        std::string label = " " + tabs[i].impl->title(ctx, tabs[i].id) + " ";
        out.put(x, 0, label, i == sess->selected_index() ? cell_style::reverse : cell_style::normal);
        x += static_cast<int>(label.size());
        if (i + 1 < tabs.size()) {
            out.put(x, 0, "|");
            x += 1;
        }
    }

    const tab_entry* sel = sess->selected();
    std::shared_ptr<tab_impl> impl = sel ? sel->impl : nullptr;
    tab_id id = sel ? sel->id : 0;

    std::vector<key_bind> binds = session::global_keybinds();
    if (impl) {
        auto tab_binds = impl->keybinds(ctx, id);
        binds.insert(binds.end(), tab_binds.begin(), tab_binds.end());
    }
    auto footer = layout_footer(binds, out.width());
    int footer_height = static_cast<int>(footer.size());

    rect box{0, 1, out.width(), out.height() - 1 - footer_height};
    out.draw_box(box);
    if (impl && !box.inner().empty()) {
        impl->render(ctx, out, box.inner(), id);
    }

    for (int line = 0; line < footer_height; ++line) {
        int y = out.height() - footer_height + line;
        int fx = 0;
        for (const key_bind* bind : footer[static_cast<size_t>(line)]) {
            std::string key = "<" + bind->key.to_string() + ">";
            out.put(fx, y, key, cell_style::reverse);
            out.put(fx + static_cast<int>(key.size()), y, " " + bind->display_name);
            fx += static_cast<int>(bind->display_text().size()) + 1;
        }
    }
}

session& open_session(context& ctx) {
    if (auto* existing = ctx.get_resource<session>()) {
        existing->close_all(ctx);
    }
    auto& sess = ctx.emplace_resource<session>();
    sess.new_tab(ctx);
    return sess;
}

} // namespace trellis::tui
