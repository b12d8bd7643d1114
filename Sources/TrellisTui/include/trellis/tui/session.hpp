#pragma once

#include "canvas.hpp"
#include "keys.hpp"
#include "tab.hpp"
#include <memory>
#include <string>
#include <vector>

namespace trellis::tui {

enum class session_phase {
    idle,
    rendering,
    awaiting_input,
    terminated
};

/// bind: keys go through global then tab binds. text: every key goes to the tab's handle_text.
enum class input_mode {
    bind,
    text
};

/// How a key event was consumed.
enum class key_dispatch {
    global,
    tab,
    text,
    unrecognized
};

struct tab_entry {
    tab_id id;
    std::shared_ptr<tab_impl> impl;
};

// ============================================================================
// session
//
// The interactive terminal session, stored as a context resource while it
// is open. Tab methods take the context because tab state lives in its
// resource registry.
// ============================================================================

class session {
public:
    /// Appends a tab and creates its state. Returns the new id.
    tab_id add_tab(context& ctx, std::shared_ptr<tab_impl> impl);

    template<typename Tab>
    tab_id add_tab(context& ctx) {
        return add_tab(ctx, std::make_shared<Tab>());
    }

    /// Replaces the kind of tab `id` in place and resets its state.
    void set_tab(context& ctx, tab_id id, std::shared_ptr<tab_impl> impl);

    /// Adds a chooser tab and selects it.
    tab_id new_tab(context& ctx);

    /// Removes a tab and its state. Closing the last tab leaves a fresh chooser tab.
    void close_tab(context& ctx, tab_id id);

    /// Turns a tab back into a chooser tab.
    void clear_tab(context& ctx, tab_id id);

    /// Closes every tab, destroying its state.
    void close_all(context& ctx);

    void select_next();
    void select_prev();
    bool select(tab_id id);

    const std::vector<tab_entry>& tabs() const { return tabs_; }
    size_t selected_index() const { return selected_; }

    /// Selected tab, or nullptr when there are no tabs.
    const tab_entry* selected() const;

    void request_quit() { quit_requested_ = true; }
    bool should_quit() const { return quit_requested_; }

    input_mode mode() const { return mode_; }
    void set_input_mode(input_mode mode) { mode_ = mode; }

    session_phase phase() const { return phase_; }
    void set_phase(session_phase phase) { phase_ = phase; }

    /// Quit, tab cycling and new/close/clear tab.
    static const std::vector<key_bind>& global_keybinds();

private:
    tab_entry* find(tab_id id);

    std::vector<tab_entry> tabs_;
    size_t selected_ = 0;
    tab_id next_id_ = 0;
    bool quit_requested_ = false;
    input_mode mode_ = input_mode::bind;
    session_phase phase_ = session_phase::idle;
};

/// Dispatches one key to the session in ctx: text mode goes to the selected
/// tab's handle_text; otherwise global binds win over the tab's binds.
key_dispatch handle_key_event(context& ctx, const key_event& ev);

/// Draws the tab header, the selected tab inside a box and the keybind footer.
void render_session(context& ctx, canvas& out);

/// Installs a new session with one chooser tab, replacing any previous one.
session& open_session(context& ctx);

} // namespace trellis::tui
