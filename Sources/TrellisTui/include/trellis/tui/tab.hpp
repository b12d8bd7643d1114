#pragma once

#include "canvas.hpp"
#include "keys.hpp"
#include <trellis/context.hpp>
#include <trellis/error.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace trellis::tui {

using tab_id = size_t;

// ============================================================================
// Tab kinds
//
// A tab kind implements tab_impl. The session only ever talks to a tab
// through this interface, so new kinds can be added without touching the
// session. Per-instance state lives in a tab_state_arena<State> stored as a
// context resource, keyed by tab id.
// ============================================================================

class tab_impl {
public:
    virtual ~tab_impl() = default;

    virtual std::string title(context& ctx, tab_id id) const = 0;
    virtual void render(context& ctx, canvas& out, const rect& area, tab_id id) = 0;
    virtual std::vector<key_bind> keybinds(context& ctx, tab_id id) const = 0;

    /// Called with the name of the matched key_bind.
    virtual void handle_key(context& ctx, const std::string& bind_name, tab_id id) = 0;

    /// Receives every key while the session is in text input mode.
    virtual void handle_text(context&, const key_event&, tab_id) {}

    virtual void create_state(context&, tab_id) {}
    virtual void destroy_state(context&, tab_id) {}
};

/// Per-kind state storage: tab id -> State.
template<typename State>
class tab_state_arena {
public:
    State& create(tab_id id, State initial = State{}) {
        return states_.insert_or_assign(id, std::move(initial)).first->second;
    }

    State* find(tab_id id) {
        auto it = states_.find(id);
        return it == states_.end() ? nullptr : &it->second;
    }

    const State* find(tab_id id) const {
        auto it = states_.find(id);
        return it == states_.end() ? nullptr : &it->second;
    }

    bool erase(tab_id id) { return states_.erase(id) != 0; }
    size_t size() const { return states_.size(); }

private:
    std::unordered_map<tab_id, State> states_;
};

/// The arena for State, created on first use.
template<typename State>
tab_state_arena<State>& tab_states(context& ctx) {
    return ctx.resources().get_or_add<tab_state_arena<State>>();
}

/// State of tab `id`. A miss is a programming error: the session creates
/// state before a tab is used and destroys it with the tab.
template<typename State>
State& tab_state(context& ctx, tab_id id) {
    auto* arena = ctx.get_resource<tab_state_arena<State>>();
    State* state = arena ? arena->find(id) : nullptr;
    if (!state) {
        throw std::logic_error("no state for tab " + std::to_string(id));
    }
    return *state;
}

/// tab_impl with default-constructed per-instance State.
template<typename State>
class basic_tab : public tab_impl {
public:
    using state_type = State;

    void create_state(context& ctx, tab_id id) override {
        tab_states<State>(ctx).create(id, initial_state(ctx));
    }

    void destroy_state(context& ctx, tab_id id) override {
        tab_states<State>(ctx).erase(id);
    }

protected:
    virtual State initial_state(context&) const { return State{}; }

    static State& state(context& ctx, tab_id id) { return tab_state<State>(ctx, id); }
};

// ============================================================================
// Catalog of creatable kinds (the "new tab" chooser lists it)
// ============================================================================

class tab_catalog {
public:
    using factory = std::function<std::shared_ptr<tab_impl>()>;

    struct kind {
        std::string name;
        factory create;
    };

    template<typename Tab>
    void register_kind(std::string name) {
        static_assert(std::is_base_of_v<tab_impl, Tab>, "Tab must derive from tab_impl");
        register_kind(std::move(name), [] { return std::make_shared<Tab>(); });
    }

    /// Throws configuration_error if `name` is already registered.
    void register_kind(std::string name, factory create);

    const std::vector<kind>& kinds() const { return kinds_; }
    const kind* find(const std::string& name) const;
    bool empty() const { return kinds_.empty(); }

private:
    std::vector<kind> kinds_;
};

/// Registers a tab kind in the context's catalog. Requires tui_plugin to have run.
template<typename Tab>
void register_tab_kind(context& ctx, std::string name) {
    ctx.require_resource<tab_catalog>("tab_catalog (add tui_plugin first)")
        .template register_kind<Tab>(std::move(name));
}

} // namespace trellis::tui
