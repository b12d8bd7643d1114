#pragma once

#include "canvas.hpp"
#include "keys.hpp"
#include <optional>
#include <trellis/context.hpp>

namespace trellis::tui {

/// Screen and keyboard backend of a session.
class terminal {
public:
    virtual ~terminal() = default;

    /// Current screen size; x and y are zero.
    virtual rect size() const = 0;
    virtual void draw(const canvas& frame) = 0;

    /// Blocks until the next key. nullopt means input ended.
    virtual std::optional<key_event> read_key() = 0;
};

/// Runs the session resource in ctx against `term` until a quit is requested
/// or input ends: Rendering -> Awaiting-Input -> dispatch -> Rendering | Terminated.
/// Throws configuration_error when no session is open.
void run_session(context& ctx, terminal& term);

/// Runs the session on the real terminal through ncurses, with logging
/// silenced while the screen is taken over.
void run_tui(context& ctx);

} // namespace trellis::tui
