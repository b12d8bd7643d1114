#include "trellis/tui/terminal.hpp"
#include "trellis/tui/ncurses_terminal.hpp"
#include "trellis/tui/session.hpp"
#include <trellis/log.hpp>

namespace trellis::tui {

void run_session(context& ctx, terminal& term) {
    ctx.require_resource<session>("tui session");

    for (;;) {
        // Handlers may replace the session resource, so look it up every cycle
        auto* sess = ctx.get_resource<session>();
        if (!sess) {
            return;
        }

        sess->set_phase(session_phase::rendering);
        rect area = term.size();
        canvas frame(area.width, area.height);
        render_session(ctx, frame);
        term.draw(frame);

        sess->set_phase(session_phase::awaiting_input);
        auto key = term.read_key();
        if (!key) {
            sess->request_quit();
        } else {
            handle_key_event(ctx, *key);
        }

        sess = ctx.get_resource<session>();
        if (!sess) {
            return;
        }
        if (sess->should_quit()) {
            sess->set_phase(session_phase::terminated);
            return;
        }
    }
}

void run_tui(context& ctx) {
    LOG_INFO("tui", "Starting session");
    {
        scoped_log_level quiet(log_level::off);
        ncurses_terminal term;
        run_session(ctx, term);
    }
    LOG_INFO("tui", "Session ended");
}

} // namespace trellis::tui
