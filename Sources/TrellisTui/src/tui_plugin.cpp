#include "trellis/tui/tui_plugin.hpp"
#include "trellis/tui/session.hpp"
#include "trellis/tui/tab.hpp"

namespace trellis::tui {

void tui_plugin::build(context& ctx) {
    ctx.add_resource(tab_catalog{});
    ctx.add_command(
        command_def("tui", "Opens an empty TUI session."),
        [](context& c, const arg_matches&) {
            open_session(c);
            return command_response::message("Opening TUI session...");
        });
}

} // namespace trellis::tui
