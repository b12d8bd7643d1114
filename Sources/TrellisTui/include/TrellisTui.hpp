#pragma once

// TrellisTui - tabbed terminal sessions over a trellis::context
//
//   ctx.add_plugin<trellis::tui::tui_plugin>();
//   trellis::tui::register_tab_kind<my_tab>(ctx, "My Tab");
//   ctx.execute("tui");
//   trellis::tui::run_tui(ctx);

#include "trellis/tui/keys.hpp"
#include "trellis/tui/canvas.hpp"
#include "trellis/tui/tab.hpp"
#include "trellis/tui/chooser_tab.hpp"
#include "trellis/tui/session.hpp"
#include "trellis/tui/terminal.hpp"
#include "trellis/tui/ncurses_terminal.hpp"
#include "trellis/tui/tui_plugin.hpp"
