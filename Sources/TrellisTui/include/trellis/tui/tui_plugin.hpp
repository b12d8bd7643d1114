#pragma once

#include <trellis/context.hpp>

namespace trellis::tui {

/// Adds the tab_catalog resource and the `tui` command, which opens a
/// session with one chooser tab. Add it before any plugin that registers
/// tab kinds.
class tui_plugin : public plugin {
public:
    void build(context& ctx) override;
};

} // namespace trellis::tui
