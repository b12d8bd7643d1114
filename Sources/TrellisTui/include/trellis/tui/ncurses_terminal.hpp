#pragma once

#include "terminal.hpp"

namespace trellis::tui {

/// ncurses backend. Construction takes over the screen; destruction restores it.
class ncurses_terminal : public terminal {
public:
    ncurses_terminal();
    ~ncurses_terminal() override;

    ncurses_terminal(const ncurses_terminal&) = delete;
    ncurses_terminal& operator=(const ncurses_terminal&) = delete;

    rect size() const override;
    void draw(const canvas& frame) override;
    std::optional<key_event> read_key() override;
};

} // namespace trellis::tui
