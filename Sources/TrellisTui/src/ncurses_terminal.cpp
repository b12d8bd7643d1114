#include "trellis/tui/ncurses_terminal.hpp"
#include <curses.h>
#include <cstring>

namespace trellis::tui {

namespace {

attr_t to_attr(cell_style style) {
    switch (style) {
        case cell_style::bold: return A_BOLD;
        case cell_style::reverse: return A_REVERSE;
        case cell_style::normal: return A_NORMAL;
    }
    return A_NORMAL;
}

// Modified arrows have no KEY_ constant; xterm-style terminals name them kLFT5, kRIT5, ...
std::optional<key_event> named_key(int ch) {
    const char* name = keyname(ch);
    if (!name) return std::nullopt;
    if (std::strcmp(name, "kLFT5") == 0) return key_event::special(key_code::left, key_modifiers::ctrl);
    if (std::strcmp(name, "kRIT5") == 0) return key_event::special(key_code::right, key_modifiers::ctrl);
    if (std::strcmp(name, "kUP5") == 0) return key_event::special(key_code::up, key_modifiers::ctrl);
    if (std::strcmp(name, "kDN5") == 0) return key_event::special(key_code::down, key_modifiers::ctrl);
    return std::nullopt;
}

} // namespace

ncurses_terminal::ncurses_terminal() {
    initscr();
    raw();
    noecho();
    keypad(stdscr, TRUE);
    set_escdelay(25);
    curs_set(0);
}

ncurses_terminal::~ncurses_terminal() {
    endwin();
}

rect ncurses_terminal::size() const {
    int height = 0;
    int width = 0;
    getmaxyx(stdscr, height, width);
    return rect{0, 0, width, height};
}

void ncurses_terminal::draw(const canvas& frame) {
    erase();
    for (int y = 0; y < frame.height(); ++y) {
        for (int x = 0; x < frame.width(); ++x) {
            attr_t attr = to_attr(frame.style_at(x, y));
            mvaddch(y, x, static_cast<chtype>(static_cast<unsigned char>(frame.at(x, y))) | attr);
        }
    }
    refresh();
}

std::optional<key_event> ncurses_terminal::read_key() {
    for (;;) {
        int ch = getch();
        switch (ch) {
            case ERR: return std::nullopt;
            case KEY_RESIZE: continue;
            case KEY_UP: return key_event::special(key_code::up);
            case KEY_DOWN: return key_event::special(key_code::down);
            case KEY_LEFT: return key_event::special(key_code::left);
            case KEY_RIGHT: return key_event::special(key_code::right);
            case KEY_HOME: return key_event::special(key_code::home);
            case KEY_END: return key_event::special(key_code::end);
            case KEY_PPAGE: return key_event::special(key_code::page_up);
            case KEY_NPAGE: return key_event::special(key_code::page_down);
            case KEY_DC: return key_event::special(key_code::delete_key);
            case KEY_ENTER:
            case '\n':
            case '\r': return key_event::special(key_code::enter);
            case 27: return key_event::special(key_code::escape);
            case '\t': return key_event::special(key_code::tab);
            case KEY_BACKSPACE:
            case 127:
            case 8: return key_event::special(key_code::backspace);
            default: break;
        }

        if (ch >= 1 && ch <= 26) {
            return key_event::character(static_cast<char>('a' + ch - 1), key_modifiers::ctrl);
        }
        if (ch >= 32 && ch < 127) {
            return key_event::character(static_cast<char>(ch));
        }
        if (auto named = named_key(ch)) {
            return named;
        }
        // Unmapped key: wait for the next one
    }
}

} // namespace trellis::tui
