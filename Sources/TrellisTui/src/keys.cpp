#include "trellis/tui/keys.hpp"
#include <cctype>

namespace trellis::tui {

namespace {

const char* key_name(key_code code) {
    switch (code) {
        case key_code::character: return "";
        case key_code::enter: return "Enter";
        case key_code::escape: return "Esc";
        case key_code::backspace: return "Backspace";
        case key_code::tab: return "Tab";
        case key_code::up: return "Up";
        case key_code::down: return "Down";
        case key_code::left: return "Left";
        case key_code::right: return "Right";
        case key_code::home: return "Home";
        case key_code::end: return "End";
        case key_code::page_up: return "PageUp";
        case key_code::page_down: return "PageDown";
        case key_code::delete_key: return "Del";
    }
    return "";
}

char fold(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

} // namespace

std::string key_event::to_string() const {
    std::string out;
    if (has_modifier(modifiers, key_modifiers::ctrl)) out += "Ctrl+";
    if (has_modifier(modifiers, key_modifiers::alt)) out += "Alt+";
    if (has_modifier(modifiers, key_modifiers::shift)) out += "Shift+";

    if (code == key_code::character) {
        if (ch == ' ') {
            out += "Space";
        } else {
            out += static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
        }
    } else {
        out += key_name(code);
    }
    return out;
}

bool key_bind::matches(const key_event& ev) const {
    if (ev.code != key.code) return false;
    // Shift only distinguishes non-character keys
    auto strip_shift = [&](key_modifiers m) {
        if (key.code != key_code::character) return m;
        return static_cast<key_modifiers>(static_cast<uint8_t>(m) & ~static_cast<uint8_t>(key_modifiers::shift));
    };
    if (strip_shift(ev.modifiers) != strip_shift(key.modifiers)) return false;
    if (key.code == key_code::character) {
        return fold(ev.ch) == fold(key.ch);
    }
    return true;
}

std::string key_bind::display_text() const {
    return "<" + key.to_string() + "> " + display_name;
}

} // namespace trellis::tui
