#pragma once

#include <cstdint>
#include <string>

namespace trellis::tui {

enum class key_code {
    character,
    enter,
    escape,
    backspace,
    tab,
    up,
    down,
    left,
    right,
    home,
    end,
    page_up,
    page_down,
    delete_key
};

enum class key_modifiers : uint8_t {
    none = 0,
    ctrl = 1 << 0,
    alt = 1 << 1,
    shift = 1 << 2
};

inline key_modifiers operator|(key_modifiers a, key_modifiers b) {
    return static_cast<key_modifiers>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline bool has_modifier(key_modifiers set, key_modifiers m) {
    return (static_cast<uint8_t>(set) & static_cast<uint8_t>(m)) != 0;
}

/// One key press read from the terminal.
struct key_event {
    key_code code = key_code::character;
    char ch = 0;   // set when code == character
    key_modifiers modifiers = key_modifiers::none;

    static key_event character(char c, key_modifiers mods = key_modifiers::none) {
        return key_event{key_code::character, c, mods};
    }
    static key_event special(key_code code, key_modifiers mods = key_modifiers::none) {
        return key_event{code, 0, mods};
    }

    /// Display form, e.g. "Q", "Ctrl+Left", "Enter".
    std::string to_string() const;
};

/// A named binding from a key combination to an action.
/// Character keys match case-insensitively.
struct key_bind {
    std::string name;          // action name passed to handle_key
    key_event key;
    std::string display_name;  // footer label

    bool matches(const key_event& ev) const;

    /// Footer form: "<Ctrl+T> New Tab".
    std::string display_text() const;
};

} // namespace trellis::tui
