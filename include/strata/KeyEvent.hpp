/**
 * @file KeyEvent.hpp
 * @brief Key notation used in keymap tables
 *
 * A key event is a key code plus a set of modifiers, written as
 * modifier prefixes followed by the key name:
 *
 * - "y", "ñ", "%"               single characters
 * - "C-s", "S-C-a", "A-F12"     modifiers S (shift), A (alt), C (control)
 * - "ret", "esc", "space", ...  named keys
 * - "F1" .. "F24"               function keys
 *
 * Modifier order does not matter when parsing ("S-C-a" == "C-S-a");
 * to_string() always renders them as "S-A-C-".
 */

#ifndef STRATA_KEY_EVENT_HPP
#define STRATA_KEY_EVENT_HPP

#include <cstdint>
#include <ostream>
#include <string>

namespace strata {

enum class KeyCode : std::uint8_t {
    Char,
    Function,
    Backspace,
    Enter,
    Left,
    Right,
    Up,
    Down,
    Home,
    End,
    PageUp,
    PageDown,
    Tab,
    Delete,
    Insert,
    Null,
    Esc,
};

/// Bit flags for KeyEvent::modifiers.
enum KeyModifier : std::uint8_t {
    kModNone = 0,
    kModShift = 1 << 0,
    kModAlt = 1 << 1,
    kModControl = 1 << 2,
};

struct KeyEvent {
    KeyCode code = KeyCode::Null;
    /// UTF-8 text of the character for KeyCode::Char, empty otherwise.
    std::string ch;
    /// Function key number (1-24) for KeyCode::Function.
    int function = 0;
    std::uint8_t modifiers = kModNone;

    /**
     * @brief Parse key notation
     * @param notation Text such as "C-s" or "A-F12"
     * @return Parsed key event
     * @throws KeyParseError for unknown key names, unknown or repeated
     *         modifiers and empty input
     */
    static KeyEvent parse(const std::string& notation);

    /// Convenience constructor for a plain character key.
    static KeyEvent character(std::string ch, std::uint8_t modifiers = kModNone);

    std::string to_string() const;

    bool operator==(const KeyEvent& other) const noexcept;
    bool operator!=(const KeyEvent& other) const noexcept { return !(*this == other); }
    bool operator<(const KeyEvent& other) const noexcept;
};

std::ostream& operator<<(std::ostream& os, const KeyEvent& key);

} // namespace strata

#endif // STRATA_KEY_EVENT_HPP
