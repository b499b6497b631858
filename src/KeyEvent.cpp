/**
 * @file KeyEvent.cpp
 * @brief Key notation parsing and rendering
 */

#include "strata/KeyEvent.hpp"
#include "strata/Errors.hpp"

#include <cstddef>
#include <tuple>
#include <utility>
#include <vector>

namespace strata {

namespace {

struct NamedKey {
    const char* name;
    KeyCode code;
    const char* ch; // non-null for names that stand for a character
};

constexpr NamedKey kNamedKeys[] = {
    {"backspace", KeyCode::Backspace, nullptr},
    {"space", KeyCode::Char, " "},
    {"ret", KeyCode::Enter, nullptr},
    {"minus", KeyCode::Char, "-"},
    {"left", KeyCode::Left, nullptr},
    {"right", KeyCode::Right, nullptr},
    {"up", KeyCode::Up, nullptr},
    {"down", KeyCode::Down, nullptr},
    {"home", KeyCode::Home, nullptr},
    {"end", KeyCode::End, nullptr},
    {"pageup", KeyCode::PageUp, nullptr},
    {"pagedown", KeyCode::PageDown, nullptr},
    {"tab", KeyCode::Tab, nullptr},
    {"del", KeyCode::Delete, nullptr},
    {"ins", KeyCode::Insert, nullptr},
    {"null", KeyCode::Null, nullptr},
    {"esc", KeyCode::Esc, nullptr},
    {"lt", KeyCode::Char, "<"},
    {"gt", KeyCode::Char, ">"},
};

std::vector<std::string> split_tokens(const std::string& s) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : s) {
        if (c == '-') {
            tokens.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    tokens.push_back(current);
    return tokens;
}

/**
 * @brief Count UTF-8 code points (continuation bytes are not counted)
 */
std::size_t utf8_length(const std::string& s) {
    std::size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

bool parse_function_number(const std::string& digits, int& out) {
    if (digits.empty() || digits.size() > 2) return false;
    int value = 0;
    for (char c : digits) {
        if (c < '0' || c > '9') return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

} // anonymous namespace

KeyEvent KeyEvent::parse(const std::string& notation) {
    std::vector<std::string> tokens = split_tokens(notation);
    const std::string code_token = tokens.back();
    tokens.pop_back();

    KeyEvent key;
    bool matched = false;
    for (const auto& named : kNamedKeys) {
        if (code_token == named.name) {
            key.code = named.code;
            if (named.ch != nullptr) key.ch = named.ch;
            matched = true;
            break;
        }
    }

    if (!matched) {
        if (!code_token.empty() && utf8_length(code_token) == 1) {
            key.code = KeyCode::Char;
            key.ch = code_token;
        } else if (code_token.size() > 1 && code_token[0] == 'F') {
            int number = 0;
            if (!parse_function_number(code_token.substr(1), number)) {
                throw KeyParseError(notation, "Invalid key code '" + code_token + "'");
            }
            if (number < 1 || number > 24) {
                throw KeyParseError(notation, "Invalid function key 'F" + std::to_string(number) + "'");
            }
            key.code = KeyCode::Function;
            key.function = number;
        } else {
            throw KeyParseError(notation, "Invalid key code '" + code_token + "'");
        }
    }

    for (const auto& token : tokens) {
        std::uint8_t flag = kModNone;
        if (token == "S") {
            flag = kModShift;
        } else if (token == "A") {
            flag = kModAlt;
        } else if (token == "C") {
            flag = kModControl;
        } else {
            throw KeyParseError(notation, "Invalid key modifier '" + token + "-'");
        }
        if (key.modifiers & flag) {
            throw KeyParseError(notation, "Repeated key modifier '" + token + "-'");
        }
        key.modifiers |= flag;
    }

    return key;
}

KeyEvent KeyEvent::character(std::string ch, std::uint8_t modifiers) {
    KeyEvent key;
    key.code = KeyCode::Char;
    key.ch = std::move(ch);
    key.modifiers = modifiers;
    return key;
}

std::string KeyEvent::to_string() const {
    std::string out;
    if (modifiers & kModShift) out += "S-";
    if (modifiers & kModAlt) out += "A-";
    if (modifiers & kModControl) out += "C-";

    switch (code) {
        case KeyCode::Char:
            if (ch == " ") return out + "space";
            if (ch == "-") return out + "minus";
            if (ch == "<") return out + "lt";
            if (ch == ">") return out + "gt";
            return out + ch;
        case KeyCode::Function:
            return out + "F" + std::to_string(function);
        default:
            break;
    }

    for (const auto& named : kNamedKeys) {
        if (named.ch == nullptr && named.code == code) {
            return out + named.name;
        }
    }
    return out + "null";
}

bool KeyEvent::operator==(const KeyEvent& other) const noexcept {
    return code == other.code && ch == other.ch &&
           function == other.function && modifiers == other.modifiers;
}

bool KeyEvent::operator<(const KeyEvent& other) const noexcept {
    return std::tie(code, ch, function, modifiers) <
           std::tie(other.code, other.ch, other.function, other.modifiers);
}

std::ostream& operator<<(std::ostream& os, const KeyEvent& key) {
    return os << key.to_string();
}

} // namespace strata
