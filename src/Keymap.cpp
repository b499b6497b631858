/**
 * @file Keymap.cpp
 * @brief KeyTrie operations and keymap merging
 */

#include "strata/Keymap.hpp"
#include "strata/Errors.hpp"

#include <utility>

namespace strata {

std::string mode_name(Mode mode) {
    switch (mode) {
        case Mode::Normal: return "normal";
        case Mode::Select: return "select";
        case Mode::Insert: return "insert";
    }
    return "normal";
}

std::optional<Mode> parse_mode(const std::string& name) {
    for (Mode mode : kAllModes) {
        if (mode_name(mode) == name) return mode;
    }
    return std::nullopt;
}

// ============================================================================
// Construction and lookup
// ============================================================================

KeyTrie KeyTrie::command(std::string name) {
    KeyTrie trie(Kind::Command);
    trie.label_ = std::move(name);
    return trie;
}

KeyTrie KeyTrie::sequence(std::vector<std::string> commands) {
    KeyTrie trie(Kind::Sequence);
    trie.commands_ = std::move(commands);
    return trie;
}

KeyTrie KeyTrie::node(std::string name) {
    KeyTrie trie(Kind::Node);
    trie.label_ = std::move(name);
    return trie;
}

const KeyTrie* KeyTrie::child(const KeyEvent& key) const {
    for (std::size_t i = 0; i < keys_.size(); ++i) {
        if (keys_[i] == key) return &children_[i];
    }
    return nullptr;
}

KeyTrie* KeyTrie::child(const KeyEvent& key) {
    for (std::size_t i = 0; i < keys_.size(); ++i) {
        if (keys_[i] == key) return &children_[i];
    }
    return nullptr;
}

void KeyTrie::insert(KeyEvent key, KeyTrie trie) {
    if (kind_ != Kind::Node) {
        *this = node();
    }
    if (KeyTrie* existing = child(key)) {
        *existing = std::move(trie);
        return;
    }
    keys_.push_back(std::move(key));
    children_.push_back(std::move(trie));
}

const KeyTrie* KeyTrie::search(const std::vector<KeyEvent>& keys) const {
    const KeyTrie* current = this;
    for (const auto& key : keys) {
        if (!current->is_node()) return nullptr;
        current = current->child(key);
        if (current == nullptr) return nullptr;
    }
    return current;
}

// ============================================================================
// Merging
// ============================================================================

void KeyTrie::merge(KeyTrie other) {
    for (std::size_t i = 0; i < other.keys_.size(); ++i) {
        KeyTrie& incoming = other.children_[i];
        KeyTrie* existing = child(other.keys_[i]);
        if (existing != nullptr && existing->is_node() && incoming.is_node()) {
            existing->merge(std::move(incoming));
            continue;
        }
        insert(std::move(other.keys_[i]), std::move(incoming));
    }
}

void KeyTrie::merge_nodes(KeyTrie other) {
    if (is_node() && other.is_node()) {
        merge(std::move(other));
        return;
    }
    *this = std::move(other);
}

void merge_keys(Keymap& dst, Keymap delta) {
    for (auto& [mode, trie] : delta) {
        auto it = dst.find(mode);
        if (it == dst.end()) {
            dst.emplace(mode, std::move(trie));
        } else {
            it->second.merge_nodes(std::move(trie));
        }
    }
}

// ============================================================================
// Conversion from/to document values
// ============================================================================

KeyTrie KeyTrie::from_value(const Value& value, const std::string& path) {
    if (value.is_string()) {
        std::string name = value.get<std::string>();
        if (name.empty()) {
            throw SchemaError(path, "empty command name");
        }
        return command(std::move(name));
    }

    if (value.is_array()) {
        std::vector<std::string> names;
        for (const auto& elem : value) {
            if (!elem.is_string() || elem.get<std::string>().empty()) {
                throw SchemaError(path, "command sequences may only contain command names, found " +
                                            type_name(elem));
            }
            names.push_back(elem.get<std::string>());
        }
        return sequence(std::move(names));
    }

    if (value.is_object()) {
        KeyTrie trie = node();
        for (auto it = value.begin(); it != value.end(); ++it) {
            const std::string child_path = path + "." + it.key();
            KeyEvent key;
            try {
                key = KeyEvent::parse(it.key());
            } catch (const KeyParseError& e) {
                throw SchemaError(child_path, e.what());
            }
            trie.insert(std::move(key), from_value(it.value(), child_path));
        }
        return trie;
    }

    throw SchemaError(path, "invalid type: " + type_name(value) +
                                ", expected a command, a command list or a key table");
}

Value KeyTrie::to_value() const {
    switch (kind_) {
        case Kind::Command:
            return Value(label_);
        case Kind::Sequence:
            return Value(commands_);
        case Kind::Node:
            break;
    }
    Value out = Value::object();
    for (std::size_t i = 0; i < keys_.size(); ++i) {
        out[keys_[i].to_string()] = children_[i].to_value();
    }
    return out;
}

bool KeyTrie::operator==(const KeyTrie& other) const {
    if (kind_ != other.kind_) return false;
    switch (kind_) {
        case Kind::Command:
            return label_ == other.label_;
        case Kind::Sequence:
            return commands_ == other.commands_;
        case Kind::Node:
            break;
    }
    if (keys_.size() != other.keys_.size()) return false;
    for (std::size_t i = 0; i < keys_.size(); ++i) {
        const KeyTrie* theirs = other.child(keys_[i]);
        if (theirs == nullptr || !(children_[i] == *theirs)) return false;
    }
    return true;
}

Keymap keymap_from_value(const Value& value, const std::string& path) {
    if (!value.is_object()) {
        throw SchemaError(path, "invalid type: " + type_name(value) + ", expected a table of modes");
    }

    Keymap keymap;
    for (auto it = value.begin(); it != value.end(); ++it) {
        const std::string mode_path = path + "." + it.key();
        auto mode = parse_mode(it.key());
        if (!mode) {
            throw SchemaError(mode_path, "unknown mode `" + it.key() +
                                             "`, expected one of `normal`, `select`, `insert`");
        }
        if (!it.value().is_object()) {
            throw SchemaError(mode_path, "invalid type: " + type_name(it.value()) +
                                             ", expected a key table");
        }
        keymap.emplace(*mode, KeyTrie::from_value(it.value(), mode_path));
    }
    return keymap;
}

Value keymap_to_value(const Keymap& keymap) {
    Value out = Value::object();
    for (const auto& [mode, trie] : keymap) {
        out[mode_name(mode)] = trie.to_value();
    }
    return out;
}

} // namespace strata
