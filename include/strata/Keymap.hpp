/**
 * @file Keymap.hpp
 * @brief Keybinding tries, per-mode keymap tables and their merge rules
 *
 * A keymap maps every editor mode to a KeyTrie. A trie is one of
 * - a command leaf:      y = "move_line_down"
 * - a command sequence:  C-s = [":write", "normal_mode"]
 * - a node:              [keys.normal.g] with child keys of its own
 *
 * Overrides are layered with merge_keys(): nodes present on both sides
 * are merged key by key, anything else is replaced by the override.
 */

#ifndef STRATA_KEYMAP_HPP
#define STRATA_KEYMAP_HPP

#include "strata/KeyEvent.hpp"
#include "strata/Value.hpp"

#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace strata {

enum class Mode {
    Normal,
    Select,
    Insert,
};

constexpr std::array<Mode, 3> kAllModes = {Mode::Normal, Mode::Select, Mode::Insert};

/// Lowercase mode name as used in documents ("normal", "select", "insert").
std::string mode_name(Mode mode);

/// Inverse of mode_name(); nullopt for anything else.
std::optional<Mode> parse_mode(const std::string& name);

class KeyTrie {
public:
    enum class Kind {
        Command,
        Sequence,
        Node,
    };

    static KeyTrie command(std::string name);
    static KeyTrie sequence(std::vector<std::string> commands);
    static KeyTrie node(std::string name = {});

    Kind kind() const noexcept { return kind_; }
    bool is_node() const noexcept { return kind_ == Kind::Node; }

    /// Command name of a leaf.
    const std::string& command_name() const noexcept { return label_; }
    /// Commands of a sequence.
    const std::vector<std::string>& commands() const noexcept { return commands_; }
    /// Display name of a node ("Goto", "Space", ...), may be empty.
    const std::string& name() const noexcept { return label_; }

    /// Child keys of a node in insertion order.
    const std::vector<KeyEvent>& keys() const noexcept { return keys_; }
    std::size_t size() const noexcept { return keys_.size(); }

    const KeyTrie* child(const KeyEvent& key) const;
    KeyTrie* child(const KeyEvent& key);

    /**
     * @brief Bind a key in this node
     *
     * Replaces an existing binding in place, otherwise appends it.
     * Calling this on a non-node turns it into an unnamed node first.
     */
    void insert(KeyEvent key, KeyTrie trie);

    /**
     * @brief Merge another node's bindings into this node
     *
     * For each key of @p other: when both sides bind a node, the nodes are
     * merged recursively, otherwise the binding from @p other wins. Keys new
     * to this node are appended after the existing ones.
     */
    void merge(KeyTrie other);

    /**
     * @brief Merge when both tries are nodes, replace otherwise
     */
    void merge_nodes(KeyTrie other);

    /**
     * @brief Follow a key sequence from this trie
     * @return The trie reached, or nullptr when a key is unbound or a leaf
     *         is hit before the sequence ends
     */
    const KeyTrie* search(const std::vector<KeyEvent>& keys) const;

    /**
     * @brief Build a trie from a document value
     *
     * Strings become commands, arrays of strings become sequences and
     * tables become nodes whose keys are parsed with KeyEvent::parse().
     *
     * @param value Document value
     * @param path Dot path of @p value, for error messages
     * @throws SchemaError for any other shape or invalid key notation
     */
    static KeyTrie from_value(const Value& value, const std::string& path);

    Value to_value() const;

    /// Nodes compare their bindings only; names and key order are ignored.
    bool operator==(const KeyTrie& other) const;
    bool operator!=(const KeyTrie& other) const { return !(*this == other); }

private:
    explicit KeyTrie(Kind kind) : kind_(kind) {}

    Kind kind_;
    std::string label_;
    std::vector<std::string> commands_;
    std::vector<KeyEvent> keys_;
    std::vector<KeyTrie> children_;
};

using Keymap = std::map<Mode, KeyTrie>;

/**
 * @brief Layer keymap overrides onto a keymap
 *
 * For each mode in @p delta the override trie is merged into the trie of
 * that mode in @p dst with KeyTrie::merge_nodes().
 */
void merge_keys(Keymap& dst, Keymap delta);

/**
 * @brief Parse a `keys` table: mode name -> key table
 * @throws SchemaError for unknown modes or malformed tries
 */
Keymap keymap_from_value(const Value& value, const std::string& path);

Value keymap_to_value(const Keymap& keymap);

/**
 * @brief Built-in bindings for every mode
 *
 * The select table is the normal table with selection-extending
 * motions layered on top.
 */
Keymap default_keymap();

} // namespace strata

#endif // STRATA_KEYMAP_HPP
