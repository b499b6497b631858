/**
 * @file test_keymap.cpp
 * @brief Tests for key tries, keymap merging and the default keymap
 */

#include <gtest/gtest.h>
#include "strata/Keymap.hpp"
#include "strata/Errors.hpp"

using namespace strata;

namespace {

KeyEvent key(const char* notation) {
    return KeyEvent::parse(notation);
}

const KeyTrie* lookup(const Keymap& keymap, Mode mode, std::vector<KeyEvent> keys) {
    return keymap.at(mode).search(keys);
}

} // namespace

// ============================================================================
// Default keymap
// ============================================================================

TEST(DefaultKeymap, HasEveryMode) {
    Keymap keymap = default_keymap();
    for (Mode mode : kAllModes) {
        ASSERT_TRUE(keymap.count(mode)) << mode_name(mode);
        EXPECT_TRUE(keymap.at(mode).is_node());
        EXPECT_GT(keymap.at(mode).size(), 0u);
    }
}

TEST(DefaultKeymap, NestedNodes) {
    Keymap keymap = default_keymap();
    const KeyTrie* goto_node = lookup(keymap, Mode::Normal, {key("g")});
    ASSERT_NE(goto_node, nullptr);
    EXPECT_TRUE(goto_node->is_node());
    EXPECT_EQ(goto_node->name(), "Goto");

    const KeyTrie* last_line = lookup(keymap, Mode::Normal, {key("g"), key("e")});
    ASSERT_NE(last_line, nullptr);
    EXPECT_EQ(last_line->command_name(), "goto_last_line");
}

TEST(DefaultKeymap, SelectModeExtendsNormal) {
    Keymap keymap = default_keymap();
    EXPECT_EQ(lookup(keymap, Mode::Select, {key("w")})->command_name(), "extend_next_word_start");
    // inherited from normal mode
    EXPECT_EQ(lookup(keymap, Mode::Select, {key("d")})->command_name(), "delete_selection");
    EXPECT_EQ(lookup(keymap, Mode::Normal, {key("w")})->command_name(), "move_next_word_start");
}

TEST(DefaultKeymap, AliasedKeysShareCommand) {
    Keymap keymap = default_keymap();
    EXPECT_EQ(lookup(keymap, Mode::Normal, {key("h")})->command_name(), "move_char_left");
    EXPECT_EQ(lookup(keymap, Mode::Normal, {key("left")})->command_name(), "move_char_left");
}

// ============================================================================
// Trie merging
// ============================================================================

TEST(KeyTrieMerge, OverrideWinsOnConflict) {
    KeyTrie base = KeyTrie::node();
    base.insert(key("a"), KeyTrie::command("one"));
    base.insert(key("b"), KeyTrie::command("two"));

    KeyTrie delta = KeyTrie::node();
    delta.insert(key("b"), KeyTrie::command("three"));
    delta.insert(key("c"), KeyTrie::command("four"));

    base.merge_nodes(delta);
    ASSERT_EQ(base.size(), 3u);
    EXPECT_EQ(base.child(key("a"))->command_name(), "one");
    EXPECT_EQ(base.child(key("b"))->command_name(), "three");
    EXPECT_EQ(base.child(key("c"))->command_name(), "four");
    // new keys are appended after existing ones
    EXPECT_EQ(base.keys().back(), key("c"));
}

TEST(KeyTrieMerge, NestedNodesMerged) {
    Keymap keymap = default_keymap();
    KeyTrie goto_delta = KeyTrie::node();
    goto_delta.insert(key("z"), KeyTrie::command("goto_nowhere"));
    KeyTrie normal = KeyTrie::node();
    normal.insert(key("g"), goto_delta);

    Keymap delta;
    delta.emplace(Mode::Normal, normal);
    merge_keys(keymap, delta);

    EXPECT_EQ(lookup(keymap, Mode::Normal, {key("g"), key("z")})->command_name(), "goto_nowhere");
    EXPECT_EQ(lookup(keymap, Mode::Normal, {key("g"), key("g")})->command_name(), "goto_file_start");
    EXPECT_EQ(lookup(keymap, Mode::Normal, {key("g")})->name(), "Goto");
}

TEST(KeyTrieMerge, CommandReplacesNode) {
    Keymap keymap = default_keymap();
    KeyTrie normal = KeyTrie::node();
    normal.insert(key("g"), KeyTrie::command("goto_line"));

    Keymap delta;
    delta.emplace(Mode::Normal, normal);
    merge_keys(keymap, delta);

    const KeyTrie* g = lookup(keymap, Mode::Normal, {key("g")});
    ASSERT_NE(g, nullptr);
    EXPECT_EQ(g->kind(), KeyTrie::Kind::Command);
    EXPECT_EQ(lookup(keymap, Mode::Normal, {key("g"), key("e")}), nullptr);
}

TEST(KeyTrieMerge, EmptyDeltaIsNoOp) {
    Keymap keymap = default_keymap();
    merge_keys(keymap, Keymap{});
    EXPECT_EQ(keymap, default_keymap());
}

TEST(KeyTrieEquality, IgnoresOrderAndName) {
    KeyTrie a = KeyTrie::node("A");
    a.insert(key("x"), KeyTrie::command("one"));
    a.insert(key("y"), KeyTrie::command("two"));

    KeyTrie b = KeyTrie::node("B");
    b.insert(key("y"), KeyTrie::command("two"));
    b.insert(key("x"), KeyTrie::command("one"));

    EXPECT_EQ(a, b);
    b.insert(key("x"), KeyTrie::command("other"));
    EXPECT_NE(a, b);
}

// ============================================================================
// Conversion from document values
// ============================================================================

TEST(KeymapFromValue, CommandsSequencesAndNodes) {
    Value v = {
        {"insert", {{"y", "move_line_down"}}},
        {"normal", {
            {"C-s", {":write", "normal_mode"}},
            {"g", {{"a", "code_action"}}},
        }},
    };
    Keymap keymap = keymap_from_value(v, "keys");

    ASSERT_EQ(keymap.size(), 2u);
    EXPECT_EQ(lookup(keymap, Mode::Insert, {key("y")})->command_name(), "move_line_down");

    const KeyTrie* save = lookup(keymap, Mode::Normal, {key("C-s")});
    ASSERT_NE(save, nullptr);
    EXPECT_EQ(save->kind(), KeyTrie::Kind::Sequence);
    EXPECT_EQ(save->commands(), (std::vector<std::string>{":write", "normal_mode"}));

    EXPECT_EQ(lookup(keymap, Mode::Normal, {key("g"), key("a")})->command_name(), "code_action");
}

TEST(KeymapFromValue, RejectsUnknownMode) {
    Value v = {{"visual", {{"y", "yank"}}}};
    EXPECT_THROW(keymap_from_value(v, "keys"), SchemaError);
}

TEST(KeymapFromValue, RejectsInvalidKey) {
    Value v = {{"normal", {{"Q-x", "yank"}}}};
    try {
        keymap_from_value(v, "keys");
        FAIL() << "expected SchemaError";
    } catch (const SchemaError& e) {
        EXPECT_EQ(e.path(), "keys.normal.Q-x");
    }
}

TEST(KeymapFromValue, RejectsWrongTypes) {
    EXPECT_THROW(keymap_from_value(Value{{"normal", "yank"}}, "keys"), SchemaError);
    EXPECT_THROW(keymap_from_value(Value{{"normal", {{"y", 5}}}}, "keys"), SchemaError);
    EXPECT_THROW(keymap_from_value(Value{{"normal", {{"y", {1, 2}}}}}, "keys"), SchemaError);
    EXPECT_THROW(keymap_from_value(Value::array(), "keys"), SchemaError);
}

TEST(KeymapToValue, RendersCanonicalNotation) {
    KeyTrie normal = KeyTrie::node();
    normal.insert(key("C-S-a"), KeyTrie::command("select_all"));
    Keymap keymap;
    keymap.emplace(Mode::Normal, normal);

    Value v = keymap_to_value(keymap);
    EXPECT_EQ(v["normal"]["S-C-a"], "select_all");
}
