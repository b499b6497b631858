/**
 * @file test_document.cpp
 * @brief Tests for strict document parsing
 */

#include <gtest/gtest.h>
#include "strata/Document.hpp"
#include "strata/Errors.hpp"

using namespace strata;

// ============================================================================
// Well-formed documents
// ============================================================================

TEST(ParseDocument, EmptyDocument) {
    RawDocument doc = parse_document("empty.toml", "");
    EXPECT_FALSE(doc.theme.has_value());
    EXPECT_FALSE(doc.keys.has_value());
    EXPECT_FALSE(doc.editor.has_value());
    EXPECT_TRUE(doc.languages.empty());
}

TEST(ParseDocument, AllSections) {
    RawDocument doc = parse_document("config.toml", R"(
        theme = "nord"

        [keys.insert]
        y = "move_line_down"
        S-C-a = "delete_selection"

        [keys.normal]
        A-F12 = "move_next_word_end"

        [editor]
        scrolloff = 8

        [editor.search]
        smart-case = false

        [[language]]
        name = "rust"
        theme = "gruvbox"

        [language.editor]
        rulers = [100]

        [[language]]
        name = "python"

        [language.keys.normal]
        C-r = ":reload"
    )");

    ASSERT_TRUE(doc.theme.has_value());
    EXPECT_EQ(*doc.theme, "nord");

    ASSERT_TRUE(doc.keys.has_value());
    EXPECT_EQ(doc.keys->size(), 2u);
    const KeyTrie* y = doc.keys->at(Mode::Insert).search({KeyEvent::parse("y")});
    ASSERT_NE(y, nullptr);
    EXPECT_EQ(y->command_name(), "move_line_down");

    ASSERT_TRUE(doc.editor.has_value());
    EXPECT_EQ((*doc.editor)["scrolloff"], 8);
    EXPECT_EQ((*doc.editor)["search"]["smart-case"], false);

    ASSERT_EQ(doc.languages.size(), 2u);
    EXPECT_EQ(doc.languages[0].name, "rust");
    EXPECT_EQ(doc.languages[0].theme, std::optional<std::string>("gruvbox"));
    EXPECT_FALSE(doc.languages[0].keys.has_value());
    ASSERT_TRUE(doc.languages[0].editor.has_value());
    EXPECT_EQ((*doc.languages[0].editor)["rulers"][0], 100);

    EXPECT_EQ(doc.languages[1].name, "python");
    EXPECT_FALSE(doc.languages[1].theme.has_value());
    ASSERT_TRUE(doc.languages[1].keys.has_value());
    EXPECT_TRUE(doc.languages[1].keys->count(Mode::Normal));
}

TEST(ParseDocument, EditorIsKeptUntyped) {
    // not a settings field, but only materialization checks that
    RawDocument doc = parse_document("config.toml", "[editor]\nno-such-setting = 1\n");
    ASSERT_TRUE(doc.editor.has_value());
    EXPECT_EQ((*doc.editor)["no-such-setting"], 1);
}

// ============================================================================
// Structural failures
// ============================================================================

TEST(ParseDocument, SyntaxErrorHasPosition) {
    try {
        parse_document("broken.toml", "theme = \"nord\"\nkeys = [\n");
        FAIL() << "expected ConfigParseError";
    } catch (const ConfigParseError& e) {
        EXPECT_EQ(e.source(), "broken.toml");
        EXPECT_GT(e.line(), 0);
    }
}

TEST(ParseDocument, UnknownTopLevelField) {
    try {
        parse_document("config.toml", "theme = \"nord\"\nthem = \"x\"\n");
        FAIL() << "expected ConfigParseError";
    } catch (const ConfigParseError& e) {
        EXPECT_NE(e.details().find("them"), std::string::npos);
    }
}

TEST(ParseDocument, UnknownLanguageField) {
    EXPECT_THROW(parse_document("config.toml", R"(
        [[language]]
        name = "rust"
        indent = 4
    )"), ConfigParseError);
}

TEST(ParseDocument, LanguageNeedsName) {
    EXPECT_THROW(parse_document("config.toml", "[[language]]\ntheme = \"nord\"\n"),
                 ConfigParseError);
    EXPECT_THROW(parse_document("config.toml", "[[language]]\nname = 3\n"),
                 ConfigParseError);
}

TEST(ParseDocument, WrongValueTypes) {
    EXPECT_THROW(parse_document("config.toml", "theme = 3\n"), ConfigParseError);
    EXPECT_THROW(parse_document("config.toml", "keys = \"normal\"\n"), ConfigParseError);
    EXPECT_THROW(parse_document("config.toml", "language = \"rust\"\n"), ConfigParseError);
    EXPECT_THROW(parse_document("config.toml", "language = [1]\n"), ConfigParseError);
}

TEST(ParseDocument, InvalidKeysAreStructural) {
    EXPECT_THROW(parse_document("config.toml", "[keys.visual]\ny = \"yank\"\n"), ConfigParseError);
    EXPECT_THROW(parse_document("config.toml", "[keys.normal]\nC-C-y = \"yank\"\n"), ConfigParseError);
    EXPECT_THROW(parse_document("config.toml", "[keys.normal]\ny = 1\n"), ConfigParseError);
}

TEST(ParseToml, DatesKeptAsText) {
    Value v = parse_toml("dates.toml", "when = 1979-05-27\n");
    ASSERT_TRUE(v["when"].is_string());
    EXPECT_EQ(v["when"], "1979-05-27");
}
