/**
 * @file test_key_event.cpp
 * @brief Tests for key notation parsing
 */

#include <gtest/gtest.h>
#include "strata/KeyEvent.hpp"
#include "strata/Errors.hpp"

using namespace strata;

TEST(KeyEventParse, SingleCharacter) {
    KeyEvent key = KeyEvent::parse("y");
    EXPECT_EQ(key.code, KeyCode::Char);
    EXPECT_EQ(key.ch, "y");
    EXPECT_EQ(key.modifiers, kModNone);
}

TEST(KeyEventParse, MultiByteCharacter) {
    KeyEvent key = KeyEvent::parse("ñ");
    EXPECT_EQ(key.code, KeyCode::Char);
    EXPECT_EQ(key.ch, "ñ");
}

TEST(KeyEventParse, NamedKeys) {
    EXPECT_EQ(KeyEvent::parse("ret").code, KeyCode::Enter);
    EXPECT_EQ(KeyEvent::parse("esc").code, KeyCode::Esc);
    EXPECT_EQ(KeyEvent::parse("backspace").code, KeyCode::Backspace);
    EXPECT_EQ(KeyEvent::parse("pagedown").code, KeyCode::PageDown);
    EXPECT_EQ(KeyEvent::parse("space"), KeyEvent::character(" "));
    EXPECT_EQ(KeyEvent::parse("minus"), KeyEvent::character("-"));
    EXPECT_EQ(KeyEvent::parse("lt"), KeyEvent::character("<"));
}

TEST(KeyEventParse, FunctionKeys) {
    KeyEvent key = KeyEvent::parse("A-F12");
    EXPECT_EQ(key.code, KeyCode::Function);
    EXPECT_EQ(key.function, 12);
    EXPECT_EQ(key.modifiers, kModAlt);

    EXPECT_EQ(KeyEvent::parse("F1").function, 1);
    EXPECT_EQ(KeyEvent::parse("F24").function, 24);
    // a lone "F" is the character
    EXPECT_EQ(KeyEvent::parse("F"), KeyEvent::character("F"));
}

TEST(KeyEventParse, ModifierOrderDoesNotMatter) {
    KeyEvent a = KeyEvent::parse("S-C-a");
    KeyEvent b = KeyEvent::parse("C-S-a");
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.modifiers, kModShift | kModControl);
}

TEST(KeyEventParse, InvalidNotation) {
    EXPECT_THROW(KeyEvent::parse(""), KeyParseError);
    EXPECT_THROW(KeyEvent::parse("-"), KeyParseError);
    EXPECT_THROW(KeyEvent::parse("C-"), KeyParseError);
    EXPECT_THROW(KeyEvent::parse("foo"), KeyParseError);
    EXPECT_THROW(KeyEvent::parse("F25"), KeyParseError);
    EXPECT_THROW(KeyEvent::parse("F0"), KeyParseError);
    EXPECT_THROW(KeyEvent::parse("X-a"), KeyParseError);
    EXPECT_THROW(KeyEvent::parse("C-C-a"), KeyParseError);
}

TEST(KeyEventToString, CanonicalModifierOrder) {
    EXPECT_EQ(KeyEvent::parse("C-A-S-x").to_string(), "S-A-C-x");
    EXPECT_EQ(KeyEvent::parse("A-F12").to_string(), "A-F12");
    EXPECT_EQ(KeyEvent::parse("C-space").to_string(), "C-space");
    EXPECT_EQ(KeyEvent::parse("S-backspace").to_string(), "S-backspace");
    EXPECT_EQ(KeyEvent::parse("minus").to_string(), "minus");
}

TEST(KeyEventToString, ParsesBackToSameKey) {
    for (const char* notation : {"y", "S-C-a", "A-F12", "ret", "C-w", "gt", "A-del", "ñ"}) {
        KeyEvent key = KeyEvent::parse(notation);
        EXPECT_EQ(KeyEvent::parse(key.to_string()), key) << notation;
    }
}
