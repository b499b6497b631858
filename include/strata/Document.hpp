/**
 * @file Document.hpp
 * @brief Raw configuration documents and their strict TOML parser
 *
 * Recognized layout:
 *
 * ```toml
 * theme = "nord"
 *
 * [keys.normal]
 * A-F12 = "move_next_word_end"
 *
 * [editor]
 * scrolloff = 8
 *
 * [[language]]
 * name = "rust"
 * theme = "gruvbox"
 * [language.editor]
 * rulers = [100]
 * ```
 *
 * Any other field, at the top level or inside a `[[language]]` block, is
 * a parse error. The `editor` tables are kept untyped; they are only
 * checked once merged and materialized.
 */

#ifndef STRATA_DOCUMENT_HPP
#define STRATA_DOCUMENT_HPP

#include "strata/Keymap.hpp"
#include "strata/Value.hpp"

#include <optional>
#include <string>
#include <vector>

namespace strata {

/**
 * @brief Overrides scoped to one language
 */
struct LanguageOverride {
    std::string name;
    std::optional<std::string> theme;
    std::optional<Keymap> keys;
    std::optional<Value> editor;
};

/**
 * @brief One parsed configuration document, nothing resolved yet
 */
struct RawDocument {
    std::optional<std::string> theme;
    std::optional<Keymap> keys;
    std::optional<Value> editor;
    std::vector<LanguageOverride> languages;
};

/**
 * @brief Parse TOML text into a Value tree
 *
 * Dates and times are kept as their TOML text.
 *
 * @param source Name used in error messages (usually the file path)
 * @param text TOML document
 * @throws ConfigParseError on syntax errors, with line and column
 */
Value parse_toml(const std::string& source, const std::string& text);

/**
 * @brief Parse a configuration document under the strict schema
 *
 * @param source Name used in error messages (usually the file path)
 * @param text TOML document
 * @return The raw document
 * @throws ConfigParseError on syntax errors, unknown fields, wrong value
 *         types, unknown modes and invalid key notation
 */
RawDocument parse_document(const std::string& source, const std::string& text);

/**
 * @brief Validate an already-parsed value tree as a document
 * @throws ConfigParseError as parse_document()
 */
RawDocument document_from_value(const std::string& source, const Value& root);

} // namespace strata

#endif // STRATA_DOCUMENT_HPP
