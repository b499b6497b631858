/**
 * @file EditorSettings.hpp
 * @brief Strongly-typed editor settings and their conversion from Values
 *
 * Documents spell every field in kebab-case (`scroll-lines`,
 * `cursor-shape.insert`). Every field is optional; absent fields keep the
 * defaults declared below. Unknown fields are rejected at every level.
 */

#ifndef STRATA_EDITOR_SETTINGS_HPP
#define STRATA_EDITOR_SETTINGS_HPP

#include "strata/Value.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace strata {

enum class LineNumber {
    Absolute,
    Relative,
};

enum class BufferLine {
    Never,
    Always,
    Multiple,
};

enum class CursorKind {
    Block,
    Bar,
    Underline,
    Hidden,
};

enum class WhitespaceRenderValue {
    None,
    All,
};

struct SearchSettings {
    bool smart_case = true;
    bool wrap_around = true;

    bool operator==(const SearchSettings& o) const {
        return smart_case == o.smart_case && wrap_around == o.wrap_around;
    }
};

struct CursorShapeSettings {
    CursorKind normal = CursorKind::Block;
    CursorKind select = CursorKind::Block;
    CursorKind insert = CursorKind::Block;

    bool operator==(const CursorShapeSettings& o) const {
        return normal == o.normal && select == o.select && insert == o.insert;
    }
};

struct FilePickerSettings {
    bool hidden = true;
    bool follow_symlinks = true;
    bool parents = true;
    bool ignore = true;
    bool git_ignore = true;
    bool git_global = true;
    bool git_exclude = true;
    std::optional<std::uint64_t> max_depth;

    bool operator==(const FilePickerSettings& o) const {
        return hidden == o.hidden && follow_symlinks == o.follow_symlinks &&
               parents == o.parents && ignore == o.ignore &&
               git_ignore == o.git_ignore && git_global == o.git_global &&
               git_exclude == o.git_exclude && max_depth == o.max_depth;
    }
};

struct LspSettings {
    bool display_messages = false;
    bool auto_signature_help = true;
    bool display_signature_help_docs = true;

    bool operator==(const LspSettings& o) const {
        return display_messages == o.display_messages &&
               auto_signature_help == o.auto_signature_help &&
               display_signature_help_docs == o.display_signature_help_docs;
    }
};

/**
 * @brief Whitespace rendering
 *
 * `render` is either a single value for every kind of whitespace
 * (`render = "all"`) or a table with per-kind values; kinds left out of
 * the table use `default`.
 */
struct WhitespaceSettings {
    WhitespaceRenderValue render_default = WhitespaceRenderValue::None;
    std::optional<WhitespaceRenderValue> render_space;
    std::optional<WhitespaceRenderValue> render_nbsp;
    std::optional<WhitespaceRenderValue> render_tab;
    std::optional<WhitespaceRenderValue> render_newline;

    std::string space = "·";
    std::string nbsp = "⍽";
    std::string tab = "→";
    std::string newline = "⏎";
    std::string tabpad = " ";

    WhitespaceRenderValue space_render() const { return render_space.value_or(render_default); }
    WhitespaceRenderValue nbsp_render() const { return render_nbsp.value_or(render_default); }
    WhitespaceRenderValue tab_render() const { return render_tab.value_or(render_default); }
    WhitespaceRenderValue newline_render() const { return render_newline.value_or(render_default); }

    bool operator==(const WhitespaceSettings& o) const {
        return render_default == o.render_default && render_space == o.render_space &&
               render_nbsp == o.render_nbsp && render_tab == o.render_tab &&
               render_newline == o.render_newline && space == o.space &&
               nbsp == o.nbsp && tab == o.tab && newline == o.newline &&
               tabpad == o.tabpad;
    }
};

struct IndentGuidesSettings {
    bool render = false;
    std::string character = "│";
    std::uint8_t skip_levels = 0;

    bool operator==(const IndentGuidesSettings& o) const {
        return render == o.render && character == o.character &&
               skip_levels == o.skip_levels;
    }
};

/**
 * @brief Fully materialized editor settings
 *
 * Default-constructed settings are the documented defaults.
 */
struct EditorSettings {
    std::uint64_t scrolloff = 5;
    std::int64_t scroll_lines = 3;
    bool mouse = true;
    std::vector<std::string> shell = {"sh", "-c"};
    LineNumber line_number = LineNumber::Absolute;
    bool cursorline = false;
    bool cursorcolumn = false;
    bool middle_click_paste = true;
    bool auto_pairs = true;
    bool auto_completion = true;
    bool auto_format = true;
    bool auto_save = false;
    /// Milliseconds.
    std::uint64_t idle_timeout = 400;
    std::uint8_t completion_trigger_len = 2;
    bool auto_info = true;
    bool true_color = false;
    bool undercurl = false;
    std::vector<std::uint16_t> rulers;
    bool color_modes = false;
    BufferLine bufferline = BufferLine::Never;

    SearchSettings search;
    CursorShapeSettings cursor_shape;
    FilePickerSettings file_picker;
    LspSettings lsp;
    WhitespaceSettings whitespace;
    IndentGuidesSettings indent_guides;

    /**
     * @brief Materialize settings from a merged document value
     *
     * @param value Merged `editor` table, or nullopt for "not configured"
     * @return Settings with every absent field at its default
     * @throws SchemaError for unknown fields, wrong types and out-of-range
     *         numbers
     */
    static EditorSettings from_value(const std::optional<Value>& value);

    /// Render every field back to a kebab-case table.
    Value to_value() const;

    bool operator==(const EditorSettings& o) const;
    bool operator!=(const EditorSettings& o) const { return !(*this == o); }
};

} // namespace strata

#endif // STRATA_EDITOR_SETTINGS_HPP
