/**
 * @file EditorSettings.cpp
 * @brief Schema-checked conversion between Values and EditorSettings
 */

#include "strata/EditorSettings.hpp"
#include "strata/Errors.hpp"

#include <cstddef>
#include <initializer_list>
#include <limits>
#include <type_traits>
#include <utility>

namespace strata {

namespace {

template <typename E>
using EnumNames = std::initializer_list<std::pair<const char*, E>>;

const EnumNames<LineNumber> kLineNumberNames = {
    {"absolute", LineNumber::Absolute},
    {"relative", LineNumber::Relative},
};

const EnumNames<BufferLine> kBufferLineNames = {
    {"never", BufferLine::Never},
    {"always", BufferLine::Always},
    {"multiple", BufferLine::Multiple},
};

const EnumNames<CursorKind> kCursorKindNames = {
    {"block", CursorKind::Block},
    {"bar", CursorKind::Bar},
    {"underline", CursorKind::Underline},
    {"hidden", CursorKind::Hidden},
};

const EnumNames<WhitespaceRenderValue> kRenderNames = {
    {"none", WhitespaceRenderValue::None},
    {"all", WhitespaceRenderValue::All},
};

template <typename E>
const char* enum_name(const EnumNames<E>& names, E value) {
    for (const auto& [name, v] : names) {
        if (v == value) return name;
    }
    return "";
}

std::size_t utf8_length(const std::string& s) {
    std::size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

/**
 * @brief Reads the fields of one settings table
 *
 * The constructor rejects non-tables and unknown fields; read() leaves
 * the target untouched when the field is absent.
 */
class TableReader {
public:
    TableReader(const Value& table, std::string path, std::initializer_list<const char*> fields)
        : table_(table), path_(std::move(path)) {
        if (!table_.is_object()) {
            throw SchemaError(path_, "invalid type: " + type_name(table_) + ", expected a table");
        }
        for (auto it = table_.begin(); it != table_.end(); ++it) {
            bool known = false;
            for (const char* field : fields) {
                if (it.key() == field) {
                    known = true;
                    break;
                }
            }
            if (!known) {
                std::string expected;
                for (const char* field : fields) {
                    if (!expected.empty()) expected += ", ";
                    expected += std::string("`") + field + "`";
                }
                throw SchemaError(path_, "unknown field `" + it.key() + "`, expected one of " + expected);
            }
        }
    }

    const Value* find(const char* key) const {
        auto it = table_.find(key);
        return it == table_.end() ? nullptr : &*it;
    }

    std::string path_of(const char* key) const {
        return path_.empty() ? std::string(key) : path_ + "." + key;
    }

    void read(const char* key, bool& out) const {
        if (const Value* v = find(key)) {
            if (!v->is_boolean()) mismatch(key, *v, "a boolean");
            out = v->get<bool>();
        }
    }

    void read(const char* key, std::string& out) const {
        if (const Value* v = find(key)) {
            if (!v->is_string()) mismatch(key, *v, "a string");
            out = v->get<std::string>();
        }
    }

    template <typename Int>
    std::enable_if_t<std::is_integral_v<Int> && !std::is_same_v<Int, bool>>
    read(const char* key, Int& out) const {
        if (const Value* v = find(key)) {
            out = to_integer<Int>(*v, path_of(key));
        }
    }

    template <typename Int>
    void read(const char* key, std::optional<Int>& out) const {
        if (const Value* v = find(key)) {
            out = to_integer<Int>(*v, path_of(key));
        }
    }

    template <typename Int>
    void read(const char* key, std::vector<Int>& out) const {
        if (const Value* v = find(key)) {
            if (!v->is_array()) mismatch(key, *v, "an array");
            std::vector<Int> items;
            for (std::size_t i = 0; i < v->size(); ++i) {
                items.push_back(to_integer<Int>((*v)[i], path_of(key) + "." + std::to_string(i)));
            }
            out = std::move(items);
        }
    }

    void read(const char* key, std::vector<std::string>& out) const {
        if (const Value* v = find(key)) {
            if (!v->is_array()) mismatch(key, *v, "an array");
            std::vector<std::string> items;
            for (const auto& elem : *v) {
                if (!elem.is_string()) mismatch(key, elem, "an array of strings");
                items.push_back(elem.get<std::string>());
            }
            out = std::move(items);
        }
    }

    template <typename E>
    void read_enum(const char* key, const EnumNames<E>& names, E& out) const {
        if (const Value* v = find(key)) {
            out = to_enum(*v, path_of(key), names);
        }
    }

    template <typename E>
    void read_enum(const char* key, const EnumNames<E>& names, std::optional<E>& out) const {
        if (const Value* v = find(key)) {
            out = to_enum(*v, path_of(key), names);
        }
    }

    void read_char(const char* key, std::string& out) const {
        if (const Value* v = find(key)) {
            if (!v->is_string() || utf8_length(v->get<std::string>()) != 1) {
                throw SchemaError(path_of(key), "expected a single character");
            }
            out = v->get<std::string>();
        }
    }

    template <typename E>
    static E to_enum(const Value& v, const std::string& path, const EnumNames<E>& names) {
        std::string expected;
        for (const auto& [name, value] : names) {
            if (v.is_string() && v.get<std::string>() == name) return value;
            if (!expected.empty()) expected += ", ";
            expected += std::string("`") + name + "`";
        }
        if (!v.is_string()) {
            throw SchemaError(path, "invalid type: " + type_name(v) + ", expected a string");
        }
        throw SchemaError(path, "unknown variant `" + v.get<std::string>() +
                                    "`, expected one of " + expected);
    }

    template <typename Int>
    static Int to_integer(const Value& v, const std::string& path) {
        if (!v.is_number_integer()) {
            throw SchemaError(path, "invalid type: " + type_name(v) + ", expected an integer");
        }
        if (v.is_number_unsigned()) {
            const auto u = v.get<std::uint64_t>();
            if (u > static_cast<std::uint64_t>(std::numeric_limits<Int>::max())) {
                throw SchemaError(path, "invalid value: integer `" + std::to_string(u) + "` is out of range");
            }
            return static_cast<Int>(u);
        }
        const auto i = v.get<std::int64_t>();
        const bool too_small = std::is_unsigned_v<Int>
            ? i < 0
            : i < static_cast<std::int64_t>(std::numeric_limits<Int>::min());
        const bool too_large = i > 0 &&
            static_cast<std::uint64_t>(i) > static_cast<std::uint64_t>(std::numeric_limits<Int>::max());
        if (too_small || too_large) {
            throw SchemaError(path, "invalid value: integer `" + std::to_string(i) + "` is out of range");
        }
        return static_cast<Int>(i);
    }

private:
    [[noreturn]] void mismatch(const char* key, const Value& v, const char* expected) const {
        throw SchemaError(path_of(key), "invalid type: " + type_name(v) + ", expected " + expected);
    }

    const Value& table_;
    std::string path_;
};

void read_search(const Value& v, const std::string& path, SearchSettings& out) {
    TableReader r(v, path, {"smart-case", "wrap-around"});
    r.read("smart-case", out.smart_case);
    r.read("wrap-around", out.wrap_around);
}

void read_cursor_shape(const Value& v, const std::string& path, CursorShapeSettings& out) {
    TableReader r(v, path, {"normal", "select", "insert"});
    r.read_enum("normal", kCursorKindNames, out.normal);
    r.read_enum("select", kCursorKindNames, out.select);
    r.read_enum("insert", kCursorKindNames, out.insert);
}

void read_file_picker(const Value& v, const std::string& path, FilePickerSettings& out) {
    TableReader r(v, path, {"hidden", "follow-symlinks", "parents", "ignore",
                            "git-ignore", "git-global", "git-exclude", "max-depth"});
    r.read("hidden", out.hidden);
    r.read("follow-symlinks", out.follow_symlinks);
    r.read("parents", out.parents);
    r.read("ignore", out.ignore);
    r.read("git-ignore", out.git_ignore);
    r.read("git-global", out.git_global);
    r.read("git-exclude", out.git_exclude);
    r.read("max-depth", out.max_depth);
}

void read_lsp(const Value& v, const std::string& path, LspSettings& out) {
    TableReader r(v, path, {"display-messages", "auto-signature-help", "display-signature-help-docs"});
    r.read("display-messages", out.display_messages);
    r.read("auto-signature-help", out.auto_signature_help);
    r.read("display-signature-help-docs", out.display_signature_help_docs);
}

void read_whitespace(const Value& v, const std::string& path, WhitespaceSettings& out) {
    TableReader r(v, path, {"render", "characters"});

    if (const Value* render = r.find("render")) {
        const std::string render_path = r.path_of("render");
        if (render->is_object()) {
            TableReader rr(*render, render_path, {"default", "space", "nbsp", "tab", "newline"});
            rr.read_enum("default", kRenderNames, out.render_default);
            rr.read_enum("space", kRenderNames, out.render_space);
            rr.read_enum("nbsp", kRenderNames, out.render_nbsp);
            rr.read_enum("tab", kRenderNames, out.render_tab);
            rr.read_enum("newline", kRenderNames, out.render_newline);
        } else {
            out.render_default = TableReader::to_enum(*render, render_path, kRenderNames);
        }
    }

    if (const Value* chars = r.find("characters")) {
        TableReader cr(*chars, r.path_of("characters"), {"space", "nbsp", "tab", "newline", "tabpad"});
        cr.read_char("space", out.space);
        cr.read_char("nbsp", out.nbsp);
        cr.read_char("tab", out.tab);
        cr.read_char("newline", out.newline);
        cr.read_char("tabpad", out.tabpad);
    }
}

void read_indent_guides(const Value& v, const std::string& path, IndentGuidesSettings& out) {
    TableReader r(v, path, {"render", "character", "skip-levels"});
    r.read("render", out.render);
    r.read_char("character", out.character);
    r.read("skip-levels", out.skip_levels);
}

} // anonymous namespace

EditorSettings EditorSettings::from_value(const std::optional<Value>& value) {
    EditorSettings out;
    if (!value) {
        return out;
    }

    TableReader r(*value, "", {
        "scrolloff", "scroll-lines", "mouse", "shell", "line-number",
        "cursorline", "cursorcolumn", "middle-click-paste", "auto-pairs",
        "auto-completion", "auto-format", "auto-save", "idle-timeout",
        "completion-trigger-len", "auto-info", "true-color", "undercurl",
        "rulers", "color-modes", "bufferline", "search", "cursor-shape",
        "file-picker", "lsp", "whitespace", "indent-guides",
    });

    r.read("scrolloff", out.scrolloff);
    r.read("scroll-lines", out.scroll_lines);
    r.read("mouse", out.mouse);
    r.read("shell", out.shell);
    r.read_enum("line-number", kLineNumberNames, out.line_number);
    r.read("cursorline", out.cursorline);
    r.read("cursorcolumn", out.cursorcolumn);
    r.read("middle-click-paste", out.middle_click_paste);
    r.read("auto-pairs", out.auto_pairs);
    r.read("auto-completion", out.auto_completion);
    r.read("auto-format", out.auto_format);
    r.read("auto-save", out.auto_save);
    r.read("idle-timeout", out.idle_timeout);
    r.read("completion-trigger-len", out.completion_trigger_len);
    r.read("auto-info", out.auto_info);
    r.read("true-color", out.true_color);
    r.read("undercurl", out.undercurl);
    r.read("rulers", out.rulers);
    r.read("color-modes", out.color_modes);
    r.read_enum("bufferline", kBufferLineNames, out.bufferline);

    if (const Value* v = r.find("search")) read_search(*v, "search", out.search);
    if (const Value* v = r.find("cursor-shape")) read_cursor_shape(*v, "cursor-shape", out.cursor_shape);
    if (const Value* v = r.find("file-picker")) read_file_picker(*v, "file-picker", out.file_picker);
    if (const Value* v = r.find("lsp")) read_lsp(*v, "lsp", out.lsp);
    if (const Value* v = r.find("whitespace")) read_whitespace(*v, "whitespace", out.whitespace);
    if (const Value* v = r.find("indent-guides")) read_indent_guides(*v, "indent-guides", out.indent_guides);

    return out;
}

Value EditorSettings::to_value() const {
    Value out = Value::object();
    out["scrolloff"] = scrolloff;
    out["scroll-lines"] = scroll_lines;
    out["mouse"] = mouse;
    out["shell"] = shell;
    out["line-number"] = enum_name(kLineNumberNames, line_number);
    out["cursorline"] = cursorline;
    out["cursorcolumn"] = cursorcolumn;
    out["middle-click-paste"] = middle_click_paste;
    out["auto-pairs"] = auto_pairs;
    out["auto-completion"] = auto_completion;
    out["auto-format"] = auto_format;
    out["auto-save"] = auto_save;
    out["idle-timeout"] = idle_timeout;
    out["completion-trigger-len"] = completion_trigger_len;
    out["auto-info"] = auto_info;
    out["true-color"] = true_color;
    out["undercurl"] = undercurl;
    out["rulers"] = rulers;
    out["color-modes"] = color_modes;
    out["bufferline"] = enum_name(kBufferLineNames, bufferline);

    out["search"] = {
        {"smart-case", search.smart_case},
        {"wrap-around", search.wrap_around},
    };
    out["cursor-shape"] = {
        {"normal", enum_name(kCursorKindNames, cursor_shape.normal)},
        {"select", enum_name(kCursorKindNames, cursor_shape.select)},
        {"insert", enum_name(kCursorKindNames, cursor_shape.insert)},
    };

    Value picker = {
        {"hidden", file_picker.hidden},
        {"follow-symlinks", file_picker.follow_symlinks},
        {"parents", file_picker.parents},
        {"ignore", file_picker.ignore},
        {"git-ignore", file_picker.git_ignore},
        {"git-global", file_picker.git_global},
        {"git-exclude", file_picker.git_exclude},
    };
    if (file_picker.max_depth) picker["max-depth"] = *file_picker.max_depth;
    out["file-picker"] = std::move(picker);

    out["lsp"] = {
        {"display-messages", lsp.display_messages},
        {"auto-signature-help", lsp.auto_signature_help},
        {"display-signature-help-docs", lsp.display_signature_help_docs},
    };

    Value render;
    if (!whitespace.render_space && !whitespace.render_nbsp &&
        !whitespace.render_tab && !whitespace.render_newline) {
        render = enum_name(kRenderNames, whitespace.render_default);
    } else {
        render = Value::object();
        render["default"] = enum_name(kRenderNames, whitespace.render_default);
        if (whitespace.render_space) render["space"] = enum_name(kRenderNames, *whitespace.render_space);
        if (whitespace.render_nbsp) render["nbsp"] = enum_name(kRenderNames, *whitespace.render_nbsp);
        if (whitespace.render_tab) render["tab"] = enum_name(kRenderNames, *whitespace.render_tab);
        if (whitespace.render_newline) render["newline"] = enum_name(kRenderNames, *whitespace.render_newline);
    }
    out["whitespace"] = {
        {"render", render},
        {"characters", {
            {"space", whitespace.space},
            {"nbsp", whitespace.nbsp},
            {"tab", whitespace.tab},
            {"newline", whitespace.newline},
            {"tabpad", whitespace.tabpad},
        }},
    };

    out["indent-guides"] = {
        {"render", indent_guides.render},
        {"character", indent_guides.character},
        {"skip-levels", indent_guides.skip_levels},
    };

    return out;
}

bool EditorSettings::operator==(const EditorSettings& o) const {
    return scrolloff == o.scrolloff && scroll_lines == o.scroll_lines &&
           mouse == o.mouse && shell == o.shell && line_number == o.line_number &&
           cursorline == o.cursorline && cursorcolumn == o.cursorcolumn &&
           middle_click_paste == o.middle_click_paste && auto_pairs == o.auto_pairs &&
           auto_completion == o.auto_completion && auto_format == o.auto_format &&
           auto_save == o.auto_save && idle_timeout == o.idle_timeout &&
           completion_trigger_len == o.completion_trigger_len &&
           auto_info == o.auto_info && true_color == o.true_color &&
           undercurl == o.undercurl && rulers == o.rulers &&
           color_modes == o.color_modes && bufferline == o.bufferline &&
           search == o.search && cursor_shape == o.cursor_shape &&
           file_picker == o.file_picker && lsp == o.lsp &&
           whitespace == o.whitespace && indent_guides == o.indent_guides;
}

} // namespace strata
