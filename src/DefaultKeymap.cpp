/**
 * @file DefaultKeymap.cpp
 * @brief Built-in keybindings
 */

#include "strata/Keymap.hpp"

#include <initializer_list>
#include <sstream>

namespace strata {

namespace {

struct Binding {
    /// One or more key notations separated by spaces, all bound to `trie`.
    const char* keys;
    KeyTrie trie;
};

KeyTrie cmd(const char* name) {
    return KeyTrie::command(name);
}

KeyTrie node(const char* name, std::initializer_list<Binding> bindings) {
    KeyTrie trie = KeyTrie::node(name);
    for (const auto& binding : bindings) {
        std::istringstream iss(binding.keys);
        std::string notation;
        while (iss >> notation) {
            trie.insert(KeyEvent::parse(notation), binding.trie);
        }
    }
    return trie;
}

KeyTrie normal_mode() {
    return node("Normal mode", {
        {"h left", cmd("move_char_left")},
        {"j down", cmd("move_visual_line_down")},
        {"k up", cmd("move_visual_line_up")},
        {"l right", cmd("move_char_right")},

        {"t", cmd("find_till_char")},
        {"f", cmd("find_next_char")},
        {"T", cmd("till_prev_char")},
        {"F", cmd("find_prev_char")},
        {"r", cmd("replace")},
        {"R", cmd("replace_with_yanked")},

        {"home", cmd("goto_line_start")},
        {"end", cmd("goto_line_end")},

        {"w", cmd("move_next_word_start")},
        {"b", cmd("move_prev_word_start")},
        {"e", cmd("move_next_word_end")},
        {"W", cmd("move_next_long_word_start")},
        {"B", cmd("move_prev_long_word_start")},
        {"E", cmd("move_next_long_word_end")},

        {"v", cmd("select_mode")},
        {"G", cmd("goto_line")},
        {"g", node("Goto", {
            {"g", cmd("goto_file_start")},
            {"e", cmd("goto_last_line")},
            {"f", cmd("goto_file")},
            {"h", cmd("goto_line_start")},
            {"l", cmd("goto_line_end")},
            {"s", cmd("goto_first_nonwhitespace")},
            {"d", cmd("goto_definition")},
            {"y", cmd("goto_type_definition")},
            {"r", cmd("goto_reference")},
            {"i", cmd("goto_implementation")},
            {"t", cmd("goto_window_top")},
            {"c", cmd("goto_window_center")},
            {"b", cmd("goto_window_bottom")},
            {"a", cmd("goto_last_accessed_file")},
            {"m", cmd("goto_last_modified_file")},
            {"n", cmd("goto_next_buffer")},
            {"p", cmd("goto_previous_buffer")},
            {".", cmd("goto_last_modification")},
        })},
        {":", cmd("command_mode")},

        {"i", cmd("insert_mode")},
        {"I", cmd("insert_at_line_start")},
        {"a", cmd("append_mode")},
        {"A", cmd("insert_at_line_end")},
        {"o", cmd("open_below")},
        {"O", cmd("open_above")},

        {"d", cmd("delete_selection")},
        {"A-d", cmd("delete_selection_noyank")},
        {"c", cmd("change_selection")},
        {"A-c", cmd("change_selection_noyank")},

        {"C", cmd("copy_selection_on_next_line")},
        {"A-C", cmd("copy_selection_on_prev_line")},

        {"s", cmd("select_regex")},
        {"A-s", cmd("split_selection_on_newline")},
        {"S", cmd("split_selection")},
        {";", cmd("collapse_selection")},
        {"A-;", cmd("flip_selections")},
        {"%", cmd("select_all")},
        {"x", cmd("extend_line_below")},
        {"X", cmd("extend_to_line_bounds")},

        {"/", cmd("search")},
        {"?", cmd("rsearch")},
        {"n", cmd("search_next")},
        {"N", cmd("search_prev")},
        {"*", cmd("search_selection")},

        {"u", cmd("undo")},
        {"U", cmd("redo")},
        {"y", cmd("yank")},
        {"p", cmd("paste_after")},
        {"P", cmd("paste_before")},

        {">", cmd("indent")},
        {"<", cmd("unindent")},
        {"=", cmd("format_selections")},
        {"J", cmd("join_selections")},

        {"C-b pageup", cmd("page_up")},
        {"C-f pagedown", cmd("page_down")},
        {"C-u", cmd("half_page_up")},
        {"C-d", cmd("half_page_down")},

        {"C-w", node("Window", {
            {"C-w w", cmd("rotate_view")},
            {"C-s s", cmd("hsplit")},
            {"C-v v", cmd("vsplit")},
            {"C-q q", cmd("wclose")},
            {"C-o o", cmd("wonly")},
            {"C-h h left", cmd("jump_view_left")},
            {"C-j j down", cmd("jump_view_down")},
            {"C-k k up", cmd("jump_view_up")},
            {"C-l l right", cmd("jump_view_right")},
        })},

        {"space", node("Space", {
            {"f", cmd("file_picker")},
            {"b", cmd("buffer_picker")},
            {"s", cmd("symbol_picker")},
            {"a", cmd("code_action")},
            {"'", cmd("last_picker")},
            {"w", node("Window", {
                {"C-w w", cmd("rotate_view")},
                {"C-s s", cmd("hsplit")},
                {"C-v v", cmd("vsplit")},
                {"C-q q", cmd("wclose")},
                {"C-o o", cmd("wonly")},
            })},
            {"y", cmd("yank_joined_to_clipboard")},
            {"p", cmd("paste_clipboard_after")},
            {"P", cmd("paste_clipboard_before")},
            {"/", cmd("global_search")},
            {"k", cmd("hover")},
            {"r", cmd("rename_symbol")},
            {"?", cmd("command_palette")},
        })},

        {"esc", cmd("normal_mode")},
        {"C-z", cmd("suspend")},
        {"C-a", cmd("increment")},
        {"C-x", cmd("decrement")},
    });
}

KeyTrie select_mode() {
    KeyTrie select = normal_mode();
    select.merge_nodes(node("Select mode", {
        {"h left", cmd("extend_char_left")},
        {"j down", cmd("extend_visual_line_down")},
        {"k up", cmd("extend_visual_line_up")},
        {"l right", cmd("extend_char_right")},

        {"w", cmd("extend_next_word_start")},
        {"b", cmd("extend_prev_word_start")},
        {"e", cmd("extend_next_word_end")},
        {"W", cmd("extend_next_long_word_start")},
        {"B", cmd("extend_prev_long_word_start")},
        {"E", cmd("extend_next_long_word_end")},

        {"n", cmd("extend_search_next")},
        {"N", cmd("extend_search_prev")},

        {"t", cmd("extend_till_char")},
        {"f", cmd("extend_next_char")},
        {"T", cmd("extend_till_prev_char")},
        {"F", cmd("extend_prev_char")},

        {"home", cmd("extend_to_line_start")},
        {"end", cmd("extend_to_line_end")},
        {"esc", cmd("exit_select_mode")},

        {"v", cmd("normal_mode")},
    }));
    return select;
}

KeyTrie insert_mode() {
    return node("Insert mode", {
        {"esc", cmd("normal_mode")},

        {"C-s", cmd("commit_undo_checkpoint")},
        {"C-x", cmd("completion")},
        {"C-r", cmd("insert_register")},

        {"C-w A-backspace", cmd("delete_word_backward")},
        {"A-d A-del", cmd("delete_word_forward")},
        {"C-u", cmd("kill_to_line_start")},
        {"C-k", cmd("kill_to_line_end")},
        {"C-h backspace S-backspace", cmd("delete_char_backward")},
        {"C-d del", cmd("delete_char_forward")},
        {"C-j ret", cmd("insert_newline")},
        {"tab", cmd("insert_tab")},

        {"up", cmd("move_visual_line_up")},
        {"down", cmd("move_visual_line_down")},
        {"left", cmd("move_char_left")},
        {"right", cmd("move_char_right")},
        {"pageup", cmd("page_up")},
        {"pagedown", cmd("page_down")},
        {"home", cmd("goto_line_start")},
        {"end", cmd("goto_line_end_newline")},
    });
}

} // anonymous namespace

Keymap default_keymap() {
    Keymap keymap;
    keymap.emplace(Mode::Normal, normal_mode());
    keymap.emplace(Mode::Select, select_mode());
    keymap.emplace(Mode::Insert, insert_mode());
    return keymap;
}

} // namespace strata
