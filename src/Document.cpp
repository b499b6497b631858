/**
 * @file Document.cpp
 * @brief TOML parsing and strict document validation
 */

#include "strata/Document.hpp"
#include "strata/Errors.hpp"

#include <toml++/toml.hpp>

#include <initializer_list>
#include <sstream>

namespace strata {

namespace {

/**
 * @brief Convert toml++ value to a Value tree.
 */
Value toml_node_to_value(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date: {
            std::ostringstream ss;
            ss << node.as_date()->get();
            return Value(ss.str());
        }

        case toml::node_type::time: {
            std::ostringstream ss;
            ss << node.as_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::date_time: {
            std::ostringstream ss;
            ss << node.as_date_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_node_to_value(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_node_to_value(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

void reject_unknown_fields(const std::string& source, const std::string& where,
                           const Value& table, std::initializer_list<const char*> fields) {
    for (auto it = table.begin(); it != table.end(); ++it) {
        bool known = false;
        std::string expected;
        for (const char* field : fields) {
            if (it.key() == field) known = true;
            if (!expected.empty()) expected += ", ";
            expected += std::string("`") + field + "`";
        }
        if (!known) {
            throw ConfigParseError(source, "unknown field `" + it.key() + "` in " + where +
                                               ", expected one of " + expected);
        }
    }
}

std::optional<std::string> read_theme(const std::string& source, const std::string& where,
                                      const Value& table) {
    auto it = table.find("theme");
    if (it == table.end()) return std::nullopt;
    if (!it->is_string()) {
        throw ConfigParseError(source, "invalid type for `" + where + "theme`: " +
                                           type_name(*it) + ", expected a string");
    }
    return it->get<std::string>();
}

std::optional<Keymap> read_keys(const std::string& source, const std::string& path,
                                const Value& table) {
    auto it = table.find("keys");
    if (it == table.end()) return std::nullopt;
    try {
        return keymap_from_value(*it, path);
    } catch (const SchemaError& e) {
        throw ConfigParseError(source, e.what());
    }
}

std::optional<Value> read_editor(const Value& table) {
    auto it = table.find("editor");
    if (it == table.end()) return std::nullopt;
    return *it;
}

LanguageOverride read_language(const std::string& source, const Value& block, std::size_t index) {
    const std::string where = "language[" + std::to_string(index) + "]";
    if (!block.is_object()) {
        throw ConfigParseError(source, "invalid type for `" + where + "`: " +
                                           type_name(block) + ", expected a table");
    }
    reject_unknown_fields(source, where, block, {"name", "theme", "keys", "editor"});

    auto name = block.find("name");
    if (name == block.end()) {
        throw ConfigParseError(source, "missing field `name` in " + where);
    }
    if (!name->is_string() || name->get<std::string>().empty()) {
        throw ConfigParseError(source, "invalid `name` in " + where + ", expected a language name");
    }

    LanguageOverride lang;
    lang.name = name->get<std::string>();
    lang.theme = read_theme(source, where + ".", block);
    lang.keys = read_keys(source, where + ".keys", block);
    lang.editor = read_editor(block);
    return lang;
}

} // anonymous namespace

Value parse_toml(const std::string& source, const std::string& text) {
    toml::table table;
    try {
        table = toml::parse(text, source);
    } catch (const toml::parse_error& e) {
        throw ConfigParseError(
            source,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }
    return toml_node_to_value(table);
}

RawDocument parse_document(const std::string& source, const std::string& text) {
    return document_from_value(source, parse_toml(source, text));
}

RawDocument document_from_value(const std::string& source, const Value& root) {
    if (!root.is_object()) {
        throw ConfigParseError(source, "expected a table at the document root");
    }
    reject_unknown_fields(source, "the document root", root, {"theme", "keys", "editor", "language"});

    RawDocument doc;
    doc.theme = read_theme(source, "", root);
    doc.keys = read_keys(source, "keys", root);
    doc.editor = read_editor(root);

    auto languages = root.find("language");
    if (languages != root.end()) {
        if (!languages->is_array()) {
            throw ConfigParseError(source, "invalid type for `language`: " + type_name(*languages) +
                                               ", expected an array of tables");
        }
        for (std::size_t i = 0; i < languages->size(); ++i) {
            doc.languages.push_back(read_language(source, (*languages)[i], i));
        }
    }

    return doc;
}

} // namespace strata
