/**
 * @file Resolver.cpp
 * @brief Precedence and per-language resolution
 */

#include "strata/Resolver.hpp"
#include "strata/Document.hpp"
#include "strata/Errors.hpp"
#include "strata/Merge.hpp"

#include <set>
#include <utility>

namespace strata {

namespace {

/**
 * @brief A source after parsing
 */
struct Outcome {
    enum class State {
        WellFormed,
        Malformed,
        Unavailable,
    };

    State state = State::Unavailable;
    const Source* source = nullptr;
    std::optional<RawDocument> doc;
    std::optional<ConfigParseError> error;
};

/**
 * @brief The four ways two outcomes combine
 */
enum class Combination {
    Malformed, // at least one source is malformed
    Both,      // both well-formed
    Single,    // one well-formed, the other unavailable
    Neither,   // both unavailable
};

Combination classify(const Outcome& global, const Outcome& local) {
    using State = Outcome::State;
    if (global.state == State::Malformed || local.state == State::Malformed) {
        return Combination::Malformed;
    }
    if (global.state == State::WellFormed && local.state == State::WellFormed) {
        return Combination::Both;
    }
    if (global.state == State::WellFormed || local.state == State::WellFormed) {
        return Combination::Single;
    }
    return Combination::Neither;
}

Outcome parse_source(const Source& source, spdlog::logger& log) {
    Outcome out;
    out.source = &source;
    if (!source.is_available()) {
        log.debug("config source '{}' unavailable: {}", source.name(), source.cause());
        out.state = Outcome::State::Unavailable;
        return out;
    }
    try {
        out.doc = parse_document(source.name(), source.text());
        out.state = Outcome::State::WellFormed;
    } catch (const ConfigParseError& e) {
        log.debug("config source '{}' is malformed: {}", source.name(), e.what());
        out.error = e;
        out.state = Outcome::State::Malformed;
    }
    return out;
}

/**
 * @brief Base values every language is layered onto
 */
struct BaseLayer {
    std::optional<std::string> theme;
    Keymap keys;
    std::optional<Value> editor_raw;
};

/// Layers keymap overrides onto @p base: lower first, then upper.
Keymap layer_keys(Keymap base, const std::optional<Keymap>& lower,
                  const std::optional<Keymap>& upper) {
    if (lower) merge_keys(base, *lower);
    if (upper) merge_keys(base, *upper);
    return base;
}

/// Deep merges editor overrides onto @p base: lower first, then upper.
std::optional<Value> layer_editor(const std::optional<Value>& base,
                                  const std::optional<Value>& lower,
                                  const std::optional<Value>& upper) {
    return merge_optional_values(merge_optional_values(base, lower), upper);
}

EditorSettings materialize(const std::optional<Value>& raw, const std::string& source,
                           const std::string& scope) {
    try {
        return EditorSettings::from_value(raw);
    } catch (const SchemaError& e) {
        throw ConfigParseError(source, "invalid " + scope + " settings: " + e.what());
    }
}

// An empty `keys` or `editor` table does not count as supplying the field.

std::optional<Keymap> supplied_keys(const LanguageOverride* lang) {
    if (lang == nullptr || !lang->keys || lang->keys->empty()) return std::nullopt;
    return lang->keys;
}

std::optional<Value> supplied_editor(const LanguageOverride* lang) {
    if (lang == nullptr || !lang->editor) return std::nullopt;
    if (lang->editor->is_object() && lang->editor->empty()) return std::nullopt;
    return lang->editor;
}

/// Language blocks by name; a later block for the same name replaces an earlier one.
std::map<std::string, const LanguageOverride*> index_languages(const RawDocument* doc) {
    std::map<std::string, const LanguageOverride*> index;
    if (doc == nullptr) return index;
    for (const auto& lang : doc->languages) {
        index[lang.name] = &lang;
    }
    return index;
}

const LanguageOverride* lookup(const std::map<std::string, const LanguageOverride*>& index,
                               const std::string& name) {
    auto it = index.find(name);
    return it == index.end() ? nullptr : it->second;
}

/**
 * @brief Fill the `*_lang` maps of @p config
 *
 * @p global and @p local may be null for a document that does not take
 * part in the resolution.
 */
void resolve_languages(ResolvedConfig& config, const BaseLayer& base,
                       const RawDocument* global, const RawDocument* local,
                       const std::string& source, spdlog::logger& log) {
    const auto global_langs = index_languages(global);
    const auto local_langs = index_languages(local);

    std::set<std::string> names;
    for (const auto& entry : global_langs) names.insert(entry.first);
    for (const auto& entry : local_langs) names.insert(entry.first);

    for (const auto& name : names) {
        const LanguageOverride* g = lookup(global_langs, name);
        const LanguageOverride* l = lookup(local_langs, name);

        if (l != nullptr && l->theme) {
            config.theme_lang.emplace(name, *l->theme);
        } else if (g != nullptr && g->theme) {
            config.theme_lang.emplace(name, *g->theme);
        }

        auto global_keys = supplied_keys(g);
        auto local_keys = supplied_keys(l);
        if (global_keys || local_keys) {
            config.keys_lang.emplace(name, layer_keys(base.keys, global_keys, local_keys));
        }

        auto global_editor = supplied_editor(g);
        auto local_editor = supplied_editor(l);
        if (global_editor || local_editor) {
            config.editor_lang.emplace(
                name, materialize(layer_editor(base.editor_raw, global_editor, local_editor),
                                  source, "language '" + name + "' editor"));
        }

        log.debug("resolved language '{}': theme={} keys={} editor={}", name,
                  config.theme_lang.count(name) > 0, config.keys_lang.count(name) > 0,
                  config.editor_lang.count(name) > 0);
    }
}

ResolvedConfig build(const BaseLayer& base, const RawDocument* global,
                     const RawDocument* local, const std::string& source,
                     spdlog::logger& log) {
    ResolvedConfig config;
    config.theme = base.theme;
    config.keys = base.keys;
    config.editor = materialize(base.editor_raw, source, "editor");
    resolve_languages(config, base, global, local, source, log);
    return config;
}

} // anonymous namespace

// ============================================================================
// ResolvedConfig
// ============================================================================

ResolvedConfig ResolvedConfig::defaults() {
    return ResolvedConfig{};
}

std::optional<std::string> ResolvedConfig::theme_for(const std::string& language) const {
    auto it = theme_lang.find(language);
    return it == theme_lang.end() ? theme : std::optional<std::string>(it->second);
}

const Keymap& ResolvedConfig::keys_for(const std::string& language) const {
    auto it = keys_lang.find(language);
    return it == keys_lang.end() ? keys : it->second;
}

const EditorSettings& ResolvedConfig::editor_for(const std::string& language) const {
    auto it = editor_lang.find(language);
    return it == editor_lang.end() ? editor : it->second;
}

Value ResolvedConfig::to_value() const {
    Value out = Value::object();
    out["theme"] = theme ? Value(*theme) : Value(nullptr);
    out["keys"] = keymap_to_value(keys);
    out["editor"] = editor.to_value();

    Value languages = Value::object();
    for (const auto& [name, value] : theme_lang) languages[name]["theme"] = value;
    for (const auto& [name, value] : keys_lang) languages[name]["keys"] = keymap_to_value(value);
    for (const auto& [name, value] : editor_lang) languages[name]["editor"] = value.to_value();
    out["language"] = std::move(languages);
    return out;
}

Value ResolvedConfig::view(const std::string& language) const {
    auto lang_theme = theme_for(language);
    Value out = Value::object();
    out["theme"] = lang_theme ? Value(*lang_theme) : Value(nullptr);
    out["keys"] = keymap_to_value(keys_for(language));
    out["editor"] = editor_for(language).to_value();
    return out;
}

bool ResolvedConfig::operator==(const ResolvedConfig& o) const {
    return theme == o.theme && theme_lang == o.theme_lang && keys == o.keys &&
           keys_lang == o.keys_lang && editor == o.editor && editor_lang == o.editor_lang;
}

// ============================================================================
// ConfigLoader
// ============================================================================

ConfigLoader::ConfigLoader(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : spdlog::default_logger()) {
}

ResolvedConfig ConfigLoader::resolve(const Source& global, const Source& local) const {
    Outcome g = parse_source(global, *logger_);
    Outcome l = parse_source(local, *logger_);

    switch (classify(g, l)) {
        case Combination::Malformed:
            // the global document's error wins ties
            throw g.error ? *g.error : *l.error;

        case Combination::Both: {
            logger_->debug("layering '{}' over '{}'", local.name(), global.name());
            BaseLayer base;
            base.theme = l.doc->theme ? l.doc->theme : g.doc->theme;
            base.keys = layer_keys(default_keymap(), g.doc->keys, l.doc->keys);
            base.editor_raw = layer_editor(std::nullopt, g.doc->editor, l.doc->editor);
            return build(base, &*g.doc, &*l.doc, global.name() + ", " + local.name(), *logger_);
        }

        case Combination::Single: {
            const Outcome& only = g.doc ? g : l;
            logger_->debug("using '{}' alone", only.source->name());
            BaseLayer base;
            base.theme = only.doc->theme;
            base.keys = layer_keys(default_keymap(), only.doc->keys, std::nullopt);
            base.editor_raw = only.doc->editor;
            // the absent side takes part as an empty document
            const RawDocument* gdoc = g.doc ? &*g.doc : nullptr;
            const RawDocument* ldoc = l.doc ? &*l.doc : nullptr;
            return build(base, gdoc, ldoc, only.source->name(), *logger_);
        }

        case Combination::Neither:
            break;
    }

    throw SourceUnavailableError(global.name(), global.cause());
}

ResolvedConfig ConfigLoader::resolve_or_default(const Source& global, const Source& local) const {
    try {
        return resolve(global, local);
    } catch (const SourceUnavailableError& e) {
        logger_->warn("no configuration found, using defaults ({})", e.what());
        return ResolvedConfig::defaults();
    }
}

ResolvedConfig ConfigLoader::resolve_default(const ConfigPaths& paths) const {
    logger_->debug("reading global config '{}' and workspace config '{}'", paths.global, paths.local);
    return resolve(read_source(paths.global), read_source(paths.local));
}

ResolvedConfig ConfigLoader::resolve_default() const {
    return resolve_default(ConfigPaths::defaults());
}

ResolvedConfig resolve(const Source& global, const Source& local) {
    return ConfigLoader{}.resolve(global, local);
}

ResolvedConfig resolve_or_default(const Source& global, const Source& local) {
    return ConfigLoader{}.resolve_or_default(global, local);
}

ResolvedConfig resolve_default() {
    return ConfigLoader{}.resolve_default();
}

} // namespace strata
