/**
 * @file Resolver.hpp
 * @brief Resolution of the global and local documents into one config
 *
 * Precedence, lowest to highest:
 *
 *   built-in defaults <- global document <- local document
 *
 * and, for each language named by either document:
 *
 *   resolved base <- global [[language]] block <- local [[language]] block
 *
 * Outcome of a resolve call, by what the two sources turn out to be:
 * - either is malformed: ConfigParseError (the global one if both are)
 * - both well-formed: both are layered
 * - one well-formed, the other unavailable: that one alone is layered
 * - both unavailable: SourceUnavailableError for the global source
 */

#ifndef STRATA_RESOLVER_HPP
#define STRATA_RESOLVER_HPP

#include "strata/EditorSettings.hpp"
#include "strata/Keymap.hpp"
#include "strata/Loader.hpp"
#include "strata/Value.hpp"

#include <spdlog/spdlog.h>

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace strata {

/**
 * @brief Fully resolved configuration
 *
 * `keys` always holds every mode. The `*_lang` maps only hold languages
 * for which some document supplied that particular field; `keys_lang`
 * entries are complete keymaps layered onto `keys`.
 */
struct ResolvedConfig {
    std::optional<std::string> theme;
    std::map<std::string, std::string> theme_lang;
    Keymap keys = default_keymap();
    std::map<std::string, Keymap> keys_lang;
    EditorSettings editor;
    std::map<std::string, EditorSettings> editor_lang;

    /// Built-in keymap, default editor settings, no theme, no languages.
    static ResolvedConfig defaults();

    /// Theme for @p language, falling back to the base theme.
    std::optional<std::string> theme_for(const std::string& language) const;
    /// Keymap for @p language, falling back to the base keymap.
    const Keymap& keys_for(const std::string& language) const;
    /// Editor settings for @p language, falling back to the base settings.
    const EditorSettings& editor_for(const std::string& language) const;

    /**
     * @brief Render as a Value tree
     *
     * {"theme", "keys", "editor", "language": {name: {"theme", "keys", "editor"}}}
     * where each language entry only holds the fields it overrides.
     */
    Value to_value() const;

    /**
     * @brief Render the configuration as seen from one language
     *
     * {"theme", "keys", "editor"} using the language's values where it has
     * them and the base values otherwise.
     */
    Value view(const std::string& language) const;

    bool operator==(const ResolvedConfig& o) const;
    bool operator!=(const ResolvedConfig& o) const { return !(*this == o); }
};

/**
 * @brief Resolves configuration sources, logging through spdlog
 *
 * Holds no state besides the logger; one instance may be shared between
 * threads.
 */
class ConfigLoader {
public:
    /// Uses spdlog's default logger when @p logger is null.
    explicit ConfigLoader(std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief Resolve the global and local sources
     * @throws ConfigParseError if either source is malformed or its
     *         editor settings fail to materialize
     * @throws SourceUnavailableError if both sources are unavailable
     */
    ResolvedConfig resolve(const Source& global, const Source& local) const;

    /**
     * @brief As resolve(), but two unavailable sources yield defaults
     * @throws ConfigParseError as resolve()
     */
    ResolvedConfig resolve_or_default(const Source& global, const Source& local) const;

    /**
     * @brief Read both documents from disk and resolve them
     */
    ResolvedConfig resolve_default(const ConfigPaths& paths) const;
    ResolvedConfig resolve_default() const;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

/// ConfigLoader{}.resolve(global, local)
ResolvedConfig resolve(const Source& global, const Source& local);

/// ConfigLoader{}.resolve_or_default(global, local)
ResolvedConfig resolve_or_default(const Source& global, const Source& local);

/// ConfigLoader{}.resolve_default(ConfigPaths::defaults())
ResolvedConfig resolve_default();

} // namespace strata

#endif // STRATA_RESOLVER_HPP
