/**
 * @file Loader.hpp
 * @brief Acquiring configuration text from disk
 *
 * The resolver never touches the filesystem. Everything it needs from
 * disk arrives as a Source: either the text of a document or the reason
 * it could not be obtained.
 */

#ifndef STRATA_LOADER_HPP
#define STRATA_LOADER_HPP

#include <optional>
#include <string>

namespace strata {

/**
 * @brief Text of one configuration document, or why it is unavailable
 */
class Source {
public:
    /**
     * @param name Name used in diagnostics (usually the file path)
     * @param text Document text
     */
    static Source available(std::string name, std::string text);

    /**
     * @param name Name used in diagnostics (usually the file path)
     * @param cause Why the document could not be read
     */
    static Source unavailable(std::string name, std::string cause);

    bool is_available() const noexcept { return text_.has_value(); }
    const std::string& name() const noexcept { return name_; }

    /// Document text; empty when unavailable.
    const std::string& text() const noexcept;

    /// Unavailability reason; empty when available.
    const std::string& cause() const noexcept { return cause_; }

private:
    Source() = default;

    std::string name_;
    std::optional<std::string> text_;
    std::string cause_;
};

/**
 * @brief Read the file at @p path into a Source
 *
 * Never throws for I/O problems: a missing, non-regular or unreadable
 * file yields Source::unavailable() with the reason.
 */
Source read_source(const std::string& path);

/**
 * @brief Locate the workspace root
 *
 * Walks up from @p start_dir (empty = current working directory) and
 * returns the first directory containing a `.git` or `.strata` entry.
 * Falls back to the start directory when none is found.
 */
std::string find_workspace(const std::string& start_dir = "");

/**
 * @brief Per-user configuration directory
 *
 * `$XDG_CONFIG_HOME/strata`, else `$HOME/.config/strata`, else
 * `.config/strata` relative to the current directory.
 */
std::string config_dir();

/**
 * @brief Locations of the two configuration documents
 */
struct ConfigPaths {
    /// Global (per-user) document.
    std::string global;
    /// Local (workspace) document.
    std::string local;

    /**
     * @brief Default locations
     *
     * global = config_dir()/config.toml,
     * local = find_workspace()/.strata/config.toml
     */
    static ConfigPaths defaults();
};

} // namespace strata

#endif // STRATA_LOADER_HPP
