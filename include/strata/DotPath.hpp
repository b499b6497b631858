/**
 * @file DotPath.hpp
 * @brief Dot-notation access into rendered configuration values
 *
 * Used to look up single values of a resolved configuration rendered by
 * ResolvedConfig::to_value(), e.g. "editor.search.smart-case" or
 * "keys.normal.g.e". Array elements are addressed by index ("editor.shell.0").
 */

#ifndef STRATA_DOTPATH_HPP
#define STRATA_DOTPATH_HPP

#include "strata/Value.hpp"

#include <string>
#include <vector>

namespace strata {

/**
 * @brief Split a dot-path into segments
 *
 * Examples:
 * - "editor.scrolloff" → ["editor", "scrolloff"]
 * - "" → []
 */
std::vector<std::string> split_dot_path(const std::string& path);

/**
 * @brief Join path segments with dots
 */
std::string join_dot_path(const std::vector<std::string>& segments);

/**
 * @brief Get value from nested structure using dot-path
 *
 * @param data Source value
 * @param path Dot-separated path; empty returns @p data itself
 * @return Pointer to value at path
 * @throws KeyError if any segment not found
 * @throws TypeError if traversal hits a scalar before the final segment
 */
const Value* get_by_dot(const Value& data, const std::string& path);

/**
 * @brief Check if dot-path exists in nested structure
 *
 * @return true if path fully resolves, false if any segment missing
 * @throws TypeError if traversal hits a scalar before the final segment
 */
bool contains_dot(const Value& data, const std::string& path);

} // namespace strata

#endif // STRATA_DOTPATH_HPP
