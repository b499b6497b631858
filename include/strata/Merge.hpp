/**
 * @file Merge.hpp
 * @brief Depth-limited deep merge for editor settings layers
 *
 * Merging rules:
 * - Both tables: keys from both are combined; keys present on both sides
 *   are merged recursively while depth remains, otherwise the override
 *   value replaces the base value wholesale
 * - Anything else (scalars, arrays, mixed types): override wins outright.
 *   Arrays are never merged element-wise.
 */

#ifndef STRATA_MERGE_HPP
#define STRATA_MERGE_HPP

#include "strata/Value.hpp"

#include <optional>

namespace strata {

/// Merge depth used for every editor settings layer.
constexpr int kSettingsMergeDepth = 3;

/**
 * @brief Deep merge two values up to a maximum table depth
 *
 * @param base Base value (lower precedence)
 * @param override_val Override value (higher precedence)
 * @param max_depth Number of table levels that are merged key by key.
 *                  At depth 0 an override table replaces the base table.
 * @return Merged result
 *
 * Examples:
 * ```cpp
 * Value base = {{"search", {{"smart-case", true}, {"wrap-around", true}}}};
 * Value over = {{"search", {{"wrap-around", false}}}};
 * auto result = merge_values(base, over, 3);
 * // Result: {"search": {"smart-case": true, "wrap-around": false}}
 *
 * Value base2 = {{"rulers", {80}}};
 * Value over2 = {{"rulers", {100, 120}}};
 * auto result2 = merge_values(base2, over2, 3);
 * // Result: {"rulers": [100, 120]}
 * ```
 */
Value merge_values(Value base, const Value& override_val, int max_depth);

/**
 * @brief Merge two optional layers
 *
 * Absent layers contribute nothing: (none, none) -> none,
 * (a, none) -> a, (none, b) -> b, (a, b) -> merge_values(a, b, max_depth).
 */
std::optional<Value> merge_optional_values(const std::optional<Value>& base,
                                           const std::optional<Value>& override_val,
                                           int max_depth = kSettingsMergeDepth);

} // namespace strata

#endif // STRATA_MERGE_HPP
