/**
 * @file Value.hpp
 * @brief Untyped value tree for configuration documents
 *
 * Every document section that is not given a typed shape at parse time
 * (the `editor` table in particular) travels as a Value until it is
 * merged and materialized. Uses nlohmann::json as the value model:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...})
 */

#ifndef STRATA_VALUE_HPP
#define STRATA_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace strata {

/**
 * @brief JSON-like value type for configuration
 *
 * TOML documents are converted into this model right after parsing
 * (see Document.hpp), so merge and schema code never sees toml++ types.
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "table")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "table";
    return "unknown";
}

} // namespace strata

#endif // STRATA_VALUE_HPP
