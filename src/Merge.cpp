/**
 * @file Merge.cpp
 * @brief Implementation of depth-limited deep merge
 */

#include "strata/Merge.hpp"

namespace strata {

Value merge_values(Value base, const Value& override_val, int max_depth) {
    // Both are tables with depth left -> merge key by key
    if (base.is_object() && override_val.is_object() && max_depth > 0) {
        for (auto it = override_val.begin(); it != override_val.end(); ++it) {
            auto existing = base.find(it.key());
            if (existing != base.end()) {
                *existing = merge_values(std::move(*existing), it.value(), max_depth - 1);
            } else {
                base[it.key()] = it.value();
            }
        }
        return base;
    }

    // Out of depth, non-table on either side, or arrays: override wins
    return override_val;
}

std::optional<Value> merge_optional_values(const std::optional<Value>& base,
                                           const std::optional<Value>& override_val,
                                           int max_depth) {
    if (!override_val) {
        return base;
    }
    if (!base) {
        return override_val;
    }
    return merge_values(*base, *override_val, max_depth);
}

} // namespace strata
