/**
 * @file Merge.cpp
 * @brief Implementation of deep merge
 */

#include "fieldpatch/Merge.hpp"

namespace fieldpatch {

Value deep_merge(const Value& base, const Value& override_val) {
    // An unset layer leaves the base alone
    if (override_val.is_null()) {
        return base;
    }

    if (base.is_null()) {
        return override_val;
    }

    if (base.is_object() && override_val.is_object()) {
        Value result = base;

        for (auto it = override_val.begin(); it != override_val.end(); ++it) {
            const auto& key = it.key();
            if (result.contains(key)) {
                result[key] = deep_merge(result[key], it.value());
            } else {
                result[key] = it.value();
            }
        }

        return result;
    }

    // Scalars, arrays and type changes replace
    return override_val;
}

void merge_onto(Value& target, const Value& patch) {
    if (!target.is_object() || !patch.is_object()) {
        target = patch;
        return;
    }

    for (auto it = patch.begin(); it != patch.end(); ++it) {
        auto existing = target.find(it.key());
        if (existing != target.end() && existing->is_object() && it->is_object()) {
            merge_onto(*existing, it.value());
        } else {
            target[it.key()] = it.value();
        }
    }
}

} // namespace fieldpatch
