/**
 * @file Merge.hpp
 * @brief Deep merge for configuration layers and patch documents
 *
 * Both merges recurse when the two sides are objects and otherwise let the
 * incoming side win, so arrays always replace wholesale. They differ only
 * in how null is treated.
 */

#ifndef FIELDPATCH_MERGE_HPP
#define FIELDPATCH_MERGE_HPP

#include "fieldpatch/Value.hpp"


namespace fieldpatch {

/**
 * @brief Deep merge two configuration layers
 *
 * Merging rules:
 * - Both objects: Recursive merge (keys from both are combined)
 * - Null override: Base is kept (an unset layer does not erase)
 * - Anything else: Override value replaces base entirely
 *
 * @param base Base object (lower precedence)
 * @param override_val Override object (higher precedence)
 * @return Merged result
 *
 * Example:
 * ```cpp
 * Value base = {{"log", {{"level", "info"}, {"tag", "x"}}}};
 * Value over = {{"log", {{"level", "debug"}}}};
 * auto result = deep_merge(base, over);
 * // Result: {"log": {"level": "debug", "tag": "x"}}
 * ```
 */
Value deep_merge(const Value& base, const Value& override_val);

/**
 * @brief Merge a patch document onto an object in place
 *
 * - Both objects: recurse per key
 * - Object over non-object, or non-object over object: replace
 * - Arrays: replace wholesale
 * - Null: stored as an explicit null (the store decides what it means)
 *
 * Example:
 * ```cpp
 * Value obj = {{"kind", "ConfigMap"}, {"metadata", {{"name", "cm"}}}};
 * merge_onto(obj, {{"metadata", {{"labels", {{"team", "a"}}}}}});
 * // obj.metadata == {"name": "cm", "labels": {"team": "a"}}
 * ```
 */
void merge_onto(Value& target, const Value& patch);

} // namespace fieldpatch

#endif // FIELDPATCH_MERGE_HPP
