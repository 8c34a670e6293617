/**
 * @file Value.hpp
 * @brief Document value type shared by patches, objects and ownership trees
 *
 * Uses nlohmann::json as the underlying value model:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t / uint64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...}), keys kept in sorted order
 *
 * Sorted object keys make `dump()` canonical, which the projection and the
 * patch fingerprint rely on.
 */

#ifndef FIELDPATCH_VALUE_HPP
#define FIELDPATCH_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace fieldpatch {

/// Patches, objects, managedFields trees and persisted state all use this.
using Value = nlohmann::json;

/**
 * @brief Type name used in error messages ("integer", "object", ...)
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

/// Arrays and objects; everything else renders as a projection scalar.
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

} // namespace fieldpatch

#endif // FIELDPATCH_VALUE_HPP
