/**
 * @file FieldPath.hpp
 * @brief Canonical field paths for documents and ownership metadata
 *
 * A canonical path is a dot-joined sequence of field names with bracketed
 * selectors for array elements:
 * - "spec.replicas"                     object fields
 * - "spec.ports[0].port"                positional element (documents)
 * - "spec.containers[name=app].image"   keyed element (ownership)
 * - "spec.ports[port=80,protocol=TCP]"  multi-field key, sorted by field
 * - "metadata.finalizers[=example.com/x]" set element
 *
 * Field names containing '.', '[', ']' or '\' are backslash-escaped, so
 * "metadata.annotations.example\.com/team" names the single annotation key
 * "example.com/team". Inside selectors '\', ']', ',' and '=' are escaped.
 */

#ifndef FIELDPATCH_FIELDPATH_HPP
#define FIELDPATCH_FIELDPATH_HPP

#include "Value.hpp"
#include "Errors.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fieldpatch {

enum class SegmentKind {
    Field,   ///< Object member
    Index,   ///< Positional array element
    Key,     ///< Array element selected by key fields
    Member   ///< Set element selected by its whole value
};

/**
 * @brief One step of a canonical path
 *
 * Selector values are stored in their rendered form (strings verbatim,
 * other scalars as JSON literals), which is also how elements are matched.
 */
struct PathSegment {
    SegmentKind kind = SegmentKind::Field;
    std::string name;                                        ///< Field name or rendered member value
    std::size_t index = 0;                                   ///< Index selector
    std::vector<std::pair<std::string, std::string>> keys;   ///< Key selector, sorted by field

    static PathSegment field(std::string name);
    static PathSegment at(std::size_t index);
    static PathSegment keyed(std::vector<std::pair<std::string, std::string>> keys);
    static PathSegment member(std::string rendered);

    bool operator==(const PathSegment& other) const;
    bool operator!=(const PathSegment& other) const { return !(*this == other); }
};

using FieldPath = std::vector<PathSegment>;

/**
 * @brief Render a scalar the way selectors and projections show it
 *
 * Strings verbatim; numbers, booleans and null as JSON literals;
 * compound values as compact JSON with sorted keys.
 */
std::string render_scalar(const Value& value);

/**
 * @brief Inverse of render_scalar for selector values
 *
 * Numbers, booleans and null parse back as JSON literals; anything else is
 * taken as a string.
 */
Value unrender_scalar(const std::string& rendered);

/**
 * @brief Array index from an all-digit token
 * @return std::nullopt when the token is not all digits or does not fit
 */
std::optional<std::size_t> parse_index(const std::string& token);

/**
 * @brief Escape a field name for use as a path segment
 */
std::string escape_field(const std::string& name);

/**
 * @brief Join segments into the canonical string form
 */
std::string join_field_path(const FieldPath& path);

/**
 * @brief Parse a canonical path string
 *
 * @throws PathError on dangling escapes, unterminated selectors,
 *         empty field names or malformed key selectors
 *
 * Examples:
 * - "a.b"          → [Field a, Field b]
 * - "a[2].b"       → [Field a, Index 2, Field b]
 * - "a[name=x]"    → [Field a, Key {name: x}]
 * - "a[=v]"        → [Field a, Member v]
 * - ""             → []
 */
FieldPath split_field_path(const std::string& path);

/**
 * @brief Append a field segment to a canonical prefix
 */
std::string append_field(const std::string& prefix, const std::string& name);

/**
 * @brief Leaf paths of a decoded document
 *
 * Objects recurse per member. Arrays whose elements are all scalars are
 * atomic leaves; arrays containing a compound element recurse per index.
 * Empty objects and empty arrays are leaves. Paths come out in document
 * order (sorted member order for objects); nothing is deduplicated.
 */
std::vector<std::string> document_paths(const Value& document);

/**
 * @brief Resolve a path against a document (non-throwing)
 *
 * Key and member selectors match array elements by rendered value.
 *
 * @return Pointer into data, or nullptr when any step is missing or the
 *         shape does not fit (a field step on an array, for example)
 */
const Value* find_by_path(const Value& data, const FieldPath& path);
const Value* find_by_path(const Value& data, const std::string& path);

/**
 * @brief Mutable variant of find_by_path
 */
Value* find_by_path(Value& data, const FieldPath& path);

/**
 * @brief Check whether a path resolves in a document
 */
bool contains_path(const Value& data, const std::string& path);

/**
 * @brief Set a value at a path, creating intermediate objects
 *
 * Index selectors must address an existing element. Key selectors create a
 * new element carrying the key fields when no element matches.
 *
 * @throws PathError if traversal hits a scalar or a selector does not fit
 */
void set_by_path(Value& data, const FieldPath& path, Value value);

/**
 * @brief True when `prefix` is a proper or equal path prefix of `path`
 *
 * Compares segment-wise, so "spec.rep" is not a prefix of "spec.replicas".
 */
bool path_has_prefix(const std::string& path, const std::string& prefix);

} // namespace fieldpatch

#endif // FIELDPATCH_FIELDPATH_HPP
