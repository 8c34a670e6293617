/**
 * @file FieldSet.hpp
 * @brief Parsed ownership trees (managedFields "FieldsV1" format)
 *
 * The store records, per manager, a prefix-tagged tree:
 *
 *   {"f:data": {".": {}, "f:key": {}},
 *    "f:spec": {"f:containers": {"k:{\"name\":\"app\"}": {".": {}, "f:image": {}}}}}
 *
 * - "f:<name>"  object field
 * - "k:<json>"  keyed array element (JSON object of key fields)
 * - "v:<json>"  set element (JSON value)
 * - "i:<n>"     positional element
 * - "."         the enclosing node itself is owned
 *
 * FieldSet parses that tree once into a validated AST and answers path
 * queries on it.
 */

#ifndef FIELDPATCH_FIELDSET_HPP
#define FIELDPATCH_FIELDSET_HPP

#include "Value.hpp"
#include "FieldPath.hpp"

#include <string>
#include <vector>

namespace fieldpatch {

struct FieldEntry;

/**
 * @brief One node of an ownership tree
 */
struct FieldNode {
    enum class Kind {
        Leaf,     ///< No children; the node itself is owned
        Object,   ///< Children are object fields
        Array     ///< Children are element selectors
    };

    bool self_owned = false;            ///< Carries the "." marker
    std::vector<FieldEntry> children;

    Kind kind() const;
    FieldNode* find(const PathSegment& segment);
    const FieldNode* find(const PathSegment& segment) const;
};

struct FieldEntry {
    PathSegment segment;
    std::string token;   ///< Wire key, e.g. "f:data" or "k:{\"name\":\"app\"}"
    FieldNode node;
};

class FieldSet {
public:
    FieldSet() = default;

    /**
     * @brief Parse a FieldsV1 tree
     * @throws ParseError if the tree is not an object, a key carries an
     *         unknown prefix, a selector is not valid JSON, or a child is
     *         not an object
     */
    static FieldSet parse(const Value& fields);

    /**
     * @brief Build a set from canonical paths
     *
     * Each path is inserted as owned. A path ending in a key or member
     * selector marks that element with ".".
     */
    static FieldSet from_paths(const std::vector<std::string>& paths);

    /**
     * @brief Add a path, creating intermediate nodes
     */
    void insert(const FieldPath& path);

    /**
     * @brief Serialize back to the FieldsV1 wire form
     */
    Value to_value() const;

    /**
     * @brief Every owned path: one per leaf plus one per internal node
     *        carrying the "." marker, depth first in tree order
     */
    std::vector<std::string> paths() const;

    /**
     * @brief Leaf paths only
     *
     * A node whose only content is the "." marker is a leaf. A marked node
     * that also has children is not listed; its descendants are.
     */
    std::vector<std::string> leaf_paths() const;

    bool contains(const std::string& path) const;
    bool empty() const { return root_.children.empty() && !root_.self_owned; }
    const FieldNode& root() const { return root_; }

private:
    FieldNode root_;
};

} // namespace fieldpatch

#endif // FIELDPATCH_FIELDSET_HPP
