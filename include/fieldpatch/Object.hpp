/**
 * @file Object.hpp
 * @brief Store objects, target references and ownership metadata entries
 */

#ifndef FIELDPATCH_OBJECT_HPP
#define FIELDPATCH_OBJECT_HPP

#include "Value.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fieldpatch {

/**
 * @brief Identity of the object a binding patches
 *
 * Namespace is empty for cluster-scoped objects.
 */
struct TargetRef {
    std::string api_version;
    std::string kind;
    std::string name;
    std::string namespace_;

    /**
     * @brief "kind/name" or "kind namespace/name"
     */
    std::string describe() const;

    bool operator==(const TargetRef& other) const;
    bool operator!=(const TargetRef& other) const { return !(*this == other); }
};

Value target_to_value(const TargetRef& ref);

/**
 * @throws ConfigurationError if apiVersion, kind or name is missing
 */
TargetRef target_from_value(const Value& value);

/**
 * @brief One element of metadata.managedFields
 */
struct ManagedFieldsEntry {
    std::string manager;
    std::string operation;    ///< "Apply" or "Update"
    std::string api_version;
    Value fields;             ///< FieldsV1 tree, null when absent
};

/**
 * @brief A document held by the resource store
 *
 * Thin view over the raw tree; accessors read the standard identity
 * fields and never throw on absent metadata.
 */
class Object {
public:
    Object() : doc_(Value::object()) {}
    explicit Object(Value doc) : doc_(std::move(doc)) {}

    const Value& doc() const { return doc_; }
    Value& doc() { return doc_; }

    std::string api_version() const;
    std::string kind() const;
    std::string name() const;
    std::string namespace_() const;

    TargetRef ref() const;

    /**
     * @brief metadata.annotations as string pairs (non-string values skipped)
     */
    std::vector<std::pair<std::string, std::string>> annotations() const;
    std::optional<std::string> annotation(const std::string& key) const;

    /**
     * @brief Decode metadata.managedFields; malformed entries are skipped
     */
    std::vector<ManagedFieldsEntry> managed_fields() const;
    void set_managed_fields(const std::vector<ManagedFieldsEntry>& entries);

private:
    Value doc_;
};

} // namespace fieldpatch

#endif // FIELDPATCH_OBJECT_HPP
