/**
 * @file Ownership.hpp
 * @brief Manager identities and the path → manager ownership index
 */

#ifndef FIELDPATCH_OWNERSHIP_HPP
#define FIELDPATCH_OWNERSHIP_HPP

#include "FieldSet.hpp"
#include "Object.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fieldpatch {

/**
 * @brief Manager name of one binding, with plan/apply equivalence
 *
 * Before a binding has an id it writes as "<prefix><placeholder>"; after,
 * as "<prefix><id>". Both names denote the same binding, so every
 * ownership comparison goes through matches() rather than string equality.
 */
class ManagerIdentity {
public:
    ManagerIdentity(std::string prefix, std::string placeholder_suffix,
                    std::optional<std::string> binding_id = std::nullopt);

    /**
     * @brief Name used for writes in the current phase
     */
    const std::string& name() const { return name_; }

    std::string placeholder() const { return prefix_ + placeholder_suffix_; }
    const std::string& prefix() const { return prefix_; }
    const std::optional<std::string>& binding_id() const { return binding_id_; }

    /**
     * @brief Same binding as this identity (current name or placeholder)
     */
    bool matches(const std::string& manager) const;

    /**
     * @brief Manager written by some binding (carries the binding prefix)
     */
    bool is_binding_manager(const std::string& manager) const;

    /**
     * @brief A binding manager that is not this binding
     */
    bool is_other_binding(const std::string& manager) const {
        return is_binding_manager(manager) && !matches(manager);
    }

    /**
     * @brief Identity of the same binding after it received an id
     */
    ManagerIdentity with_binding_id(const std::string& id) const;

private:
    std::string prefix_;
    std::string placeholder_suffix_;
    std::optional<std::string> binding_id_;
    std::string name_;
};

/**
 * @brief Paths excluded from every ownership map
 */
struct OwnershipFilter {
    std::vector<std::string> volatile_roots;      ///< Whole subtrees, e.g. "status"
    std::vector<std::string> volatile_metadata;   ///< e.g. "metadata.resourceVersion"
    std::vector<std::string> system_annotations;  ///< Raw annotation keys

    static OwnershipFilter defaults();

    bool excluded(const std::string& path) const;
};

/**
 * @brief path → manager index rebuilt from an object's managedFields
 *
 * When several managers claim a path, the first entry in managedFields
 * order is the owner; the rest stay visible through claimants().
 */
class OwnershipMap {
public:
    OwnershipMap() = default;

    /**
     * @brief Build from managedFields entries
     *
     * Entries whose field tree fails to parse are skipped with a warning.
     */
    static OwnershipMap build(const std::vector<ManagedFieldsEntry>& entries,
                              const OwnershipFilter& filter);

    static OwnershipMap build(const Object& object, const OwnershipFilter& filter) {
        return build(object.managed_fields(), filter);
    }

    std::optional<std::string> owner(const std::string& path) const;

    /**
     * @brief Every manager claiming the path, in encounter order
     */
    const std::vector<std::string>& claimants(const std::string& path) const;

    /**
     * @brief Leaf paths claimed by any manager accepted by `matches`
     *
     * Order follows managedFields order, then tree order; no duplicates.
     */
    std::vector<std::string> leaf_paths_of(
        const std::function<bool(const std::string&)>& matches) const;

    /**
     * @brief All paths (leaves and marked nodes) claimed by matching managers
     */
    std::vector<std::string> paths_of(
        const std::function<bool(const std::string&)>& matches) const;

    /**
     * @brief Flattened path → owner view
     */
    std::map<std::string, std::string> owners() const;

    std::vector<std::string> managers() const;
    bool empty() const { return claims_.empty(); }
    std::size_t size() const { return claims_.size(); }

private:
    struct ManagerFields {
        std::string manager;
        std::vector<std::string> paths;
        std::vector<std::string> leaves;
    };

    std::map<std::string, std::vector<std::string>> claims_;
    std::vector<ManagerFields> by_manager_;
};

} // namespace fieldpatch

#endif // FIELDPATCH_OWNERSHIP_HPP
