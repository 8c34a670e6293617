/**
 * @file Detector.hpp
 * @brief Self-management, cross-binding and takeover checks
 *
 * The first two checks run against the live object before any write and
 * throw; the takeover check runs after a dry run or apply and only ever
 * produces records for warnings.
 */

#ifndef FIELDPATCH_DETECTOR_HPP
#define FIELDPATCH_DETECTOR_HPP

#include "fieldpatch/Diagnostics.hpp"
#include "fieldpatch/Object.hpp"
#include "fieldpatch/Ownership.hpp"
#include "fieldpatch/PatchSpec.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace fieldpatch {

/**
 * @brief One ownership transition
 *
 * current_owner is empty when the path had no owner before (first
 * ownership).
 */
struct ConflictRecord {
    std::string path;
    std::string current_owner;
    std::string incoming_owner;

    bool first_ownership() const { return current_owner.empty(); }

    bool operator==(const ConflictRecord& other) const {
        return path == other.path && current_owner == other.current_owner &&
               incoming_owner == other.incoming_owner;
    }
};

/**
 * @brief Paths a patch touches, in ownership form
 *
 * Lists whose elements are all objects with a string "name" are addressed
 * by key ("containers[name=app].image") the way the store tracks them;
 * other lists are atomic. JSON patches yield their pointer targets.
 */
std::vector<std::string> patch_ownership_paths(const PatchSpec& spec);

/**
 * @brief True when either path is a segment prefix of the other
 */
bool paths_overlap(const std::string& a, const std::string& b);

/**
 * @brief Refuse targets owned by the full-lifecycle manager
 *
 * Evidence is a reserved annotation on the object, or a manager named
 * `lifecycle_manager` (or prefixed by it) that is not a binding manager.
 *
 * @throws SelfManagedError
 */
void check_self_management(const Object& live, const std::string& lifecycle_manager,
                           const std::vector<std::string>& reserved_annotations,
                           const ManagerIdentity& identity);

/**
 * @brief Refuse patches overlapping paths owned by another binding
 *
 * @param live_ownership Ownership map of the live object
 * @param patch_paths Output of patch_ownership_paths()
 * @param display_limit Overlaps listed before "+N more"
 *
 * @throws BindingConflictError naming the other binding's manager
 */
void check_cross_binding(const OwnershipMap& live_ownership,
                         const std::vector<std::string>& patch_paths,
                         const ManagerIdentity& identity, const TargetRef& target,
                         std::size_t display_limit);

/**
 * @brief Ownership transitions into this binding
 *
 * For every leaf path this binding owns in `after`, the previous owner is
 * the first claimant in `before` that no longer claims the path in `after`.
 * When every claimant keeps it (same value, shared ownership) it is the
 * first claimant; when `before` has none, the recorded snapshot entry.
 * Paths where `before` already lists this binding (under either name) yield
 * nothing. Paths with no previous owner yield a first-ownership record.
 */
std::vector<ConflictRecord> detect_takeovers(const OwnershipMap& before, const OwnershipMap& after,
                                             const std::map<std::string, std::string>& recorded,
                                             const ManagerIdentity& identity);

/**
 * @brief Bullet list of records, truncated with "+N more"
 */
std::string format_conflicts(const std::vector<ConflictRecord>& records, std::size_t limit);

/**
 * @brief Warning for takeovers plus an info line for first ownership
 *
 * Returns nothing for an empty record list.
 */
Diagnostics takeover_diagnostics(const std::vector<ConflictRecord>& records,
                                 const TargetRef& target, std::size_t limit);

} // namespace fieldpatch

#endif // FIELDPATCH_DETECTOR_HPP
