/**
 * @file State.hpp
 * @brief Durable per-binding state written after each successful cycle
 *
 * Layout (JSON):
 * ```json
 * {
 *   "schema_version": 1,
 *   "binding_id": "patch-1718000000000",
 *   "manager": "fieldpatch-patch-patch-1718000000000",
 *   "target": {"apiVersion": "v1", "kind": "ConfigMap", "name": "cfg", "namespace": "default"},
 *   "patch_kind": "patch",
 *   "patch_fingerprint": "9f3c0a1b2c3d4e5f",
 *   "projection_status": "known",
 *   "projection": {"data.k": "v"},
 *   "ownership": {"data.k": "fieldpatch-patch-patch-1718000000000"},
 *   "previous_owners": {"data.k": "kubectl"}
 * }
 * ```
 */

#ifndef FIELDPATCH_STATE_HPP
#define FIELDPATCH_STATE_HPP

#include "fieldpatch/Object.hpp"
#include "fieldpatch/PatchSpec.hpp"
#include "fieldpatch/Projection.hpp"

#include <map>
#include <string>

namespace fieldpatch {

struct BindingState {
    static constexpr int kSchemaVersion = 1;

    std::string binding_id;
    std::string manager;
    TargetRef target;
    PatchKind patch_kind = PatchKind::Merge;
    std::string patch_fingerprint;
    ProjectionStatus projection_status = ProjectionStatus::Unknown;
    Projection projection;
    std::map<std::string, std::string> ownership;         ///< Our paths → our manager
    std::map<std::string, std::string> previous_owners;   ///< Paths taken over → former owner

    Value to_value() const;

    /**
     * @brief Decode, upgrading version 0 layouts
     *
     * Version 0 stored "field_ownership" and "managed_state_projection";
     * both are renamed on load.
     *
     * @throws ParseError on malformed content or a newer schema version
     */
    static BindingState from_value(const Value& value);
};

/**
 * @throws FileNotFoundError, ParseError
 */
BindingState load_state_file(const std::string& path);

void save_state_file(const std::string& path, const BindingState& state);

} // namespace fieldpatch

#endif // FIELDPATCH_STATE_HPP
