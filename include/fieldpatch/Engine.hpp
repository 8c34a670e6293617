/**
 * @file Engine.hpp
 * @brief Plan / apply / reconcile / release protocol for patch bindings
 *
 * One PatchEngine serves any number of bindings. It keeps no per-binding
 * state between calls: every call re-reads the target, rebuilds ownership,
 * and returns the new durable state for the caller to persist.
 *
 * Typical cycle:
 * ```cpp
 * fieldpatch::LocalStore store;
 * fieldpatch::PatchEngine engine(store);
 * auto spec = fieldpatch::PatchSpec(fieldpatch::PatchKind::Merge, R"({"data":{"k":"v"}})");
 *
 * auto plan = engine.compute_projection(spec, target, std::nullopt, ctx);
 * auto applied = engine.apply_and_update_projection(spec, target, id, std::nullopt, ctx);
 * auto read = engine.reconcile(spec, applied.state, ctx);
 * ```
 */

#ifndef FIELDPATCH_ENGINE_HPP
#define FIELDPATCH_ENGINE_HPP

#include "fieldpatch/Config.hpp"
#include "fieldpatch/Detector.hpp"
#include "fieldpatch/Diagnostics.hpp"
#include "fieldpatch/Projection.hpp"
#include "fieldpatch/Simulator.hpp"
#include "fieldpatch/State.hpp"
#include "fieldpatch/Store.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fieldpatch {

struct PlanResult {
    ProjectionStatus status = ProjectionStatus::Unknown;
    Projection projection;
    std::map<std::string, std::string> ownership;         ///< Predicted paths → our manager
    std::map<std::string, std::string> previous_owners;
    std::vector<ConflictRecord> conflicts;                ///< Takeover preview
    Diagnostics diagnostics;
    bool preserved = false;                               ///< Prior projection reused as-is
};

struct ApplyResult {
    BindingState state;
    std::vector<ConflictRecord> conflicts;
    Diagnostics diagnostics;
};

struct ReconcileResult {
    Projection projection;
    bool drift_detected = false;
    bool target_gone = false;                             ///< Binding should be dropped
    std::vector<std::string> drifted_paths;
    std::vector<std::string> interfering_managers;
    Diagnostics diagnostics;
    std::optional<BindingState> state;                    ///< Refreshed state; empty when gone
};

class PatchEngine {
public:
    explicit PatchEngine(ResourceStore& store, EngineConfig config = EngineConfig::defaults());

    const EngineConfig& config() const { return config_; }

    /**
     * @brief Predict the projection of a patch (plan time)
     *
     * An absent target yields ProjectionStatus::Unknown; JSON patch and
     * map-merge kinds yield NotApplicable. With an unchanged fingerprint and
     * an equal recomputed projection, the prior projection is returned and
     * `preserved` is set.
     *
     * @throws ConfigurationError, ParseError for bad payloads
     * @throws TargetChangedError when `prior` names a different target
     * @throws SelfManagedError, BindingConflictError
     * @throws StoreRejectionError subclasses when the dry run is refused
     * @throws CancelledError
     */
    PlanResult compute_projection(const PatchSpec& spec, const TargetRef& target,
                                  const std::optional<BindingState>& prior,
                                  const CallContext& ctx) const;

    /**
     * @brief Apply the patch for real and return the new binding state
     *
     * @throws TargetNotFoundError when the target is absent
     * @throws everything compute_projection() throws
     */
    ApplyResult apply_and_update_projection(const PatchSpec& spec, const TargetRef& target,
                                            const std::string& binding_id,
                                            const std::optional<BindingState>& prior,
                                            const CallContext& ctx) const;

    /**
     * @brief Detect drift on owned fields and re-assert declared values
     *
     * Live values are compared against the projection in `state`. Drift is
     * corrected only when `spec` is the content that produced `state` (same
     * fingerprint), and only after the self-management and cross-binding
     * checks pass. Skipped or failed corrections become warnings and keep
     * the stored projection.
     *
     * @throws ConfigurationError, ParseError for bad payloads
     * @throws StoreError when the target cannot be read
     * @throws CancelledError
     */
    ReconcileResult reconcile(const PatchSpec& spec, const BindingState& state,
                              const CallContext& ctx) const;

    /**
     * @brief Hand taken-over fields back to their previous owners
     *
     * Fields are grouped by previous owner; the object is re-read before
     * each transfer and fields this binding no longer owns are skipped.
     * Failures are warnings.
     *
     * @throws CancelledError
     */
    Diagnostics release(const BindingState& state, const CallContext& ctx) const;

    /**
     * @brief "patch-<milliseconds since epoch>"
     */
    static std::string generate_binding_id();

private:
    struct Prechecked {
        Object live;
        OwnershipMap ownership;
    };

    void validate(const PatchSpec& spec, const TargetRef& target,
                  const std::optional<BindingState>& prior) const;
    std::optional<Object> fetch(const TargetRef& target, const CallContext& ctx) const;
    Prechecked precheck(Object live, const PatchSpec& spec, const ManagerIdentity& identity,
                        const TargetRef& target) const;
    std::map<std::string, std::string> owned_snapshot(const OwnershipMap& ownership,
                                                      const ManagerIdentity& identity) const;
    std::map<std::string, std::string> carry_previous_owners(
        const std::vector<ConflictRecord>& records,
        const std::map<std::string, std::string>& ownership,
        const std::map<std::string, std::string>& recorded) const;

    ResourceStore& store_;
    EngineConfig config_;
    MergeSimulator simulator_;
};

} // namespace fieldpatch

#endif // FIELDPATCH_ENGINE_HPP
