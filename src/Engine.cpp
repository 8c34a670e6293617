/**
 * @file Engine.cpp
 * @brief Patch binding protocol
 */

#include "fieldpatch/Engine.hpp"
#include "fieldpatch/Classify.hpp"
#include "fieldpatch/Errors.hpp"
#include "fieldpatch/FieldPath.hpp"
#include "fieldpatch/Log.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <chrono>
#include <set>

namespace fieldpatch {

namespace {

const char* const kTag = "engine";

/**
 * @brief Identity skeleton carrying the current values of `paths`
 */
Value partial_document(const Object& live, const std::vector<std::string>& paths) {
    Value doc = {
        {"apiVersion", live.api_version()},
        {"kind", live.kind()},
        {"metadata", {{"name", live.name()}}}
    };
    if (!live.namespace_().empty()) {
        doc["metadata"]["namespace"] = live.namespace_();
    }
    for (const auto& path : paths) {
        const Value* value = find_by_path(live.doc(), path);
        if (value == nullptr) continue;
        set_by_path(doc, split_field_path(path), *value);
    }
    return doc;
}

} // namespace

PatchEngine::PatchEngine(ResourceStore& store, EngineConfig config)
    : store_(store)
    , config_(std::move(config))
    , simulator_(store)
{}

std::string PatchEngine::generate_binding_id() {
    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch());
    return fmt::format("patch-{}", now.count());
}

// ============================================================================
// Shared steps
// ============================================================================

void PatchEngine::validate(const PatchSpec& spec, const TargetRef& target,
                           const std::optional<BindingState>& prior) const {
    if (target.api_version.empty() || target.kind.empty() || target.name.empty()) {
        throw ConfigurationError("Target requires apiVersion, kind and name");
    }
    if (prior && prior->target != target) {
        throw TargetChangedError(prior->target.describe(), target.describe());
    }
    spec.decode();
    validate_patch_content(spec, config_.reserved_annotations);
}

std::optional<Object> PatchEngine::fetch(const TargetRef& target, const CallContext& ctx) const {
    ctx.check("get " + target.describe());
    try {
        return store_.get(target, ctx);
    } catch (const NotFoundError&) {
        return std::nullopt;
    } catch (const StoreError& e) {
        decode_store_error(e);
        throw;
    }
}

PatchEngine::Prechecked PatchEngine::precheck(Object live, const PatchSpec& spec,
                                              const ManagerIdentity& identity,
                                              const TargetRef& target) const {
    check_self_management(live, config_.lifecycle_manager, config_.reserved_annotations,
                          identity);
    OwnershipMap ownership = OwnershipMap::build(live, config_.filter);
    check_cross_binding(ownership, patch_ownership_paths(spec), identity, target,
                        config_.conflict_display_limit);
    return Prechecked{std::move(live), std::move(ownership)};
}

std::map<std::string, std::string> PatchEngine::owned_snapshot(
    const OwnershipMap& ownership, const ManagerIdentity& identity) const {
    std::map<std::string, std::string> out;
    for (const auto& path : ownership.leaf_paths_of(
             [&](const std::string& m) { return identity.matches(m); })) {
        out[path] = identity.name();
    }
    return out;
}

std::map<std::string, std::string> PatchEngine::carry_previous_owners(
    const std::vector<ConflictRecord>& records,
    const std::map<std::string, std::string>& ownership,
    const std::map<std::string, std::string>& recorded) const {
    std::map<std::string, std::string> out;
    for (const auto& kv : recorded) {
        if (ownership.count(kv.first) > 0) out.insert(kv);
    }
    // The owner recorded at the first takeover is the one release hands back to
    for (const auto& r : records) {
        if (!r.first_ownership()) out.emplace(r.path, r.current_owner);
    }
    return out;
}

// ============================================================================
// Plan
// ============================================================================

PlanResult PatchEngine::compute_projection(const PatchSpec& spec, const TargetRef& target,
                                           const std::optional<BindingState>& prior,
                                           const CallContext& ctx) const {
    validate(spec, target, prior);

    const ManagerIdentity identity = prior ? config_.identity(prior->binding_id)
                                           : config_.identity();
    PlanResult plan;

    auto live = fetch(target, ctx);
    if (!live) {
        FIELDPATCH_LOG_DEBUG(kTag, "{} not found at plan time; projection unknown",
                             target.describe());
        plan.status = spec.capabilities().supports_projection ? ProjectionStatus::Unknown
                                                              : ProjectionStatus::NotApplicable;
        return plan;
    }

    const Prechecked checked = precheck(std::move(*live), spec, identity, target);

    if (!spec.capabilities().supports_projection) {
        plan.status = ProjectionStatus::NotApplicable;
        FIELDPATCH_LOG_DEBUG(kTag, "{} patches produce no projection",
                             patch_kind_name(spec.kind()));
        return plan;
    }

    const Object predicted = simulator_.simulate(checked.live, spec, identity.name(), ctx);
    const OwnershipMap after = OwnershipMap::build(predicted, config_.filter);

    plan.status = ProjectionStatus::Known;
    plan.projection = project_owned(predicted, identity, config_.filter);
    plan.ownership = owned_snapshot(after, identity);
    plan.conflicts = detect_takeovers(checked.ownership, after,
                                      prior ? prior->previous_owners
                                            : std::map<std::string, std::string>{},
                                      identity);
    plan.previous_owners = carry_previous_owners(
        plan.conflicts, plan.ownership,
        prior ? prior->previous_owners : std::map<std::string, std::string>{});
    plan.diagnostics = takeover_diagnostics(plan.conflicts, target,
                                            config_.conflict_display_limit);

    if (prior && prior->projection_status == ProjectionStatus::Known &&
        prior->patch_fingerprint == spec.fingerprint()) {
        if (plan.projection == prior->projection) {
            plan.projection = prior->projection;
            plan.preserved = true;
        } else {
            FIELDPATCH_LOG_DEBUG(kTag, "projection of {} changed with unchanged patch: {}",
                                 target.describe(),
                                 fmt::join(projection_diff(prior->projection, plan.projection),
                                           ", "));
        }
    }

    FIELDPATCH_LOG_INFO(kTag, "planned {}: {} owned field(s), {} transition(s){}",
                        target.describe(), plan.projection.size(), plan.conflicts.size(),
                        plan.preserved ? " (unchanged)" : "");
    return plan;
}

// ============================================================================
// Apply
// ============================================================================

ApplyResult PatchEngine::apply_and_update_projection(const PatchSpec& spec, const TargetRef& target,
                                                     const std::string& binding_id,
                                                     const std::optional<BindingState>& prior,
                                                     const CallContext& ctx) const {
    validate(spec, target, prior);
    if (binding_id.empty()) {
        throw ConfigurationError("Binding id must not be empty");
    }

    const ManagerIdentity identity = config_.identity(binding_id);

    auto live = fetch(target, ctx);
    if (!live) {
        throw TargetNotFoundError(target.describe());
    }
    const Prechecked checked = precheck(std::move(*live), spec, identity, target);

    const Object result = simulator_.submit(checked.live, spec, identity.name(), false, ctx);

    ApplyResult out;
    out.state.binding_id = binding_id;
    out.state.manager = identity.name();
    out.state.target = target;
    out.state.patch_kind = spec.kind();
    out.state.patch_fingerprint = spec.fingerprint();

    const std::map<std::string, std::string> recorded =
        prior ? prior->previous_owners : std::map<std::string, std::string>{};

    if (spec.capabilities().supports_projection) {
        const OwnershipMap after = OwnershipMap::build(result, config_.filter);
        out.state.projection_status = ProjectionStatus::Known;
        out.state.projection = project_owned(result, identity, config_.filter);
        out.state.ownership = owned_snapshot(after, identity);
        out.conflicts = detect_takeovers(checked.ownership, after, recorded, identity);
        out.state.previous_owners = carry_previous_owners(out.conflicts, out.state.ownership,
                                                          recorded);
        out.diagnostics = takeover_diagnostics(out.conflicts, target,
                                               config_.conflict_display_limit);
    } else {
        out.state.projection_status = ProjectionStatus::NotApplicable;
        out.diagnostics.push_back({Severity::Info, "Projection Not Available",
                                   fmt::format("{} patches carry no ownership information; "
                                               "every apply of this binding is treated as a "
                                               "potential change.",
                                               patch_kind_name(spec.kind()))});
    }

    FIELDPATCH_LOG_INFO(kTag, "applied {} as '{}': {} owned field(s), {} transition(s)",
                        target.describe(), identity.name(), out.state.projection.size(),
                        out.conflicts.size());
    return out;
}

// ============================================================================
// Reconcile
// ============================================================================

ReconcileResult PatchEngine::reconcile(const PatchSpec& spec, const BindingState& state,
                                       const CallContext& ctx) const {
    spec.decode();
    const ManagerIdentity identity = config_.identity(state.binding_id);
    const TargetRef& target = state.target;
    const bool applied_content = spec.fingerprint() == state.patch_fingerprint;

    ReconcileResult out;

    auto live = fetch(target, ctx);
    if (!live) {
        out.target_gone = true;
        out.diagnostics.push_back({Severity::Warning, "Read: Resource Not Found",
                                   fmt::format("The target {} no longer exists; the binding "
                                               "will be removed.", target.describe())});
        FIELDPATCH_LOG_WARN(kTag, "{} is gone", target.describe());
        return out;
    }

    out.projection = state.projection;
    out.state = state;

    if (!spec.capabilities().supports_projection) {
        FIELDPATCH_LOG_DEBUG(kTag, "no drift detection for {} patches",
                             patch_kind_name(spec.kind()));
        return out;
    }

    const OwnershipMap live_ownership = OwnershipMap::build(*live, config_.filter);

    // Declared values are the ones last applied, not the current patch text
    Projection want;
    if (state.projection_status == ProjectionStatus::Known) {
        want = state.projection;
    } else if (applied_content) {
        Object declared;
        try {
            declared = simulator_.simulate(*live, spec, identity.name(), ctx);
        } catch (const StoreError& e) {
            out.diagnostics.push_back(classify_store_error(e, "Read", target.describe()));
            out.diagnostics.back().severity = Severity::Warning;
            FIELDPATCH_LOG_WARN(kTag, "drift check of {} failed: {}", target.describe(),
                                e.what());
            return out;
        }
        const OwnershipMap declared_ownership = OwnershipMap::build(declared, config_.filter);
        want = flatten_projection(declared.doc(), declared_ownership.leaf_paths_of(
            [&](const std::string& m) { return identity.matches(m); }));
    } else {
        FIELDPATCH_LOG_DEBUG(kTag, "no applied projection for {}; skipping drift check",
                             target.describe());
        return out;
    }

    std::vector<std::string> paths;
    for (const auto& kv : want) paths.push_back(kv.first);
    const Projection have = flatten_projection(live->doc(), paths);
    out.drifted_paths = projection_diff(want, have);

    if (out.drifted_paths.empty()) {
        out.projection = have;
        out.state->projection_status = ProjectionStatus::Known;
        out.state->projection = have;
        out.state->ownership = owned_snapshot(live_ownership, identity);
        return out;
    }

    out.drift_detected = true;
    std::vector<std::string> lines;
    for (const auto& path : out.drifted_paths) {
        std::vector<std::string> others;
        for (const auto& m : live_ownership.claimants(path)) {
            if (identity.matches(m)) continue;
            others.push_back(m);
            if (std::find(out.interfering_managers.begin(), out.interfering_managers.end(), m) ==
                out.interfering_managers.end()) {
                out.interfering_managers.push_back(m);
            }
        }
        auto want_it = want.find(path);
        auto have_it = have.find(path);
        lines.push_back(fmt::format("  - {}: declared {}, found {}{}", path,
                                    want_it == want.end() ? "<absent>" : want_it->second,
                                    have_it == have.end() ? "<absent>" : have_it->second,
                                    others.empty() ? std::string()
                                                   : fmt::format(" (modified by {})",
                                                                 fmt::join(others, ", "))));
    }
    out.diagnostics.push_back({Severity::Warning, "Patch Drift Detected",
                               fmt::format("Fields managed by this patch on {} were changed "
                                           "outside of it and will be restored:\n{}",
                                           target.describe(), fmt::join(lines, "\n"))});
    FIELDPATCH_LOG_WARN(kTag, "drift on {}: {}", target.describe(),
                        fmt::join(out.drifted_paths, ", "));

    if (!applied_content) {
        out.diagnostics.push_back({Severity::Warning, "Drift Correction Deferred",
                                   fmt::format("The patch for {} changed since it was last "
                                               "applied; drifted fields are restored when the "
                                               "new content is applied.", target.describe())});
        FIELDPATCH_LOG_INFO(kTag, "patch for {} changed; not correcting at read time",
                            target.describe());
        return out;
    }

    try {
        precheck(*live, spec, identity, target);
    } catch (const TargetError& e) {
        out.diagnostics.push_back({Severity::Warning, "Drift Correction Blocked", e.what()});
        FIELDPATCH_LOG_WARN(kTag, "not restoring {}: {}", target.describe(), e.what());
        return out;
    }

    Object corrected;
    try {
        corrected = simulator_.submit(*live, spec, identity.name(), false, ctx);
    } catch (const StoreError& e) {
        Diagnostic diag = classify_store_error(e, "Drift Correction", target.describe());
        diag.severity = Severity::Warning;
        out.diagnostics.push_back(std::move(diag));
        FIELDPATCH_LOG_WARN(kTag, "could not restore {}: {}", target.describe(), e.what());
        return out;
    }

    const OwnershipMap after = OwnershipMap::build(corrected, config_.filter);
    const auto records = detect_takeovers(live_ownership, after, state.previous_owners, identity);

    out.projection = project_owned(corrected, identity, config_.filter);
    out.state->projection_status = ProjectionStatus::Known;
    out.state->projection = out.projection;
    out.state->ownership = owned_snapshot(after, identity);
    out.state->previous_owners = carry_previous_owners(records, out.state->ownership,
                                                       state.previous_owners);
    FIELDPATCH_LOG_INFO(kTag, "restored {} field(s) on {}", out.drifted_paths.size(),
                        target.describe());
    return out;
}

// ============================================================================
// Release
// ============================================================================

Diagnostics PatchEngine::release(const BindingState& state, const CallContext& ctx) const {
    const ManagerIdentity identity = config_.identity(state.binding_id);
    const TargetRef& target = state.target;
    Diagnostics diags;

    std::optional<Object> live;
    try {
        live = fetch(target, ctx);
    } catch (const StoreError& e) {
        Diagnostic diag = classify_store_error(e, "Release", target.describe());
        diag.severity = Severity::Warning;
        diags.push_back(std::move(diag));
        return diags;
    }
    if (!live) {
        FIELDPATCH_LOG_INFO(kTag, "{} already deleted; nothing to release", target.describe());
        return diags;
    }

    if (state.previous_owners.empty()) {
        diags.push_back({Severity::Warning, "Ownership Not Transferred",
                         fmt::format("No previous owners are recorded for {}; fields stay "
                                     "owned by '{}'.", target.describe(), identity.name())});
        return diags;
    }

    std::map<std::string, std::vector<std::string>> by_owner;
    for (const auto& kv : state.previous_owners) {
        by_owner[kv.second].push_back(kv.first);
    }

    for (const auto& [owner, fields] : by_owner) {
        std::optional<Object> current;
        try {
            current = fetch(target, ctx);
        } catch (const StoreError& e) {
            FIELDPATCH_LOG_WARN(kTag, "could not re-read {} for '{}': {}", target.describe(),
                                owner, e.what());
            diags.push_back({Severity::Warning, "Ownership Transfer Failed",
                             fmt::format("Could not re-read {} before returning fields to "
                                         "'{}': {}", target.describe(), owner, e.what())});
            continue;
        }
        if (!current) {
            FIELDPATCH_LOG_INFO(kTag, "{} deleted during release", target.describe());
            break;
        }

        const OwnershipMap ownership = OwnershipMap::build(*current, config_.filter);
        std::vector<std::string> transfer;
        for (const auto& field : fields) {
            const auto& claimants = ownership.claimants(field);
            if (std::any_of(claimants.begin(), claimants.end(),
                            [&](const std::string& m) { return identity.matches(m); })) {
                transfer.push_back(field);
            }
        }
        if (transfer.empty()) {
            FIELDPATCH_LOG_DEBUG(kTag, "no fields for '{}' still owned by this binding", owner);
            continue;
        }

        ApplyOptions options;
        options.manager = owner;
        options.force = true;
        try {
            ctx.check("release " + target.describe());
            store_.apply(Object(partial_document(*current, transfer)), options, ctx);
        } catch (const StoreError& e) {
            FIELDPATCH_LOG_WARN(kTag, "transfer to '{}' failed: {}", owner, e.what());
            diags.push_back({Severity::Warning, "Ownership Transfer Failed",
                             fmt::format("Could not return {} field(s) on {} to '{}': {}",
                                         transfer.size(), target.describe(), owner,
                                         e.message())});
            continue;
        } catch (const PathError& e) {
            FIELDPATCH_LOG_WARN(kTag, "transfer to '{}' failed: {}", owner, e.what());
            diags.push_back({Severity::Warning, "Ownership Transfer Failed", e.what()});
            continue;
        }
        FIELDPATCH_LOG_DEBUG(kTag, "returned {} field(s) to '{}' ({} skipped)", transfer.size(),
                             owner, fields.size() - transfer.size());
    }
    return diags;
}

} // namespace fieldpatch
