/**
 * @file Detector.cpp
 * @brief Ownership checks run around every dry run and apply
 */

#include "fieldpatch/Detector.hpp"
#include "fieldpatch/Errors.hpp"
#include "fieldpatch/FieldPath.hpp"
#include "fieldpatch/Log.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <set>

namespace fieldpatch {

namespace {

const char* const kTag = "detector";

bool named_list(const Value& arr) {
    if (!arr.is_array() || arr.empty()) return false;
    return std::all_of(arr.begin(), arr.end(), [](const Value& e) {
        return e.is_object() && e.contains("name") && e["name"].is_string();
    });
}

void collect(const Value& node, const std::string& prefix, std::vector<std::string>& out) {
    if (node.is_object() && !node.empty()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            collect(it.value(), append_field(prefix, it.key()), out);
        }
        return;
    }
    if (named_list(node)) {
        for (const auto& element : node) {
            const std::string path = prefix + join_field_path(FieldPath{
                PathSegment::keyed({{"name", element["name"].get<std::string>()}})});
            for (auto it = element.begin(); it != element.end(); ++it) {
                collect(it.value(), append_field(path, it.key()), out);
            }
        }
        return;
    }
    if (!prefix.empty()) out.push_back(prefix);
}

} // namespace

std::vector<std::string> patch_ownership_paths(const PatchSpec& spec) {
    if (spec.kind() == PatchKind::JsonPatch) {
        return spec.paths();
    }
    std::vector<std::string> out;
    collect(spec.decode(), "", out);
    return out;
}

bool paths_overlap(const std::string& a, const std::string& b) {
    return path_has_prefix(a, b) || path_has_prefix(b, a);
}

// ============================================================================
// Pre-write checks
// ============================================================================

void check_self_management(const Object& live, const std::string& lifecycle_manager,
                           const std::vector<std::string>& reserved_annotations,
                           const ManagerIdentity& identity) {
    for (const auto& key : reserved_annotations) {
        if (live.annotation(key)) {
            throw SelfManagedError(live.ref().describe(), "annotation " + key);
        }
    }

    if (lifecycle_manager.empty()) return;

    for (const auto& entry : live.managed_fields()) {
        const std::string& m = entry.manager;
        if (identity.is_binding_manager(m)) continue;
        if (m == lifecycle_manager ||
            m.compare(0, lifecycle_manager.size(), lifecycle_manager) == 0) {
            throw SelfManagedError(live.ref().describe(), "field manager " + m);
        }
    }
}

void check_cross_binding(const OwnershipMap& live_ownership,
                         const std::vector<std::string>& patch_paths,
                         const ManagerIdentity& identity, const TargetRef& target,
                         std::size_t display_limit) {
    std::vector<std::pair<std::string, std::string>> overlaps;
    std::set<std::pair<std::string, std::string>> seen;

    for (const auto& manager : live_ownership.managers()) {
        if (!identity.is_other_binding(manager)) continue;
        const auto owned = live_ownership.paths_of(
            [&](const std::string& m) { return m == manager; });
        for (const auto& patch_path : patch_paths) {
            for (const auto& owned_path : owned) {
                if (!paths_overlap(patch_path, owned_path)) continue;
                // Report the more specific of the two
                const std::string& path = owned_path.size() > patch_path.size() ? owned_path
                                                                                 : patch_path;
                if (seen.emplace(path, manager).second) {
                    overlaps.emplace_back(path, manager);
                }
            }
        }
    }

    if (overlaps.empty()) return;

    std::vector<ConflictRecord> records;
    for (const auto& o : overlaps) {
        records.push_back({o.first, o.second, identity.name()});
    }
    const std::string message = fmt::format(
        "Patch conflicts with an existing patch on {}: fields are already managed by "
        "another binding:\n{}\n\nTwo bindings cannot manage the same fields. Remove the "
        "overlapping fields from one of them or merge the two patches.",
        target.describe(), format_conflicts(records, display_limit));
    throw BindingConflictError(target.describe(), std::move(overlaps), message);
}

// ============================================================================
// Takeover detection
// ============================================================================

std::vector<ConflictRecord> detect_takeovers(const OwnershipMap& before, const OwnershipMap& after,
                                             const std::map<std::string, std::string>& recorded,
                                             const ManagerIdentity& identity) {
    std::vector<ConflictRecord> records;
    const auto ours = after.leaf_paths_of(
        [&](const std::string& m) { return identity.matches(m); });

    for (const auto& path : ours) {
        const auto& claimants = before.claimants(path);
        const bool already_ours = std::any_of(claimants.begin(), claimants.end(),
                                              [&](const std::string& m) {
                                                  return identity.matches(m);
                                              });
        if (already_ours) continue;

        std::string previous;
        if (!claimants.empty()) {
            const auto& now = after.claimants(path);
            auto lost = std::find_if(claimants.begin(), claimants.end(),
                                     [&](const std::string& m) {
                                         return std::find(now.begin(), now.end(), m) == now.end();
                                     });
            // Same value applied: ownership is shared, the first claimant is still recorded
            previous = lost != claimants.end() ? *lost : claimants.front();
        } else {
            auto it = recorded.find(path);
            if (it != recorded.end() && !identity.matches(it->second)) {
                previous = it->second;
            }
        }
        FIELDPATCH_LOG_DEBUG(kTag, "{}: {} -> {}", path,
                             previous.empty() ? "<none>" : previous, identity.name());
        records.push_back({path, previous, identity.name()});
    }
    return records;
}

std::string format_conflicts(const std::vector<ConflictRecord>& records, std::size_t limit) {
    std::vector<std::string> lines;
    const std::size_t shown = limit == 0 ? records.size() : std::min(limit, records.size());
    for (std::size_t i = 0; i < shown; ++i) {
        const auto& r = records[i];
        if (r.first_ownership()) {
            lines.push_back(fmt::format("  - {} (not previously owned)", r.path));
        } else {
            lines.push_back(fmt::format("  - {} (currently owned by {})", r.path, r.current_owner));
        }
    }
    if (shown < records.size()) {
        lines.push_back(fmt::format("  +{} more", records.size() - shown));
    }
    return fmt::format("{}", fmt::join(lines, "\n"));
}

Diagnostics takeover_diagnostics(const std::vector<ConflictRecord>& records,
                                 const TargetRef& target, std::size_t limit) {
    std::vector<ConflictRecord> taken;
    std::vector<ConflictRecord> first;
    for (const auto& r : records) {
        (r.first_ownership() ? first : taken).push_back(r);
    }

    Diagnostics diags;
    if (!taken.empty()) {
        diags.push_back({Severity::Warning, "Field Ownership Takeover",
                         fmt::format("This patch takes ownership of fields managed by other "
                                     "controllers on {}:\n{}\n\nThe other controllers may "
                                     "revert these values.",
                                     target.describe(), format_conflicts(taken, limit))});
    }
    if (!first.empty()) {
        diags.push_back({Severity::Info, "Field Ownership Acquired",
                         fmt::format("This patch becomes the first owner of {} field(s) on {}:\n{}",
                                     first.size(), target.describe(),
                                     format_conflicts(first, limit))});
    }
    return diags;
}

} // namespace fieldpatch
