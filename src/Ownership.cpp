/**
 * @file Ownership.cpp
 * @brief Manager identity equivalence and ownership map construction
 */

#include "fieldpatch/Ownership.hpp"
#include "fieldpatch/Errors.hpp"
#include "fieldpatch/Log.hpp"

#include <algorithm>
#include <set>

namespace fieldpatch {

// ============================================================================
// ManagerIdentity
// ============================================================================

ManagerIdentity::ManagerIdentity(std::string prefix, std::string placeholder_suffix,
                                 std::optional<std::string> binding_id)
    : prefix_(std::move(prefix))
    , placeholder_suffix_(std::move(placeholder_suffix))
    , binding_id_(std::move(binding_id))
{
    name_ = binding_id_ ? prefix_ + *binding_id_ : placeholder();
}

bool ManagerIdentity::matches(const std::string& manager) const {
    return manager == name_ || manager == placeholder();
}

bool ManagerIdentity::is_binding_manager(const std::string& manager) const {
    return !prefix_.empty() && manager.compare(0, prefix_.size(), prefix_) == 0;
}

ManagerIdentity ManagerIdentity::with_binding_id(const std::string& id) const {
    return ManagerIdentity(prefix_, placeholder_suffix_, id);
}

// ============================================================================
// OwnershipFilter
// ============================================================================

OwnershipFilter OwnershipFilter::defaults() {
    OwnershipFilter filter;
    filter.volatile_roots = {"status"};
    filter.volatile_metadata = {
        "metadata.resourceVersion",
        "metadata.generation",
        "metadata.managedFields",
        "metadata.uid",
        "metadata.creationTimestamp"
    };
    filter.system_annotations = {
        "kubectl.kubernetes.io/last-applied-configuration",
        "kubectl.kubernetes.io/restartedAt",
        "deployment.kubernetes.io/revision"
    };
    return filter;
}

bool OwnershipFilter::excluded(const std::string& path) const {
    for (const auto& root : volatile_roots) {
        if (path_has_prefix(path, root)) return true;
    }
    for (const auto& meta : volatile_metadata) {
        if (path_has_prefix(path, meta)) return true;
    }
    for (const auto& annotation : system_annotations) {
        if (path_has_prefix(path, append_field("metadata.annotations", annotation))) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// OwnershipMap
// ============================================================================

OwnershipMap OwnershipMap::build(const std::vector<ManagedFieldsEntry>& entries,
                                 const OwnershipFilter& filter) {
    OwnershipMap map;

    for (const auto& entry : entries) {
        if (entry.fields.is_null()) continue;

        FieldSet fields;
        try {
            fields = FieldSet::parse(entry.fields);
        } catch (const ParseError& e) {
            FIELDPATCH_LOG_WARN("ownership", "skipping managedFields entry of '{}': {}",
                                entry.manager, e.what());
            continue;
        }

        ManagerFields mf;
        mf.manager = entry.manager;

        for (const auto& path : fields.paths()) {
            if (filter.excluded(path)) continue;
            mf.paths.push_back(path);

            auto& claimants = map.claims_[path];
            if (std::find(claimants.begin(), claimants.end(), entry.manager) != claimants.end()) {
                continue;
            }
            if (!claimants.empty()) {
                FIELDPATCH_LOG_DEBUG("ownership", "'{}' also claimed by '{}', keeping '{}'",
                                     path, entry.manager, claimants.front());
            }
            claimants.push_back(entry.manager);
        }
        for (const auto& path : fields.leaf_paths()) {
            if (!filter.excluded(path)) mf.leaves.push_back(path);
        }

        map.by_manager_.push_back(std::move(mf));
    }

    return map;
}

std::optional<std::string> OwnershipMap::owner(const std::string& path) const {
    auto it = claims_.find(path);
    if (it == claims_.end() || it->second.empty()) return std::nullopt;
    return it->second.front();
}

const std::vector<std::string>& OwnershipMap::claimants(const std::string& path) const {
    static const std::vector<std::string> kNone;
    auto it = claims_.find(path);
    return it == claims_.end() ? kNone : it->second;
}

std::vector<std::string> OwnershipMap::leaf_paths_of(
    const std::function<bool(const std::string&)>& matches) const {
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (const auto& mf : by_manager_) {
        if (!matches(mf.manager)) continue;
        for (const auto& path : mf.leaves) {
            if (seen.insert(path).second) out.push_back(path);
        }
    }
    return out;
}

std::vector<std::string> OwnershipMap::paths_of(
    const std::function<bool(const std::string&)>& matches) const {
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (const auto& mf : by_manager_) {
        if (!matches(mf.manager)) continue;
        for (const auto& path : mf.paths) {
            if (seen.insert(path).second) out.push_back(path);
        }
    }
    return out;
}

std::map<std::string, std::string> OwnershipMap::owners() const {
    std::map<std::string, std::string> out;
    for (const auto& kv : claims_) {
        if (!kv.second.empty()) out.emplace(kv.first, kv.second.front());
    }
    return out;
}

std::vector<std::string> OwnershipMap::managers() const {
    std::vector<std::string> out;
    for (const auto& mf : by_manager_) {
        if (std::find(out.begin(), out.end(), mf.manager) == out.end()) {
            out.push_back(mf.manager);
        }
    }
    return out;
}

} // namespace fieldpatch
