/**
 * @file Projection.cpp
 * @brief Projection flattening and comparison
 */

#include "fieldpatch/Projection.hpp"
#include "fieldpatch/Errors.hpp"
#include "fieldpatch/FieldPath.hpp"
#include "fieldpatch/Log.hpp"

namespace fieldpatch {

const char* projection_status_name(ProjectionStatus status) {
    switch (status) {
        case ProjectionStatus::Known: return "known";
        case ProjectionStatus::Unknown: return "unknown";
        case ProjectionStatus::NotApplicable: return "not_applicable";
    }
    return "unknown";
}

ProjectionStatus projection_status_from_name(const std::string& name) {
    if (name == "known") return ProjectionStatus::Known;
    if (name == "unknown") return ProjectionStatus::Unknown;
    if (name == "not_applicable") return ProjectionStatus::NotApplicable;
    throw ConfigurationError("Unknown projection status '" + name + "'");
}

Projection flatten_projection(const Value& doc, const std::vector<std::string>& paths) {
    Projection out;
    for (const auto& path : paths) {
        const Value* value = find_by_path(doc, path);
        if (value == nullptr) {
            FIELDPATCH_LOG_DEBUG("projection", "owned path '{}' not present in document", path);
            continue;
        }
        out[path] = render_scalar(*value);
    }
    return out;
}

Projection project_owned(const Object& result, const ManagerIdentity& identity,
                         const OwnershipFilter& filter) {
    const OwnershipMap ownership = OwnershipMap::build(result, filter);
    const auto paths = ownership.leaf_paths_of(
        [&](const std::string& m) { return identity.matches(m); });
    return flatten_projection(result.doc(), paths);
}

std::vector<std::string> projection_diff(const Projection& a, const Projection& b) {
    std::vector<std::string> out;
    auto ia = a.begin();
    auto ib = b.begin();
    while (ia != a.end() || ib != b.end()) {
        if (ib == b.end() || (ia != a.end() && ia->first < ib->first)) {
            out.push_back(ia->first);
            ++ia;
        } else if (ia == a.end() || ib->first < ia->first) {
            out.push_back(ib->first);
            ++ib;
        } else {
            if (ia->second != ib->second) out.push_back(ia->first);
            ++ia;
            ++ib;
        }
    }
    return out;
}

} // namespace fieldpatch
