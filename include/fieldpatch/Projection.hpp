/**
 * @file Projection.hpp
 * @brief Flat path → value view of the fields a binding owns
 */

#ifndef FIELDPATCH_PROJECTION_HPP
#define FIELDPATCH_PROJECTION_HPP

#include "fieldpatch/Object.hpp"
#include "fieldpatch/Ownership.hpp"

#include <map>
#include <string>
#include <vector>

namespace fieldpatch {

/**
 * @brief Whether a projection could be computed
 *
 * - Known: computed from a dry run or apply result
 * - Unknown: target absent at plan time; computed at apply
 * - NotApplicable: the patch kind produces no ownership metadata
 */
enum class ProjectionStatus {
    Known,
    Unknown,
    NotApplicable
};

const char* projection_status_name(ProjectionStatus status);

/**
 * @throws ConfigurationError for unknown names
 */
ProjectionStatus projection_status_from_name(const std::string& name);

/**
 * @brief Ordered map, so equality is set equality
 */
using Projection = std::map<std::string, std::string>;

/**
 * @brief Render the values at `paths` in `doc`
 *
 * Values use render_scalar(); paths missing from the document are left out.
 */
Projection flatten_projection(const Value& doc, const std::vector<std::string>& paths);

/**
 * @brief Projection of the leaf paths `identity` owns in `result`
 */
Projection project_owned(const Object& result, const ManagerIdentity& identity,
                         const OwnershipFilter& filter);

/**
 * @brief Paths whose values differ, including paths present on one side only
 */
std::vector<std::string> projection_diff(const Projection& a, const Projection& b);

} // namespace fieldpatch

#endif // FIELDPATCH_PROJECTION_HPP
