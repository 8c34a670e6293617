/**
 * @file Classify.hpp
 * @brief Turning raw store failures into structured errors and diagnostics
 *
 * Status codes are checked before message text, and field validation (400)
 * before the generic invalid case (422), so a schema rejection is never
 * reported as an immutable-field change.
 */

#ifndef FIELDPATCH_CLASSIFY_HPP
#define FIELDPATCH_CLASSIFY_HPP

#include "fieldpatch/Diagnostics.hpp"
#include "fieldpatch/Errors.hpp"

#include <string>
#include <vector>

namespace fieldpatch {

/**
 * @brief 422 whose message names an immutable or forbidden change
 */
bool is_immutable_field_error(const StoreError& err);

/**
 * @brief 400 reporting unknown, duplicate or undeclared fields
 */
bool is_field_validation_error(const StoreError& err);

/**
 * @brief Field paths named by an immutable-field message
 *
 * Looks for "<path>: Invalid value" / "<path>: Forbidden" clauses.
 */
std::vector<std::string> extract_immutable_fields(const std::string& message);

/**
 * @brief Field paths named by a field validation message
 *
 * Handles `unknown field "x"`, `duplicate field "x"` and
 * `x: field not declared in schema`.
 */
std::vector<std::string> extract_validation_fields(const std::string& message);

/**
 * @brief (manager, path) pairs from a 409 apply conflict message
 */
std::vector<std::pair<std::string, std::string>> extract_conflicts(const std::string& message);

/**
 * @brief Map a store failure to a diagnostic
 *
 * @param err The failure
 * @param operation "Plan", "Apply", "Read", "Release", ...
 * @param target Human-readable target description
 *
 * Not found is a warning; everything else is an error.
 */
Diagnostic classify_store_error(const StoreError& err, const std::string& operation,
                                const std::string& target);

/**
 * @brief Rethrow a store failure as its structured subclass
 *
 * NotFoundError, StoreConflictError, FieldValidationError and
 * ImmutableFieldError are thrown for their cases. Other 400 and 422
 * rejections become StoreRejectionError; anything else is rethrown as
 * the original StoreError.
 */
void decode_store_error(const StoreError& err);

} // namespace fieldpatch

#endif // FIELDPATCH_CLASSIFY_HPP
