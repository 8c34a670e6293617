/**
 * @file Classify.cpp
 * @brief Store error classification
 */

#include "fieldpatch/Classify.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cctype>
#include <regex>

namespace fieldpatch {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool contains_any(const std::string& haystack, const std::vector<std::string>& needles) {
    return std::any_of(needles.begin(), needles.end(), [&](const std::string& n) {
        return haystack.find(n) != std::string::npos;
    });
}

void push_unique(std::vector<std::string>& out, const std::string& value) {
    if (std::find(out.begin(), out.end(), value) == out.end()) {
        out.push_back(value);
    }
}

} // namespace

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info: return "info";
        case Severity::Warning: return "warning";
        case Severity::Error: return "error";
    }
    return "unknown";
}

// ============================================================================
// Predicates
// ============================================================================

bool is_immutable_field_error(const StoreError& err) {
    if (err.code() != 422) return false;
    return contains_any(to_lower(err.message()),
                        {"immutable", "forbidden", "cannot be changed", "may not be modified"});
}

bool is_field_validation_error(const StoreError& err) {
    if (err.code() != 400) return false;
    return contains_any(to_lower(err.message()),
                        {"unknown field", "duplicate field", "strict decoding error",
                         "field not declared in schema"});
}

// ============================================================================
// Extraction
// ============================================================================

std::vector<std::string> extract_immutable_fields(const std::string& message) {
    static const std::regex pattern(R"(([A-Za-z0-9_.\[\]=/\\-]+):\s*(Invalid value|Forbidden))");
    std::vector<std::string> fields;
    for (auto it = std::sregex_iterator(message.begin(), message.end(), pattern);
         it != std::sregex_iterator(); ++it) {
        push_unique(fields, (*it)[1].str());
    }
    return fields;
}

std::vector<std::string> extract_validation_fields(const std::string& message) {
    static const std::regex quoted(R"((unknown field|duplicate field)\s*"([^"]+)\")");
    static const std::regex undeclared(R"(([\w\[\]\.]+):\s*field not declared in schema)");

    std::vector<std::string> fields;
    for (auto it = std::sregex_iterator(message.begin(), message.end(), quoted);
         it != std::sregex_iterator(); ++it) {
        push_unique(fields, (*it)[2].str());
    }
    for (auto it = std::sregex_iterator(message.begin(), message.end(), undeclared);
         it != std::sregex_iterator(); ++it) {
        std::string field = (*it)[1].str();
        if (!field.empty() && field.front() == '.') field.erase(0, 1);
        push_unique(fields, field);
    }
    return fields;
}

std::vector<std::pair<std::string, std::string>> extract_conflicts(const std::string& message) {
    static const std::regex pattern(R"re(conflict with "([^"]+)".*?: ([\.\w\[\]=,/-]+))re");
    std::vector<std::pair<std::string, std::string>> out;
    for (auto it = std::sregex_iterator(message.begin(), message.end(), pattern);
         it != std::sregex_iterator(); ++it) {
        std::string path = (*it)[2].str();
        if (!path.empty() && path.front() == '.') path.erase(0, 1);
        out.emplace_back((*it)[1].str(), path);
    }
    return out;
}

// ============================================================================
// Classification
// ============================================================================

Diagnostic classify_store_error(const StoreError& err, const std::string& operation,
                                const std::string& target) {
    const std::string lower = to_lower(err.message());

    if (err.code() == 404) {
        return {Severity::Warning, operation + ": Resource Not Found",
                fmt::format("The {} was not found in the store. It may have been deleted "
                            "outside of this tool.", target)};
    }

    if (err.code() == 403) {
        return {Severity::Error, operation + ": Insufficient Permissions",
                fmt::format("Permissions are insufficient to {} {}. Details: {}",
                            to_lower(operation), target, err.message())};
    }

    if (err.code() == 409) {
        std::vector<std::string> lines;
        for (const auto& c : extract_conflicts(err.message())) {
            lines.push_back(fmt::format("- {}: managed by \"{}\"", c.second, c.first));
        }
        if (lines.empty()) {
            lines.push_back("- Multiple field ownership conflicts detected");
        }
        return {Severity::Error, operation + ": Field Manager Conflict",
                fmt::format("Server-side apply conflict detected for {}.\n"
                            "Another manager owns one or more of the fields.\n\n"
                            "Conflicting fields:\n{}\n\nDetails: {}",
                            target, fmt::join(lines, "\n"), err.message())};
    }

    if (err.code() == 504 || err.code() == 408 || err.reason() == "Timeout" ||
        lower.find("timeout") != std::string::npos) {
        return {Severity::Error, operation + ": Store Timeout",
                fmt::format("Timeout while performing {} on {}. Details: {}",
                            to_lower(operation), target, err.message())};
    }

    if (err.code() == 401) {
        return {Severity::Error, operation + ": Authentication Failed",
                fmt::format("Authentication failed for {} {}. Details: {}",
                            to_lower(operation), target, err.message())};
    }

    // Field validation (400) before the generic invalid case (422)
    if (is_field_validation_error(err)) {
        std::vector<std::string> lines;
        for (const auto& field : extract_validation_fields(err.message())) {
            lines.push_back("Field: " + field);
        }
        std::string fields = lines.empty() ? "Field validation failed."
                                           : fmt::format("{}", fmt::join(lines, "\n"));
        if (lines.size() > 1) {
            fields = fmt::format("Found {} field validation errors:\n{}", lines.size(), fields);
        }
        return {Severity::Error, operation + ": Field Validation Failed",
                fmt::format("Field validation failed for {}.\n\n{}\n\nDetails: {}",
                            target, fields, err.message())};
    }

    if (err.code() == 422) {
        if (is_immutable_field_error(err)) {
            const auto fields = extract_immutable_fields(err.message());
            return {Severity::Error, operation + ": Immutable Field Changed",
                    fmt::format("Cannot update immutable field(s) [{}] on {}.\n"
                                "Immutable fields cannot be changed after creation; restore "
                                "the original value or recreate the object.",
                                fields.empty() ? std::string("see details")
                                               : fmt::format("{}", fmt::join(fields, ", ")),
                                target)};
        }
        return {Severity::Error, operation + ": Invalid Resource",
                fmt::format("The {} contains invalid fields or values. Details: {}",
                            target, err.message())};
    }

    return {Severity::Error, operation + ": Store Error",
            fmt::format("An unexpected error occurred while performing {} on {}. Details: {}",
                        to_lower(operation), target, err.message())};
}

void decode_store_error(const StoreError& err) {
    if (err.code() == 404) {
        throw NotFoundError(err.message());
    }
    if (err.code() == 409) {
        throw StoreConflictError(err.message());
    }
    if (is_field_validation_error(err)) {
        throw FieldValidationError(err.message(), extract_validation_fields(err.message()));
    }
    if (is_immutable_field_error(err)) {
        throw ImmutableFieldError(err.message(), extract_immutable_fields(err.message()));
    }
    if (err.code() == 400 || err.code() == 422) {
        throw StoreRejectionError(err.code(), err.reason(), err.message(), {});
    }
    throw err;
}

} // namespace fieldpatch
