/**
 * @file Errors.hpp
 * @brief Exception types for patch planning, apply and reconciliation
 *
 * Error taxonomy:
 * - PatchError: Base class
 * - ConfigurationError: Invalid patch specification or engine configuration
 *   - ParseError: Malformed patch payload or configuration file
 *   - FileNotFoundError: Configuration/object/state file not found
 *   - MissingMandatoryConfig: Mandatory configuration keys absent
 *   - TargetChangedError: Binding target modified in place
 * - PathError: Field path syntax or traversal failure
 * - TargetError: The target object cannot be patched
 *   - TargetNotFoundError: Target absent at apply time
 *   - SelfManagedError: Target owned by the full-lifecycle manager
 *   - BindingConflictError: Paths already owned by another binding
 * - StoreError: Resource store failure (status code + reason)
 *   - NotFoundError: 404 from the store
 *   - StoreConflictError: 409 field manager conflict (non-forced apply)
 *   - StoreRejectionError: Store refused the content
 *     - ImmutableFieldError: Immutable field changed
 *     - FieldValidationError: Unknown/duplicate/undeclared fields
 * - CancelledError: Caller cancelled or timed out the cycle
 */

#ifndef FIELDPATCH_ERRORS_HPP
#define FIELDPATCH_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <sstream>

namespace fieldpatch {

/**
 * @brief Base class for all fieldpatch exceptions
 */
class PatchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ============================================================================
// Configuration errors
// ============================================================================

/**
 * @brief Invalid configuration, raised before any store call
 */
class ConfigurationError : public PatchError {
public:
    using PatchError::PatchError;
};

/**
 * @brief Malformed payload or configuration file
 */
class ParseError : public ConfigurationError {
public:
    /**
     * @brief Construct with source description and parser message
     * @param source What was being parsed (file path, "patch", "managedFields")
     * @param details Detailed error message from parser
     */
    ParseError(std::string source, std::string details)
        : ConfigurationError("Parse error in '" + source + "': " + details)
        , source_(std::move(source))
        , details_(std::move(details))
    {}

    /**
     * @brief Construct with a line/column position (TOML parser)
     */
    ParseError(std::string source, int line, int column, std::string details)
        : ConfigurationError("Parse error in '" + source + "' at line " +
                             std::to_string(line) + ", column " +
                             std::to_string(column) + ": " + details)
        , source_(std::move(source))
        , details_(std::move(details))
        , line_(line)
        , column_(column)
    {}

    const std::string& source() const noexcept { return source_; }
    const std::string& details() const noexcept { return details_; }
    int line() const noexcept { return line_; }
    int column() const noexcept { return column_; }

private:
    std::string source_;
    std::string details_;
    int line_ = 0;
    int column_ = 0;
};

/**
 * @brief File not found
 */
class FileNotFoundError : public ConfigurationError {
public:
    explicit FileNotFoundError(std::string path)
        : ConfigurationError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/**
 * @brief Mandatory configuration keys are missing after merge
 */
class MissingMandatoryConfig : public ConfigurationError {
public:
    explicit MissingMandatoryConfig(std::vector<std::string> keys)
        : ConfigurationError(format_message(keys))
        , missing_keys_(std::move(keys))
    {}

    const std::vector<std::string>& missing_keys() const noexcept {
        return missing_keys_;
    }

private:
    std::vector<std::string> missing_keys_;

    static std::string format_message(const std::vector<std::string>& keys) {
        std::ostringstream oss;
        oss << "Missing mandatory configuration keys: [";
        for (size_t i = 0; i < keys.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << "'" << keys[i] << "'";
        }
        oss << "]";
        return oss.str();
    }
};

/**
 * @brief The target of an existing binding was changed
 *
 * A binding's target is immutable; a new target requires a new binding.
 */
class TargetChangedError : public ConfigurationError {
public:
    TargetChangedError(std::string previous, std::string requested)
        : ConfigurationError("Target changed from " + previous + " to " +
                             requested + "; the binding must be replaced")
        , previous_(std::move(previous))
        , requested_(std::move(requested))
    {}

    const std::string& previous() const noexcept { return previous_; }
    const std::string& requested() const noexcept { return requested_; }

private:
    std::string previous_;
    std::string requested_;
};

// ============================================================================
// Path errors
// ============================================================================

/**
 * @brief Field path could not be parsed or traversed
 */
class PathError : public PatchError {
public:
    PathError(std::string path, std::string reason)
        : PatchError("Invalid field path '" + path + "': " + reason)
        , path_(std::move(path))
        , reason_(std::move(reason))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& reason() const noexcept { return reason_; }

private:
    std::string path_;
    std::string reason_;
};

// ============================================================================
// Target errors
// ============================================================================

/**
 * @brief Base class for errors about the target object itself
 */
class TargetError : public PatchError {
public:
    TargetError(std::string target, const std::string& message)
        : PatchError(message)
        , target_(std::move(target))
    {}

    /**
     * @brief Human-readable target description
     */
    const std::string& target() const noexcept { return target_; }

private:
    std::string target_;
};

/**
 * @brief Target object does not exist (fatal at apply time)
 */
class TargetNotFoundError : public TargetError {
public:
    explicit TargetNotFoundError(std::string target)
        : TargetError(target,
                      "Target resource not found: " + target +
                      ". Patches can only modify existing objects.")
    {}
};

/**
 * @brief Target is already managed by the full-lifecycle manager
 */
class SelfManagedError : public TargetError {
public:
    SelfManagedError(std::string target, std::string evidence)
        : TargetError(target,
                      "Cannot patch own resource " + target +
                      ": it is already managed by the lifecycle manager (" +
                      evidence + ")")
        , evidence_(std::move(evidence))
    {}

    /**
     * @brief The annotation or manager name that marked the object
     */
    const std::string& evidence() const noexcept { return evidence_; }

private:
    std::string evidence_;
};

/**
 * @brief Patch paths overlap paths owned by another binding
 */
class BindingConflictError : public TargetError {
public:
    /**
     * @param target Target description
     * @param overlaps (path, owning manager) pairs
     * @param message Fully formatted diagnostic (already truncated)
     */
    BindingConflictError(std::string target,
                         std::vector<std::pair<std::string, std::string>> overlaps,
                         const std::string& message)
        : TargetError(std::move(target), message)
        , overlaps_(std::move(overlaps))
    {}

    const std::vector<std::pair<std::string, std::string>>& overlaps() const noexcept {
        return overlaps_;
    }

private:
    std::vector<std::pair<std::string, std::string>> overlaps_;
};

// ============================================================================
// Store errors
// ============================================================================

/**
 * @brief Failure reported by the resource store
 */
class StoreError : public PatchError {
public:
    /**
     * @param code HTTP-style status code (0 when not applicable)
     * @param reason Machine-readable reason ("NotFound", "Invalid", ...)
     * @param message Store-supplied message
     */
    StoreError(int code, std::string reason, std::string message)
        : PatchError(format_message(code, reason, message))
        , code_(code)
        , reason_(std::move(reason))
        , message_(std::move(message))
    {}

    int code() const noexcept { return code_; }
    const std::string& reason() const noexcept { return reason_; }
    const std::string& message() const noexcept { return message_; }

private:
    int code_;
    std::string reason_;
    std::string message_;

    static std::string format_message(int code, const std::string& reason,
                                      const std::string& message) {
        std::ostringstream oss;
        oss << "store error";
        if (code != 0) oss << " " << code;
        if (!reason.empty()) oss << " (" << reason << ")";
        oss << ": " << message;
        return oss.str();
    }
};

/**
 * @brief Object absent in the store
 */
class NotFoundError : public StoreError {
public:
    explicit NotFoundError(std::string message)
        : StoreError(404, "NotFound", std::move(message))
    {}
};

/**
 * @brief Field manager conflict on a non-forced apply
 */
class StoreConflictError : public StoreError {
public:
    explicit StoreConflictError(std::string message)
        : StoreError(409, "Conflict", std::move(message))
    {}
};

/**
 * @brief Store refused the submitted content
 */
class StoreRejectionError : public StoreError {
public:
    StoreRejectionError(int code, std::string reason, std::string message,
                        std::vector<std::string> fields)
        : StoreError(code, std::move(reason), std::move(message))
        , fields_(std::move(fields))
    {}

    /**
     * @brief Field paths named by the rejection (may be empty)
     */
    const std::vector<std::string>& fields() const noexcept { return fields_; }

private:
    std::vector<std::string> fields_;
};

/**
 * @brief Immutable field modification rejected (422)
 */
class ImmutableFieldError : public StoreRejectionError {
public:
    ImmutableFieldError(std::string message, std::vector<std::string> fields)
        : StoreRejectionError(422, "Invalid", std::move(message), std::move(fields))
    {}
};

/**
 * @brief Schema validation rejected unknown or duplicate fields (400)
 */
class FieldValidationError : public StoreRejectionError {
public:
    FieldValidationError(std::string message, std::vector<std::string> fields)
        : StoreRejectionError(400, "BadRequest", std::move(message), std::move(fields))
    {}
};

// ============================================================================
// Cancellation
// ============================================================================

/**
 * @brief The caller cancelled the cycle or its deadline passed
 *
 * Never retried and never downgraded to a warning.
 */
class CancelledError : public PatchError {
public:
    explicit CancelledError(const std::string& where)
        : PatchError("Operation cancelled: " + where)
    {}
};

} // namespace fieldpatch

#endif // FIELDPATCH_ERRORS_HPP
