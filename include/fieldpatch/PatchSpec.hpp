/**
 * @file PatchSpec.hpp
 * @brief Patch payload kinds and their validation
 */

#ifndef FIELDPATCH_PATCHSPEC_HPP
#define FIELDPATCH_PATCHSPEC_HPP

#include "fieldpatch/Value.hpp"

#include <optional>
#include <string>
#include <vector>

namespace fieldpatch {

/**
 * @brief Closed set of payload kinds
 */
enum class PatchKind {
    Merge,       ///< Deep-merge document, submitted as a force-apply
    JsonPatch,   ///< RFC 6902 operation list
    MergePatch   ///< RFC 7396 map-merge document
};

struct PatchCapabilities {
    bool supports_projection;   ///< Dry-run prediction and ownership projection
    bool uses_apply;            ///< Submitted through apply rather than patch
};

PatchCapabilities capabilities(PatchKind kind);

const char* patch_kind_name(PatchKind kind);

/**
 * @brief Inverse of patch_kind_name ("patch", "json_patch", "merge_patch")
 * @throws ConfigurationError for unknown names
 */
PatchKind patch_kind_from_name(const std::string& name);

/**
 * @brief One binding's patch payload
 *
 * Content stays opaque until decode(). Merge documents may be JSON or TOML;
 * JSON is tried first.
 */
class PatchSpec {
public:
    PatchSpec(PatchKind kind, std::string content);

    /**
     * @brief Build from the three optional payload fields
     *
     * Empty strings count as unset.
     *
     * @throws ConfigurationError unless exactly one field is set
     */
    static PatchSpec from_fields(const std::optional<std::string>& merge,
                                 const std::optional<std::string>& json_patch,
                                 const std::optional<std::string>& merge_patch);

    PatchKind kind() const { return kind_; }
    const std::string& content() const { return content_; }
    PatchCapabilities capabilities() const { return fieldpatch::capabilities(kind_); }

    /**
     * @brief Parse the payload
     *
     * Merge and map-merge documents must decode to an object; JSON patch
     * content must be an array of well-formed operations.
     *
     * @throws ParseError on malformed content
     * @throws ConfigurationError on structurally invalid operations
     */
    Value decode() const;

    /**
     * @brief Digest of the kind and canonical payload
     *
     * Insensitive to key order and whitespace in the payload text.
     */
    std::string fingerprint() const;

    /**
     * @brief Canonical paths the payload touches
     *
     * Documents yield their leaf paths; JSON patch yields each operation's
     * target (and source for move/copy), converted from JSON pointers.
     */
    std::vector<std::string> paths() const;

private:
    PatchKind kind_;
    std::string content_;
};

/**
 * @brief Reject payloads that can never be applied as intended
 *
 * - server-managed metadata (uid, resourceVersion, generation,
 *   creationTimestamp, managedFields) or status in the payload
 * - reserved ownership annotations in the payload
 * - container lists (spec[.template.spec].{containers,initContainers})
 *   with an element lacking "name"
 *
 * @throws ConfigurationError naming the offending field
 */
void validate_patch_content(const PatchSpec& spec,
                            const std::vector<std::string>& reserved_annotations);

/**
 * @brief Convert an RFC 6901 pointer ("/a/b~1c/0") to a canonical path
 *        ("a.b/c[0]"); "-" (append) becomes the array path itself
 */
std::string pointer_to_path(const std::string& pointer);

} // namespace fieldpatch

#endif // FIELDPATCH_PATCHSPEC_HPP
