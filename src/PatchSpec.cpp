/**
 * @file PatchSpec.cpp
 * @brief Patch payload decoding, fingerprinting and validation
 */

#include "fieldpatch/PatchSpec.hpp"
#include "fieldpatch/Errors.hpp"
#include "fieldpatch/FieldPath.hpp"
#include "fieldpatch/Loader.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <set>

namespace fieldpatch {

// ============================================================================
// Kinds
// ============================================================================

PatchCapabilities capabilities(PatchKind kind) {
    switch (kind) {
        case PatchKind::Merge:
            return PatchCapabilities{true, true};
        case PatchKind::JsonPatch:
        case PatchKind::MergePatch:
            return PatchCapabilities{false, false};
    }
    return PatchCapabilities{false, false};
}

const char* patch_kind_name(PatchKind kind) {
    switch (kind) {
        case PatchKind::Merge: return "patch";
        case PatchKind::JsonPatch: return "json_patch";
        case PatchKind::MergePatch: return "merge_patch";
    }
    return "unknown";
}

PatchKind patch_kind_from_name(const std::string& name) {
    if (name == "patch") return PatchKind::Merge;
    if (name == "json_patch") return PatchKind::JsonPatch;
    if (name == "merge_patch") return PatchKind::MergePatch;
    throw ConfigurationError("Unknown patch kind: '" + name + "'");
}

namespace {

const std::set<std::string> kOps = {"add", "remove", "replace", "move", "copy", "test"};

const std::vector<std::string> kServerManagedMetadata = {
    "uid", "resourceVersion", "generation", "creationTimestamp", "managedFields"
};

bool only_whitespace(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

/**
 * @brief Structural checks on an RFC 6902 operation list
 */
void validate_operations(const Value& ops) {
    if (!ops.is_array()) {
        throw ConfigurationError("json_patch must be a JSON array of operations, got " +
                                 type_name(ops));
    }
    if (ops.empty()) {
        throw ConfigurationError("json_patch must contain at least one operation");
    }
    for (std::size_t i = 0; i < ops.size(); ++i) {
        const Value& op = ops[i];
        const std::string where = "json_patch operation " + std::to_string(i);
        if (!op.is_object()) {
            throw ConfigurationError(where + " is not an object");
        }
        auto kind = op.find("op");
        if (kind == op.end() || !kind->is_string()) {
            throw ConfigurationError(where + " is missing required 'op' field");
        }
        const std::string name = kind->get<std::string>();
        if (kOps.count(name) == 0) {
            throw ConfigurationError(where + " has invalid 'op' value '" + name +
                                     "' (expected add, remove, replace, move, copy or test)");
        }
        auto path = op.find("path");
        if (path == op.end() || !path->is_string()) {
            throw ConfigurationError(where + " is missing required 'path' field");
        }
        if ((name == "add" || name == "replace" || name == "test") && !op.contains("value")) {
            throw ConfigurationError(where + " ('" + name + "') requires a 'value' field");
        }
        if ((name == "move" || name == "copy") &&
            (!op.contains("from") || !op["from"].is_string())) {
            throw ConfigurationError(where + " ('" + name + "') requires a 'from' field");
        }
    }
}

std::uint64_t fnv1a(const std::string& data) {
    std::uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

void check_containers(const Value& doc, const std::vector<const char*>& path,
                      const std::string& label) {
    const Value* node = &doc;
    for (const char* step : path) {
        if (!node->is_object()) return;
        auto it = node->find(step);
        if (it == node->end()) return;
        node = &*it;
    }
    if (!node->is_array()) return;
    for (std::size_t i = 0; i < node->size(); ++i) {
        const Value& c = (*node)[i];
        if (!c.is_object()) {
            throw ConfigurationError(label + " at index " + std::to_string(i) +
                                     " is not a valid object");
        }
        auto name = c.find("name");
        if (name == c.end() || !name->is_string() || name->get<std::string>().empty()) {
            throw ConfigurationError(label + " at index " + std::to_string(i) +
                                     " is missing required 'name' field; container lists "
                                     "merge by name");
        }
    }
}

bool pointer_is_server_managed(const std::string& pointer) {
    static const std::vector<std::string> kPrefixes = {
        "/metadata/uid", "/metadata/resourceVersion", "/metadata/generation",
        "/metadata/creationTimestamp", "/metadata/managedFields", "/status"
    };
    for (const auto& p : kPrefixes) {
        if (pointer == p || pointer.compare(0, p.size() + 1, p + "/") == 0) {
            return true;
        }
    }
    return false;
}

} // namespace

// ============================================================================
// PatchSpec
// ============================================================================

PatchSpec::PatchSpec(PatchKind kind, std::string content)
    : kind_(kind)
    , content_(std::move(content))
{
    if (only_whitespace(content_)) {
        throw ConfigurationError(std::string("no patch content provided for '") +
                                 patch_kind_name(kind_) + "'");
    }
}

PatchSpec PatchSpec::from_fields(const std::optional<std::string>& merge,
                                 const std::optional<std::string>& json_patch,
                                 const std::optional<std::string>& merge_patch) {
    auto is_set = [](const std::optional<std::string>& v) {
        return v.has_value() && !v->empty();
    };
    const int count = static_cast<int>(is_set(merge)) +
                      static_cast<int>(is_set(json_patch)) +
                      static_cast<int>(is_set(merge_patch));
    if (count != 1) {
        throw ConfigurationError(
            "Exactly one of 'patch', 'json_patch' or 'merge_patch' must be specified (got " +
            std::to_string(count) + ")");
    }
    if (is_set(merge)) return PatchSpec(PatchKind::Merge, *merge);
    if (is_set(json_patch)) return PatchSpec(PatchKind::JsonPatch, *json_patch);
    return PatchSpec(PatchKind::MergePatch, *merge_patch);
}

Value PatchSpec::decode() const {
    const std::string source = patch_kind_name(kind_);

    switch (kind_) {
        case PatchKind::Merge: {
            Value doc = Value::parse(content_, nullptr, false);
            if (doc.is_discarded()) {
                // Not JSON; TOML is the only other accepted authoring format
                doc = parse_toml_text(content_, source);
            }
            if (!doc.is_object()) {
                throw ParseError(source, "patch document must be an object, got " +
                                         type_name(doc));
            }
            return doc;
        }
        case PatchKind::JsonPatch: {
            Value ops = parse_json_text(content_, source);
            validate_operations(ops);
            return ops;
        }
        case PatchKind::MergePatch: {
            Value doc = parse_json_text(content_, source);
            if (!doc.is_object()) {
                throw ParseError(source, "merge patch must be a JSON object, got " +
                                         type_name(doc));
            }
            return doc;
        }
    }
    throw ConfigurationError("unknown patch kind");
}

std::string PatchSpec::fingerprint() const {
    const std::string canonical = std::string(patch_kind_name(kind_)) + "\n" + decode().dump();
    return fmt::format("{:016x}", fnv1a(canonical));
}

std::vector<std::string> PatchSpec::paths() const {
    const Value decoded = decode();
    if (kind_ != PatchKind::JsonPatch) {
        return document_paths(decoded);
    }

    std::vector<std::string> out;
    for (const auto& op : decoded) {
        if (op.contains("from")) {
            out.push_back(pointer_to_path(op["from"].get<std::string>()));
        }
        out.push_back(pointer_to_path(op["path"].get<std::string>()));
    }
    return out;
}

// ============================================================================
// Validation
// ============================================================================

void validate_patch_content(const PatchSpec& spec,
                            const std::vector<std::string>& reserved_annotations) {
    const Value decoded = spec.decode();

    if (spec.kind() == PatchKind::JsonPatch) {
        for (const auto& op : decoded) {
            const std::string pointer = op["path"].get<std::string>();
            if (pointer_is_server_managed(pointer)) {
                throw ConfigurationError("json_patch targets server-managed path '" +
                                         pointer + "'");
            }
            for (const auto& reserved : reserved_annotations) {
                if (pointer_to_path(pointer) ==
                    append_field("metadata.annotations", reserved)) {
                    throw ConfigurationError("json_patch modifies reserved annotation '" +
                                             reserved + "'");
                }
            }
        }
        return;
    }

    if (decoded.contains("status")) {
        throw ConfigurationError(
            "'status' is a read-only subresource and cannot be patched");
    }

    auto meta = decoded.find("metadata");
    if (meta != decoded.end() && meta->is_object()) {
        for (const auto& field : kServerManagedMetadata) {
            if (meta->contains(field)) {
                throw ConfigurationError("'metadata." + field +
                                         "' is managed by the store and cannot be patched");
            }
        }
        auto annotations = meta->find("annotations");
        if (annotations != meta->end() && annotations->is_object()) {
            for (const auto& reserved : reserved_annotations) {
                if (annotations->contains(reserved)) {
                    throw ConfigurationError("annotation '" + reserved +
                                             "' is reserved and cannot be patched");
                }
            }
        }
    }

    check_containers(decoded, {"spec", "containers"}, "container");
    check_containers(decoded, {"spec", "initContainers"}, "initContainer");
    check_containers(decoded, {"spec", "template", "spec", "containers"}, "template container");
    check_containers(decoded, {"spec", "template", "spec", "initContainers"},
                     "template initContainer");
}

std::string pointer_to_path(const std::string& pointer) {
    FieldPath path;
    std::size_t pos = 0;
    if (!pointer.empty() && pointer[0] == '/') pos = 1;

    while (pos <= pointer.size() && !pointer.empty()) {
        std::size_t next = pointer.find('/', pos);
        std::string token = pointer.substr(pos, next == std::string::npos
                                                     ? std::string::npos
                                                     : next - pos);
        std::string decoded;
        for (std::size_t i = 0; i < token.size(); ++i) {
            if (token[i] == '~' && i + 1 < token.size()) {
                decoded += token[i + 1] == '1' ? '/' : '~';
                ++i;
            } else {
                decoded += token[i];
            }
        }

        // Digit runs too long for an index can only be map keys
        const auto index = parse_index(decoded);
        if (decoded == "-" && !path.empty()) {
            // append: the array itself is affected
        } else if (index && !path.empty()) {
            path.push_back(PathSegment::at(*index));
        } else {
            path.push_back(PathSegment::field(decoded));
        }

        if (next == std::string::npos) break;
        pos = next + 1;
    }
    return join_field_path(path);
}

} // namespace fieldpatch
