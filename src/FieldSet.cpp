/**
 * @file FieldSet.cpp
 * @brief Ownership tree parsing and path extraction
 */

#include "fieldpatch/FieldSet.hpp"
#include "fieldpatch/Errors.hpp"

#include <algorithm>
#include <cctype>

namespace fieldpatch {

namespace {

const char* const kSource = "managedFields";

std::string extend(const std::string& prefix, const PathSegment& seg) {
    if (seg.kind == SegmentKind::Field) {
        return append_field(prefix, seg.name);
    }
    return prefix + join_field_path(FieldPath{seg});
}

/**
 * @brief Decode one tagged key into a path segment
 */
PathSegment parse_token(const std::string& token, const std::string& where) {
    if (token.size() < 2 || token[1] != ':') {
        throw ParseError(kSource, "unrecognized key '" + token + "' at " +
                                  (where.empty() ? "<root>" : where));
    }
    const char tag = token[0];
    const std::string body = token.substr(2);

    switch (tag) {
        case 'f':
            if (body.empty()) {
                throw ParseError(kSource, "empty field name at " +
                                          (where.empty() ? "<root>" : where));
            }
            return PathSegment::field(body);

        case 'k': {
            Value key = Value::parse(body, nullptr, false);
            if (key.is_discarded() || !key.is_object() || key.empty()) {
                throw ParseError(kSource, "invalid key selector '" + token + "'");
            }
            std::vector<std::pair<std::string, std::string>> keys;
            for (auto it = key.begin(); it != key.end(); ++it) {
                keys.emplace_back(it.key(), render_scalar(it.value()));
            }
            return PathSegment::keyed(std::move(keys));
        }

        case 'v': {
            Value member = Value::parse(body, nullptr, false);
            if (member.is_discarded()) {
                throw ParseError(kSource, "invalid set element '" + token + "'");
            }
            return PathSegment::member(render_scalar(member));
        }

        case 'i': {
            const auto index = parse_index(body);
            if (!index) {
                throw ParseError(kSource, "invalid index '" + token + "'");
            }
            return PathSegment::at(*index);
        }

        default:
            throw ParseError(kSource, "unrecognized key '" + token + "' at " +
                                      (where.empty() ? "<root>" : where));
    }
}

/**
 * @brief Wire key for a segment built from a canonical path
 */
std::string token_for(const PathSegment& seg) {
    switch (seg.kind) {
        case SegmentKind::Field:
            return "f:" + seg.name;
        case SegmentKind::Index:
            return "i:" + std::to_string(seg.index);
        case SegmentKind::Key: {
            Value key = Value::object();
            for (const auto& kv : seg.keys) {
                key[kv.first] = unrender_scalar(kv.second);
            }
            return "k:" + key.dump();
        }
        case SegmentKind::Member:
            return "v:" + unrender_scalar(seg.name).dump();
    }
    return "";
}

FieldNode parse_node(const Value& fields, const std::string& where) {
    if (!fields.is_object()) {
        throw ParseError(kSource, "expected object at " +
                                  (where.empty() ? std::string("<root>") : where) +
                                  ", got " + type_name(fields));
    }

    FieldNode node;
    for (auto it = fields.begin(); it != fields.end(); ++it) {
        if (it.key() == ".") {
            node.self_owned = true;
            continue;
        }
        FieldEntry entry;
        entry.segment = parse_token(it.key(), where);
        entry.token = it.key();
        entry.node = parse_node(it.value(), extend(where, entry.segment));
        node.children.push_back(std::move(entry));
    }
    return node;
}

Value node_to_value(const FieldNode& node) {
    Value out = Value::object();
    if (node.self_owned) {
        out["."] = Value::object();
    }
    for (const auto& child : node.children) {
        out[child.token] = node_to_value(child.node);
    }
    return out;
}

void collect(const FieldNode& node, const std::string& prefix,
             bool leaves_only, std::vector<std::string>& out) {
    for (const auto& child : node.children) {
        const std::string path = extend(prefix, child.segment);
        if (child.node.children.empty()) {
            out.push_back(path);
            continue;
        }
        if (child.node.self_owned && !leaves_only) {
            out.push_back(path);
        }
        collect(child.node, path, leaves_only, out);
    }
}

} // namespace

// ============================================================================
// FieldNode
// ============================================================================

FieldNode::Kind FieldNode::kind() const {
    if (children.empty()) return Kind::Leaf;
    if (children.front().segment.kind == SegmentKind::Field) return Kind::Object;
    return Kind::Array;
}

FieldNode* FieldNode::find(const PathSegment& segment) {
    for (auto& child : children) {
        if (child.segment == segment) return &child.node;
    }
    return nullptr;
}

const FieldNode* FieldNode::find(const PathSegment& segment) const {
    for (const auto& child : children) {
        if (child.segment == segment) return &child.node;
    }
    return nullptr;
}

// ============================================================================
// FieldSet
// ============================================================================

FieldSet FieldSet::parse(const Value& fields) {
    FieldSet set;
    if (fields.is_null()) {
        return set;
    }
    set.root_ = parse_node(fields, "");
    return set;
}

FieldSet FieldSet::from_paths(const std::vector<std::string>& paths) {
    FieldSet set;
    for (const auto& path : paths) {
        set.insert(split_field_path(path));
    }
    return set;
}

void FieldSet::insert(const FieldPath& path) {
    FieldNode* current = &root_;
    for (const auto& seg : path) {
        FieldNode* next = current->find(seg);
        if (next == nullptr) {
            FieldEntry entry;
            entry.segment = seg;
            entry.token = token_for(seg);
            current->children.push_back(std::move(entry));
            next = &current->children.back().node;
        }
        current = next;
    }
    if (!path.empty() && path.back().kind != SegmentKind::Field) {
        current->self_owned = true;
    }
}

Value FieldSet::to_value() const {
    return node_to_value(root_);
}

std::vector<std::string> FieldSet::paths() const {
    std::vector<std::string> out;
    collect(root_, "", false, out);
    return out;
}

std::vector<std::string> FieldSet::leaf_paths() const {
    std::vector<std::string> out;
    collect(root_, "", true, out);
    return out;
}

bool FieldSet::contains(const std::string& path) const {
    const FieldNode* current = &root_;
    for (const auto& seg : split_field_path(path)) {
        current = current->find(seg);
        if (current == nullptr) return false;
    }
    return current != &root_ && (current->children.empty() || current->self_owned);
}

} // namespace fieldpatch
