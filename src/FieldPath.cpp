/**
 * @file FieldPath.cpp
 * @brief Implementation of canonical field path utilities
 */

#include "fieldpatch/FieldPath.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>
#include <sstream>

namespace fieldpatch {

// ============================================================================
// PathSegment
// ============================================================================

PathSegment PathSegment::field(std::string name) {
    PathSegment seg;
    seg.kind = SegmentKind::Field;
    seg.name = std::move(name);
    return seg;
}

PathSegment PathSegment::at(std::size_t index) {
    PathSegment seg;
    seg.kind = SegmentKind::Index;
    seg.index = index;
    return seg;
}

PathSegment PathSegment::keyed(std::vector<std::pair<std::string, std::string>> keys) {
    PathSegment seg;
    seg.kind = SegmentKind::Key;
    std::sort(keys.begin(), keys.end());
    seg.keys = std::move(keys);
    return seg;
}

PathSegment PathSegment::member(std::string rendered) {
    PathSegment seg;
    seg.kind = SegmentKind::Member;
    seg.name = std::move(rendered);
    return seg;
}

bool PathSegment::operator==(const PathSegment& other) const {
    if (kind != other.kind) return false;
    switch (kind) {
        case SegmentKind::Field:
        case SegmentKind::Member:
            return name == other.name;
        case SegmentKind::Index:
            return index == other.index;
        case SegmentKind::Key:
            return keys == other.keys;
    }
    return false;
}

// ============================================================================
// Rendering and escaping
// ============================================================================

std::string render_scalar(const Value& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

std::string escape_field(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (c == '.' || c == '[' || c == ']' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    return out;
}

Value unrender_scalar(const std::string& rendered) {
    Value parsed = Value::parse(rendered, nullptr, false);
    if (parsed.is_discarded() || parsed.is_string() || is_container(parsed)) {
        return Value(rendered);
    }
    return parsed;
}

std::optional<std::size_t> parse_index(const std::string& token) {
    if (token.empty() ||
        !std::all_of(token.begin(), token.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    try {
        const unsigned long long n = std::stoull(token);
        if (n > std::numeric_limits<std::size_t>::max()) return std::nullopt;
        return static_cast<std::size_t>(n);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

namespace {

std::string escape_selector(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '\\' || c == ']' || c == ',' || c == '=') {
            out += '\\';
        }
        out += c;
    }
    return out;
}

/**
 * @brief Parse the body of a selector starting after '['
 * @param pos In: index of first body char. Out: index after the closing ']'
 */
PathSegment parse_selector(const std::string& path, std::size_t& pos) {
    struct Part {
        std::string key;
        std::string value;
        bool has_value = false;
    };
    std::vector<Part> parts(1);
    bool closed = false;

    while (pos < path.size()) {
        char c = path[pos];
        if (c == '\\') {
            if (pos + 1 >= path.size()) {
                throw PathError(path, "dangling escape");
            }
            Part& p = parts.back();
            (p.has_value ? p.value : p.key) += path[pos + 1];
            pos += 2;
            continue;
        }
        if (c == ']') {
            closed = true;
            ++pos;
            break;
        }
        if (c == ',') {
            parts.emplace_back();
        } else if (c == '=' && !parts.back().has_value) {
            parts.back().has_value = true;
        } else {
            Part& p = parts.back();
            (p.has_value ? p.value : p.key) += c;
        }
        ++pos;
    }

    if (!closed) {
        throw PathError(path, "unterminated selector");
    }

    if (parts.size() == 1 && !parts[0].has_value) {
        const auto index = parse_index(parts[0].key);
        if (!index) {
            throw PathError(path, "selector '" + parts[0].key +
                                  "' is neither an index nor a key");
        }
        return PathSegment::at(*index);
    }

    if (parts.size() == 1 && parts[0].key.empty()) {
        return PathSegment::member(parts[0].value);
    }

    std::vector<std::pair<std::string, std::string>> keys;
    for (const auto& p : parts) {
        if (!p.has_value || p.key.empty()) {
            throw PathError(path, "malformed key selector");
        }
        keys.emplace_back(p.key, p.value);
    }
    return PathSegment::keyed(std::move(keys));
}

bool element_matches(const Value& element, const PathSegment& seg) {
    if (seg.kind == SegmentKind::Member) {
        return render_scalar(element) == seg.name;
    }
    if (!element.is_object()) return false;
    for (const auto& kv : seg.keys) {
        auto it = element.find(kv.first);
        if (it == element.end() || render_scalar(*it) != kv.second) {
            return false;
        }
    }
    return true;
}

} // namespace

std::string join_field_path(const FieldPath& path) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& seg : path) {
        switch (seg.kind) {
            case SegmentKind::Field:
                if (!first) oss << '.';
                oss << escape_field(seg.name);
                break;
            case SegmentKind::Index:
                oss << '[' << seg.index << ']';
                break;
            case SegmentKind::Key:
                oss << '[';
                for (std::size_t i = 0; i < seg.keys.size(); ++i) {
                    if (i > 0) oss << ',';
                    oss << escape_selector(seg.keys[i].first) << '='
                        << escape_selector(seg.keys[i].second);
                }
                oss << ']';
                break;
            case SegmentKind::Member:
                oss << "[=" << escape_selector(seg.name) << ']';
                break;
        }
        first = false;
    }
    return oss.str();
}

FieldPath split_field_path(const std::string& path) {
    FieldPath segments;
    if (path.empty()) {
        return segments;
    }

    std::string current;
    bool building = false;      // current holds a (possibly empty-so-far) field
    bool expect_field = true;   // a field name must start here
    bool after_selector = false;
    std::size_t pos = 0;

    auto flush = [&]() {
        if (current.empty()) {
            throw PathError(path, "empty field name");
        }
        segments.push_back(PathSegment::field(current));
        current.clear();
        building = false;
    };

    while (pos < path.size()) {
        char c = path[pos];
        if (c == '\\') {
            if (pos + 1 >= path.size()) {
                throw PathError(path, "dangling escape");
            }
            if (after_selector) {
                throw PathError(path, "expected '.' or '[' after selector");
            }
            current += path[pos + 1];
            building = true;
            expect_field = false;
            pos += 2;
            continue;
        }
        if (c == '.') {
            if (building) {
                flush();
            } else if (!after_selector) {
                throw PathError(path, "empty field name");
            }
            expect_field = true;
            after_selector = false;
            ++pos;
            continue;
        }
        if (c == '[') {
            if (building) {
                flush();
            } else if (expect_field && !segments.empty()) {
                throw PathError(path, "selector without a field");
            }
            ++pos;
            segments.push_back(parse_selector(path, pos));
            expect_field = false;
            after_selector = true;
            continue;
        }
        if (c == ']') {
            throw PathError(path, "unexpected ']'");
        }
        if (after_selector) {
            throw PathError(path, "expected '.' or '[' after selector");
        }
        current += c;
        building = true;
        expect_field = false;
        ++pos;
    }

    if (building) {
        flush();
    } else if (expect_field) {
        throw PathError(path, "trailing '.'");
    }
    return segments;
}

std::string append_field(const std::string& prefix, const std::string& name) {
    if (prefix.empty()) {
        return escape_field(name);
    }
    return prefix + "." + escape_field(name);
}

// ============================================================================
// Document traversal
// ============================================================================

namespace {

void collect_document_paths(const Value& node, const std::string& prefix,
                            std::vector<std::string>& out) {
    if (node.is_object()) {
        if (node.empty()) {
            if (!prefix.empty()) out.push_back(prefix);
            return;
        }
        for (auto it = node.begin(); it != node.end(); ++it) {
            collect_document_paths(it.value(), append_field(prefix, it.key()), out);
        }
        return;
    }

    if (node.is_array()) {
        bool has_compound = std::any_of(node.begin(), node.end(),
                                        [](const Value& v) { return is_container(v); });
        if (!has_compound) {
            if (!prefix.empty()) out.push_back(prefix);
            return;
        }
        for (std::size_t i = 0; i < node.size(); ++i) {
            collect_document_paths(node[i], prefix + "[" + std::to_string(i) + "]", out);
        }
        return;
    }

    if (!prefix.empty()) {
        out.push_back(prefix);
    }
}

// V is Value or const Value
template <typename V>
V* step(V& current, const PathSegment& seg) {
    switch (seg.kind) {
        case SegmentKind::Field: {
            if (!current.is_object()) return nullptr;
            auto it = current.find(seg.name);
            return it == current.end() ? nullptr : &*it;
        }
        case SegmentKind::Index:
            if (!current.is_array() || seg.index >= current.size()) return nullptr;
            return &current[seg.index];
        case SegmentKind::Key:
        case SegmentKind::Member:
            if (!current.is_array()) return nullptr;
            for (auto& element : current) {
                if (element_matches(element, seg)) return &element;
            }
            return nullptr;
    }
    return nullptr;
}

Value* step_create(Value& current, const PathSegment& seg, const std::string& full) {
    switch (seg.kind) {
        case SegmentKind::Field:
            if (current.is_null()) current = Value::object();
            if (!current.is_object()) {
                throw PathError(full, "cannot select field '" + seg.name +
                                      "' in " + type_name(current));
            }
            return &current[seg.name];
        case SegmentKind::Index:
            if (!current.is_array()) {
                throw PathError(full, "cannot index into " + type_name(current));
            }
            if (seg.index >= current.size()) {
                throw PathError(full, "index " + std::to_string(seg.index) +
                                      " out of range");
            }
            return &current[seg.index];
        case SegmentKind::Key:
        case SegmentKind::Member: {
            if (current.is_null()) current = Value::array();
            if (!current.is_array()) {
                throw PathError(full, "cannot select element in " + type_name(current));
            }
            for (auto& element : current) {
                if (element_matches(element, seg)) return &element;
            }
            if (seg.kind == SegmentKind::Member) {
                current.push_back(unrender_scalar(seg.name));
            } else {
                Value element = Value::object();
                for (const auto& kv : seg.keys) {
                    element[kv.first] = unrender_scalar(kv.second);
                }
                current.push_back(std::move(element));
            }
            return &current.back();
        }
    }
    throw PathError(full, "unknown segment kind");
}

} // namespace

std::vector<std::string> document_paths(const Value& document) {
    std::vector<std::string> out;
    collect_document_paths(document, "", out);
    return out;
}

namespace {

template <typename V>
V* walk(V& data, const FieldPath& path) {
    V* current = &data;
    for (const auto& seg : path) {
        current = step(*current, seg);
        if (current == nullptr) return nullptr;
    }
    return current;
}

} // namespace

const Value* find_by_path(const Value& data, const FieldPath& path) {
    return walk(data, path);
}

Value* find_by_path(Value& data, const FieldPath& path) {
    return walk(data, path);
}

const Value* find_by_path(const Value& data, const std::string& path) {
    return find_by_path(data, split_field_path(path));
}

bool contains_path(const Value& data, const std::string& path) {
    return find_by_path(data, path) != nullptr;
}

void set_by_path(Value& data, const FieldPath& path, Value value) {
    if (path.empty()) {
        data = std::move(value);
        return;
    }
    const std::string full = join_field_path(path);
    Value* current = &data;
    for (const auto& seg : path) {
        current = step_create(*current, seg, full);
    }
    *current = std::move(value);
}

bool path_has_prefix(const std::string& path, const std::string& prefix) {
    if (prefix.empty()) return true;
    if (path.size() < prefix.size()) return false;
    if (path.compare(0, prefix.size(), prefix) != 0) return false;
    if (path.size() == prefix.size()) return true;
    char next = path[prefix.size()];
    return next == '.' || next == '[';
}

} // namespace fieldpatch
