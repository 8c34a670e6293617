/**
 * @file Object.cpp
 * @brief Object identity and managedFields accessors
 */

#include "fieldpatch/Object.hpp"
#include "fieldpatch/Errors.hpp"

namespace fieldpatch {

namespace {

std::string string_at(const Value& obj, const char* key) {
    if (!obj.is_object()) return "";
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

const Value* metadata_of(const Value& doc) {
    if (!doc.is_object()) return nullptr;
    auto it = doc.find("metadata");
    if (it == doc.end() || !it->is_object()) return nullptr;
    return &*it;
}

} // namespace

// ============================================================================
// TargetRef
// ============================================================================

std::string TargetRef::describe() const {
    if (namespace_.empty()) {
        return kind + "/" + name;
    }
    return kind + " " + namespace_ + "/" + name;
}

bool TargetRef::operator==(const TargetRef& other) const {
    return api_version == other.api_version && kind == other.kind &&
           name == other.name && namespace_ == other.namespace_;
}

Value target_to_value(const TargetRef& ref) {
    Value out = {
        {"apiVersion", ref.api_version},
        {"kind", ref.kind},
        {"name", ref.name}
    };
    if (!ref.namespace_.empty()) {
        out["namespace"] = ref.namespace_;
    }
    return out;
}

TargetRef target_from_value(const Value& value) {
    if (!value.is_object()) {
        throw ConfigurationError("target must be an object, got " + type_name(value));
    }
    TargetRef ref;
    ref.api_version = string_at(value, "apiVersion");
    ref.kind = string_at(value, "kind");
    ref.name = string_at(value, "name");
    ref.namespace_ = string_at(value, "namespace");
    if (ref.api_version.empty() || ref.kind.empty() || ref.name.empty()) {
        throw ConfigurationError("target requires apiVersion, kind and name");
    }
    return ref;
}

// ============================================================================
// Object
// ============================================================================

std::string Object::api_version() const { return string_at(doc_, "apiVersion"); }
std::string Object::kind() const { return string_at(doc_, "kind"); }

std::string Object::name() const {
    const Value* meta = metadata_of(doc_);
    return meta ? string_at(*meta, "name") : "";
}

std::string Object::namespace_() const {
    const Value* meta = metadata_of(doc_);
    return meta ? string_at(*meta, "namespace") : "";
}

TargetRef Object::ref() const {
    return TargetRef{api_version(), kind(), name(), namespace_()};
}

std::vector<std::pair<std::string, std::string>> Object::annotations() const {
    std::vector<std::pair<std::string, std::string>> out;
    const Value* meta = metadata_of(doc_);
    if (!meta) return out;
    auto it = meta->find("annotations");
    if (it == meta->end() || !it->is_object()) return out;
    for (auto a = it->begin(); a != it->end(); ++a) {
        if (a->is_string()) {
            out.emplace_back(a.key(), a->get<std::string>());
        }
    }
    return out;
}

std::optional<std::string> Object::annotation(const std::string& key) const {
    for (const auto& kv : annotations()) {
        if (kv.first == key) return kv.second;
    }
    return std::nullopt;
}

std::vector<ManagedFieldsEntry> Object::managed_fields() const {
    std::vector<ManagedFieldsEntry> out;
    const Value* meta = metadata_of(doc_);
    if (!meta) return out;
    auto it = meta->find("managedFields");
    if (it == meta->end() || !it->is_array()) return out;

    for (const auto& raw : *it) {
        if (!raw.is_object()) continue;
        ManagedFieldsEntry entry;
        entry.manager = string_at(raw, "manager");
        entry.operation = string_at(raw, "operation");
        entry.api_version = string_at(raw, "apiVersion");
        auto fields = raw.find("fieldsV1");
        entry.fields = fields != raw.end() ? *fields : Value();
        if (entry.manager.empty()) continue;
        out.push_back(std::move(entry));
    }
    return out;
}

void Object::set_managed_fields(const std::vector<ManagedFieldsEntry>& entries) {
    Value list = Value::array();
    for (const auto& entry : entries) {
        Value raw = {
            {"manager", entry.manager},
            {"operation", entry.operation},
            {"apiVersion", entry.api_version},
            {"fieldsType", "FieldsV1"}
        };
        if (!entry.fields.is_null()) {
            raw["fieldsV1"] = entry.fields;
        }
        list.push_back(std::move(raw));
    }
    if (!doc_.is_object()) doc_ = Value::object();
    Value& meta = doc_["metadata"];
    if (!meta.is_object()) meta = Value::object();
    if (list.empty()) {
        meta.erase("managedFields");
    } else {
        meta["managedFields"] = std::move(list);
    }
}

} // namespace fieldpatch
