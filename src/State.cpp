/**
 * @file State.cpp
 * @brief Binding state serialization
 */

#include "fieldpatch/State.hpp"
#include "fieldpatch/Errors.hpp"
#include "fieldpatch/Loader.hpp"
#include "fieldpatch/Log.hpp"

namespace fieldpatch {

namespace {

const char* const kSource = "binding state";

std::string require_string(const Value& v, const char* key) {
    auto it = v.find(key);
    if (it == v.end() || !it->is_string()) {
        throw ParseError(kSource, std::string("missing or non-string '") + key + "'");
    }
    return it->get<std::string>();
}

std::map<std::string, std::string> string_map(const Value& v, const char* key) {
    std::map<std::string, std::string> out;
    auto it = v.find(key);
    if (it == v.end() || it->is_null()) return out;
    if (!it->is_object()) {
        throw ParseError(kSource, std::string("'") + key + "' must be an object");
    }
    for (auto e = it->begin(); e != it->end(); ++e) {
        if (!e->is_string()) {
            throw ParseError(kSource, std::string("'") + key + "." + e.key() +
                                      "' must be a string");
        }
        out[e.key()] = e->get<std::string>();
    }
    return out;
}

Value map_value(const std::map<std::string, std::string>& m) {
    Value out = Value::object();
    for (const auto& kv : m) out[kv.first] = kv.second;
    return out;
}

/**
 * @brief Rename version 0 keys in place
 */
void upgrade_v0(Value& v) {
    FIELDPATCH_LOG_INFO("state", "upgrading binding state from schema version 0");
    if (v.contains("field_ownership")) {
        v["ownership"] = v["field_ownership"];
        v.erase("field_ownership");
    }
    if (v.contains("managed_state_projection")) {
        v["projection"] = v["managed_state_projection"];
        v.erase("managed_state_projection");
    }
    if (!v.contains("projection_status")) {
        v["projection_status"] = v.contains("projection") && v["projection"].is_object()
                                     ? "known" : "unknown";
    }
}

} // namespace

Value BindingState::to_value() const {
    return Value{
        {"schema_version", kSchemaVersion},
        {"binding_id", binding_id},
        {"manager", manager},
        {"target", target_to_value(target)},
        {"patch_kind", patch_kind_name(patch_kind)},
        {"patch_fingerprint", patch_fingerprint},
        {"projection_status", projection_status_name(projection_status)},
        {"projection", map_value(projection)},
        {"ownership", map_value(ownership)},
        {"previous_owners", map_value(previous_owners)}
    };
}

BindingState BindingState::from_value(const Value& value) {
    if (!value.is_object()) {
        throw ParseError(kSource, "root must be an object");
    }

    Value v = value;
    const Value version = v.value("schema_version", Value(0));
    if (!version.is_number_integer()) {
        throw ParseError(kSource, "schema_version must be an integer");
    }
    const int schema = version.get<int>();
    if (schema > kSchemaVersion) {
        throw ParseError(kSource, "schema_version " + std::to_string(schema) +
                                  " is newer than supported version " +
                                  std::to_string(kSchemaVersion));
    }
    if (schema == 0) {
        upgrade_v0(v);
    }

    BindingState state;
    state.binding_id = require_string(v, "binding_id");
    state.manager = require_string(v, "manager");
    if (!v.contains("target")) {
        throw ParseError(kSource, "missing 'target'");
    }
    try {
        state.target = target_from_value(v["target"]);
        state.patch_kind = patch_kind_from_name(require_string(v, "patch_kind"));
        state.projection_status = projection_status_from_name(
            require_string(v, "projection_status"));
    } catch (const ParseError&) {
        throw;
    } catch (const ConfigurationError& e) {
        throw ParseError(kSource, e.what());
    }
    state.patch_fingerprint = v.value("patch_fingerprint", "");
    state.projection = string_map(v, "projection");
    state.ownership = string_map(v, "ownership");
    state.previous_owners = string_map(v, "previous_owners");
    return state;
}

BindingState load_state_file(const std::string& path) {
    return BindingState::from_value(load_json_file(path));
}

void save_state_file(const std::string& path, const BindingState& state) {
    save_json_file(path, state.to_value());
}

} // namespace fieldpatch
