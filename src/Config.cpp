/**
 * @file Config.cpp
 * @brief Layered engine configuration
 */

#include "fieldpatch/Config.hpp"
#include "fieldpatch/Errors.hpp"
#include "fieldpatch/FieldPath.hpp"
#include "fieldpatch/Loader.hpp"
#include "fieldpatch/Merge.hpp"
#include "fieldpatch/Parse.hpp"

#include <algorithm>
#include <cctype>

#ifdef _WIN32
    #include <windows.h>
#else
    extern char** environ;
#endif

namespace fieldpatch {

namespace {

const char* const kTag = "config";

std::string normalize_key(const std::string& key) {
    std::string out = key;
    for (auto& ch : out) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        if (ch == '.') ch = '_';
    }
    return out;
}

std::vector<std::pair<std::string, std::string>> get_all_env_vars() {
    std::vector<std::pair<std::string, std::string>> result;

#ifdef _WIN32
    LPCH env_block = GetEnvironmentStrings();
    if (env_block == nullptr) return result;

    LPCH current = env_block;
    while (*current != '\0') {
        std::string entry(current);
        size_t eq_pos = entry.find('=');
        if (eq_pos != std::string::npos && eq_pos > 0) {
            result.emplace_back(entry.substr(0, eq_pos), entry.substr(eq_pos + 1));
        }
        current += entry.length() + 1;
    }
    FreeEnvironmentStrings(env_block);
#else
    if (environ == nullptr) return result;

    for (char** env = environ; *env != nullptr; ++env) {
        std::string entry(*env);
        size_t eq_pos = entry.find('=');
        if (eq_pos != std::string::npos) {
            result.emplace_back(entry.substr(0, eq_pos), entry.substr(eq_pos + 1));
        }
    }
#endif

    return result;
}

void collect_leaf_keys(const Value& node, const std::string& prefix,
                       std::vector<std::string>& out) {
    if (node.is_object() && !node.empty()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            collect_leaf_keys(it.value(), prefix.empty() ? it.key() : prefix + "." + it.key(), out);
        }
        return;
    }
    if (!prefix.empty()) out.push_back(prefix);
}

/**
 * @brief Set a dot key ("ownership.volatile_roots") in a config tree
 */
void set_dot_key(Value& tree, const std::string& key, const Value& value) {
    FieldPath path;
    std::string::size_type start = 0;
    while (true) {
        const auto dot = key.find('.', start);
        const std::string part = key.substr(start, dot == std::string::npos ? std::string::npos
                                                                            : dot - start);
        if (part.empty()) {
            throw ConfigurationError("Invalid configuration key '" + key + "'");
        }
        path.push_back(PathSegment::field(part));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    set_by_path(tree, path, value);
}

const Value* get_dot_key(const Value& tree, const std::string& key) {
    const Value* node = &tree;
    std::string::size_type start = 0;
    while (true) {
        const auto dot = key.find('.', start);
        const std::string part = key.substr(start, dot == std::string::npos ? std::string::npos
                                                                            : dot - start);
        if (!node->is_object()) return nullptr;
        auto it = node->find(part);
        if (it == node->end()) return nullptr;
        node = &*it;
        if (dot == std::string::npos) return node;
        start = dot + 1;
    }
}

std::string read_string(const Value& tree, const std::string& key, const std::string& fallback) {
    const Value* v = get_dot_key(tree, key);
    if (v == nullptr || v->is_null()) return fallback;
    if (!v->is_string()) {
        throw ConfigurationError("Configuration key '" + key + "' must be a string, got " +
                                 type_name(*v));
    }
    return v->get<std::string>();
}

/**
 * @brief String list; a comma-separated string is accepted as well
 */
std::vector<std::string> read_list(const Value& tree, const std::string& key,
                                   const std::vector<std::string>& fallback) {
    const Value* v = get_dot_key(tree, key);
    if (v == nullptr || v->is_null()) return fallback;

    std::vector<std::string> out;
    if (v->is_string()) {
        const std::string& s = v->get_ref<const std::string&>();
        std::string::size_type start = 0;
        while (start <= s.size()) {
            const auto comma = s.find(',', start);
            std::string item = s.substr(start, comma == std::string::npos ? std::string::npos
                                                                         : comma - start);
            item.erase(0, item.find_first_not_of(' '));
            item.erase(item.find_last_not_of(' ') + 1);
            if (!item.empty()) out.push_back(item);
            if (comma == std::string::npos) break;
            start = comma + 1;
        }
        return out;
    }
    if (!v->is_array()) {
        throw ConfigurationError("Configuration key '" + key + "' must be a list of strings, got " +
                                 type_name(*v));
    }
    for (const auto& item : *v) {
        if (!item.is_string()) {
            throw ConfigurationError("Configuration key '" + key +
                                     "' must contain only strings");
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

long long read_integer(const Value& tree, const std::string& key, long long fallback) {
    const Value* v = get_dot_key(tree, key);
    if (v == nullptr || v->is_null()) return fallback;
    if (!v->is_number_integer()) {
        throw ConfigurationError("Configuration key '" + key + "' must be an integer, got " +
                                 type_name(*v));
    }
    const long long n = v->get<long long>();
    if (n < 0) {
        throw ConfigurationError("Configuration key '" + key + "' must not be negative");
    }
    return n;
}

Value list_value(const std::vector<std::string>& items) {
    Value out = Value::array();
    for (const auto& item : items) out.push_back(item);
    return out;
}

} // namespace

// ============================================================================
// Defaults
// ============================================================================

Value EngineConfig::defaults_tree() {
    const OwnershipFilter filter = OwnershipFilter::defaults();
    return Value{
        {"managers", {
            {"binding_prefix", "fieldpatch-patch-"},
            {"placeholder_suffix", "temp"},
            {"lifecycle", "fieldpatch"}
        }},
        {"ownership", {
            {"reserved_annotations", list_value({"fieldpatch.io/lifecycle-id",
                                                 "fieldpatch.io/owned-by"})},
            {"volatile_roots", list_value(filter.volatile_roots)},
            {"volatile_metadata", list_value(filter.volatile_metadata)},
            {"system_annotations", list_value(filter.system_annotations)}
        }},
        {"diagnostics", {
            {"conflict_display_limit", 5}
        }},
        {"store", {
            {"timeout_ms", 30000}
        }},
        {"log", {
            {"level", "info"}
        }}
    };
}

EngineConfig EngineConfig::defaults() {
    return from_value(defaults_tree());
}

// ============================================================================
// Typed conversion
// ============================================================================

EngineConfig EngineConfig::from_value(const Value& tree) {
    const Value base = defaults_tree();
    const Value merged = deep_merge(base, tree.is_object() ? tree : Value::object());

    EngineConfig cfg;
    cfg.binding_prefix = read_string(merged, "managers.binding_prefix", "");
    cfg.placeholder_suffix = read_string(merged, "managers.placeholder_suffix", "");
    cfg.lifecycle_manager = read_string(merged, "managers.lifecycle", "");
    cfg.reserved_annotations = read_list(merged, "ownership.reserved_annotations", {});
    cfg.filter.volatile_roots = read_list(merged, "ownership.volatile_roots", {});
    cfg.filter.volatile_metadata = read_list(merged, "ownership.volatile_metadata", {});
    cfg.filter.system_annotations = read_list(merged, "ownership.system_annotations", {});
    cfg.conflict_display_limit = static_cast<std::size_t>(
        read_integer(merged, "diagnostics.conflict_display_limit", 5));
    cfg.store_timeout = std::chrono::milliseconds(read_integer(merged, "store.timeout_ms", 30000));
    cfg.log_level = parse_log_level(read_string(merged, "log.level", "info"));

    if (cfg.binding_prefix.empty()) {
        throw ConfigurationError("managers.binding_prefix must not be empty");
    }
    if (cfg.placeholder_suffix.empty()) {
        throw ConfigurationError("managers.placeholder_suffix must not be empty");
    }
    return cfg;
}

Value EngineConfig::to_value() const {
    return Value{
        {"managers", {
            {"binding_prefix", binding_prefix},
            {"placeholder_suffix", placeholder_suffix},
            {"lifecycle", lifecycle_manager}
        }},
        {"ownership", {
            {"reserved_annotations", list_value(reserved_annotations)},
            {"volatile_roots", list_value(filter.volatile_roots)},
            {"volatile_metadata", list_value(filter.volatile_metadata)},
            {"system_annotations", list_value(filter.system_annotations)}
        }},
        {"diagnostics", {
            {"conflict_display_limit", conflict_display_limit}
        }},
        {"store", {
            {"timeout_ms", store_timeout.count()}
        }},
        {"log", {
            {"level", log_level_name(log_level)}
        }}
    };
}

ManagerIdentity EngineConfig::identity(const std::optional<std::string>& binding_id) const {
    return ManagerIdentity(binding_prefix, placeholder_suffix, binding_id);
}

// ============================================================================
// Layered loading
// ============================================================================

std::vector<std::string> config_leaf_keys(const Value& tree) {
    std::vector<std::string> out;
    collect_leaf_keys(tree, "", out);
    return out;
}

std::optional<std::string> env_name_to_key(const std::string& suffix,
                                           const std::vector<std::string>& known_keys) {
    const std::string wanted = normalize_key(suffix);
    if (wanted.empty()) return std::nullopt;
    for (const auto& key : known_keys) {
        if (normalize_key(key) == wanted) return key;
    }
    return std::nullopt;
}

std::map<std::string, Value> collect_env_overrides(const std::string& prefix,
                                                   const std::vector<std::string>& known_keys) {
    std::string normalized = prefix;
    while (!normalized.empty() && normalized.back() == '_') normalized.pop_back();
    normalized += "_";

    std::map<std::string, Value> out;
    for (const auto& [name, value] : get_all_env_vars()) {
        if (name.size() <= normalized.size() || name.compare(0, normalized.size(), normalized) != 0) {
            continue;
        }
        const auto key = env_name_to_key(name.substr(normalized.size()), known_keys);
        if (!key) {
            FIELDPATCH_LOG_DEBUG(kTag, "ignoring unknown environment variable {}", name);
            continue;
        }
        out[*key] = parse_value(value);
    }
    return out;
}

Value load_config_tree(const ConfigOptions& options) {
    const Value defaults = EngineConfig::defaults_tree();
    Value merged = defaults;

    if (options.file_path && !options.file_path->empty()) {
        const Value file = load_document_file(*options.file_path);
        if (!file.is_object()) {
            throw ParseError(*options.file_path, "configuration root must be an object");
        }
        merged = deep_merge(merged, file);
    }

    if (options.env_prefix && !options.env_prefix->empty()) {
        for (const auto& [key, value] : collect_env_overrides(*options.env_prefix,
                                                              config_leaf_keys(defaults))) {
            set_dot_key(merged, key, value);
        }
    }

    for (const auto& [key, value] : options.overrides) {
        set_dot_key(merged, key, value);
    }

    std::vector<std::string> missing;
    for (const auto& key : options.mandatory) {
        const Value* v = get_dot_key(merged, key);
        if (v == nullptr || v->is_null()) missing.push_back(key);
    }
    if (!missing.empty()) {
        throw MissingMandatoryConfig(missing);
    }
    return merged;
}

EngineConfig EngineConfig::load(const ConfigOptions& options) {
    return from_value(load_config_tree(options));
}

} // namespace fieldpatch
