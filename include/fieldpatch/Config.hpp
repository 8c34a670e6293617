/**
 * @file Config.hpp
 * @brief Engine configuration with layered loading
 *
 * Precedence, lowest first: built-in defaults → file (.json/.toml) →
 * environment (FIELDPATCH_ prefix) → explicit overrides. The merged tree is
 * then checked for mandatory keys and converted to a typed EngineConfig.
 */

#ifndef FIELDPATCH_CONFIG_HPP
#define FIELDPATCH_CONFIG_HPP

#include "fieldpatch/Log.hpp"
#include "fieldpatch/Ownership.hpp"
#include "fieldpatch/Value.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fieldpatch {

/**
 * @brief Sources for EngineConfig::load
 */
struct ConfigOptions {
    std::optional<std::string> file_path;
    std::optional<std::string> env_prefix = std::string("FIELDPATCH");   ///< nullopt disables env
    std::map<std::string, Value> overrides;                               ///< Dot keys, final precedence
    std::vector<std::string> mandatory;
};

struct EngineConfig {
    std::string binding_prefix;
    std::string placeholder_suffix;
    std::string lifecycle_manager;
    std::vector<std::string> reserved_annotations;
    OwnershipFilter filter;
    std::size_t conflict_display_limit = 5;
    std::chrono::milliseconds store_timeout{30000};
    LogLevel log_level = LogLevel::info;

    /**
     * @brief Default configuration tree (also the set of known keys)
     */
    static Value defaults_tree();

    static EngineConfig defaults();

    /**
     * @brief Load with the layered precedence
     *
     * @throws FileNotFoundError, ParseError if the file cannot be read
     * @throws MissingMandatoryConfig if mandatory keys are absent
     * @throws ConfigurationError if a value has the wrong type
     */
    static EngineConfig load(const ConfigOptions& options);

    /**
     * @brief Typed view of a merged tree; absent keys keep their defaults
     * @throws ConfigurationError if a value has the wrong type
     */
    static EngineConfig from_value(const Value& tree);

    Value to_value() const;

    /**
     * @brief Manager identity of a binding under this configuration
     */
    ManagerIdentity identity(const std::optional<std::string>& binding_id = std::nullopt) const;
};

/**
 * @brief Merge defaults, file, environment and overrides into one tree
 */
Value load_config_tree(const ConfigOptions& options);

/**
 * @brief Dot keys of every leaf in a tree ("log.level", ...)
 */
std::vector<std::string> config_leaf_keys(const Value& tree);

/**
 * @brief Map an environment name suffix to a known dot key
 *
 * Lowercased; '.' and '_' compare equal, so "OWNERSHIP_VOLATILE_ROOTS"
 * matches "ownership.volatile_roots".
 *
 * @return The key, or std::nullopt when nothing matches
 */
std::optional<std::string> env_name_to_key(const std::string& suffix,
                                           const std::vector<std::string>& known_keys);

/**
 * @brief Collect typed overrides from `<prefix>_*` environment variables
 *
 * Unknown names are ignored (logged at debug level).
 */
std::map<std::string, Value> collect_env_overrides(const std::string& prefix,
                                                   const std::vector<std::string>& known_keys);

} // namespace fieldpatch

#endif // FIELDPATCH_CONFIG_HPP
