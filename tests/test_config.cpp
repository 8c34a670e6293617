#include <catch2/catch_all.hpp>
#include <fieldpatch/Config.hpp>
#include <fieldpatch/Errors.hpp>
#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace fieldpatch;
using nlohmann::json;

namespace {

void set_env(const char* name, const char* value) {
#ifdef _WIN32
    _putenv_s(name, value);
#else
    setenv(name, value, 1);
#endif
}

void unset_env(const char* name) {
#ifdef _WIN32
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
}

ConfigOptions no_env() {
    ConfigOptions opts;
    opts.env_prefix = std::nullopt;
    return opts;
}

} // namespace

TEST_CASE("defaults") {
    EngineConfig cfg = EngineConfig::defaults();
    REQUIRE(cfg.binding_prefix == "fieldpatch-patch-");
    REQUIRE(cfg.placeholder_suffix == "temp");
    REQUIRE(cfg.lifecycle_manager == "fieldpatch");
    REQUIRE(cfg.reserved_annotations.size() == 2);
    REQUIRE(cfg.conflict_display_limit == 5);
    REQUIRE(cfg.store_timeout.count() == 30000);
    REQUIRE(cfg.log_level == LogLevel::info);
    REQUIRE(cfg.identity().name() == "fieldpatch-patch-temp");
    REQUIRE(cfg.identity(std::string("b1")).name() == "fieldpatch-patch-b1");
}

TEST_CASE("load JSON") {
    std::string path = "tmp_fieldpatch_cfg.json";
    json j = {{"managers", {{"lifecycle", "stackctl"}}},
              {"diagnostics", {{"conflict_display_limit", 3}}}};
    std::ofstream(path) << j.dump(2);
    ConfigOptions opts = no_env();
    opts.file_path = path;
    EngineConfig cfg = EngineConfig::load(opts);
    REQUIRE(cfg.lifecycle_manager == "stackctl");
    REQUIRE(cfg.conflict_display_limit == 3);
    REQUIRE(cfg.binding_prefix == "fieldpatch-patch-");
    std::remove(path.c_str());
}

TEST_CASE("load TOML") {
    std::string path = "tmp_fieldpatch_cfg.toml";
    std::ofstream(path) << "[store]\ntimeout_ms = 500\n\n[ownership]\n"
                           "volatile_roots = [\"status\", \"spec.nodeName\"]\n";
    ConfigOptions opts = no_env();
    opts.file_path = path;
    EngineConfig cfg = EngineConfig::load(opts);
    REQUIRE(cfg.store_timeout.count() == 500);
    REQUIRE(cfg.filter.volatile_roots.size() == 2);
    REQUIRE(cfg.filter.excluded("spec.nodeName"));
    std::remove(path.c_str());
}

TEST_CASE("missing file") {
    ConfigOptions opts = no_env();
    opts.file_path = "does_not_exist_fieldpatch.toml";
    REQUIRE_THROWS_AS(EngineConfig::load(opts), FileNotFoundError);
}

TEST_CASE("env override") {
    set_env("FIELDPATCH_LOG_LEVEL", "debug");
    set_env("FIELDPATCH_STORE_TIMEOUT_MS", "1500");
    set_env("FIELDPATCH_NOT_A_KEY", "x");
    ConfigOptions opts;
    EngineConfig cfg = EngineConfig::load(opts);
    REQUIRE(cfg.log_level == LogLevel::debug);
    REQUIRE(cfg.store_timeout.count() == 1500);
    unset_env("FIELDPATCH_LOG_LEVEL");
    unset_env("FIELDPATCH_STORE_TIMEOUT_MS");
    unset_env("FIELDPATCH_NOT_A_KEY");
}

TEST_CASE("env disabled") {
    set_env("FIELDPATCH_LOG_LEVEL", "debug");
    EngineConfig cfg = EngineConfig::load(no_env());
    REQUIRE(cfg.log_level == LogLevel::info);
    unset_env("FIELDPATCH_LOG_LEVEL");
}

TEST_CASE("dict override wins over env") {
    set_env("FIELDPATCH_LOG_LEVEL", "debug");
    ConfigOptions opts;
    opts.overrides = {{"log.level", "error"}};
    EngineConfig cfg = EngineConfig::load(opts);
    REQUIRE(cfg.log_level == LogLevel::error);
    unset_env("FIELDPATCH_LOG_LEVEL");
}

TEST_CASE("comma separated lists") {
    ConfigOptions opts = no_env();
    opts.overrides = {{"ownership.reserved_annotations", "a.io/x, b.io/y"}};
    EngineConfig cfg = EngineConfig::load(opts);
    REQUIRE(cfg.reserved_annotations == std::vector<std::string>{"a.io/x", "b.io/y"});
}

TEST_CASE("mandatory keys") {
    ConfigOptions opts = no_env();
    opts.mandatory = {"store.endpoint"};
    REQUIRE_THROWS_AS(EngineConfig::load(opts), MissingMandatoryConfig);

    opts.overrides = {{"store.endpoint", "local"}};
    REQUIRE_NOTHROW(EngineConfig::load(opts));
}

TEST_CASE("type errors") {
    REQUIRE_THROWS_AS(EngineConfig::from_value(json{{"store", {{"timeout_ms", "soon"}}}}),
                      ConfigurationError);
    REQUIRE_THROWS_AS(EngineConfig::from_value(json{{"managers", {{"binding_prefix", ""}}}}),
                      ConfigurationError);
    REQUIRE_THROWS_AS(EngineConfig::from_value(json{{"log", {{"level", "loud"}}}}),
                      ConfigurationError);
    REQUIRE_THROWS_AS(EngineConfig::from_value(json{{"diagnostics",
                                                     {{"conflict_display_limit", -1}}}}),
                      ConfigurationError);
}

TEST_CASE("to_value round trip") {
    EngineConfig cfg = EngineConfig::defaults();
    cfg.lifecycle_manager = "other";
    cfg.log_level = LogLevel::warn;
    EngineConfig back = EngineConfig::from_value(cfg.to_value());
    REQUIRE(back.lifecycle_manager == "other");
    REQUIRE(back.log_level == LogLevel::warn);
    REQUIRE(back.to_value() == cfg.to_value());
}

TEST_CASE("env name mapping") {
    const auto keys = config_leaf_keys(EngineConfig::defaults_tree());
    REQUIRE(env_name_to_key("LOG_LEVEL", keys) == std::optional<std::string>("log.level"));
    REQUIRE(env_name_to_key("MANAGERS_BINDING_PREFIX", keys) ==
            std::optional<std::string>("managers.binding_prefix"));
    REQUIRE_FALSE(env_name_to_key("UNKNOWN", keys).has_value());
}
