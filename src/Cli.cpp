/**
 * @file Cli.cpp
 * @brief fieldpatch command implementations
 */

#include "fieldpatch/Cli.hpp"
#include "fieldpatch/Classify.hpp"
#include "fieldpatch/Config.hpp"
#include "fieldpatch/Engine.hpp"
#include "fieldpatch/Errors.hpp"
#include "fieldpatch/Loader.hpp"
#include "fieldpatch/LocalStore.hpp"
#include "fieldpatch/Log.hpp"
#include "fieldpatch/Parse.hpp"

#include <cxxopts.hpp>

#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace fieldpatch {

namespace {

const char* const kUsage =
    "Commands: plan | apply | reconcile | release | ownership | paths\n"
    "Patch content may be given inline or as @FILE.\n";

std::optional<std::string> content_option(const cxxopts::ParseResult& result, const char* name) {
    if (!result.count(name)) return std::nullopt;
    std::string value = result[name].as<std::string>();
    if (!value.empty() && value.front() == '@') {
        return read_text_file(value.substr(1));
    }
    return value;
}

Value diagnostics_value(const Diagnostics& diags) {
    Value out = Value::array();
    for (const auto& d : diags) {
        out.push_back({{"severity", severity_name(d.severity)},
                       {"summary", d.summary},
                       {"detail", d.detail}});
    }
    return out;
}

Value conflicts_value(const std::vector<ConflictRecord>& records) {
    Value out = Value::array();
    for (const auto& r : records) {
        out.push_back({{"path", r.path},
                       {"current_owner", r.current_owner.empty() ? Value() : Value(r.current_owner)},
                       {"incoming_owner", r.incoming_owner}});
    }
    return out;
}

Value string_map_value(const std::map<std::string, std::string>& m) {
    Value out = Value::object();
    for (const auto& kv : m) out[kv.first] = kv.second;
    return out;
}

void print_diagnostics(const Diagnostics& diags, std::ostream& err) {
    for (const auto& d : diags) {
        err << "[" << severity_name(d.severity) << "] " << d.summary << "\n" << d.detail << "\n";
    }
}

std::string operation_name(const std::string& cmd) {
    if (cmd == "reconcile" || cmd == "ownership") return "Read";
    if (cmd.empty()) return "Store";
    std::string out = cmd;
    out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    return out;
}

/**
 * @brief Target from explicit options, the prior state, or the only object
 */
TargetRef resolve_target(const cxxopts::ParseResult& result, const LocalStore& store,
                         const std::optional<BindingState>& prior) {
    if (result.count("kind") || result.count("name")) {
        if (!result.count("kind") || !result.count("name")) {
            throw ConfigurationError("--kind and --name must be given together");
        }
        TargetRef ref;
        ref.api_version = result["api-version"].as<std::string>();
        ref.kind = result["kind"].as<std::string>();
        ref.name = result["name"].as<std::string>();
        if (result.count("namespace")) ref.namespace_ = result["namespace"].as<std::string>();
        if (ref.namespace_.empty() && store.namespaced(ref.api_version, ref.kind)) {
            ref.namespace_ = "default";
        }
        return ref;
    }
    if (prior) {
        return prior->target;
    }
    const auto objects = store.list();
    if (objects.size() != 1) {
        throw ConfigurationError("Target is ambiguous: pass --kind and --name");
    }
    return objects.front().ref();
}

} // namespace

int run_cli(int argc, const char* const* argv, std::ostream& out, std::ostream& err) {
    std::string cmd;
    std::string target_name = "object";
    try {
        cxxopts::Options options("fieldpatch",
                                 "Ownership-aware field patches over a local object file");
        options.positional_help("COMMAND");

        options.add_options()
            ("o,object", "Object file (JSON/TOML object or List)", cxxopts::value<std::string>())
            ("patch", "Merge document", cxxopts::value<std::string>())
            ("json-patch", "RFC 6902 JSON patch", cxxopts::value<std::string>())
            ("merge-patch", "RFC 7396 merge patch", cxxopts::value<std::string>())
            ("s,state", "Binding state file", cxxopts::value<std::string>())
            ("id", "Binding id (apply)", cxxopts::value<std::string>())
            ("api-version", "Target apiVersion", cxxopts::value<std::string>()->default_value("v1"))
            ("kind", "Target kind", cxxopts::value<std::string>())
            ("name", "Target name", cxxopts::value<std::string>())
            ("n,namespace", "Target namespace", cxxopts::value<std::string>())
            ("c,config", "Engine configuration file (JSON/TOML)", cxxopts::value<std::string>())
            ("set", "Configuration override key=value (repeatable)",
             cxxopts::value<std::vector<std::string>>())
            ("log-level", "off|error|warn|info|debug", cxxopts::value<std::string>())
            ("h,help", "Show help");

        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());
        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            out << options.help() << "\n" << kUsage;
            return 0;
        }
        const auto commands = result["command"].as<std::vector<std::string>>();
        if (commands.size() != 1) {
            err << "Error: expected exactly one command\n";
            return 1;
        }
        cmd = commands.front();

        // Configuration
        ConfigOptions config_options;
        if (result.count("config")) config_options.file_path = result["config"].as<std::string>();
        if (result.count("set")) {
            for (const auto& assignment : result["set"].as<std::vector<std::string>>()) {
                config_options.overrides.insert(parse_assignment(assignment));
            }
        }
        if (result.count("log-level")) {
            config_options.overrides["log.level"] = result["log-level"].as<std::string>();
        }
        const EngineConfig config = EngineConfig::load(config_options);
        set_log_level(config.log_level);

        const auto merge = content_option(result, "patch");
        const auto json_patch = content_option(result, "json-patch");
        const auto merge_patch = content_option(result, "merge-patch");
        auto load_spec = [&]() { return PatchSpec::from_fields(merge, json_patch, merge_patch); };

        if (cmd == "paths") {
            Value paths = Value::array();
            for (const auto& p : patch_ownership_paths(load_spec())) paths.push_back(p);
            out << paths.dump(2) << "\n";
            return 0;
        }

        if (!result.count("object")) {
            err << "Error: --object is required for '" << cmd << "'\n";
            return 1;
        }
        const std::string object_file = result["object"].as<std::string>();
        LocalStore store;
        store.load_file(object_file);

        std::optional<std::string> state_file;
        std::optional<BindingState> prior;
        if (result.count("state")) {
            state_file = result["state"].as<std::string>();
            if (fs::exists(*state_file)) {
                prior = load_state_file(*state_file);
            }
        }

        const TargetRef target = resolve_target(result, store, prior);
        target_name = target.describe();
        PatchEngine engine(store, config);
        const CallContext ctx(config.store_timeout);

        if (cmd == "ownership") {
            auto live = store.get(target, ctx);
            if (!live) throw TargetNotFoundError(target.describe());
            out << string_map_value(OwnershipMap::build(*live, config.filter).owners()).dump(2)
                << "\n";
            return 0;
        }

        if (cmd == "plan") {
            const PlanResult plan = engine.compute_projection(load_spec(), target, prior, ctx);
            print_diagnostics(plan.diagnostics, err);
            out << Value{{"status", projection_status_name(plan.status)},
                         {"projection", string_map_value(plan.projection)},
                         {"conflicts", conflicts_value(plan.conflicts)},
                         {"previous_owners", string_map_value(plan.previous_owners)},
                         {"preserved", plan.preserved},
                         {"diagnostics", diagnostics_value(plan.diagnostics)}}.dump(2)
                << "\n";
            return 0;
        }

        if (cmd == "apply") {
            if (!state_file) {
                err << "Error: --state is required for 'apply'\n";
                return 1;
            }
            std::string id;
            if (result.count("id")) id = result["id"].as<std::string>();
            else if (prior) id = prior->binding_id;
            else id = PatchEngine::generate_binding_id();

            const ApplyResult applied = engine.apply_and_update_projection(load_spec(), target, id,
                                                                           prior, ctx);
            print_diagnostics(applied.diagnostics, err);
            save_state_file(*state_file, applied.state);
            store.save_file(object_file);
            out << Value{{"binding_id", applied.state.binding_id},
                         {"projection", string_map_value(applied.state.projection)},
                         {"conflicts", conflicts_value(applied.conflicts)},
                         {"diagnostics", diagnostics_value(applied.diagnostics)}}.dump(2)
                << "\n";
            return 0;
        }

        if (cmd == "reconcile" || cmd == "release") {
            if (!prior) {
                err << "Error: '" << cmd << "' needs an existing --state file\n";
                return 1;
            }
        }

        if (cmd == "reconcile") {
            const ReconcileResult read = engine.reconcile(load_spec(), *prior, ctx);
            print_diagnostics(read.diagnostics, err);
            if (read.state) {
                save_state_file(*state_file, *read.state);
            } else {
                fs::remove(*state_file);
            }
            store.save_file(object_file);
            out << Value{{"drift_detected", read.drift_detected},
                         {"target_gone", read.target_gone},
                         {"drifted_paths", read.drifted_paths},
                         {"interfering_managers", read.interfering_managers},
                         {"projection", string_map_value(read.projection)},
                         {"diagnostics", diagnostics_value(read.diagnostics)}}.dump(2)
                << "\n";
            return 0;
        }

        if (cmd == "release") {
            const Diagnostics diags = engine.release(*prior, ctx);
            print_diagnostics(diags, err);
            store.save_file(object_file);
            fs::remove(*state_file);
            out << Value{{"released", prior->binding_id},
                         {"diagnostics", diagnostics_value(diags)}}.dump(2)
                << "\n";
            return 0;
        }

        err << "Unknown command: " << cmd << "\n" << kUsage;
        return 1;

    } catch (const StoreError& ex) {
        // Store refusals are reported as diagnostics
        const Diagnostics diags{classify_store_error(ex, operation_name(cmd), target_name)};
        print_diagnostics(diags, err);
        return has_errors(diags) ? 1 : 0;
    } catch (const std::exception& ex) {
        err << "Error: " << ex.what() << "\n";
        return 1;
    }
}

} // namespace fieldpatch
