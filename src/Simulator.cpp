/**
 * @file Simulator.cpp
 * @brief Request construction and submission
 */

#include "fieldpatch/Simulator.hpp"
#include "fieldpatch/Classify.hpp"
#include "fieldpatch/Log.hpp"
#include "fieldpatch/Merge.hpp"

namespace fieldpatch {

Value MergeSimulator::build_request(const Object& live, const Value& patch) const {
    Value request = {
        {"apiVersion", live.api_version()},
        {"kind", live.kind()},
        {"metadata", {{"name", live.name()}}}
    };
    const std::string ns = live.namespace_();
    if (!ns.empty() && store_.namespaced(live.api_version(), live.kind())) {
        request["metadata"]["namespace"] = ns;
    }
    merge_onto(request, patch);
    return request;
}

Object MergeSimulator::submit(const Object& live, const PatchSpec& spec, const std::string& manager,
                              bool dry_run, const CallContext& ctx) const {
    const Value patch = spec.decode();
    const std::string mode = dry_run ? "dry-run" : "write";

    ctx.check(mode + " " + live.ref().describe());
    FIELDPATCH_LOG_DEBUG("simulator", "{} {} as '{}' ({})", mode, live.ref().describe(), manager,
                         patch_kind_name(spec.kind()));

    try {
        if (spec.kind() == PatchKind::Merge) {
            ApplyOptions options;
            options.manager = manager;
            options.force = true;
            options.dry_run = dry_run;
            return store_.apply(Object(build_request(live, patch)), options, ctx);
        }

        PatchOptions options;
        options.manager = manager;
        options.dry_run = dry_run;
        return store_.patch(live.ref(), spec.kind(), patch.dump(), options, ctx);
    } catch (const StoreError& e) {
        decode_store_error(e);
        throw;
    }
}

} // namespace fieldpatch
