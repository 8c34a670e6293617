#include <catch2/catch_all.hpp>
#include <fieldpatch/State.hpp>
#include <fieldpatch/Errors.hpp>
#include <cstdio>
#include <fstream>

using namespace fieldpatch;
using nlohmann::json;

namespace {

BindingState sample_state() {
    BindingState state;
    state.binding_id = "b1";
    state.manager = "fieldpatch-patch-b1";
    state.target = TargetRef{"v1", "ConfigMap", "cfg", "default"};
    state.patch_kind = PatchKind::Merge;
    state.patch_fingerprint = "0123456789abcdef";
    state.projection_status = ProjectionStatus::Known;
    state.projection = {{"data.a", "1"}};
    state.ownership = {{"data.a", "fieldpatch-patch-b1"}};
    state.previous_owners = {{"data.a", "kubectl"}};
    return state;
}

} // namespace

TEST_CASE("state serializes with schema version") {
    json v = sample_state().to_value();
    REQUIRE(v["schema_version"] == BindingState::kSchemaVersion);
    REQUIRE(v["patch_kind"] == "patch");
    REQUIRE(v["projection_status"] == "known");
    REQUIRE(v["target"]["namespace"] == "default");
    REQUIRE(v["previous_owners"]["data.a"] == "kubectl");
}

TEST_CASE("state decodes what it encodes") {
    BindingState back = BindingState::from_value(sample_state().to_value());
    REQUIRE(back.binding_id == "b1");
    REQUIRE(back.target == sample_state().target);
    REQUIRE(back.projection == sample_state().projection);
    REQUIRE(back.previous_owners.at("data.a") == "kubectl");
}

TEST_CASE("version 0 state is upgraded") {
    json v0 = {
        {"binding_id", "old"},
        {"manager", "fieldpatch-patch-old"},
        {"target", {{"apiVersion", "v1"}, {"kind", "ConfigMap"}, {"name", "cfg"}}},
        {"patch_kind", "patch"},
        {"field_ownership", {{"data.a", "fieldpatch-patch-old"}}},
        {"managed_state_projection", {{"data.a", "1"}}}
    };
    BindingState state = BindingState::from_value(v0);
    REQUIRE(state.ownership.at("data.a") == "fieldpatch-patch-old");
    REQUIRE(state.projection.at("data.a") == "1");
    REQUIRE(state.projection_status == ProjectionStatus::Known);
    REQUIRE(state.previous_owners.empty());
}

TEST_CASE("version 0 without projection is unknown") {
    json v0 = {
        {"binding_id", "old"},
        {"manager", "fieldpatch-patch-old"},
        {"target", {{"apiVersion", "v1"}, {"kind", "ConfigMap"}, {"name", "cfg"}}},
        {"patch_kind", "json_patch"}
    };
    REQUIRE(BindingState::from_value(v0).projection_status == ProjectionStatus::Unknown);
}

TEST_CASE("newer or malformed state rejected") {
    json v = sample_state().to_value();
    v["schema_version"] = BindingState::kSchemaVersion + 1;
    REQUIRE_THROWS_AS(BindingState::from_value(v), ParseError);

    json missing = sample_state().to_value();
    missing.erase("manager");
    REQUIRE_THROWS_AS(BindingState::from_value(missing), ParseError);

    json bad_kind = sample_state().to_value();
    bad_kind["patch_kind"] = "strategic";
    REQUIRE_THROWS_AS(BindingState::from_value(bad_kind), ParseError);

    json bad_map = sample_state().to_value();
    bad_map["projection"] = json{{"data.a", 1}};
    REQUIRE_THROWS_AS(BindingState::from_value(bad_map), ParseError);

    REQUIRE_THROWS_AS(BindingState::from_value(json::array()), ParseError);
}

TEST_CASE("state file save and load") {
    std::string path = "tmp_fieldpatch_state.json";
    save_state_file(path, sample_state());
    BindingState loaded = load_state_file(path);
    REQUIRE(loaded.manager == "fieldpatch-patch-b1");
    REQUIRE(loaded.ownership == sample_state().ownership);
    std::remove(path.c_str());
}
