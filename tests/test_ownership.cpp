/**
 * @file test_ownership.cpp
 * @brief Tests for manager identity and the ownership map (GoogleTest)
 */

#include <gtest/gtest.h>

#include "fieldpatch/Ownership.hpp"
#include "fieldpatch/FieldSet.hpp"

using namespace fieldpatch;

namespace {

ManagedFieldsEntry entry(const std::string& manager, const std::vector<std::string>& paths,
                         const std::string& operation = "Apply") {
    ManagedFieldsEntry e;
    e.manager = manager;
    e.operation = operation;
    e.api_version = "v1";
    e.fields = FieldSet::from_paths(paths).to_value();
    return e;
}

} // namespace

// ============================================================================
// ManagerIdentity
// ============================================================================

TEST(ManagerIdentity, PlaceholderBeforeId) {
    ManagerIdentity id("fieldpatch-patch-", "temp");
    EXPECT_EQ(id.name(), "fieldpatch-patch-temp");
    EXPECT_EQ(id.placeholder(), "fieldpatch-patch-temp");
    EXPECT_FALSE(id.binding_id().has_value());
}

TEST(ManagerIdentity, NamedAfterId) {
    ManagerIdentity id("fieldpatch-patch-", "temp", std::string("b1"));
    EXPECT_EQ(id.name(), "fieldpatch-patch-b1");
    EXPECT_TRUE(id.matches("fieldpatch-patch-b1"));
    EXPECT_TRUE(id.matches("fieldpatch-patch-temp"));
    EXPECT_FALSE(id.matches("fieldpatch-patch-b2"));
    EXPECT_FALSE(id.matches("kubectl"));
}

TEST(ManagerIdentity, OtherBindings) {
    ManagerIdentity id("fieldpatch-patch-", "temp", std::string("b1"));
    EXPECT_TRUE(id.is_binding_manager("fieldpatch-patch-b2"));
    EXPECT_TRUE(id.is_other_binding("fieldpatch-patch-b2"));
    EXPECT_FALSE(id.is_other_binding("fieldpatch-patch-b1"));
    EXPECT_FALSE(id.is_other_binding("fieldpatch-patch-temp"));
    EXPECT_FALSE(id.is_other_binding("kube-controller-manager"));
}

TEST(ManagerIdentity, WithBindingIdKeepsPrefix) {
    ManagerIdentity planned("fieldpatch-patch-", "temp");
    ManagerIdentity applied = planned.with_binding_id("abc");
    EXPECT_EQ(applied.name(), "fieldpatch-patch-abc");
    EXPECT_EQ(applied.placeholder(), planned.placeholder());
}

// ============================================================================
// OwnershipFilter
// ============================================================================

TEST(OwnershipFilter, DefaultsExcludeVolatileFields) {
    auto filter = OwnershipFilter::defaults();
    EXPECT_TRUE(filter.excluded("status.replicas"));
    EXPECT_TRUE(filter.excluded("metadata.resourceVersion"));
    EXPECT_TRUE(filter.excluded(
        "metadata.annotations.kubectl\\.kubernetes\\.io/last-applied-configuration"));
    EXPECT_FALSE(filter.excluded("spec.replicas"));
    EXPECT_FALSE(filter.excluded("metadata.labels.app"));
    EXPECT_FALSE(filter.excluded("statusline"));
}

// ============================================================================
// OwnershipMap
// ============================================================================

TEST(OwnershipMap, OwnerPerPath) {
    auto map = OwnershipMap::build({
        entry("kubectl", {"data.a", "data.b"}, "Update"),
        entry("controller", {"data.c"})
    }, OwnershipFilter::defaults());

    EXPECT_EQ(map.owner("data.a"), std::optional<std::string>("kubectl"));
    EXPECT_EQ(map.owner("data.c"), std::optional<std::string>("controller"));
    EXPECT_FALSE(map.owner("data.z").has_value());
    EXPECT_EQ(map.size(), 3u);
}

TEST(OwnershipMap, SharedPathKeepsAllClaimants) {
    auto map = OwnershipMap::build({
        entry("first", {"spec.replicas"}),
        entry("second", {"spec.replicas"})
    }, OwnershipFilter::defaults());

    EXPECT_EQ(map.owner("spec.replicas"), std::optional<std::string>("first"));
    EXPECT_EQ(map.claimants("spec.replicas"),
              (std::vector<std::string>{"first", "second"}));
    EXPECT_TRUE(map.claimants("spec.paused").empty());
}

TEST(OwnershipMap, FilteredPathsDropped) {
    auto map = OwnershipMap::build({
        entry("kubelet", {"status.phase", "spec.nodeName"}, "Update")
    }, OwnershipFilter::defaults());

    EXPECT_FALSE(map.owner("status.phase").has_value());
    EXPECT_TRUE(map.owner("spec.nodeName").has_value());
}

TEST(OwnershipMap, MalformedEntrySkipped) {
    ManagedFieldsEntry bad;
    bad.manager = "broken";
    bad.fields = Value::parse(R"({"z:nope":{}})");

    auto map = OwnershipMap::build({bad, entry("good", {"data.a"})},
                                   OwnershipFilter::defaults());
    EXPECT_EQ(map.managers(), std::vector<std::string>{"good"});
}

TEST(OwnershipMap, LeafAndMarkedPathsOfManager) {
    auto map = OwnershipMap::build({
        entry("fieldpatch-patch-b1", {
            "spec.containers[name=app]",
            "spec.containers[name=app].image"
        }),
        entry("kubectl", {"spec.replicas"}, "Update")
    }, OwnershipFilter::defaults());

    auto mine = [](const std::string& m) { return m == "fieldpatch-patch-b1"; };
    EXPECT_EQ(map.leaf_paths_of(mine),
              std::vector<std::string>{"spec.containers[name=app].image"});
    EXPECT_EQ(map.paths_of(mine), (std::vector<std::string>{
        "spec.containers[name=app]",
        "spec.containers[name=app].image"
    }));
}

TEST(OwnershipMap, FlattenedOwners) {
    auto map = OwnershipMap::build({
        entry("a", {"data.x"}),
        entry("b", {"data.y", "data.x"})
    }, OwnershipFilter::defaults());

    auto owners = map.owners();
    EXPECT_EQ(owners.at("data.x"), "a");
    EXPECT_EQ(owners.at("data.y"), "b");
    EXPECT_EQ(map.managers(), (std::vector<std::string>{"a", "b"}));
}

TEST(OwnershipMap, ObjectWithoutManagedFieldsIsEmpty) {
    Object obj(Value{{"apiVersion", "v1"}, {"kind", "ConfigMap"},
                     {"metadata", {{"name", "cfg"}}}});
    EXPECT_TRUE(OwnershipMap::build(obj, OwnershipFilter::defaults()).empty());
}
