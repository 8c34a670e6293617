/**
 * @file test_merge.cpp
 * @brief Tests for configuration layering and request construction merges
 *
 * deep_merge layers configuration sources (null leaves the base alone);
 * merge_onto overlays a patch document onto an identity skeleton.
 */

#include <gtest/gtest.h>
#include "fieldpatch/Merge.hpp"

using namespace fieldpatch;

// ============================================================================
// deep_merge
// ============================================================================

TEST(DeepMerge, BothEmpty) {
    auto result = deep_merge(Value::object(), Value::object());
    EXPECT_TRUE(result.is_object());
    EXPECT_TRUE(result.empty());
}

TEST(DeepMerge, OverrideReplacesValues) {
    Value base = {{"a", 1}, {"b", 2}};
    Value override = {{"b", 3}, {"c", 4}};
    auto result = deep_merge(base, override);
    EXPECT_EQ(result["a"], 1);
    EXPECT_EQ(result["b"], 3);
    EXPECT_EQ(result["c"], 4);
}

TEST(DeepMerge, NestedSectionsMerged) {
    Value base = {{"managers", {{"binding_prefix", "fieldpatch-patch-"},
                                {"placeholder_suffix", "temp"}}}};
    Value override = {{"managers", {{"placeholder_suffix", "pending"}}}};
    auto result = deep_merge(base, override);

    EXPECT_EQ(result["managers"]["binding_prefix"], "fieldpatch-patch-");
    EXPECT_EQ(result["managers"]["placeholder_suffix"], "pending");
}

TEST(DeepMerge, NullLayerKeepsBase) {
    Value base = {{"log", {{"level", "info"}}}};
    EXPECT_EQ(deep_merge(base, Value()), base);
    EXPECT_EQ(deep_merge(Value(), base), base);
}

TEST(DeepMerge, ArraysReplaced) {
    Value base = {{"ownership", {{"volatile_roots", {"status"}}}}};
    Value override = {{"ownership", {{"volatile_roots", {"status", "spec.nodeName"}}}}};
    auto result = deep_merge(base, override);
    EXPECT_EQ(result["ownership"]["volatile_roots"].size(), 2u);
}

TEST(DeepMerge, TypeChangeReplaces) {
    Value base = {{"store", {{"timeout_ms", 30000}}}};
    Value override = {{"store", "disabled"}};
    EXPECT_EQ(deep_merge(base, override)["store"], "disabled");
}

// ============================================================================
// merge_onto
// ============================================================================

TEST(MergeOnto, PatchOverlaysSkeleton) {
    Value skeleton = {
        {"apiVersion", "v1"},
        {"kind", "ConfigMap"},
        {"metadata", {{"name", "cfg"}, {"namespace", "default"}}}
    };
    merge_onto(skeleton, Value{{"metadata", {{"labels", {{"team", "a"}}}}},
                               {"data", {{"k", "v"}}}});

    EXPECT_EQ(skeleton["metadata"]["name"], "cfg");
    EXPECT_EQ(skeleton["metadata"]["labels"]["team"], "a");
    EXPECT_EQ(skeleton["data"]["k"], "v");
}

TEST(MergeOnto, NullValuesKept) {
    Value target = {{"data", {{"k", "v"}}}};
    merge_onto(target, Value{{"data", {{"k", nullptr}}}});
    ASSERT_TRUE(target["data"].contains("k"));
    EXPECT_TRUE(target["data"]["k"].is_null());
}

TEST(MergeOnto, NonObjectReplaces) {
    Value target = {{"a", 1}};
    merge_onto(target, Value::array({1, 2}));
    EXPECT_TRUE(target.is_array());
}
