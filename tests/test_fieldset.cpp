/**
 * @file test_fieldset.cpp
 * @brief Tests for the managedFields ownership tree (GoogleTest)
 */

#include <gtest/gtest.h>

#include "fieldpatch/FieldSet.hpp"
#include "fieldpatch/Errors.hpp"

#include <algorithm>

using namespace fieldpatch;

namespace {

Value deployment_fields() {
    return Value::parse(R"({
        "f:metadata": {
            "f:labels": {
                "f:app": {}
            }
        },
        "f:spec": {
            "f:replicas": {},
            "f:template": {
                "f:spec": {
                    "f:containers": {
                        "k:{\"name\":\"app\"}": {
                            ".": {},
                            "f:image": {},
                            "f:name": {}
                        }
                    }
                }
            }
        }
    })");
}

} // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST(FieldSetParse, LeafPaths) {
    FieldSet set = FieldSet::parse(deployment_fields());
    EXPECT_EQ(set.leaf_paths(), (std::vector<std::string>{
        "metadata.labels.app",
        "spec.replicas",
        "spec.template.spec.containers[name=app].image",
        "spec.template.spec.containers[name=app].name"
    }));
}

TEST(FieldSetParse, MarkedElementListedInPaths) {
    FieldSet set = FieldSet::parse(deployment_fields());
    auto paths = set.paths();
    EXPECT_NE(std::find(paths.begin(), paths.end(), "spec.template.spec.containers[name=app]"),
              paths.end());
    EXPECT_EQ(paths.size(), 5u);
}

TEST(FieldSetParse, DottedFieldNameEscaped) {
    FieldSet set = FieldSet::parse(Value::parse(
        R"({"f:metadata":{"f:annotations":{"f:example.com/owner":{}}}})"));
    EXPECT_EQ(set.leaf_paths(),
              std::vector<std::string>{"metadata.annotations.example\\.com/owner"});
}

TEST(FieldSetParse, SetMembersAndIndexes) {
    FieldSet set = FieldSet::parse(Value::parse(
        R"({"f:metadata":{"f:finalizers":{"v:\"example.com/cleanup\"":{}}},
            "f:items":{"i:0":{"f:value":{}}}})"));
    auto leaves = set.leaf_paths();
    EXPECT_NE(std::find(leaves.begin(), leaves.end(), "metadata.finalizers[=example.com/cleanup]"),
              leaves.end());
    EXPECT_NE(std::find(leaves.begin(), leaves.end(), "items[0].value"), leaves.end());
}

TEST(FieldSetParse, NullIsEmpty) {
    EXPECT_TRUE(FieldSet::parse(Value()).empty());
}

TEST(FieldSetParse, MalformedTreesThrow) {
    EXPECT_THROW(FieldSet::parse(Value::array()), ParseError);
    EXPECT_THROW(FieldSet::parse(Value::parse(R"({"x:bad":{}})")), ParseError);
    EXPECT_THROW(FieldSet::parse(Value::parse(R"({"k:notjson":{}})")), ParseError);
    EXPECT_THROW(FieldSet::parse(Value::parse(R"({"f:a":1})")), ParseError);
    EXPECT_THROW(FieldSet::parse(Value::parse(R"({"i:x":{}})")), ParseError);
}

TEST(FieldSetParse, OversizedIndexIsParseError) {
    EXPECT_THROW(FieldSet::parse(Value::parse(R"({"f:spec":{"i:99999999999999999999999":{}}})")),
                 ParseError);
}

// ============================================================================
// Building and serialization
// ============================================================================

TEST(FieldSetBuild, FromPathsSerializesWireForm) {
    FieldSet set = FieldSet::from_paths({
        "data.key",
        "spec.containers[name=app]",
        "spec.containers[name=app].image"
    });
    Value wire = set.to_value();
    EXPECT_TRUE(wire["f:data"]["f:key"].is_object());
    const Value& element = wire["f:spec"]["f:containers"]["k:{\"name\":\"app\"}"];
    EXPECT_TRUE(element.contains("."));
    EXPECT_TRUE(element["f:image"].is_object());
}

TEST(FieldSetBuild, WireFormParsesBack) {
    FieldSet original = FieldSet::parse(deployment_fields());
    FieldSet copy = FieldSet::parse(original.to_value());
    EXPECT_EQ(copy.paths(), original.paths());
}

TEST(FieldSetContains, LeavesAndMarkedNodes) {
    FieldSet set = FieldSet::parse(deployment_fields());
    EXPECT_TRUE(set.contains("spec.replicas"));
    EXPECT_TRUE(set.contains("spec.template.spec.containers[name=app]"));
    EXPECT_FALSE(set.contains("spec.template"));
    EXPECT_FALSE(set.contains("spec.paused"));
}

TEST(FieldSetKind, NodeKinds) {
    FieldSet set = FieldSet::parse(deployment_fields());
    const FieldNode* spec = set.root().find(PathSegment::field("spec"));
    ASSERT_NE(spec, nullptr);
    EXPECT_EQ(spec->kind(), FieldNode::Kind::Object);

    const FieldNode* containers = spec->find(PathSegment::field("template"))
                                      ->find(PathSegment::field("spec"))
                                      ->find(PathSegment::field("containers"));
    ASSERT_NE(containers, nullptr);
    EXPECT_EQ(containers->kind(), FieldNode::Kind::Array);
    EXPECT_EQ(spec->find(PathSegment::field("replicas"))->kind(), FieldNode::Kind::Leaf);
}
