/**
 * @file test_patchspec.cpp
 * @brief Tests for patch payload selection, decoding and validation
 */

#include <gtest/gtest.h>

#include "fieldpatch/PatchSpec.hpp"
#include "fieldpatch/Errors.hpp"

using namespace fieldpatch;

namespace {

const std::vector<std::string> kReserved = {
    "fieldpatch.io/lifecycle-id",
    "fieldpatch.io/owned-by"
};

} // namespace

// ============================================================================
// Payload selection
// ============================================================================

TEST(PatchSpecFields, ExactlyOneRequired) {
    EXPECT_THROW(PatchSpec::from_fields(std::nullopt, std::nullopt, std::nullopt),
                 ConfigurationError);
    EXPECT_THROW(PatchSpec::from_fields(std::string("{}"), std::string("[]"), std::nullopt),
                 ConfigurationError);
}

TEST(PatchSpecFields, EmptyStringCountsAsUnset) {
    auto spec = PatchSpec::from_fields(std::string(""), std::nullopt,
                                       std::string(R"({"data":{"a":"1"}})"));
    EXPECT_EQ(spec.kind(), PatchKind::MergePatch);
}

TEST(PatchSpecFields, WhitespaceContentRejected) {
    EXPECT_THROW(PatchSpec(PatchKind::Merge, "   \n"), ConfigurationError);
}

TEST(PatchSpecKinds, NamesAndCapabilities) {
    EXPECT_STREQ(patch_kind_name(PatchKind::Merge), "patch");
    EXPECT_STREQ(patch_kind_name(PatchKind::JsonPatch), "json_patch");
    EXPECT_STREQ(patch_kind_name(PatchKind::MergePatch), "merge_patch");
    EXPECT_EQ(patch_kind_from_name("json_patch"), PatchKind::JsonPatch);
    EXPECT_THROW(patch_kind_from_name("strategic"), ConfigurationError);

    EXPECT_TRUE(capabilities(PatchKind::Merge).supports_projection);
    EXPECT_TRUE(capabilities(PatchKind::Merge).uses_apply);
    EXPECT_FALSE(capabilities(PatchKind::JsonPatch).supports_projection);
    EXPECT_FALSE(capabilities(PatchKind::MergePatch).uses_apply);
}

// ============================================================================
// Decoding
// ============================================================================

TEST(PatchSpecDecode, JsonDocument) {
    PatchSpec spec(PatchKind::Merge, R"({"data":{"key":"value"}})");
    EXPECT_EQ(spec.decode()["data"]["key"], "value");
}

TEST(PatchSpecDecode, TomlDocument) {
    PatchSpec spec(PatchKind::Merge, "[data]\nkey = \"value\"\n");
    EXPECT_EQ(spec.decode()["data"]["key"], "value");
}

TEST(PatchSpecDecode, DocumentMustBeObject) {
    EXPECT_THROW(PatchSpec(PatchKind::Merge, "[1, 2]").decode(), ParseError);
    EXPECT_THROW(PatchSpec(PatchKind::MergePatch, "\"text\"").decode(), ParseError);
    EXPECT_THROW(PatchSpec(PatchKind::Merge, "{not valid").decode(), ParseError);
}

TEST(PatchSpecDecode, JsonPatchOperations) {
    PatchSpec spec(PatchKind::JsonPatch,
                   R"([{"op":"replace","path":"/spec/replicas","value":3}])");
    Value ops = spec.decode();
    ASSERT_TRUE(ops.is_array());
    EXPECT_EQ(ops[0]["op"], "replace");
}

TEST(PatchSpecDecode, InvalidOperationsRejected) {
    EXPECT_THROW(PatchSpec(PatchKind::JsonPatch, R"({"op":"add"})").decode(),
                 ConfigurationError);
    EXPECT_THROW(PatchSpec(PatchKind::JsonPatch, "[]").decode(), ConfigurationError);
    EXPECT_THROW(PatchSpec(PatchKind::JsonPatch, R"([{"path":"/a"}])").decode(),
                 ConfigurationError);
    EXPECT_THROW(PatchSpec(PatchKind::JsonPatch, R"([{"op":"merge","path":"/a"}])").decode(),
                 ConfigurationError);
    EXPECT_THROW(PatchSpec(PatchKind::JsonPatch, R"([{"op":"add","path":"/a"}])").decode(),
                 ConfigurationError);
    EXPECT_THROW(PatchSpec(PatchKind::JsonPatch, R"([{"op":"move","path":"/a"}])").decode(),
                 ConfigurationError);
}

// ============================================================================
// Fingerprint and paths
// ============================================================================

TEST(PatchSpecFingerprint, InsensitiveToFormatting) {
    PatchSpec compact(PatchKind::Merge, R"({"data":{"a":"1","b":"2"}})");
    PatchSpec pretty(PatchKind::Merge, "{\n  \"data\": {\n    \"b\": \"2\",\n    \"a\": \"1\"\n  }\n}");
    EXPECT_EQ(compact.fingerprint(), pretty.fingerprint());
    EXPECT_EQ(compact.fingerprint().size(), 16u);
}

TEST(PatchSpecFingerprint, SensitiveToContentAndKind) {
    PatchSpec a(PatchKind::Merge, R"({"data":{"a":"1"}})");
    PatchSpec b(PatchKind::Merge, R"({"data":{"a":"2"}})");
    PatchSpec c(PatchKind::MergePatch, R"({"data":{"a":"1"}})");
    EXPECT_NE(a.fingerprint(), b.fingerprint());
    EXPECT_NE(a.fingerprint(), c.fingerprint());
}

TEST(PatchSpecPaths, DocumentLeaves) {
    PatchSpec spec(PatchKind::Merge, R"({"data":{"a":"1"},"metadata":{"labels":{"x":"y"}}})");
    EXPECT_EQ(spec.paths(), (std::vector<std::string>{"data.a", "metadata.labels.x"}));
}

TEST(PatchSpecPaths, JsonPatchPointers) {
    PatchSpec spec(PatchKind::JsonPatch, R"([
        {"op":"replace","path":"/spec/replicas","value":2},
        {"op":"add","path":"/metadata/annotations/example.com~1owner","value":"me"},
        {"op":"move","from":"/data/old","path":"/data/new"}
    ])");
    EXPECT_EQ(spec.paths(), (std::vector<std::string>{
        "spec.replicas",
        "metadata.annotations.example\\.com/owner",
        "data.old",
        "data.new"
    }));
}

TEST(PointerToPath, Conversion) {
    EXPECT_EQ(pointer_to_path("/spec/containers/0/image"), "spec.containers[0].image");
    EXPECT_EQ(pointer_to_path("/spec/containers/-"), "spec.containers");
    EXPECT_EQ(pointer_to_path("/a~0b"), "a~b");
    EXPECT_EQ(pointer_to_path(""), "");
}

TEST(PointerToPath, OversizedNumericTokenIsFieldName) {
    EXPECT_EQ(pointer_to_path("/data/123456789012345678901234567890"),
              "data.123456789012345678901234567890");

    PatchSpec spec(PatchKind::JsonPatch,
                   R"([{"op":"add","path":"/data/123456789012345678901234567890","value":"x"}])");
    EXPECT_EQ(spec.paths(),
              (std::vector<std::string>{"data.123456789012345678901234567890"}));
}

// ============================================================================
// Content validation
// ============================================================================

TEST(ValidatePatch, AcceptsOrdinaryDocument) {
    PatchSpec spec(PatchKind::Merge,
                   R"({"metadata":{"labels":{"a":"b"}},"spec":{"replicas":2}})");
    EXPECT_NO_THROW(validate_patch_content(spec, kReserved));
}

TEST(ValidatePatch, RejectsStatus) {
    PatchSpec spec(PatchKind::Merge, R"({"status":{"phase":"Running"}})");
    EXPECT_THROW(validate_patch_content(spec, kReserved), ConfigurationError);
}

TEST(ValidatePatch, RejectsServerManagedMetadata) {
    PatchSpec spec(PatchKind::MergePatch, R"({"metadata":{"resourceVersion":"5"}})");
    EXPECT_THROW(validate_patch_content(spec, kReserved), ConfigurationError);
}

TEST(ValidatePatch, RejectsReservedAnnotation) {
    PatchSpec spec(PatchKind::Merge,
                   R"({"metadata":{"annotations":{"fieldpatch.io/owned-by":"x"}}})");
    EXPECT_THROW(validate_patch_content(spec, kReserved), ConfigurationError);
}

TEST(ValidatePatch, RejectsUnnamedContainers) {
    PatchSpec spec(PatchKind::Merge,
                   R"({"spec":{"template":{"spec":{"containers":[{"image":"nginx"}]}}}})");
    EXPECT_THROW(validate_patch_content(spec, kReserved), ConfigurationError);

    PatchSpec named(PatchKind::Merge,
                    R"({"spec":{"template":{"spec":{"containers":[{"name":"app","image":"nginx"}]}}}})");
    EXPECT_NO_THROW(validate_patch_content(named, kReserved));
}

TEST(ValidatePatch, JsonPatchPointerRules) {
    PatchSpec status(PatchKind::JsonPatch,
                     R"([{"op":"replace","path":"/status/phase","value":"x"}])");
    EXPECT_THROW(validate_patch_content(status, kReserved), ConfigurationError);

    PatchSpec reserved(PatchKind::JsonPatch,
                       R"([{"op":"add","path":"/metadata/annotations/fieldpatch.io~1lifecycle-id","value":"x"}])");
    EXPECT_THROW(validate_patch_content(reserved, kReserved), ConfigurationError);

    PatchSpec ok(PatchKind::JsonPatch,
                 R"([{"op":"replace","path":"/spec/replicas","value":1}])");
    EXPECT_NO_THROW(validate_patch_content(ok, kReserved));
}
