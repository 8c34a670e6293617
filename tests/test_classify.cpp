/**
 * @file test_classify.cpp
 * @brief Tests for store error classification (GoogleTest)
 */

#include <gtest/gtest.h>

#include "fieldpatch/Classify.hpp"
#include "fieldpatch/Errors.hpp"

using namespace fieldpatch;

namespace {

const std::string kTarget = "Deployment default/web";

} // namespace

// ============================================================================
// Predicates and extraction
// ============================================================================

TEST(ClassifyPredicates, ImmutableNeeds422AndKeyword) {
    EXPECT_TRUE(is_immutable_field_error(
        StoreError(422, "Invalid", "spec.selector: Invalid value: field is immutable")));
    EXPECT_FALSE(is_immutable_field_error(
        StoreError(422, "Invalid", "spec.replicas: Invalid value: must be >= 0")));
    EXPECT_FALSE(is_immutable_field_error(
        StoreError(400, "BadRequest", "field is immutable")));
}

TEST(ClassifyPredicates, ValidationNeeds400AndKeyword) {
    EXPECT_TRUE(is_field_validation_error(
        StoreError(400, "BadRequest", "strict decoding error: unknown field \"spec.foo\"")));
    EXPECT_TRUE(is_field_validation_error(
        StoreError(400, "BadRequest", ".spec.bar: field not declared in schema")));
    EXPECT_FALSE(is_field_validation_error(
        StoreError(422, "Invalid", "unknown field \"spec.foo\"")));
}

TEST(ClassifyExtract, ImmutableFields) {
    auto fields = extract_immutable_fields(
        "Deployment.apps \"web\" is invalid: spec.selector: Invalid value: "
        "v1.LabelSelector{}: field is immutable");
    EXPECT_EQ(fields, std::vector<std::string>{"spec.selector"});
}

TEST(ClassifyExtract, ValidationFields) {
    auto fields = extract_validation_fields(
        "strict decoding error: unknown field \"spec.foo\", unknown field \"spec.bar\"");
    EXPECT_EQ(fields, (std::vector<std::string>{"spec.foo", "spec.bar"}));

    auto undeclared = extract_validation_fields(".spec.baz: field not declared in schema");
    EXPECT_EQ(undeclared, std::vector<std::string>{"spec.baz"});
}

TEST(ClassifyExtract, Conflicts) {
    auto conflicts = extract_conflicts(
        "Apply failed with 2 conflicts: conflict with \"kubectl\" using v1: .data.a\n"
        "conflict with \"controller\" using apps/v1: .spec.replicas");
    ASSERT_EQ(conflicts.size(), 2u);
    EXPECT_EQ(conflicts[0], std::make_pair(std::string("kubectl"), std::string("data.a")));
    EXPECT_EQ(conflicts[1].first, "controller");
    EXPECT_EQ(conflicts[1].second, "spec.replicas");
}

// ============================================================================
// Diagnostics
// ============================================================================

TEST(ClassifyDiagnostic, NotFoundIsWarning) {
    auto d = classify_store_error(StoreError(404, "NotFound", "not found"), "Read", kTarget);
    EXPECT_EQ(d.severity, Severity::Warning);
    EXPECT_EQ(d.summary, "Read: Resource Not Found");
}

TEST(ClassifyDiagnostic, Forbidden) {
    auto d = classify_store_error(StoreError(403, "Forbidden", "denied"), "Create", kTarget);
    EXPECT_EQ(d.severity, Severity::Error);
    EXPECT_EQ(d.summary, "Create: Insufficient Permissions");
}

TEST(ClassifyDiagnostic, ConflictListsFields) {
    auto d = classify_store_error(
        StoreError(409, "Conflict",
                   "Apply failed with 1 conflict: conflict with \"kubectl\" using v1: .data.a"),
        "Update", kTarget);
    EXPECT_EQ(d.summary, "Update: Field Manager Conflict");
    EXPECT_NE(d.detail.find("- data.a: managed by \"kubectl\""), std::string::npos);
}

TEST(ClassifyDiagnostic, Timeouts) {
    EXPECT_EQ(classify_store_error(StoreError(504, "", "gateway"), "Read", kTarget).summary,
              "Read: Store Timeout");
    EXPECT_EQ(classify_store_error(StoreError(500, "", "request timeout exceeded"), "Read",
                                   kTarget).summary,
              "Read: Store Timeout");
}

TEST(ClassifyDiagnostic, Unauthorized) {
    EXPECT_EQ(classify_store_error(StoreError(401, "Unauthorized", "token"), "Read",
                                   kTarget).summary,
              "Read: Authentication Failed");
}

TEST(ClassifyDiagnostic, FieldValidationBeforeInvalid) {
    auto d = classify_store_error(
        StoreError(400, "BadRequest",
                   "strict decoding error: unknown field \"spec.foo\", unknown field \"spec.bar\""),
        "Create", kTarget);
    EXPECT_EQ(d.summary, "Create: Field Validation Failed");
    EXPECT_NE(d.detail.find("Found 2 field validation errors"), std::string::npos);
}

TEST(ClassifyDiagnostic, ImmutableAndInvalid) {
    auto immutable = classify_store_error(
        StoreError(422, "Invalid", "spec.selector: Invalid value: field is immutable"),
        "Update", kTarget);
    EXPECT_EQ(immutable.summary, "Update: Immutable Field Changed");
    EXPECT_NE(immutable.detail.find("[spec.selector]"), std::string::npos);

    auto invalid = classify_store_error(
        StoreError(422, "Invalid", "spec.replicas: Invalid value: -1"), "Update", kTarget);
    EXPECT_EQ(invalid.summary, "Update: Invalid Resource");
}

TEST(ClassifyDiagnostic, Generic) {
    auto d = classify_store_error(StoreError(500, "InternalError", "boom"), "Delete", kTarget);
    EXPECT_EQ(d.summary, "Delete: Store Error");
    EXPECT_NE(d.detail.find("boom"), std::string::npos);
}

// ============================================================================
// Structured rethrow
// ============================================================================

TEST(DecodeStoreError, Subclasses) {
    EXPECT_THROW(decode_store_error(StoreError(404, "NotFound", "x")), NotFoundError);
    EXPECT_THROW(decode_store_error(StoreError(409, "Conflict", "x")), StoreConflictError);
    EXPECT_THROW(decode_store_error(StoreError(400, "BadRequest", "unknown field \"a\"")),
                 FieldValidationError);
    EXPECT_THROW(decode_store_error(StoreError(422, "Invalid", "a: field is immutable")),
                 ImmutableFieldError);
}

TEST(DecodeStoreError, CarriesFields) {
    try {
        decode_store_error(StoreError(400, "BadRequest", "unknown field \"spec.foo\""));
        FAIL() << "expected FieldValidationError";
    } catch (const FieldValidationError& e) {
        EXPECT_EQ(e.fields(), std::vector<std::string>{"spec.foo"});
        EXPECT_EQ(e.code(), 400);
    }
}

TEST(DecodeStoreError, GenericRejection) {
    try {
        decode_store_error(StoreError(422, "Invalid", "data.a: Invalid value: too long"));
        FAIL() << "expected StoreRejectionError";
    } catch (const ImmutableFieldError&) {
        FAIL() << "not an immutable field";
    } catch (const StoreRejectionError& e) {
        EXPECT_EQ(e.code(), 422);
        EXPECT_EQ(e.reason(), "Invalid");
        EXPECT_TRUE(e.fields().empty());
    }
    EXPECT_THROW(decode_store_error(StoreError(400, "BadRequest", "malformed body")),
                 StoreRejectionError);
}

TEST(DecodeStoreError, OtherErrorsRethrownAsIs) {
    try {
        decode_store_error(StoreError(500, "InternalError", "boom"));
        FAIL() << "expected StoreError";
    } catch (const StoreRejectionError&) {
        FAIL() << "unexpected rejection subclass";
    } catch (const StoreError& e) {
        EXPECT_EQ(e.code(), 500);
    }
}
