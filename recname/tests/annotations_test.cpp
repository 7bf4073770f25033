//! # Annotation Extraction Tests

#include "common.hpp"
#include "frontend/annotations.hpp"

#include <gtest/gtest.h>
#include <vector>

using namespace recname;
using namespace recname::frontend;

TEST(ParseAnnotationTest, KindOnly) {
    EXPECT_EQ(parse_annotation("erased"), (Annotation{"erased", std::nullopt}));
}

TEST(ParseAnnotationTest, KindAndValue) {
    EXPECT_EQ(parse_annotation("namespace=com.example"), (Annotation{"namespace", "com.example"}));
}

TEST(ParseAnnotationTest, ValueKeepsLaterEqualsSigns) {
    EXPECT_EQ(parse_annotation("name=a=b"), (Annotation{"name", "a=b"}));
}

TEST(ParseAnnotationTest, EmptyValueIsPresent) {
    auto annotation = parse_annotation("namespace=");

    ASSERT_TRUE(annotation.value.has_value());
    EXPECT_EQ(*annotation.value, "");
}

TEST(ExtractOverridesTest, NoAnnotationsMeansNoOverrides) {
    auto result = extract_overrides({});

    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(unwrap(result).is_empty());
}

TEST(ExtractOverridesTest, CollectsAllKinds) {
    std::vector<Annotation> annotations = {
        {"name", "Custom"}, {"namespace", "org.other"}, {"erased", std::nullopt}};
    auto result = extract_overrides(annotations);

    ASSERT_TRUE(is_ok(result));
    const auto& overrides = unwrap(result);
    EXPECT_EQ(overrides.name, "Custom");
    EXPECT_EQ(overrides.namespace_name, "org.other");
    EXPECT_TRUE(overrides.erased);
}

TEST(ExtractOverridesTest, AcceptsAvroAliases) {
    std::vector<Annotation> annotations = {{"AvroName", "Renamed"},
                                           {"AvroNamespace", "ns"},
                                           {"AvroErasedName", std::nullopt}};
    auto result = extract_overrides(annotations);

    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).name, "Renamed");
    EXPECT_EQ(unwrap(result).namespace_name, "ns");
    EXPECT_TRUE(unwrap(result).erased);
}

TEST(ExtractOverridesTest, FirstOccurrenceWins) {
    std::vector<Annotation> annotations = {
        {"name", "First"}, {"name", "Second"}, {"namespace", "a"}, {"AvroNamespace", "b"}};
    auto result = extract_overrides(annotations);

    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).name, "First");
    EXPECT_EQ(unwrap(result).namespace_name, "a");
}

TEST(ExtractOverridesTest, UnrelatedAnnotationsAreIgnored) {
    std::vector<Annotation> annotations = {{"doc", "A record"}, {"deprecated", std::nullopt}};
    auto result = extract_overrides(annotations);

    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(unwrap(result).is_empty());
}

TEST(ExtractOverridesTest, NameWithoutValueIsRejected) {
    std::vector<Annotation> annotations = {{"name", std::nullopt}};
    auto result = extract_overrides(annotations);

    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).find("requires a value"), std::string::npos);
}

TEST(ExtractOverridesTest, NamespaceWithoutValueIsRejected) {
    std::vector<Annotation> annotations = {{"AvroNamespace", std::nullopt}};

    EXPECT_TRUE(is_err(extract_overrides(annotations)));
}

TEST(ExtractOverridesTest, ErasedRejectsAValue) {
    for (const char* value : {"false", "true", ""}) {
        std::vector<Annotation> annotations = {{"erased", value}};
        auto result = extract_overrides(annotations);

        ASSERT_TRUE(is_err(result)) << value;
        EXPECT_EQ(unwrap_err(result), "annotation 'erased' takes no value");
    }
    std::vector<Annotation> aliased = {{"AvroErasedName", "false"}};
    EXPECT_TRUE(is_err(extract_overrides(aliased)));
}
