//! # Scope Normalizer Tests

#include "naming/scope_normalizer.hpp"

#include <gtest/gtest.h>

using namespace recname::naming;

TEST(LocalScopeNormalizerTest, StripsLocalScopeAndPackageSuffix) {
    LocalScopeNormalizer normalizer;

    EXPECT_EQ(normalizer.normalize("com.example.<local MyMethod>.inner.package"),
              "com.example.inner");
}

TEST(LocalScopeNormalizerTest, StripsEveryLocalScope) {
    LocalScopeNormalizer normalizer;

    EXPECT_EQ(normalizer.normalize("a.<local f>.b.<local g>.c"), "a.b.c");
    EXPECT_EQ(normalizer.normalize("a.<local f>.<local g>"), "a");
}

TEST(LocalScopeNormalizerTest, MarkerEndsAtFirstClosingBracket) {
    LocalScopeNormalizer normalizer;

    EXPECT_EQ(normalizer.normalize("a.<local f>.b>c"), "a.b>c");
}

TEST(LocalScopeNormalizerTest, UnterminatedMarkerIsKept) {
    LocalScopeNormalizer normalizer;

    EXPECT_EQ(normalizer.normalize("a.<local f.b"), "a.<local f.b");
}

TEST(LocalScopeNormalizerTest, MarkerWithoutLeadingDotIsKept) {
    LocalScopeNormalizer normalizer;

    EXPECT_EQ(normalizer.normalize("<local f>.a"), "<local f>.a");
}

TEST(LocalScopeNormalizerTest, PackageSuffixStrippedOnce) {
    LocalScopeNormalizer normalizer;

    EXPECT_EQ(normalizer.normalize("com.example.package.package"), "com.example.package");
    EXPECT_EQ(normalizer.normalize("com.example.package"), "com.example");
}

TEST(LocalScopeNormalizerTest, PackageWithoutDotIsKept) {
    LocalScopeNormalizer normalizer;

    EXPECT_EQ(normalizer.normalize("package"), "package");
    EXPECT_EQ(normalizer.normalize("com.mypackage"), "com.mypackage");
    EXPECT_EQ(normalizer.normalize("com.package.inner"), "com.package.inner");
}

TEST(LocalScopeNormalizerTest, EmptyPathStaysEmpty) {
    EXPECT_EQ(LocalScopeNormalizer().normalize(""), "");
}

TEST(LocalScopeNormalizerTest, CustomOptions) {
    NormalizerOptions options;
    options.local_scope_prefix = ".$anon";
    options.local_scope_suffix = '$';
    options.package_segment = "module";
    LocalScopeNormalizer normalizer(options);

    EXPECT_EQ(normalizer.normalize("app.$anon1$.models.module"), "app.models");
    EXPECT_EQ(normalizer.normalize("app.<local f>.package"), "app.<local f>.package");
}

TEST(LocalScopeNormalizerTest, EmptyPackageSegmentDisablesSuffixStripping) {
    NormalizerOptions options;
    options.package_segment = "";

    EXPECT_EQ(LocalScopeNormalizer(options).normalize("com.example.package"),
              "com.example.package");
}

TEST(IdentityNormalizerTest, ReturnsInputUnchanged) {
    EXPECT_EQ(IdentityNormalizer().normalize("com.<local f>.x.package"), "com.<local f>.x.package");
}

TEST(StandardNormalizerTest, UsesDefaultOptions) {
    EXPECT_EQ(standard_normalizer().normalize("com.example.<local f>.package"), "com.example");
}
