//! # Type Expression Front End Tests
//!
//! Parsing of qualified names, type arguments in both bracket styles,
//! local scope segments, and error reporting.

#include "common.hpp"
#include "frontend/type_expr.hpp"
#include "naming/resolver.hpp"

#include <gtest/gtest.h>

using namespace recname;
using namespace recname::frontend;
using recname::naming::TypeDescriptor;

namespace {

TypeDescriptor parse_ok(std::string_view text) {
    auto result = parse_type_expr(text);
    EXPECT_TRUE(is_ok(result)) << "failed to parse '" << text
                               << "': " << (is_err(result) ? unwrap_err(result).message : "");
    return is_ok(result) ? unwrap(result) : TypeDescriptor{};
}

TypeExprError parse_err(std::string_view text) {
    auto result = parse_type_expr(text);
    EXPECT_TRUE(is_err(result)) << "unexpectedly parsed '" << text << "'";
    return is_err(result) ? unwrap_err(result) : TypeExprError{};
}

} // namespace

// ============================================================================
// Accepted Expressions
// ============================================================================

TEST(TypeExprTest, QualifiedName) {
    auto descriptor = parse_ok("com.example.List");

    EXPECT_EQ(descriptor.short_name, "List");
    EXPECT_EQ(descriptor.owner_path, "com.example");
    EXPECT_TRUE(descriptor.type_arguments.empty());
}

TEST(TypeExprTest, UnqualifiedName) {
    auto descriptor = parse_ok("Event");

    EXPECT_EQ(descriptor.short_name, "Event");
    EXPECT_EQ(descriptor.owner_path, "");
}

TEST(TypeExprTest, AngleBracketArguments) {
    auto descriptor = parse_ok("com.example.Pair<Int, String>");

    EXPECT_EQ(descriptor, (TypeDescriptor{"Pair", "com.example", {{"Int"}, {"String"}}}));
}

TEST(TypeExprTest, SquareBracketArguments) {
    auto descriptor = parse_ok("scala.collection.Map[scala.Predef.String, scala.Int]");

    EXPECT_EQ(descriptor, (TypeDescriptor{"Map",
                                          "scala.collection",
                                          {{"String", "scala.Predef"}, {"Int", "scala"}}}));
}

TEST(TypeExprTest, NestedArgumentsArePreserved) {
    auto descriptor = parse_ok("app.Box<std.List<Int>, Map[String, Long]>");

    ASSERT_EQ(descriptor.type_arguments.size(), 2u);
    EXPECT_EQ(descriptor.type_arguments[0],
              (TypeDescriptor{"List", "std", {{"Int"}}}));
    EXPECT_EQ(descriptor.type_arguments[1],
              (TypeDescriptor{"Map", "", {{"String"}, {"Long"}}}));
}

TEST(TypeExprTest, WhitespaceIsIgnored) {
    auto descriptor = parse_ok("  com . example . Pair <  Int ,String >  ");

    EXPECT_EQ(descriptor, (TypeDescriptor{"Pair", "com.example", {{"Int"}, {"String"}}}));
}

TEST(TypeExprTest, LocalScopeSegmentsStayInOwnerPath) {
    auto descriptor = parse_ok("com.example.<local MyMethod>.inner.package.Event");

    EXPECT_EQ(descriptor.short_name, "Event");
    EXPECT_EQ(descriptor.owner_path, "com.example.<local MyMethod>.inner.package");
}

TEST(TypeExprTest, ParsedLocalTypeResolvesToNormalizedNamespace) {
    auto resolved = naming::resolve(parse_ok("com.example.<local MyMethod>.inner.package.Event"),
                                    naming::OverrideSet{});

    EXPECT_EQ(resolved.namespace_name, "com.example.inner");
    EXPECT_EQ(resolved.full_name, "com.example.inner.Event");
}

// ============================================================================
// Rejected Expressions
// ============================================================================

TEST(TypeExprErrorTest, EmptyInput) {
    EXPECT_EQ(parse_err("").message, "empty type expression");
    EXPECT_EQ(parse_err("   ").message, "empty type expression");
}

TEST(TypeExprErrorTest, MissingNameAfterDot) {
    auto error = parse_err("com.example.");

    EXPECT_EQ(error.message, "expected type name");
    EXPECT_EQ(error.offset, 12u);
}

TEST(TypeExprErrorTest, LeadingDot) {
    EXPECT_EQ(parse_err(".List").message, "expected type name");
}

TEST(TypeExprErrorTest, ScopeMarkerCannotBeTheTypeName) {
    auto error = parse_err("com.<local f>");

    EXPECT_EQ(error.message, "type name expected after scope marker");
    EXPECT_EQ(error.offset, 4u);
}

TEST(TypeExprErrorTest, NestedBracketInsideScopeMarker) {
    auto error = parse_err("a.<local f<g>>.C");

    EXPECT_EQ(error.message, "'<' inside scope marker");
    EXPECT_EQ(error.offset, 10u);
    EXPECT_EQ(parse_err("a.<local f<g").message, "'<' inside scope marker");
}

TEST(TypeExprErrorTest, UnterminatedScopeMarker) {
    EXPECT_EQ(parse_err("com.<local f.Event").message, "unterminated scope marker");
}

TEST(TypeExprErrorTest, EmptyArgumentList) {
    EXPECT_EQ(parse_err("List<>").message, "empty type argument list");
    EXPECT_EQ(parse_err("List[ ]").message, "empty type argument list");
}

TEST(TypeExprErrorTest, MismatchedBrackets) {
    EXPECT_EQ(parse_err("List<Int]").message, "expected ',' or '>' in type argument list");
    EXPECT_EQ(parse_err("Pair<Int, String").message, "expected ',' or '>' in type argument list");
}

TEST(TypeExprErrorTest, TrailingComma) {
    EXPECT_EQ(parse_err("Pair<Int,>").message, "expected type name");
}

TEST(TypeExprErrorTest, TrailingInput) {
    auto error = parse_err("List<Int> extra");

    EXPECT_EQ(error.message, "unexpected 'e'");
    EXPECT_EQ(error.offset, 10u);
}

TEST(TypeExprErrorTest, ExcessiveNesting) {
    std::string text;
    for (int i = 0; i < 100; ++i) {
        text += "L<";
    }
    text += "Int";
    text += std::string(100, '>');

    EXPECT_EQ(parse_err(text).message, "type arguments nested too deeply");
}

TEST(TypeExprErrorTest, ErrorRendering) {
    EXPECT_EQ(to_string(TypeExprError{"expected type name", 3}), "offset 3: expected type name");
}
