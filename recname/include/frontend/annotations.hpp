//! # Annotation Extraction
//!
//! Turns the annotations attached to a type into an `OverrideSet`. The
//! resolver never looks at annotations itself; front ends scan them once here.
//!
//! ## Recognized Annotations
//!
//! | Kind        | Alias            | Value    | Effect                        |
//! |-------------|------------------|----------|-------------------------------|
//! | `name`      | `AvroName`       | required | replaces the derived name     |
//! | `namespace` | `AvroNamespace`  | required | replaces the derived namespace|
//! | `erased`    | `AvroErasedName` | none     | drops type arguments          |
//!
//! Any other kind is ignored. When a kind occurs more than once the first
//! occurrence wins. An `erased` annotation carrying a value is rejected.

#ifndef RECNAME_FRONTEND_ANNOTATIONS_HPP
#define RECNAME_FRONTEND_ANNOTATIONS_HPP

#include "common.hpp"
#include "naming/override_set.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace recname::frontend {

/// One annotation as read off a type: a kind and an optional argument.
struct Annotation {
    std::string kind;
    std::optional<std::string> value;

    [[nodiscard]] auto operator==(const Annotation& other) const -> bool = default;
};

/// Parses `kind` or `kind=value`. Everything after the first '=' is the value,
/// so `namespace=` yields an empty (but present) value.
[[nodiscard]] auto parse_annotation(std::string_view text) -> Annotation;

/// Collects the overrides carried by `annotations`.
/// Fails when `name` or `namespace` has no value.
[[nodiscard]] auto extract_overrides(std::span<const Annotation> annotations)
    -> Result<naming::OverrideSet, std::string>;

} // namespace recname::frontend

#endif // RECNAME_FRONTEND_ANNOTATIONS_HPP
