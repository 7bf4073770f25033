//! # Type Expression Front End
//!
//! Builds descriptors from textual type expressions, the form in which
//! runtime metadata (reflection output, schema tooling, command lines)
//! reports types.
//!
//! ## Grammar
//!
//! ```text
//! type     := path [ args ]
//! path     := segment { '.' segment }
//! segment  := identifier | '<' chars '>'          (local/anonymous scope)
//! args     := '<' type { ',' type } '>'
//!           | '[' type { ',' type } ']'
//! ```
//!
//! The last segment is the short name. The preceding segments, joined with
//! '.', are the owner path, kept verbatim: local scope segments are removed
//! later by the resolver's scope normalizer.
//!
//! ## Examples
//!
//! | Input                                    | short  | owner                      | args        |
//! |------------------------------------------|--------|----------------------------|-------------|
//! | `com.example.Pair<Int, String>`          | Pair   | com.example                | Int, String |
//! | `scala.collection.List[scala.Int]`       | List   | scala.collection           | Int         |
//! | `app.<local run>.Event`                  | Event  | app.<local run>            |             |

#ifndef RECNAME_FRONTEND_TYPE_EXPR_HPP
#define RECNAME_FRONTEND_TYPE_EXPR_HPP

#include "common.hpp"
#include "naming/type_descriptor.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace recname::frontend {

/// A parse failure with the byte offset where it was detected.
struct TypeExprError {
    std::string message;
    size_t offset;
};

/// Parses a complete type expression.
[[nodiscard]] auto parse_type_expr(std::string_view text)
    -> Result<naming::TypeDescriptor, TypeExprError>;

/// Renders an error as `offset N: message`.
[[nodiscard]] auto to_string(const TypeExprError& error) -> std::string;

} // namespace recname::frontend

#endif // RECNAME_FRONTEND_TYPE_EXPR_HPP
