//! # Type Descriptors
//!
//! A `TypeDescriptor` is the shape every front end reduces a type to before
//! asking the resolver for its schema name:
//!
//! | Field            | Example for `com.example.Pair<Int, String>` |
//! |------------------|---------------------------------------------|
//! | `short_name`     | `"Pair"`                                    |
//! | `owner_path`     | `"com.example"`                             |
//! | `type_arguments` | `[Int, String]` (declaration order)         |
//!
//! `short_name` must never be empty. Front ends construct descriptors through
//! `make_descriptor()`, which rejects empty names so a malformed identifier is
//! caught at the boundary instead of leaking into a schema.

#ifndef RECNAME_NAMING_TYPE_DESCRIPTOR_HPP
#define RECNAME_NAMING_TYPE_DESCRIPTOR_HPP

#include "common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace recname::naming {

/// Immutable description of a (possibly generic) type.
struct TypeDescriptor {
    /// Bare type name with no scope qualifiers and no type arguments.
    std::string short_name;

    /// Dotted path of the enclosing scope; empty for a top-level type.
    std::string owner_path;

    /// Type arguments in declaration order; empty for non-generic types.
    std::vector<TypeDescriptor> type_arguments;

    [[nodiscard]] auto is_generic() const -> bool {
        return !type_arguments.empty();
    }

    [[nodiscard]] auto operator==(const TypeDescriptor& other) const -> bool = default;
};

/// Builds a descriptor, rejecting an empty short name anywhere in the tree.
[[nodiscard]] auto make_descriptor(std::string short_name, std::string owner_path = {},
                                   std::vector<TypeDescriptor> type_arguments = {})
    -> Result<TypeDescriptor, std::string>;

/// Checks the non-empty short name invariant recursively.
/// Returns an empty string when the descriptor is well formed, else the reason.
[[nodiscard]] auto validate(const TypeDescriptor& descriptor) -> std::string;

/// `owner.Short`, or just `Short` when the owner path is empty.
[[nodiscard]] auto qualified_name(const TypeDescriptor& descriptor) -> std::string;

/// Renders `owner.Short<A, B<C>>` for diagnostics.
[[nodiscard]] auto to_string(const TypeDescriptor& descriptor) -> std::string;

} // namespace recname::naming

#endif // RECNAME_NAMING_TYPE_DESCRIPTOR_HPP
