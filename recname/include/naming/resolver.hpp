//! # Name Resolver
//!
//! Computes the schema identifier `(namespace, name, full_name)` for a type.
//!
//! ## Algorithm
//!
//! | Step              | Rule                                                          |
//! |-------------------|---------------------------------------------------------------|
//! | default namespace | owner path after scope normalization                          |
//! | erased name       | short name                                                    |
//! | generic name      | `Short__A_B` (argument short names only, declaration order)   |
//! | name              | override, else erased name if `erased`, else generic name     |
//! | namespace         | override (verbatim), else default namespace                   |
//! | full name         | `name` if the namespace is blank, else `namespace + "." + name` |
//!
//! Resolution is total and pure: no errors, no I/O and no shared mutable
//! state, so the same input always yields the same output and callers may
//! cache results or resolve from any number of threads.
//!
//! ## Example
//!
//! ```cpp
//! TypeDescriptor pair{"Pair", "com.example", {{"Int"}, {"String"}}};
//! auto resolved = resolve(pair, OverrideSet{});
//! // resolved.full_name == "com.example.Pair__Int_String"
//! ```

#ifndef RECNAME_NAMING_RESOLVER_HPP
#define RECNAME_NAMING_RESOLVER_HPP

#include "naming/override_set.hpp"
#include "naming/scope_normalizer.hpp"
#include "naming/type_descriptor.hpp"

#include <string>
#include <string_view>

namespace recname::naming {

/// Separates the base name from the encoded type arguments.
constexpr std::string_view GENERIC_SEPARATOR = "__";

/// Separates encoded type arguments from each other.
constexpr std::string_view ARGUMENT_SEPARATOR = "_";

/// The identifier a schema record is emitted under.
struct ResolvedName {
    std::string namespace_name; ///< May be empty
    std::string name;           ///< Never empty for a well-formed descriptor
    std::string full_name;

    [[nodiscard]] auto operator==(const ResolvedName& other) const -> bool = default;
};

/// The short name, type arguments dropped (`List<Int>` -> `List`).
[[nodiscard]] auto erased_name(const TypeDescriptor& descriptor) -> std::string;

/// The short name with argument short names encoded (`Pair<Int, String>` ->
/// `Pair__Int_String`). Arguments of arguments are not expanded.
[[nodiscard]] auto generic_name(const TypeDescriptor& descriptor) -> std::string;

/// Applies the name override and the erasure flag.
[[nodiscard]] auto select_name(const TypeDescriptor& descriptor, const OverrideSet& overrides)
    -> std::string;

/// Applies the namespace override, falling back to `default_namespace`.
[[nodiscard]] auto select_namespace(std::string_view default_namespace,
                                    const OverrideSet& overrides) -> std::string;

/// Joins namespace and name; a namespace made only of whitespace counts as empty.
[[nodiscard]] auto compose_full_name(std::string_view namespace_name, std::string_view name)
    -> std::string;

/// True when every character is whitespace or a control character (<= 0x20).
[[nodiscard]] auto is_blank(std::string_view text) -> bool;

/// Resolver bound to a scope normalization strategy.
///
/// The normalizer must outlive the resolver.
class NameResolver {
public:
    NameResolver() : normalizer_(&standard_normalizer()) {}
    explicit NameResolver(const ScopeNormalizer& normalizer) : normalizer_(&normalizer) {}

    /// Namespace used when no namespace override is present.
    [[nodiscard]] auto default_namespace(const TypeDescriptor& descriptor) const -> std::string;

    [[nodiscard]] auto resolve(const TypeDescriptor& descriptor,
                               const OverrideSet& overrides) const -> ResolvedName;

private:
    const ScopeNormalizer* normalizer_;
};

/// Resolves with the standard scope normalizer.
[[nodiscard]] auto resolve(const TypeDescriptor& descriptor, const OverrideSet& overrides)
    -> ResolvedName;

} // namespace recname::naming

#endif // RECNAME_NAMING_RESOLVER_HPP
