//! # Owner Path Normalization
//!
//! Owner paths reported by a type system can contain scope segments that must
//! not appear in a schema namespace:
//!
//! - block- or function-local scopes, rendered as `.<local fnName>`
//! - package-object scopes, rendered as a trailing `.package` segment
//!
//! Only the front end that produced the path knows how its local scopes are
//! spelled, so normalization is a pluggable strategy. The resolver applies it
//! to the *default* namespace only; explicit namespace overrides are never
//! normalized.
//!
//! ## Example
//!
//! ```cpp
//! LocalScopeNormalizer normalizer;
//! normalizer.normalize("com.example.<local run>.inner.package"); // "com.example.inner"
//! ```

#ifndef RECNAME_NAMING_SCOPE_NORMALIZER_HPP
#define RECNAME_NAMING_SCOPE_NORMALIZER_HPP

#include <string>
#include <string_view>

namespace recname::naming {

/// Strategy that turns a raw owner path into a namespace candidate.
class ScopeNormalizer {
public:
    virtual ~ScopeNormalizer() = default;

    /// Must be a pure function of its input; called concurrently.
    [[nodiscard]] virtual auto normalize(std::string_view owner_path) const -> std::string = 0;
};

/// Leaves owner paths untouched.
class IdentityNormalizer : public ScopeNormalizer {
public:
    [[nodiscard]] auto normalize(std::string_view owner_path) const -> std::string override;
};

/// Spelling of the scope segments removed by LocalScopeNormalizer.
struct NormalizerOptions {
    /// Start of a local/anonymous scope segment, including its leading dot.
    std::string local_scope_prefix = ".<local ";

    /// Character that closes a local scope segment.
    char local_scope_suffix = '>';

    /// Name of the trailing package-object segment (stripped once, with its dot).
    /// An empty name disables suffix stripping.
    std::string package_segment = "package";
};

/// Removes local scope segments, then one trailing package-object segment.
class LocalScopeNormalizer : public ScopeNormalizer {
public:
    LocalScopeNormalizer() = default;
    explicit LocalScopeNormalizer(NormalizerOptions options);

    [[nodiscard]] auto normalize(std::string_view owner_path) const -> std::string override;

    [[nodiscard]] auto options() const -> const NormalizerOptions& {
        return options_;
    }

private:
    NormalizerOptions options_;
};

/// Shared LocalScopeNormalizer with default options.
[[nodiscard]] auto standard_normalizer() -> const ScopeNormalizer&;

} // namespace recname::naming

#endif // RECNAME_NAMING_SCOPE_NORMALIZER_HPP
