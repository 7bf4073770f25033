//! # Owner Path Normalization Implementation
//!
//! Local scope markers are matched non-greedily: each marker runs from the
//! prefix to the first closing character after it. An unterminated marker is
//! kept as-is.

#include "naming/scope_normalizer.hpp"

#include <utility>

namespace recname::naming {

auto IdentityNormalizer::normalize(std::string_view owner_path) const -> std::string {
    return std::string(owner_path);
}

LocalScopeNormalizer::LocalScopeNormalizer(NormalizerOptions options)
    : options_(std::move(options)) {}

auto LocalScopeNormalizer::normalize(std::string_view owner_path) const -> std::string {
    std::string result(owner_path);

    const auto& prefix = options_.local_scope_prefix;
    if (!prefix.empty()) {
        size_t pos = 0;
        while ((pos = result.find(prefix, pos)) != std::string::npos) {
            size_t close = result.find(options_.local_scope_suffix, pos + prefix.size());
            if (close == std::string::npos) {
                break;
            }
            result.erase(pos, close - pos + 1);
        }
    }

    if (!options_.package_segment.empty()) {
        std::string suffix = "." + options_.package_segment;
        if (result.ends_with(suffix)) {
            result.erase(result.size() - suffix.size());
        }
    }

    return result;
}

auto standard_normalizer() -> const ScopeNormalizer& {
    static const LocalScopeNormalizer normalizer;
    return normalizer;
}

} // namespace recname::naming
