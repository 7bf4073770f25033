//! # Override Sets
//!
//! User-supplied overrides for a type's schema name. Every field is
//! independent; the default-constructed value means "derive everything".

#ifndef RECNAME_NAMING_OVERRIDE_SET_HPP
#define RECNAME_NAMING_OVERRIDE_SET_HPP

#include <optional>
#include <string>

namespace recname::naming {

struct OverrideSet {
    /// Replaces the derived name outright.
    std::optional<std::string> name;

    /// Replaces the derived namespace outright, used verbatim.
    std::optional<std::string> namespace_name;

    /// Drop type arguments from the derived name. Ignored when `name` is set.
    bool erased = false;

    [[nodiscard]] auto is_empty() const -> bool {
        return !name && !namespace_name && !erased;
    }

    [[nodiscard]] auto operator==(const OverrideSet& other) const -> bool = default;
};

} // namespace recname::naming

#endif // RECNAME_NAMING_OVERRIDE_SET_HPP
