//! # Name Resolver Implementation

#include "naming/resolver.hpp"

namespace recname::naming {

auto erased_name(const TypeDescriptor& descriptor) -> std::string {
    return descriptor.short_name;
}

auto generic_name(const TypeDescriptor& descriptor) -> std::string {
    if (!descriptor.is_generic()) {
        return erased_name(descriptor);
    }

    std::string result = descriptor.short_name;
    result += GENERIC_SEPARATOR;
    for (size_t i = 0; i < descriptor.type_arguments.size(); ++i) {
        if (i > 0) {
            result += ARGUMENT_SEPARATOR;
        }
        result += descriptor.type_arguments[i].short_name;
    }
    return result;
}

auto select_name(const TypeDescriptor& descriptor, const OverrideSet& overrides) -> std::string {
    if (overrides.name) {
        return *overrides.name;
    }
    return overrides.erased ? erased_name(descriptor) : generic_name(descriptor);
}

auto select_namespace(std::string_view default_namespace, const OverrideSet& overrides)
    -> std::string {
    if (overrides.namespace_name) {
        return *overrides.namespace_name;
    }
    return std::string(default_namespace);
}

auto is_blank(std::string_view text) -> bool {
    for (char c : text) {
        if (static_cast<unsigned char>(c) > ' ') {
            return false;
        }
    }
    return true;
}

auto compose_full_name(std::string_view namespace_name, std::string_view name) -> std::string {
    if (is_blank(namespace_name)) {
        return std::string(name);
    }
    std::string result;
    result.reserve(namespace_name.size() + 1 + name.size());
    result += namespace_name;
    result += '.';
    result += name;
    return result;
}

auto NameResolver::default_namespace(const TypeDescriptor& descriptor) const -> std::string {
    return normalizer_->normalize(descriptor.owner_path);
}

auto NameResolver::resolve(const TypeDescriptor& descriptor, const OverrideSet& overrides) const
    -> ResolvedName {
    ResolvedName resolved;
    resolved.name = select_name(descriptor, overrides);
    // The normalizer only ever sees the owner path, never an override.
    resolved.namespace_name = select_namespace(default_namespace(descriptor), overrides);
    resolved.full_name = compose_full_name(resolved.namespace_name, resolved.name);
    return resolved;
}

auto resolve(const TypeDescriptor& descriptor, const OverrideSet& overrides) -> ResolvedName {
    return NameResolver().resolve(descriptor, overrides);
}

} // namespace recname::naming
