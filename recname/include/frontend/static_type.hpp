//! # Static Type Front End
//!
//! Derives descriptors and overrides from C++ types at compile time. A type
//! opts in by specializing `TypeName<T>`:
//!
//! ```cpp
//! namespace recname::frontend {
//! template <typename A, typename B> struct TypeName<example::Pair<A, B>> {
//!     static constexpr std::string_view short_name = "Pair";
//!     static constexpr std::string_view owner = "com.example";
//!     using arguments = TypeList<A, B>;
//! };
//! } // namespace recname::frontend
//! ```
//!
//! Optional members play the role of annotations:
//!
//! | Member                                               | Override  |
//! |------------------------------------------------------|-----------|
//! | `static constexpr std::string_view record_name`      | name      |
//! | `static constexpr std::string_view record_namespace` | namespace |
//! | `static constexpr bool erased`                       | erased    |
//!
//! An empty `short_name` fails the build. Descriptors produced here are
//! identical to those `parse_type_expr()` builds for the same spelling, so
//! both front ends resolve to the same schema names.

#ifndef RECNAME_FRONTEND_STATIC_TYPE_HPP
#define RECNAME_FRONTEND_STATIC_TYPE_HPP

#include "naming/override_set.hpp"
#include "naming/resolver.hpp"
#include "naming/type_descriptor.hpp"

#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace recname::frontend {

/// Ordered list of type arguments.
template <typename... Ts> struct TypeList {};

/// Naming traits; specialize for every type that needs a schema name.
template <typename T> struct TypeName;

template <> struct TypeName<bool> {
    static constexpr std::string_view short_name = "Boolean";
};

template <> struct TypeName<int32_t> {
    static constexpr std::string_view short_name = "Int";
};

template <> struct TypeName<int64_t> {
    static constexpr std::string_view short_name = "Long";
};

template <> struct TypeName<float> {
    static constexpr std::string_view short_name = "Float";
};

template <> struct TypeName<double> {
    static constexpr std::string_view short_name = "Double";
};

template <> struct TypeName<std::string> {
    static constexpr std::string_view short_name = "String";
};

namespace detail {

template <typename T>
concept HasOwner = requires {
    { TypeName<T>::owner } -> std::convertible_to<std::string_view>;
};

template <typename T>
concept HasArguments = requires { typename TypeName<T>::arguments; };

template <typename T>
concept HasRecordName = requires {
    { TypeName<T>::record_name } -> std::convertible_to<std::string_view>;
};

template <typename T>
concept HasRecordNamespace = requires {
    { TypeName<T>::record_namespace } -> std::convertible_to<std::string_view>;
};

template <typename T>
concept HasErased = requires {
    { TypeName<T>::erased } -> std::convertible_to<bool>;
};

template <typename T> auto describe_impl() -> naming::TypeDescriptor;

template <typename List> struct ArgumentDescriptors;

template <typename... Ts> struct ArgumentDescriptors<TypeList<Ts...>> {
    static auto collect() -> std::vector<naming::TypeDescriptor> {
        return {describe_impl<Ts>()...};
    }
};

template <typename T> auto describe_impl() -> naming::TypeDescriptor {
    static_assert(!TypeName<T>::short_name.empty(), "TypeName<T>::short_name must not be empty");

    naming::TypeDescriptor descriptor;
    descriptor.short_name = std::string(TypeName<T>::short_name);
    if constexpr (HasOwner<T>) {
        descriptor.owner_path = std::string(TypeName<T>::owner);
    }
    if constexpr (HasArguments<T>) {
        using Arguments = typename TypeName<T>::arguments;
        descriptor.type_arguments = ArgumentDescriptors<Arguments>::collect();
    }
    return descriptor;
}

} // namespace detail

/// Descriptor for `T`, built from its `TypeName` specialization.
template <typename T> auto describe() -> naming::TypeDescriptor {
    return detail::describe_impl<T>();
}

/// Overrides declared on `T`'s `TypeName` specialization.
template <typename T> auto overrides_of() -> naming::OverrideSet {
    naming::OverrideSet overrides;
    if constexpr (detail::HasRecordName<T>) {
        overrides.name = std::string(TypeName<T>::record_name);
    }
    if constexpr (detail::HasRecordNamespace<T>) {
        overrides.namespace_name = std::string(TypeName<T>::record_namespace);
    }
    if constexpr (detail::HasErased<T>) {
        overrides.erased = TypeName<T>::erased;
    }
    return overrides;
}

/// Schema name for `T` using the standard scope normalizer.
template <typename T> auto resolve_type() -> naming::ResolvedName {
    return naming::resolve(describe<T>(), overrides_of<T>());
}

/// Schema name for `T` using a caller-supplied resolver.
template <typename T>
auto resolve_type(const naming::NameResolver& resolver) -> naming::ResolvedName {
    return resolver.resolve(describe<T>(), overrides_of<T>());
}

} // namespace recname::frontend

#endif // RECNAME_FRONTEND_STATIC_TYPE_HPP
