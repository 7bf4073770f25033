//! # Type Descriptor Implementation
//!
//! Validation and display helpers for `TypeDescriptor`.

#include "naming/type_descriptor.hpp"

#include <sstream>

namespace recname::naming {

namespace {

auto validate_at(const TypeDescriptor& descriptor, const std::string& where) -> std::string {
    if (descriptor.short_name.empty()) {
        return "empty short name in " + where;
    }
    for (size_t i = 0; i < descriptor.type_arguments.size(); ++i) {
        auto reason = validate_at(descriptor.type_arguments[i], "type argument " +
                                                                    std::to_string(i) + " of '" +
                                                                    descriptor.short_name + "'");
        if (!reason.empty()) {
            return reason;
        }
    }
    return {};
}

void write_descriptor(std::ostringstream& out, const TypeDescriptor& descriptor) {
    out << qualified_name(descriptor);
    if (!descriptor.is_generic()) {
        return;
    }
    out << '<';
    for (size_t i = 0; i < descriptor.type_arguments.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        write_descriptor(out, descriptor.type_arguments[i]);
    }
    out << '>';
}

} // namespace

auto make_descriptor(std::string short_name, std::string owner_path,
                     std::vector<TypeDescriptor> type_arguments)
    -> Result<TypeDescriptor, std::string> {
    TypeDescriptor descriptor{std::move(short_name), std::move(owner_path),
                              std::move(type_arguments)};
    auto reason = validate(descriptor);
    if (!reason.empty()) {
        return reason;
    }
    return descriptor;
}

auto validate(const TypeDescriptor& descriptor) -> std::string {
    return validate_at(descriptor, "type descriptor");
}

auto qualified_name(const TypeDescriptor& descriptor) -> std::string {
    if (descriptor.owner_path.empty()) {
        return descriptor.short_name;
    }
    return descriptor.owner_path + "." + descriptor.short_name;
}

auto to_string(const TypeDescriptor& descriptor) -> std::string {
    std::ostringstream out;
    write_descriptor(out, descriptor);
    return out.str();
}

} // namespace recname::naming
