//! # Resolve and Describe Commands
//!
//! `resolve` runs every type expression through the type-expression front
//! end, the annotation extractor and the name resolver. `describe` stops
//! after the front end and prints the descriptor.

#include "cmd_resolve.hpp"

#include "frontend/type_expr.hpp"
#include "log/log.hpp"
#include "naming/resolver.hpp"
#include "utils.hpp"

#include <memory>
#include <string_view>

namespace recname::cli {

namespace {

void print_resolved(std::ostream& out, OutputFormat format, const std::string& type,
                    const naming::ResolvedName& resolved, bool first) {
    if (format == OutputFormat::JSON) {
        out << "{\"type\":\"" << json_escape(type) << "\","
            << "\"namespace\":\"" << json_escape(resolved.namespace_name) << "\","
            << "\"name\":\"" << json_escape(resolved.name) << "\","
            << "\"full_name\":\"" << json_escape(resolved.full_name) << "\"}\n";
        return;
    }
    if (!first) {
        out << "\n";
    }
    out << "namespace: " << resolved.namespace_name << "\n"
        << "name: " << resolved.name << "\n"
        << "full_name: " << resolved.full_name << "\n";
}

void print_descriptor(std::ostream& out, OutputFormat format, const std::string& type,
                      const naming::TypeDescriptor& descriptor, bool first) {
    if (format == OutputFormat::JSON) {
        out << "{\"type\":\"" << json_escape(type) << "\","
            << "\"short_name\":\"" << json_escape(descriptor.short_name) << "\","
            << "\"owner_path\":\"" << json_escape(descriptor.owner_path) << "\","
            << "\"type_arguments\":[";
        for (size_t i = 0; i < descriptor.type_arguments.size(); ++i) {
            out << (i > 0 ? "," : "") << "\""
                << json_escape(naming::to_string(descriptor.type_arguments[i])) << "\"";
        }
        out << "]}\n";
        return;
    }
    if (!first) {
        out << "\n";
    }
    out << "short_name: " << descriptor.short_name << "\n"
        << "owner_path: " << descriptor.owner_path << "\n"
        << "type_arguments:";
    for (size_t i = 0; i < descriptor.type_arguments.size(); ++i) {
        out << (i > 0 ? ", " : " ") << naming::to_string(descriptor.type_arguments[i]);
    }
    out << "\n";
}

bool is_resolve_only_option(std::string_view arg) {
    return arg.starts_with("--name=") || arg.starts_with("--namespace=") || arg == "--erased" ||
           arg.starts_with("--annotation=") || arg.starts_with("--package-segment=") ||
           arg.starts_with("--local-scope-prefix=") || arg == "--no-normalize";
}

} // namespace

Result<ResolveOptions, std::string> parse_resolve_options(const std::vector<std::string>& args,
                                                          Command command) {
    ResolveOptions options;

    for (const auto& arg : args) {
        if (log::is_log_option(arg)) {
            continue;
        }
        if (command == Command::Describe && is_resolve_only_option(arg)) {
            return "option '" + arg + "' is not accepted by describe";
        }

        if (arg.starts_with("--name=")) {
            options.annotations.push_back({"name", arg.substr(7)});
        } else if (arg.starts_with("--namespace=")) {
            options.annotations.push_back({"namespace", arg.substr(12)});
        } else if (arg == "--erased") {
            options.annotations.push_back({"erased", std::nullopt});
        } else if (arg.starts_with("--annotation=")) {
            options.annotations.push_back(frontend::parse_annotation(arg.substr(13)));
        } else if (arg.starts_with("--format=")) {
            std::string fmt = arg.substr(9);
            if (fmt == "json") {
                options.format = OutputFormat::JSON;
            } else if (fmt == "text") {
                options.format = OutputFormat::Text;
            } else {
                return "unknown output format '" + fmt + "'";
            }
        } else if (arg.starts_with("--package-segment=")) {
            options.normalizer.package_segment = arg.substr(18);
        } else if (arg.starts_with("--local-scope-prefix=")) {
            options.normalizer.local_scope_prefix = arg.substr(21);
        } else if (arg == "--no-normalize") {
            options.normalize = false;
        } else if (arg.starts_with("--")) {
            return "unknown option '" + arg + "'";
        } else {
            options.types.push_back(arg);
        }
    }

    if (options.types.empty()) {
        return std::string("no type expression given");
    }
    return options;
}

int run_resolve(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    auto parsed = parse_resolve_options(args);
    if (is_err(parsed)) {
        err << "error: " << unwrap_err(parsed) << "\n";
        err << "Usage: recname resolve <type>... [options]\n";
        return 2;
    }
    const auto& options = unwrap(parsed);

    auto overrides = frontend::extract_overrides(options.annotations);
    if (is_err(overrides)) {
        err << "error: " << unwrap_err(overrides) << "\n";
        return 1;
    }

    std::unique_ptr<naming::ScopeNormalizer> normalizer;
    if (options.normalize) {
        normalizer = std::make_unique<naming::LocalScopeNormalizer>(options.normalizer);
    } else {
        normalizer = std::make_unique<naming::IdentityNormalizer>();
    }
    naming::NameResolver resolver(*normalizer);

    int status = 0;
    bool first = true;
    for (const auto& type : options.types) {
        auto descriptor = frontend::parse_type_expr(type);
        if (is_err(descriptor)) {
            err << "error: cannot parse '" << type
                << "': " << frontend::to_string(unwrap_err(descriptor)) << "\n";
            status = 1;
            continue;
        }

        auto resolved = resolver.resolve(unwrap(descriptor), unwrap(overrides));
        RECNAME_LOG_DEBUG("cli", type << " -> " << resolved.full_name);
        print_resolved(out, options.format, type, resolved, first);
        first = false;
    }
    return status;
}

int run_describe(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    auto parsed = parse_resolve_options(args, Command::Describe);
    if (is_err(parsed)) {
        err << "error: " << unwrap_err(parsed) << "\n";
        err << "Usage: recname describe <type>... [--format=text|json]\n";
        return 2;
    }
    const auto& options = unwrap(parsed);

    int status = 0;
    bool first = true;
    for (const auto& type : options.types) {
        auto descriptor = frontend::parse_type_expr(type);
        if (is_err(descriptor)) {
            err << "error: cannot parse '" << type
                << "': " << frontend::to_string(unwrap_err(descriptor)) << "\n";
            status = 1;
            continue;
        }
        print_descriptor(out, options.format, type, unwrap(descriptor), first);
        first = false;
    }
    return status;
}

} // namespace recname::cli
