//! # Resolve and Describe Commands
//!
//! ## Exit Codes
//!
//! | Code | Meaning                                   |
//! |------|-------------------------------------------|
//! | 0    | Every type was resolved                   |
//! | 1    | A type or annotation was rejected         |
//! | 2    | Usage error (unknown option, no types)    |

#pragma once

#include "common.hpp"
#include "frontend/annotations.hpp"
#include "naming/scope_normalizer.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace recname::cli {

enum class OutputFormat { Text, JSON };

enum class Command { Resolve, Describe };

/// Options shared by `resolve` and `describe`.
struct ResolveOptions {
    std::vector<std::string> types;
    /// --name, --namespace, --erased and --annotation in command-line order.
    std::vector<frontend::Annotation> annotations;
    OutputFormat format = OutputFormat::Text;
    naming::NormalizerOptions normalizer;
    bool normalize = true;
};

/// Parses the arguments following the command name. Logging options are skipped.
/// `describe` accepts only `--format`; override and normalizer flags are rejected.
Result<ResolveOptions, std::string> parse_resolve_options(const std::vector<std::string>& args,
                                                          Command command = Command::Resolve);

int run_resolve(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
int run_describe(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace recname::cli
