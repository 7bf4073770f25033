//! # CLI Utilities Interface
//!
//! | Function          | Description                         |
//! |-------------------|-------------------------------------|
//! | `json_escape()`   | Escape a string for a JSON literal  |
//! | `print_usage()`   | Print CLI help text                 |
//! | `print_version()` | Print library version               |

#pragma once
#include <ostream>
#include <string>
#include <string_view>

namespace recname::cli {

std::string json_escape(std::string_view text);

void print_usage(std::ostream& out);
void print_version(std::ostream& out);

} // namespace recname::cli
