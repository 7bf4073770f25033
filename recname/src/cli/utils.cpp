//! # CLI Utilities

#include "utils.hpp"

#include "common.hpp"

#include <cstdio>

namespace recname::cli {

std::string json_escape(std::string_view text) {
    std::string result;
    result.reserve(text.size() + 2);
    for (char c : text) {
        switch (c) {
        case '"':
            result += "\\\"";
            break;
        case '\\':
            result += "\\\\";
            break;
        case '\n':
            result += "\\n";
            break;
        case '\r':
            result += "\\r";
            break;
        case '\t':
            result += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                result += buf;
            } else {
                result += c;
            }
        }
    }
    return result;
}

void print_usage(std::ostream& out) {
    out << "recname - schema record names for (generic) types\n"
        << "\n"
        << "Usage:\n"
        << "  recname resolve <type>... [options]   Print namespace, name and full name\n"
        << "  recname describe <type>...            Print the parsed type descriptor\n"
        << "  recname --help | --version\n"
        << "\n"
        << "Types are written as qualified names with optional arguments:\n"
        << "  com.example.Pair<Int, String>   scala.collection.List[scala.Int]\n"
        << "\n"
        << "Resolve options:\n"
        << "  --name=NAME                Use NAME instead of the derived name\n"
        << "  --namespace=NS             Use NS verbatim as the namespace\n"
        << "  --erased                   Leave type arguments out of the derived name\n"
        << "  --annotation=KIND[=VALUE]  Apply an annotation (name, namespace, erased)\n"
        << "  --format=text|json         Output format (default: text)\n"
        << "  --package-segment=NAME     Trailing scope segment to strip (default: package)\n"
        << "  --local-scope-prefix=TEXT  Start of a local scope marker (default: '.<local ')\n"
        << "  --no-normalize             Use owner paths as namespaces unchanged\n"
        << "\n"
        << "Logging options:\n"
        << "  --log-level=LEVEL  --log-filter=SPEC  --log-file=PATH  --log-format=text|json\n"
        << "  -v, -vv, -vvv, -q  (or the RECNAME_LOG environment variable)\n";
}

void print_version(std::ostream& out) {
    out << "recname " << VERSION << "\n";
}

} // namespace recname::cli
