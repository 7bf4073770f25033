//! # Type Expression Parser
//!
//! Recursive descent over the grammar in `frontend/type_expr.hpp`.
//! Every descriptor is built through `make_descriptor()`, so an expression
//! that would produce an empty short name is rejected here.

#include "frontend/type_expr.hpp"

#include "log/log.hpp"

#include <cctype>
#include <vector>

namespace recname::frontend {

namespace {

/// Deepest accepted nesting of type argument lists.
constexpr int MAX_NESTING = 64;

class TypeExprParser {
public:
    explicit TypeExprParser(std::string_view text) : text_(text) {}

    auto parse() -> Result<naming::TypeDescriptor, TypeExprError> {
        skip_whitespace();
        if (at_end()) {
            return error("empty type expression");
        }

        auto result = parse_type(0);
        if (is_err(result)) {
            return result;
        }

        skip_whitespace();
        if (!at_end()) {
            return error(std::string("unexpected '") + peek() + "'");
        }
        return result;
    }

private:
    std::string_view text_;
    size_t pos_ = 0;

    auto at_end() const -> bool {
        return pos_ >= text_.size();
    }

    auto peek() const -> char {
        return at_end() ? '\0' : text_[pos_];
    }

    void skip_whitespace() {
        while (!at_end() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    auto error(std::string message) const -> TypeExprError {
        return TypeExprError{std::move(message), pos_};
    }

    static auto is_delimiter(char c) -> bool {
        switch (c) {
        case '.':
        case '<':
        case '>':
        case '[':
        case ']':
        case ',':
            return true;
        default:
            return std::isspace(static_cast<unsigned char>(c)) != 0;
        }
    }

    /// An identifier, or a `<...>` scope marker returned with its brackets.
    auto parse_segment() -> Result<std::string, TypeExprError> {
        if (at_end()) {
            return error("expected type name");
        }

        if (peek() == '<') {
            size_t close = text_.find('>', pos_);
            size_t nested = text_.find('<', pos_ + 1);
            if (nested < close) {
                return TypeExprError{"'<' inside scope marker", nested};
            }
            if (close == std::string_view::npos) {
                return error("unterminated scope marker");
            }
            std::string segment(text_.substr(pos_, close - pos_ + 1));
            pos_ = close + 1;
            return segment;
        }

        size_t start = pos_;
        while (!at_end() && !is_delimiter(peek())) {
            ++pos_;
        }
        if (pos_ == start) {
            return error("expected type name");
        }
        return std::string(text_.substr(start, pos_ - start));
    }

    auto parse_type(int depth) -> Result<naming::TypeDescriptor, TypeExprError> {
        if (depth > MAX_NESTING) {
            return error("type arguments nested too deeply");
        }

        skip_whitespace();
        size_t start = pos_;

        std::vector<std::string> segments;
        size_t last_segment_offset = pos_;
        while (true) {
            last_segment_offset = pos_;
            auto segment = parse_segment();
            if (is_err(segment)) {
                return unwrap_err(segment);
            }
            segments.push_back(std::move(unwrap(segment)));

            skip_whitespace();
            if (peek() != '.') {
                break;
            }
            ++pos_;
            skip_whitespace();
        }

        if (segments.back().front() == '<') {
            return TypeExprError{"type name expected after scope marker", last_segment_offset};
        }

        std::vector<naming::TypeDescriptor> arguments;
        if (peek() == '<' || peek() == '[') {
            char close = peek() == '<' ? '>' : ']';
            ++pos_;
            skip_whitespace();
            if (peek() == close) {
                return error("empty type argument list");
            }

            while (true) {
                auto argument = parse_type(depth + 1);
                if (is_err(argument)) {
                    return argument;
                }
                arguments.push_back(std::move(unwrap(argument)));

                skip_whitespace();
                if (peek() == ',') {
                    ++pos_;
                    continue;
                }
                if (peek() == close) {
                    ++pos_;
                    break;
                }
                return error(std::string("expected ',' or '") + close + "' in type argument list");
            }
        }

        std::string short_name = std::move(segments.back());
        segments.pop_back();

        std::string owner;
        for (const auto& segment : segments) {
            if (!owner.empty()) {
                owner += '.';
            }
            owner += segment;
        }

        auto descriptor = naming::make_descriptor(std::move(short_name), std::move(owner),
                                                  std::move(arguments));
        if (is_err(descriptor)) {
            return TypeExprError{unwrap_err(descriptor), start};
        }
        return std::move(unwrap(descriptor));
    }
};

} // namespace

auto parse_type_expr(std::string_view text) -> Result<naming::TypeDescriptor, TypeExprError> {
    auto result = TypeExprParser(text).parse();
    if (is_ok(result)) {
        RECNAME_LOG_TRACE("frontend",
                          "parsed '" << text << "' as " << naming::to_string(unwrap(result)));
    } else {
        RECNAME_LOG_DEBUG("frontend",
                          "rejected '" << text << "': " << to_string(unwrap_err(result)));
    }
    return result;
}

auto to_string(const TypeExprError& error) -> std::string {
    return "offset " + std::to_string(error.offset) + ": " + error.message;
}

} // namespace recname::frontend
