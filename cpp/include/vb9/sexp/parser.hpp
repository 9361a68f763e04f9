#pragma once

#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "vb9/core/errors.hpp"
#include "vb9/sexp/expr.hpp"

namespace vb9::sexp {

    enum class TokenKind : u8 {
        Open = 0,
        Close = 1,
        String = 2,   // text holds the decoded contents
        Atom = 3,
    };

    struct Token {
        TokenKind kind{TokenKind::Atom};
        std::string text;
        u32 offset{0};
    };

    // Carried in Status::aux when Status::code == StatusCode::Parse.
    enum class ParseErrorKind : u32 {
        None = 0,
        Unclosed = 1,
        StrayClose = 2,
        Empty = 3,
        TooDeep = 4,
    };

    // Lists nested deeper than this are rejected; tree walks downstream recurse.
    inline constexpr u32 kMaxNestingDepth = 1024;

    struct ParseError {
        ParseErrorKind kind{ParseErrorKind::None};
        u32 offset{0};
    };

    [[nodiscard]] const char* parse_error_name(ParseErrorKind kind) noexcept;

    [[nodiscard]] constexpr ParseErrorKind parse_error_kind(vb9::core::Status s) noexcept {
        if (s.code != vb9::core::StatusCode::Parse) {
            return ParseErrorKind::None;
        }
        return static_cast<ParseErrorKind>(s.aux);
    }

    // Splits source into tokens. Comments (';' to end of line) and whitespace are dropped.
    vb9::core::Status tokenize(std::string_view src, std::vector<Token>* out) noexcept;

    // Integer, else float when the token contains '.', else symbol.
    [[nodiscard]] ExprPtr coerce_atom(std::string_view token);

    // Single top-level expression is returned as is; several are wrapped in one list.
    // On failure *out is left untouched and err (if given) describes the first problem.
    vb9::core::Status parse(std::string_view src, ExprPtr* out, ParseError* err = nullptr) noexcept;

    static_assert(std::is_trivially_copyable_v<ParseError>);

} // namespace vb9::sexp
