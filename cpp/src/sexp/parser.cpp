#include "vb9/sexp/parser.hpp"

#include <charconv>
#include <limits>

namespace vb9::sexp {
    using vb9::core::Status;
    using vb9::core::StatusCode;
    using vb9::core::StatusDomain;

    namespace {
        [[nodiscard]] bool is_space(char c) noexcept {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
        }

        [[nodiscard]] int hex_digit(char c) noexcept {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        void append_utf8(std::string& out, u32 cp) {
            if (cp < 0x80) {
                out.push_back(static_cast<char>(cp));
            } else if (cp < 0x800) {
                out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        // Reads `count` hex digits at body[i]; returns false if they are not all hex.
        [[nodiscard]] bool read_hex(std::string_view body, size_t i, size_t count, u32* out) noexcept {
            if (i + count > body.size()) {
                return false;
            }
            u32 v = 0;
            for (size_t k = 0; k < count; ++k) {
                const int d = hex_digit(body[i + k]);
                if (d < 0) {
                    return false;
                }
                v = (v << 4) | static_cast<u32>(d);
            }
            *out = v;
            return true;
        }

        std::string decode_escapes(std::string_view body) {
            std::string out;
            out.reserve(body.size());
            for (size_t i = 0; i < body.size(); ++i) {
                const char c = body[i];
                if (c != '\\' || i + 1 >= body.size()) {
                    out.push_back(c);
                    continue;
                }
                const char n = body[++i];
                switch (n) {
                    case 'n': out.push_back('\n'); break;
                    case 't': out.push_back('\t'); break;
                    case 'r': out.push_back('\r'); break;
                    case 'a': out.push_back('\a'); break;
                    case 'b': out.push_back('\b'); break;
                    case 'f': out.push_back('\f'); break;
                    case 'v': out.push_back('\v'); break;
                    case '\\': out.push_back('\\'); break;
                    case '"': out.push_back('"'); break;
                    case '\'': out.push_back('\''); break;
                    case '0': case '1': case '2': case '3':
                    case '4': case '5': case '6': case '7': {
                        // Up to three octal digits.
                        u32 v = static_cast<u32>(n - '0');
                        for (int k = 0; k < 2 && i + 1 < body.size() && body[i + 1] >= '0' && body[i + 1] <= '7'; ++k) {
                            v = (v << 3) | static_cast<u32>(body[++i] - '0');
                        }
                        append_utf8(out, v);
                        break;
                    }
                    case 'x': {
                        u32 v = 0;
                        if (read_hex(body, i + 1, 2, &v)) {
                            out.push_back(static_cast<char>(v));
                            i += 2;
                        } else {
                            out.push_back('\\');
                            out.push_back(n);
                        }
                        break;
                    }
                    case 'u': {
                        u32 v = 0;
                        if (read_hex(body, i + 1, 4, &v)) {
                            append_utf8(out, v);
                            i += 4;
                        } else {
                            out.push_back('\\');
                            out.push_back(n);
                        }
                        break;
                    }
                    default:
                        out.push_back('\\');
                        out.push_back(n);
                        break;
                }
            }
            return out;
        }

        // Length of a complete string literal starting at src[pos] == '"', or 0 if unterminated.
        [[nodiscard]] size_t string_literal_len(std::string_view src, size_t pos) noexcept {
            size_t i = pos + 1;
            while (i < src.size()) {
                if (src[i] == '\\') {
                    if (i + 1 >= src.size()) {
                        return 0;
                    }
                    i += 2;
                    continue;
                }
                if (src[i] == '"') {
                    return i + 1 - pos;
                }
                ++i;
            }
            return 0;
        }

        // The sign handling from_chars does not do: one optional leading '+'.
        [[nodiscard]] std::string_view strip_plus(std::string_view t) noexcept {
            if (t.size() > 1 && t[0] == '+' && t[1] != '-' && t[1] != '+') {
                return t.substr(1);
            }
            return t;
        }

        [[nodiscard]] Status parse_failure(ParseErrorKind kind, u32 offset, ParseError* err) noexcept {
            if (err != nullptr) {
                err->kind = kind;
                err->offset = offset;
            }
            return vb9::core::make_status(StatusDomain::Sexp, StatusCode::Parse, static_cast<u32>(kind));
        }
    } // namespace

    const char* parse_error_name(ParseErrorKind kind) noexcept {
        switch (kind) {
            case ParseErrorKind::None: return "none";
            case ParseErrorKind::Unclosed: return "unclosed (";
            case ParseErrorKind::StrayClose: return ") without (";
            case ParseErrorKind::Empty: return "empty input";
            case ParseErrorKind::TooDeep: return "nesting too deep";
        }
        return "unknown";
    }

    Status tokenize(std::string_view src, std::vector<Token>* out) noexcept {
        if (out == nullptr) {
            return vb9::core::make_status(StatusDomain::Sexp, StatusCode::Invalid);
        }
        if (src.size() > std::numeric_limits<u32>::max()) {
            return vb9::core::make_status(StatusDomain::Sexp, StatusCode::Invalid);
        }
        out->clear();

        size_t i = 0;
        while (i < src.size()) {
            const char c = src[i];
            if (is_space(c)) {
                ++i;
                continue;
            }
            if (c == ';') {
                while (i < src.size() && src[i] != '\n') {
                    ++i;
                }
                continue;
            }
            const u32 offset = static_cast<u32>(i);
            if (c == '(' || c == ')') {
                out->push_back(Token{c == '(' ? TokenKind::Open : TokenKind::Close, std::string(1, c), offset});
                ++i;
                continue;
            }
            if (c == '"') {
                const size_t len = string_literal_len(src, i);
                if (len > 0) {
                    out->push_back(Token{TokenKind::String, decode_escapes(src.substr(i + 1, len - 2)), offset});
                    i += len;
                    continue;
                }
                // Unterminated quote: falls through and lexes as a bare atom.
            }
            size_t j = i;
            while (j < src.size() && !is_space(src[j]) && src[j] != '(' && src[j] != ')') {
                ++j;
            }
            out->push_back(Token{TokenKind::Atom, std::string(src.substr(i, j - i)), offset});
            i = j;
        }
        return vb9::core::ok_status();
    }

    ExprPtr coerce_atom(std::string_view token) {
        const std::string_view t = strip_plus(token);
        const char* first = t.data();
        const char* last = t.data() + t.size();

        if (t.find('.') != std::string_view::npos) {
            double v{};
            auto r = std::from_chars(first, last, v, std::chars_format::general);
            if (r.ec == std::errc() && r.ptr == last) {
                return make_float(v);
            }
            return make_symbol(std::string(token));
        }

        i64 v{};
        auto r = std::from_chars(first, last, v, 10);
        if (!t.empty() && r.ec == std::errc() && r.ptr == last) {
            return make_int(v);
        }
        return make_symbol(std::string(token));
    }

    Status parse(std::string_view src, ExprPtr* out, ParseError* err) noexcept {
        if (out == nullptr) {
            return vb9::core::make_status(StatusDomain::Sexp, StatusCode::Invalid);
        }

        std::vector<Token> toks;
        Status s = tokenize(src, &toks);
        if (!vb9::core::is_ok(s)) {
            return s;
        }
        if (toks.empty()) {
            return parse_failure(ParseErrorKind::Empty, 0, err);
        }

        // Explicit stack of open lists, capped at kMaxNestingDepth.
        struct Frame {
            ExprList items;
            u32 offset{0};
        };
        std::vector<Frame> stack;
        ExprList top;

        for (const Token& tok : toks) {
            ExprPtr value;
            switch (tok.kind) {
                case TokenKind::Open:
                    if (stack.size() >= kMaxNestingDepth) {
                        return parse_failure(ParseErrorKind::TooDeep, tok.offset, err);
                    }
                    stack.push_back(Frame{{}, tok.offset});
                    continue;
                case TokenKind::Close: {
                    if (stack.empty()) {
                        return parse_failure(ParseErrorKind::StrayClose, tok.offset, err);
                    }
                    value = make_list(std::move(stack.back().items));
                    stack.pop_back();
                    break;
                }
                case TokenKind::String:
                    value = make_string(tok.text);
                    break;
                case TokenKind::Atom:
                    value = coerce_atom(tok.text);
                    break;
            }
            if (stack.empty()) {
                top.push_back(std::move(value));
            } else {
                stack.back().items.push_back(std::move(value));
            }
        }

        if (!stack.empty()) {
            return parse_failure(ParseErrorKind::Unclosed, stack.back().offset, err);
        }

        *out = top.size() == 1 ? std::move(top.front()) : make_list(std::move(top));
        return vb9::core::ok_status();
    }
} // namespace vb9::sexp
