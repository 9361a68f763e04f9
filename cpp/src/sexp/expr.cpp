#include "vb9/sexp/expr.hpp"

#include <charconv>
#include <cmath>
#include <cstdio>

namespace vb9::sexp {
    namespace {
        void append_float(std::string& out, double v) {
            char buf[64];
            auto r = std::to_chars(buf, buf + sizeof(buf), v);
            std::string_view text(buf, static_cast<size_t>(r.ptr - buf));
            out.append(text);
            // Keep floats distinguishable from integers when re-read.
            if (text.find_first_of(".en") == std::string_view::npos) {
                out.append(".0");
            }
        }

        void append_quoted(std::string& out, std::string_view s) {
            out.push_back('"');
            for (char c : s) {
                switch (c) {
                    case '"': out.append("\\\""); break;
                    case '\\': out.append("\\\\"); break;
                    case '\n': out.append("\\n"); break;
                    case '\t': out.append("\\t"); break;
                    case '\r': out.append("\\r"); break;
                    default:
                        if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
                            char esc[8];
                            std::snprintf(esc, sizeof(esc), "\\x%02x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                            out.append(esc);
                        } else {
                            out.push_back(c);
                        }
                        break;
                }
            }
            out.push_back('"');
        }

        void write_expr(std::string& out, const Expr& e, bool quote_strings) {
            switch (e.kind) {
                case ExprKind::Int:
                    out.append(std::to_string(e.int_value));
                    return;
                case ExprKind::Float:
                    append_float(out, e.float_value);
                    return;
                case ExprKind::String:
                    if (quote_strings) {
                        append_quoted(out, e.text);
                    } else {
                        out.append(e.text);
                    }
                    return;
                case ExprKind::Symbol:
                    out.append(e.text);
                    return;
                case ExprKind::List:
                    out.push_back('(');
                    for (size_t i = 0; i < e.items.size(); ++i) {
                        if (i > 0) out.push_back(' ');
                        write_expr(out, *e.items[i], true);
                    }
                    out.push_back(')');
                    return;
            }
        }
    } // namespace

    ExprPtr make_int(i64 v) {
        auto e = std::make_shared<Expr>();
        e->kind = ExprKind::Int;
        e->int_value = v;
        return e;
    }

    ExprPtr make_float(double v) {
        auto e = std::make_shared<Expr>();
        e->kind = ExprKind::Float;
        e->float_value = v;
        return e;
    }

    ExprPtr make_string(std::string v) {
        auto e = std::make_shared<Expr>();
        e->kind = ExprKind::String;
        e->text = std::move(v);
        return e;
    }

    ExprPtr make_symbol(std::string name) {
        auto e = std::make_shared<Expr>();
        e->kind = ExprKind::Symbol;
        e->text = std::move(name);
        return e;
    }

    ExprPtr make_list(ExprList items) {
        auto e = std::make_shared<Expr>();
        e->kind = ExprKind::List;
        e->items = std::move(items);
        return e;
    }

    std::string to_string(const Expr& e) {
        std::string out;
        write_expr(out, e, true);
        return out;
    }

    std::string display(const Expr& e) {
        std::string out;
        write_expr(out, e, false);
        return out;
    }

    bool expr_equal(const Expr& a, const Expr& b) noexcept {
        if (a.kind != b.kind) {
            return false;
        }
        switch (a.kind) {
            case ExprKind::Int:
                return a.int_value == b.int_value;
            case ExprKind::Float:
                return a.float_value == b.float_value ||
                       (std::isnan(a.float_value) && std::isnan(b.float_value));
            case ExprKind::String:
            case ExprKind::Symbol:
                return a.text == b.text;
            case ExprKind::List:
                if (a.items.size() != b.items.size()) {
                    return false;
                }
                for (size_t i = 0; i < a.items.size(); ++i) {
                    if (!expr_equal(*a.items[i], *b.items[i])) {
                        return false;
                    }
                }
                return true;
        }
        return false;
    }

    std::string path_of(const Expr& e) {
        if (e.is_atom()) {
            return "/" + display(e);
        }
        std::string out = "/";
        for (size_t i = 0; i < e.items.size(); ++i) {
            if (i > 0) out.push_back('/');
            out.append(display(*e.items[i]));
        }
        return out;
    }
} // namespace vb9::sexp
