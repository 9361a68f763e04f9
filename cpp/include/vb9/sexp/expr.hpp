#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "vb9/core/types.hpp"

namespace vb9::sexp {
    using u8 = vb9::core::u8;
    using u32 = vb9::core::u32;
    using i64 = vb9::core::i64;

    enum class ExprKind : u8 {
        Int = 0,
        Float = 1,
        String = 2,
        Symbol = 3,
        List = 4,
    };

    struct Expr;

    // Expressions are immutable once built and shared between stages.
    using ExprPtr = std::shared_ptr<const Expr>;
    using ExprList = std::vector<ExprPtr>;

    struct Expr {
        ExprKind kind{ExprKind::List};
        i64 int_value{0};
        double float_value{0.0};
        std::string text;   // symbol name or decoded string contents
        ExprList items;

        [[nodiscard]] bool is_list() const noexcept { return kind == ExprKind::List; }
        [[nodiscard]] bool is_atom() const noexcept { return kind != ExprKind::List; }
        [[nodiscard]] bool is_number() const noexcept { return kind == ExprKind::Int || kind == ExprKind::Float; }
        // Symbols and strings: the atoms that name kernels.
        [[nodiscard]] bool is_textual() const noexcept { return kind == ExprKind::Symbol || kind == ExprKind::String; }
        [[nodiscard]] bool is_symbol(std::string_view name) const noexcept {
            return kind == ExprKind::Symbol && text == name;
        }
        [[nodiscard]] bool empty_list() const noexcept { return kind == ExprKind::List && items.empty(); }
    };

    // Head symbol that marks a node whose children are order-insensitive.
    inline constexpr std::string_view kCommutativeMarker = "#:commutative";

    [[nodiscard]] ExprPtr make_int(i64 v);
    [[nodiscard]] ExprPtr make_float(double v);
    [[nodiscard]] ExprPtr make_string(std::string v);
    [[nodiscard]] ExprPtr make_symbol(std::string name);
    [[nodiscard]] ExprPtr make_list(ExprList items);

    // Deterministic textual encoding; strings are quoted and escaped.
    [[nodiscard]] std::string to_string(const Expr& e);

    // Like to_string but strings are written raw. Used for paths and goal terms.
    [[nodiscard]] std::string display(const Expr& e);

    [[nodiscard]] bool expr_equal(const Expr& a, const Expr& b) noexcept;

    // Atom -> "/atom"; list -> "/" + top-level elements joined by '/'.
    [[nodiscard]] std::string path_of(const Expr& e);

} // namespace vb9::sexp
