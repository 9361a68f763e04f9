#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <string_view>

#include "vb9/core/errors.hpp"
#include "vb9/core/types.hpp"
#include "vb9/sexp/expr.hpp"
#include "vb9/sexp/parser.hpp"

namespace vb9::seed {
    using i64 = vb9::core::i64;

    // Stage0: the three parts of a seed form, e.g.
    //   ((self vb9) (*structure input hidden output) (**computation seq))
    // Missing parts are the symbol `nil`.
    struct Stage0Seed {
        vb9::sexp::ExprPtr self_ref;
        vb9::sexp::ExprPtr structure;
        vb9::sexp::ExprPtr computation;
        vb9::core::Hash128 hash{};
    };

    // Stage1: first eight structure tokens t -> "ACTION:t".
    struct Stage1Pattern {
        std::map<std::string, std::string> patterns;
        vb9::core::Hash128 hash{};
    };

    // Stage2: each pattern numbered in sorted order.
    struct Stage2Symbols {
        std::map<std::string, i64> symbols;
        vb9::core::Hash128 hash{};
    };

    // Stage3: a tiny evaluator over the symbol table.
    //   (seq e...)        value of the last e (nil when empty)
    //   (count-symbols)   number of stage2 symbols
    //   (x y ...)         element-wise evaluation
    //   atom              itself
    struct Stage3Eval {
        std::map<std::string, i64> symbols;
        vb9::core::Hash128 hash{};

        [[nodiscard]] vb9::sexp::ExprPtr eval(const vb9::sexp::ExprPtr& e) const;
    };

    struct BootstrapChain {
        Stage0Seed stage0;
        Stage1Pattern stage1;
        Stage2Symbols stage2;
        Stage3Eval stage3;
    };

    inline constexpr std::size_t kMaxPatterns = 8;

    // Invalid (Seed domain) when the form is a bare atom; parse errors pass through.
    [[nodiscard]] vb9::core::Status parse_seed(std::string_view src, Stage0Seed* out,
                                               vb9::sexp::ParseError* err = nullptr) noexcept;
    [[nodiscard]] vb9::core::Status stage1_from_seed(const Stage0Seed& seed, Stage1Pattern* out) noexcept;
    [[nodiscard]] vb9::core::Status stage2_from_stage1(const Stage1Pattern& stage1, Stage2Symbols* out) noexcept;
    [[nodiscard]] vb9::core::Status stage3_from_stage2(const Stage2Symbols& stage2, Stage3Eval* out) noexcept;

    [[nodiscard]] vb9::core::Status bootstrap_chain(std::string_view src, BootstrapChain* out,
                                                    vb9::sexp::ParseError* err = nullptr) noexcept;

} // namespace vb9::seed
