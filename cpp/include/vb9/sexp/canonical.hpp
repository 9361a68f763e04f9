#pragma once

#include <string>

#include "vb9/core/errors.hpp"
#include "vb9/core/types.hpp"
#include "vb9/sexp/expr.hpp"

namespace vb9::sexp {

    // Children of a node headed by kCommutativeMarker are sorted by their textual form.
    // Every other node keeps its shape. Idempotent.
    [[nodiscard]] ExprPtr canonicalize(const ExprPtr& e);

    // to_string(*canonicalize(e)) without building the intermediate tree.
    [[nodiscard]] std::string canonical_text(const Expr& e);

    // 128-bit digest of canonical_text(e). Stable across processes.
    vb9::core::Status content_hash(const Expr& e, vb9::core::Hash128* out) noexcept;

} // namespace vb9::sexp
