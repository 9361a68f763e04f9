#pragma once

#include <vector>

#include "vb9/sexp/expr.hpp"

namespace vb9::compiler {

    // One structural edge: a list's head and the heads of its immediate children
    // (a child that is an atom, or an empty list, appears as itself).
    struct ProofEdge {
        vb9::sexp::ExprPtr node;
        vb9::sexp::ExprList deps;
    };

    [[nodiscard]] bool edge_equal(const ProofEdge& a, const ProofEdge& b) noexcept;

    // Pre-order walk over non-empty lists. Duplicate (node, deps) pairs keep their first occurrence.
    [[nodiscard]] std::vector<ProofEdge> derive_proof_tree(const vb9::sexp::Expr& e);

} // namespace vb9::compiler
