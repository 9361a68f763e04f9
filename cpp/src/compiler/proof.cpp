#include "vb9/compiler/proof.hpp"

#include <string>
#include <unordered_map>

namespace vb9::compiler {
    using vb9::sexp::Expr;
    using vb9::sexp::ExprPtr;

    namespace {
        [[nodiscard]] const ExprPtr& head_or_self(const ExprPtr& child) noexcept {
            if (child->is_list() && !child->items.empty()) {
                return child->items.front();
            }
            return child;
        }

        void walk(const Expr& e, std::vector<ProofEdge>& edges) {
            if (!e.is_list() || e.items.empty()) {
                return;
            }
            ProofEdge edge;
            edge.node = e.items.front();
            edge.deps.reserve(e.items.size() - 1);
            for (size_t i = 1; i < e.items.size(); ++i) {
                edge.deps.push_back(head_or_self(e.items[i]));
            }
            edges.push_back(std::move(edge));
            for (size_t i = 1; i < e.items.size(); ++i) {
                walk(*e.items[i], edges);
            }
        }

        [[nodiscard]] std::string edge_key(const ProofEdge& edge) {
            std::string key = vb9::sexp::to_string(*edge.node);
            for (const auto& dep : edge.deps) {
                key.push_back('\x1f');
                key.append(vb9::sexp::to_string(*dep));
            }
            return key;
        }
    } // namespace

    bool edge_equal(const ProofEdge& a, const ProofEdge& b) noexcept {
        if (!vb9::sexp::expr_equal(*a.node, *b.node) || a.deps.size() != b.deps.size()) {
            return false;
        }
        for (size_t i = 0; i < a.deps.size(); ++i) {
            if (!vb9::sexp::expr_equal(*a.deps[i], *b.deps[i])) {
                return false;
            }
        }
        return true;
    }

    std::vector<ProofEdge> derive_proof_tree(const Expr& e) {
        std::vector<ProofEdge> edges;
        walk(e, edges);

        // Textual keys bucket the candidates; edge_equal decides.
        std::unordered_map<std::string, std::vector<size_t>> buckets;
        std::vector<ProofEdge> unique;
        unique.reserve(edges.size());
        for (auto& edge : edges) {
            auto& bucket = buckets[edge_key(edge)];
            bool dup = false;
            for (size_t idx : bucket) {
                if (edge_equal(unique[idx], edge)) {
                    dup = true;
                    break;
                }
            }
            if (!dup) {
                bucket.push_back(unique.size());
                unique.push_back(std::move(edge));
            }
        }
        return unique;
    }
} // namespace vb9::compiler
