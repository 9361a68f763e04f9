#include "vb9/sexp/canonical.hpp"

#include <algorithm>
#include <utility>

#include "vb9/core/hashing.hpp"

namespace vb9::sexp {
    namespace {
        [[nodiscard]] bool is_commutative(const Expr& e) noexcept {
            return e.is_list() && !e.items.empty() && e.items.front()->is_symbol(kCommutativeMarker);
        }
    } // namespace

    ExprPtr canonicalize(const ExprPtr& e) {
        if (!e || e->is_atom()) {
            return e;
        }

        ExprList items;
        items.reserve(e->items.size());
        for (const ExprPtr& child : e->items) {
            items.push_back(canonicalize(child));
        }

        if (is_commutative(*e)) {
            std::vector<std::pair<std::string, ExprPtr>> keyed;
            keyed.reserve(items.size() - 1);
            for (size_t i = 1; i < items.size(); ++i) {
                keyed.emplace_back(to_string(*items[i]), items[i]);
            }
            std::stable_sort(keyed.begin(), keyed.end(),
                             [](const auto& a, const auto& b) { return a.first < b.first; });
            for (size_t i = 0; i < keyed.size(); ++i) {
                items[i + 1] = std::move(keyed[i].second);
            }
        }
        return make_list(std::move(items));
    }

    std::string canonical_text(const Expr& e) {
        if (e.is_atom()) {
            return to_string(e);
        }

        std::vector<std::string> parts;
        parts.reserve(e.items.size());
        for (const ExprPtr& child : e.items) {
            parts.push_back(canonical_text(*child));
        }
        if (is_commutative(e)) {
            std::sort(parts.begin() + 1, parts.end());
        }

        std::string out = "(";
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) out.push_back(' ');
            out.append(parts[i]);
        }
        out.push_back(')');
        return out;
    }

    vb9::core::Status content_hash(const Expr& e, vb9::core::Hash128* out) noexcept {
        if (out == nullptr) {
            return vb9::core::make_status(vb9::core::StatusDomain::Sexp, vb9::core::StatusCode::Invalid);
        }
        return vb9::core::hash_text(canonical_text(e), out);
    }
} // namespace vb9::sexp
