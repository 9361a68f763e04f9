#include "vb9/seed/bootstrap.hpp"

#include <utility>
#include <vector>

#include "vb9/core/hashing.hpp"
#include "vb9/sexp/canonical.hpp"

namespace vb9::seed {
    using vb9::core::Status;
    using vb9::core::StatusCode;
    using vb9::core::StatusDomain;
    using vb9::sexp::ExprList;
    using vb9::sexp::ExprPtr;

    namespace {
        [[nodiscard]] ExprPtr nil() {
            return vb9::sexp::make_symbol("nil");
        }

        [[nodiscard]] ExprPtr hex_atom(const vb9::core::Hash128& h) {
            return vb9::sexp::make_string(vb9::core::hash_to_hex(h));
        }

        [[nodiscard]] ExprPtr first_of(const std::map<std::string, ExprPtr>& parts,
                                       const char* primary, const char* fallback) {
            if (auto it = parts.find(primary); it != parts.end()) {
                return it->second;
            }
            if (fallback == nullptr) {
                return nil();
            }
            if (auto it = parts.find(fallback); it != parts.end()) {
                return it->second;
            }
            return nil();
        }
    } // namespace

    ExprPtr Stage3Eval::eval(const ExprPtr& e) const {
        if (!e || !e->is_list() || e->items.empty()) {
            return e;
        }
        const ExprPtr& op = e->items.front();
        if (op->is_symbol("seq")) {
            ExprPtr last = nil();
            for (size_t i = 1; i < e->items.size(); ++i) {
                last = eval(e->items[i]);
            }
            return last;
        }
        if (op->is_symbol("count-symbols")) {
            return vb9::sexp::make_int(static_cast<i64>(symbols.size()));
        }
        ExprList items;
        items.reserve(e->items.size());
        for (const auto& item : e->items) {
            items.push_back(eval(item));
        }
        return vb9::sexp::make_list(std::move(items));
    }

    Status parse_seed(std::string_view src, Stage0Seed* out, vb9::sexp::ParseError* err) noexcept {
        if (out == nullptr) {
            return vb9::core::make_status(StatusDomain::Seed, StatusCode::Invalid);
        }

        ExprPtr expr;
        Status s = vb9::sexp::parse(src, &expr, err);
        if (!vb9::core::is_ok(s)) {
            return s;
        }
        if (!expr->is_list()) {
            return vb9::core::make_status(StatusDomain::Seed, StatusCode::Invalid);
        }

        std::map<std::string, ExprPtr> parts;
        for (const auto& entry : expr->items) {
            if (!entry->is_list() || entry->items.size() < 2) {
                continue;
            }
            ExprPtr body;
            if (entry->items.size() > 2) {
                body = vb9::sexp::make_list(ExprList(entry->items.begin() + 1, entry->items.end()));
            } else {
                body = entry->items[1];
            }
            parts.insert_or_assign(vb9::sexp::display(*entry->items.front()), std::move(body));
        }

        Stage0Seed seed;
        seed.self_ref = first_of(parts, "self", nullptr);
        seed.structure = first_of(parts, "*structure", "*layers");
        seed.computation = first_of(parts, "**computation", "**heads");

        const ExprPtr summary = vb9::sexp::make_list({seed.self_ref, seed.structure, seed.computation});
        s = vb9::sexp::content_hash(*summary, &seed.hash);
        if (!vb9::core::is_ok(s)) {
            return s;
        }
        *out = std::move(seed);
        return vb9::core::ok_status();
    }

    Status stage1_from_seed(const Stage0Seed& seed, Stage1Pattern* out) noexcept {
        if (out == nullptr || !seed.structure) {
            return vb9::core::make_status(StatusDomain::Seed, StatusCode::Invalid);
        }

        std::vector<std::string> tokens;
        if (seed.structure->is_list()) {
            for (const auto& item : seed.structure->items) {
                tokens.push_back(vb9::sexp::display(*item));
            }
        } else if (!seed.structure->is_symbol("nil")) {
            tokens.push_back(vb9::sexp::display(*seed.structure));
        }

        Stage1Pattern stage;
        for (size_t i = 0; i < tokens.size() && i < kMaxPatterns; ++i) {
            stage.patterns.insert_or_assign(tokens[i], "ACTION:" + tokens[i]);
        }

        ExprList pairs;
        for (const auto& [token, action] : stage.patterns) {
            pairs.push_back(vb9::sexp::make_list({vb9::sexp::make_string(token), vb9::sexp::make_string(action)}));
        }
        const ExprPtr summary = vb9::sexp::make_list({hex_atom(seed.hash), vb9::sexp::make_list(std::move(pairs))});
        Status s = vb9::sexp::content_hash(*summary, &stage.hash);
        if (!vb9::core::is_ok(s)) {
            return s;
        }
        *out = std::move(stage);
        return vb9::core::ok_status();
    }

    Status stage2_from_stage1(const Stage1Pattern& stage1, Stage2Symbols* out) noexcept {
        if (out == nullptr) {
            return vb9::core::make_status(StatusDomain::Seed, StatusCode::Invalid);
        }

        Stage2Symbols stage;
        ExprList entries;
        i64 next = 0;
        for (const auto& [pattern, action] : stage1.patterns) {
            (void)action;
            stage.symbols[pattern] = next;
            entries.push_back(vb9::sexp::make_list({vb9::sexp::make_string(pattern), vb9::sexp::make_int(next)}));
            ++next;
        }

        const ExprPtr summary = vb9::sexp::make_list({hex_atom(stage1.hash), vb9::sexp::make_list(std::move(entries))});
        Status s = vb9::sexp::content_hash(*summary, &stage.hash);
        if (!vb9::core::is_ok(s)) {
            return s;
        }
        *out = std::move(stage);
        return vb9::core::ok_status();
    }

    Status stage3_from_stage2(const Stage2Symbols& stage2, Stage3Eval* out) noexcept {
        if (out == nullptr) {
            return vb9::core::make_status(StatusDomain::Seed, StatusCode::Invalid);
        }

        Stage3Eval stage;
        stage.symbols = stage2.symbols;
        const ExprPtr summary = vb9::sexp::make_list({hex_atom(stage2.hash), vb9::sexp::make_symbol("eval"),
                                                      vb9::sexp::make_int(static_cast<i64>(stage.symbols.size()))});
        Status s = vb9::sexp::content_hash(*summary, &stage.hash);
        if (!vb9::core::is_ok(s)) {
            return s;
        }
        *out = std::move(stage);
        return vb9::core::ok_status();
    }

    Status bootstrap_chain(std::string_view src, BootstrapChain* out, vb9::sexp::ParseError* err) noexcept {
        if (out == nullptr) {
            return vb9::core::make_status(StatusDomain::Seed, StatusCode::Invalid);
        }

        BootstrapChain chain;
        Status s = parse_seed(src, &chain.stage0, err);
        if (!vb9::core::is_ok(s)) return s;
        s = stage1_from_seed(chain.stage0, &chain.stage1);
        if (!vb9::core::is_ok(s)) return s;
        s = stage2_from_stage1(chain.stage1, &chain.stage2);
        if (!vb9::core::is_ok(s)) return s;
        s = stage3_from_stage2(chain.stage2, &chain.stage3);
        if (!vb9::core::is_ok(s)) return s;

        *out = std::move(chain);
        return vb9::core::ok_status();
    }
} // namespace vb9::seed
