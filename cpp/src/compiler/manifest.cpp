#include "vb9/compiler/manifest.hpp"

#include <nlohmann/json.hpp>

#include "vb9/core/hashing.hpp"

namespace vb9::compiler {
    using ordered_json = nlohmann::ordered_json;
    using vb9::sexp::Expr;
    using vb9::sexp::ExprKind;

    namespace {
        // Numbers stay numbers; symbols and strings become JSON strings; a list
        // (list-valued head or empty child) is written in its textual form.
        [[nodiscard]] ordered_json term_json(const Expr& e) {
            switch (e.kind) {
                case ExprKind::Int:
                    return e.int_value;
                case ExprKind::Float:
                    return e.float_value;
                case ExprKind::String:
                case ExprKind::Symbol:
                    return e.text;
                case ExprKind::List:
                    return vb9::sexp::to_string(e);
            }
            return nullptr;
        }

        [[nodiscard]] ordered_json proof_tree_array(const std::vector<ProofEdge>& tree) {
            ordered_json arr = ordered_json::array();
            for (const auto& edge : tree) {
                ordered_json deps = ordered_json::array();
                for (const auto& dep : edge.deps) {
                    deps.push_back(term_json(*dep));
                }
                ordered_json obj = ordered_json::object();
                obj["node"] = term_json(*edge.node);
                obj["deps"] = std::move(deps);
                arr.push_back(std::move(obj));
            }
            return arr;
        }

        [[nodiscard]] std::string dump(const ordered_json& j, int indent) {
            // Symbols may carry arbitrary bytes; never throw on invalid UTF-8.
            return j.dump(indent, ' ', false, ordered_json::error_handler_t::replace);
        }
    } // namespace

    std::string proof_tree_json(const std::vector<ProofEdge>& tree) {
        return dump(proof_tree_array(tree), -1);
    }

    vb9::core::Status manifest_seal(Manifest* m) noexcept {
        if (m == nullptr) {
            return vb9::core::make_status(vb9::core::StatusDomain::Compiler, vb9::core::StatusCode::Invalid);
        }
        return vb9::core::hash_text(proof_tree_json(m->proof_tree), &m->proof_hash);
    }

    std::string manifest_to_json(const Manifest& m) {
        ordered_json kernels = ordered_json::array();
        for (const auto& k : m.kernels) {
            ordered_json obj = ordered_json::object();
            obj["symbol"] = k.symbol;
            obj["kernel"] = k.kernel;
            obj["hash"] = vb9::core::hash_to_hex(k.hash);
            obj["changed"] = k.changed;
            kernels.push_back(std::move(obj));
        }

        ordered_json root = ordered_json::object();
        root["kernels"] = std::move(kernels);
        root["proof_tree"] = proof_tree_array(m.proof_tree);
        root["proof_hash"] = vb9::core::hash_to_hex(m.proof_hash);
        return dump(root, 2);
    }

    std::map<std::string, vb9::core::Hash128> manifest_previous_hashes(std::string_view json_text) {
        std::map<std::string, vb9::core::Hash128> out;

        const nlohmann::json root = nlohmann::json::parse(json_text.begin(), json_text.end(), nullptr, false);
        if (root.is_discarded() || !root.is_object()) {
            return out;
        }
        auto kernels = root.find("kernels");
        if (kernels == root.end() || !kernels->is_array()) {
            return out;
        }
        for (const auto& entry : *kernels) {
            if (!entry.is_object()) {
                continue;
            }
            auto sym = entry.find("symbol");
            auto hash = entry.find("hash");
            if (sym == entry.end() || hash == entry.end() || !sym->is_string() || !hash->is_string()) {
                continue;
            }
            vb9::core::Hash128 h{};
            if (vb9::core::hash_from_hex(hash->get_ref<const std::string&>(), &h)) {
                out[sym->get<std::string>()] = h;
            }
        }
        return out;
    }
} // namespace vb9::compiler
