#include "vb9/compiler/kernel.hpp"

#include <unordered_set>

#include "vb9/core/hashing.hpp"
#include "vb9/ns/path.hpp"
#include "vb9/sexp/canonical.hpp"

namespace vb9::compiler {
    using vb9::core::Status;

    namespace {
        void collect_leaves(const vb9::sexp::Expr& e,
                            std::unordered_set<std::string>& seen,
                            std::vector<std::string>& out) {
            if (e.is_list()) {
                for (const auto& child : e.items) {
                    collect_leaves(*child, seen, out);
                }
                return;
            }
            if (e.is_textual() && seen.insert(e.text).second) {
                out.push_back(e.text);
            }
        }
    } // namespace

    std::vector<std::string> extract_symbols(const vb9::sexp::Expr& e) {
        std::unordered_set<std::string> seen;
        std::vector<std::string> out;
        collect_leaves(e, seen, out);
        return out;
    }

    Status kernel_for_symbol(std::string_view symbol, KernelMeta* out) noexcept {
        if (out == nullptr) {
            return vb9::core::make_status(vb9::core::StatusDomain::Compiler, vb9::core::StatusCode::Invalid);
        }

        const vb9::sexp::ExprPtr atom = vb9::sexp::make_symbol(std::string(symbol));
        vb9::core::Hash128 h{};
        Status s = vb9::sexp::content_hash(*atom, &h);
        if (!vb9::core::is_ok(s)) {
            return s;
        }

        const std::string code = "BYTECODE(" + std::string(symbol) + ":" + vb9::core::hash_to_hex(h) + ")";

        out->symbol = std::string(symbol);
        out->kernel = out->symbol;
        out->hash = h;
        out->bytecode.assign(code.begin(), code.end());
        out->changed = true;
        return vb9::core::ok_status();
    }

    std::string kernel_path(std::string_view kernel_dir, std::string_view kernel) {
        std::string file(kernel);
        file.append(".kernel");
        return vb9::ns::join_path(kernel_dir, file);
    }
} // namespace vb9::compiler
