#include "vb9/compiler/incremental.hpp"

#include <utility>
#include <variant>

#include "vb9/compiler/proof.hpp"

namespace vb9::compiler {
    using vb9::core::Status;

    IncrementalCompiler::IncrementalCompiler(vb9::ns::Namespace& ns, vb9::logic::KnowledgeBase& kb,
                                             vb9::core::PathConfig paths)
        : ns_(ns), kb_(kb), paths_(std::move(paths)) {}

    bool IncrementalCompiler::cache_hit(const KernelMeta& meta, const std::string& path) const {
        auto it = cache_.find(meta.kernel);
        if (it == cache_.end() || it->second != meta.hash) {
            return false;
        }
        const auto stored = ns_.read(path);
        return stored.has_value() && std::holds_alternative<vb9::ns::Blob>(*stored);
    }

    Status IncrementalCompiler::compile(const vb9::sexp::Expr& expr, std::vector<KernelMeta>* out) noexcept {
        if (out == nullptr) {
            return vb9::core::make_status(vb9::core::StatusDomain::Compiler, vb9::core::StatusCode::Invalid);
        }

        const std::vector<std::string> symbols = extract_symbols(expr);

        std::map<std::string, vb9::core::Hash128> previous;
        if (auto text = ns_.read_text(paths_.manifest)) {
            previous = manifest_previous_hashes(*text);
        }

        Manifest manifest;
        manifest.kernels.reserve(symbols.size());
        for (const auto& sym : symbols) {
            KernelMeta meta;
            Status s = kernel_for_symbol(sym, &meta);
            if (!vb9::core::is_ok(s)) {
                return s;
            }

            const std::string path = kernel_path(paths_.kernel_dir, meta.kernel);
            if (cache_hit(meta, path)) {
                ns_.log(kEventSkip, meta.kernel);
            } else {
                ns_.write(path, meta.bytecode);
                ns_.log(kEventEmit, meta.kernel);
                cache_[meta.kernel] = meta.hash;
            }

            auto prev = previous.find(meta.symbol);
            meta.changed = prev == previous.end() || prev->second != meta.hash;
            manifest.kernels.push_back(std::move(meta));
        }

        manifest.proof_tree = derive_proof_tree(expr);

        // Provability is recorded in the resolver's memo but does not gate the compile.
        for (const auto& edge : manifest.proof_tree) {
            (void)kb_.prove(vb9::logic::Goal{"build", vb9::sexp::display(*edge.node)});
        }

        Status s = manifest_seal(&manifest);
        if (!vb9::core::is_ok(s)) {
            return s;
        }

        ns_.write(paths_.manifest, manifest_to_json(manifest));
        ns_.log(kEventManifest, std::to_string(manifest.kernels.size()) + " kernels, " +
                                    std::to_string(manifest.proof_tree.size()) + " edges");

        *out = manifest.kernels;
        last_ = std::move(manifest);
        return vb9::core::ok_status();
    }
} // namespace vb9::compiler
