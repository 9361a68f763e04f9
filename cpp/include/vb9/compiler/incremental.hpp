#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "vb9/compiler/kernel.hpp"
#include "vb9/compiler/manifest.hpp"
#include "vb9/core/config.hpp"
#include "vb9/core/errors.hpp"
#include "vb9/logic/kb.hpp"
#include "vb9/ns/namespace.hpp"
#include "vb9/sexp/expr.hpp"

namespace vb9::compiler {

    inline constexpr std::string_view kEventEmit = "compiler-emit";
    inline constexpr std::string_view kEventSkip = "compiler-skip";
    inline constexpr std::string_view kEventManifest = "compiler-manifest";

    // Turns an expression into kernel artifacts and a proof manifest stored in the namespace.
    //
    // The kernel cache lives in this object only. A cached entry is trusted when its hash
    // matches and the namespace still holds bytecode at the kernel path; otherwise the
    // kernel is emitted again. Staleness across instances comes from the persisted
    // manifest, read at the start of every compile.
    //
    // Not thread-safe: meant for the synchronous foreground path.
    class IncrementalCompiler {
    public:
        IncrementalCompiler(vb9::ns::Namespace& ns, vb9::logic::KnowledgeBase& kb,
                            vb9::core::PathConfig paths = {});

        [[nodiscard]] vb9::core::Status compile(const vb9::sexp::Expr& expr, std::vector<KernelMeta>* out) noexcept;

        [[nodiscard]] const Manifest& last_manifest() const noexcept { return last_; }
        [[nodiscard]] std::size_t cache_size() const noexcept { return cache_.size(); }
        void clear_cache() noexcept { cache_.clear(); }

    private:
        [[nodiscard]] bool cache_hit(const KernelMeta& meta, const std::string& path) const;

        vb9::ns::Namespace& ns_;
        vb9::logic::KnowledgeBase& kb_;
        vb9::core::PathConfig paths_;
        std::unordered_map<std::string, vb9::core::Hash128> cache_;
        Manifest last_;
    };

} // namespace vb9::compiler
