#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "vb9/core/errors.hpp"
#include "vb9/core/types.hpp"
#include "vb9/ns/namespace.hpp"
#include "vb9/sexp/expr.hpp"

namespace vb9::compiler {

    struct KernelMeta {
        std::string symbol;
        std::string kernel;            // kernel name; equal to the symbol
        vb9::core::Hash128 hash{};     // content hash of the symbol alone
        vb9::ns::Blob bytecode;        // "BYTECODE(<symbol>:<hex hash>)"
        bool changed{true};            // false only when the previous manifest had the same hash
    };

    // Distinct symbol and string leaves in first-occurrence order. Numbers are skipped.
    [[nodiscard]] std::vector<std::string> extract_symbols(const vb9::sexp::Expr& e);

    // Pure function of the name: equal symbols always give equal metadata (changed = true).
    vb9::core::Status kernel_for_symbol(std::string_view symbol, KernelMeta* out) noexcept;

    // "changed" or "unchanged" against the previous manifest. Says nothing about emission.
    [[nodiscard]] inline const char* change_label(const KernelMeta& k) noexcept {
        return k.changed ? "changed" : "unchanged";
    }

    [[nodiscard]] std::string kernel_path(std::string_view kernel_dir, std::string_view kernel);

} // namespace vb9::compiler
