#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "vb9/compiler/incremental.hpp"
#include "vb9/core/config.hpp"
#include "vb9/core/errors.hpp"
#include "vb9/logic/kb.hpp"
#include "vb9/ns/namespace.hpp"
#include "vb9/runtime/loop.hpp"
#include "vb9/sexp/expr.hpp"
#include "vb9/sexp/parser.hpp"

namespace vb9::ide {

    inline constexpr std::string_view kEventDesigner = "designer";

    // designer -> compiler -> runtime over one shared namespace.
    // The namespace and knowledge base must outlive the workbench.
    class Workbench {
    public:
        Workbench(vb9::ns::Namespace& ns, vb9::logic::KnowledgeBase& kb,
                  vb9::core::PipelineConfig cfg = vb9::core::config_defaults());

        Workbench(const Workbench&) = delete;
        Workbench& operator=(const Workbench&) = delete;

        // Parses the form and stores its source. Parse failures reach the caller.
        [[nodiscard]] vb9::core::Status designer(std::string_view source, vb9::sexp::ExprPtr* out,
                                                 vb9::sexp::ParseError* err = nullptr) noexcept;

        [[nodiscard]] vb9::core::Status compiler(const vb9::sexp::Expr& expr,
                                                 std::vector<vb9::compiler::KernelMeta>* out) noexcept;

        // designer then compiler.
        [[nodiscard]] vb9::core::Status build(std::string_view source,
                                              std::vector<vb9::compiler::KernelMeta>* out,
                                              vb9::sexp::ParseError* err = nullptr) noexcept;

        // Records the (advisory) mount and starts the runtime loop if it is not running.
        [[nodiscard]] vb9::core::Status runtime() noexcept;
        [[nodiscard]] vb9::core::Status runtime(std::string_view mount_source, std::string_view mount_point) noexcept;

        void send(std::string message);

        [[nodiscard]] vb9::core::Status stop() noexcept;

        [[nodiscard]] vb9::ns::Namespace& ns() noexcept { return ns_; }
        [[nodiscard]] const vb9::compiler::IncrementalCompiler& incremental() const noexcept { return compiler_; }
        [[nodiscard]] const vb9::runtime::RuntimeLoop& loop() const noexcept { return loop_; }
        [[nodiscard]] const vb9::core::PipelineConfig& config() const noexcept { return cfg_; }

    private:
        vb9::core::PipelineConfig cfg_;
        vb9::ns::Namespace& ns_;
        vb9::compiler::IncrementalCompiler compiler_;
        vb9::runtime::RuntimeLoop loop_;
    };

} // namespace vb9::ide
