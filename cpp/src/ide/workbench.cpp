#include "vb9/ide/workbench.hpp"

#include <utility>

namespace vb9::ide {
    using vb9::core::Status;

    Workbench::Workbench(vb9::ns::Namespace& ns, vb9::logic::KnowledgeBase& kb, vb9::core::PipelineConfig cfg)
        : cfg_(std::move(cfg)),
          ns_(ns),
          compiler_(ns, kb, cfg_.paths),
          loop_(ns, cfg_.runtime, cfg_.paths) {}

    Status Workbench::designer(std::string_view source, vb9::sexp::ExprPtr* out, vb9::sexp::ParseError* err) noexcept {
        if (out == nullptr) {
            return vb9::core::make_status(vb9::core::StatusDomain::Core, vb9::core::StatusCode::Invalid);
        }

        vb9::sexp::ExprPtr expr;
        Status s = vb9::sexp::parse(source, &expr, err);
        if (!vb9::core::is_ok(s)) {
            return s;
        }

        ns_.write(cfg_.paths.source, std::string(source));
        const size_t top = expr->is_list() ? expr->items.size() : 1;
        ns_.log(kEventDesigner, "source " + std::to_string(source.size()) + " bytes, " +
                                    std::to_string(top) + " top-level items");
        *out = std::move(expr);
        return vb9::core::ok_status();
    }

    Status Workbench::compiler(const vb9::sexp::Expr& expr, std::vector<vb9::compiler::KernelMeta>* out) noexcept {
        return compiler_.compile(expr, out);
    }

    Status Workbench::build(std::string_view source, std::vector<vb9::compiler::KernelMeta>* out,
                            vb9::sexp::ParseError* err) noexcept {
        vb9::sexp::ExprPtr expr;
        Status s = designer(source, &expr, err);
        if (!vb9::core::is_ok(s)) {
            return s;
        }
        return compiler(*expr, out);
    }

    Status Workbench::runtime() noexcept {
        return runtime(cfg_.runtime.mount_source, cfg_.runtime.mount_point);
    }

    Status Workbench::runtime(std::string_view mount_source, std::string_view mount_point) noexcept {
        ns_.mount(mount_source, mount_point);
        return loop_.start();
    }

    void Workbench::send(std::string message) {
        ns_.enqueue(std::move(message));
    }

    Status Workbench::stop() noexcept {
        return loop_.stop();
    }
} // namespace vb9::ide
