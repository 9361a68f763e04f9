#include "vb9/runtime/loop.hpp"

#include <string>
#include <system_error>
#include <utility>

#include "vb9/sexp/parser.hpp"

namespace vb9::runtime {
    using vb9::core::Status;
    using vb9::core::StatusCode;
    using vb9::core::StatusDomain;

    RuntimeLoop::RuntimeLoop(vb9::ns::Namespace& ns, vb9::core::RuntimeConfig cfg, vb9::core::PathConfig paths)
        : ns_(ns), cfg_(std::move(cfg)), paths_(std::move(paths)) {}

    Status RuntimeLoop::start() noexcept {
        std::lock_guard<std::mutex> control(control_mutex_);

        if (worker_.joinable()) {
            bool exited = false;
            {
                std::lock_guard<std::mutex> lock(exit_mutex_);
                exited = exited_;
            }
            if (!exited) {
                if (worker_.get_stop_token().stop_requested()) {
                    return vb9::core::make_status(StatusDomain::Runtime, StatusCode::Busy);
                }
                return vb9::core::ok_status();
            }
            worker_.join();
        }

        {
            std::lock_guard<std::mutex> lock(exit_mutex_);
            exited_ = false;
        }
        state_.store(LoopState::Polling);

        try {
            worker_ = std::jthread([this](std::stop_token token) { run(token); });
        } catch (const std::system_error& e) {
            {
                std::lock_guard<std::mutex> lock(exit_mutex_);
                exited_ = true;
            }
            state_.store(LoopState::Stopped);
            return vb9::core::make_status(StatusDomain::Runtime, StatusCode::Unavailable,
                                          static_cast<vb9::core::u32>(e.code().value()));
        }
        started_ = true;
        return vb9::core::ok_status();
    }

    Status RuntimeLoop::stop() noexcept {
        std::lock_guard<std::mutex> control(control_mutex_);

        if (!started_) {
            return vb9::core::make_status(StatusDomain::Runtime, StatusCode::Invalid);
        }
        if (!worker_.joinable()) {
            return vb9::core::ok_status();
        }

        worker_.request_stop();
        {
            std::unique_lock<std::mutex> lock(exit_mutex_);
            if (!exit_cv_.wait_for(lock, cfg_.stop_timeout, [this] { return exited_; })) {
                return vb9::core::make_status(StatusDomain::Runtime, StatusCode::Busy);
            }
        }
        worker_.join();
        return vb9::core::ok_status();
    }

    Status RuntimeLoop::handle_message(std::string_view message) noexcept {
        vb9::sexp::ExprPtr expr;
        vb9::sexp::ParseError err{};
        Status s = vb9::sexp::parse(message, &expr, &err);
        if (!vb9::core::is_ok(s)) {
            failures_.fetch_add(1);
            ns_.log(kEventError, std::string(vb9::sexp::parse_error_name(err.kind)) + " at offset " +
                                     std::to_string(err.offset));
            return s;
        }

        const std::string path = vb9::sexp::path_of(*expr);
        ns_.write(paths_.last_message, path);
        ns_.log(kEventMessage, path);
        processed_.fetch_add(1);
        return vb9::core::ok_status();
    }

    void RuntimeLoop::run(std::stop_token token) noexcept {
        ns_.log(kEventRuntime, "start");
        while (!token.stop_requested()) {
            auto message = ns_.dequeue(cfg_.poll_interval);
            if (!message) {
                continue;
            }
            // Failures are already logged; the loop keeps polling.
            if (!vb9::core::is_ok(handle_message(*message))) {
                continue;
            }
        }
        ns_.log(kEventRuntime, "stop");
        state_.store(LoopState::Stopped);
        {
            std::lock_guard<std::mutex> lock(exit_mutex_);
            exited_ = true;
        }
        exit_cv_.notify_all();
    }
} // namespace vb9::runtime
