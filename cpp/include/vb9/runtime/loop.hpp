#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <string_view>
#include <thread>

#include "vb9/core/config.hpp"
#include "vb9/core/errors.hpp"
#include "vb9/core/types.hpp"
#include "vb9/ns/namespace.hpp"

namespace vb9::runtime {
    using u8 = vb9::core::u8;
    using u64 = vb9::core::u64;

    inline constexpr std::string_view kEventRuntime = "runtime";
    inline constexpr std::string_view kEventMessage = "runtime-msg";
    inline constexpr std::string_view kEventError = "runtime-error";

    enum class LoopState : u8 {
        Idle = 0,
        Polling = 1,
        Stopped = 2,
    };

    // Background consumer of the namespace message channel.
    //
    // Each message is parsed as an expression; its derived path is written to the
    // last-message entry. Malformed messages are logged and skipped, they never end
    // the loop. The channel is unbounded: a slow consumer lets the queue grow.
    class RuntimeLoop {
    public:
        RuntimeLoop(vb9::ns::Namespace& ns, vb9::core::RuntimeConfig cfg = {}, vb9::core::PathConfig paths = {});
        ~RuntimeLoop() = default;

        RuntimeLoop(const RuntimeLoop&) = delete;
        RuntimeLoop& operator=(const RuntimeLoop&) = delete;

        // No-op while already running. Busy while a previous stop is still draining.
        [[nodiscard]] vb9::core::Status start() noexcept;

        // Cooperative: requests cancellation and waits up to stop_timeout.
        // Invalid if never started, Busy if the worker has not exited in time.
        [[nodiscard]] vb9::core::Status stop() noexcept;

        [[nodiscard]] bool running() const noexcept { return state_.load() == LoopState::Polling; }
        [[nodiscard]] LoopState state() const noexcept { return state_.load(); }
        [[nodiscard]] u64 processed() const noexcept { return processed_.load(); }
        [[nodiscard]] u64 failures() const noexcept { return failures_.load(); }

        // One message through the same path the worker uses.
        vb9::core::Status handle_message(std::string_view message) noexcept;

    private:
        void run(std::stop_token token) noexcept;

        vb9::ns::Namespace& ns_;
        vb9::core::RuntimeConfig cfg_;
        vb9::core::PathConfig paths_;

        std::atomic<LoopState> state_{LoopState::Idle};
        std::atomic<u64> processed_{0};
        std::atomic<u64> failures_{0};

        std::mutex control_mutex_;
        bool started_{false};

        std::mutex exit_mutex_;
        std::condition_variable exit_cv_;
        bool exited_{true};

        // Last member: destroyed first, so the worker is joined before the state it uses.
        std::jthread worker_;
    };

} // namespace vb9::runtime
