#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "vb9/core/types.hpp"

namespace vb9::ns {
    using u8 = vb9::core::u8;

    using Blob = std::vector<u8>;
    using Value = std::variant<std::string, Blob>;

    struct Event {
        std::string kind;
        std::string detail;
    };

    struct Mount {
        std::string point;
        std::string source;
    };

    // In-process file-like store shared by every pipeline stage.
    //
    // Three independent sections, each with its own lock:
    //  - the path map (plus mount bookkeeping): one critical section per call,
    //    nothing is atomic across two calls;
    //  - the message channel: unbounded FIFO, any number of producers and consumers;
    //  - the event log: append-only, readers get copies.
    class Namespace {
    public:
        Namespace() = default;
        Namespace(const Namespace&) = delete;
        Namespace& operator=(const Namespace&) = delete;

        // Last write wins. Paths are normalized first.
        void write(std::string_view path, Value value);
        [[nodiscard]] std::optional<Value> read(std::string_view path) const;
        // Absent when the path is missing or holds a blob.
        [[nodiscard]] std::optional<std::string> read_text(std::string_view path) const;
        [[nodiscard]] bool exists(std::string_view path) const;
        // Sorted snapshot of every stored path.
        [[nodiscard]] std::vector<std::string> paths() const;

        // Advisory only: records point -> source, reads and writes are not redirected.
        void mount(std::string_view source, std::string_view point);
        [[nodiscard]] std::optional<std::string> mount_source(std::string_view point) const;
        [[nodiscard]] std::vector<Mount> mounts() const;

        void enqueue(std::string message);
        // Blocks up to `timeout`; absent on expiry, leaving the queue untouched.
        [[nodiscard]] std::optional<std::string> dequeue(std::chrono::milliseconds timeout);
        [[nodiscard]] std::size_t pending() const;

        void log(std::string_view kind, std::string_view detail);
        [[nodiscard]] std::vector<Event> events() const;
        [[nodiscard]] std::vector<Event> events_since(std::size_t index) const;
        [[nodiscard]] std::size_t event_count() const;

    private:
        mutable std::mutex mutex_;
        std::map<std::string, Value, std::less<>> entries_;
        std::map<std::string, std::string, std::less<>> mounts_;

        mutable std::mutex queue_mutex_;
        std::condition_variable queue_cv_;
        std::deque<std::string> queue_;

        mutable std::mutex events_mutex_;
        std::vector<Event> events_;
    };

} // namespace vb9::ns
