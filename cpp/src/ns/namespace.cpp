#include "vb9/ns/namespace.hpp"

#include <utility>

#include "vb9/ns/path.hpp"

namespace vb9::ns {

    // ========================================================================
    // Path map
    // ========================================================================

    void Namespace::write(std::string_view path, Value value) {
        std::string key = normalize_path(path);
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.insert_or_assign(std::move(key), std::move(value));
    }

    std::optional<Value> Namespace::read(std::string_view path) const {
        const std::string key = normalize_path(path);
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<std::string> Namespace::read_text(std::string_view path) const {
        const std::string key = normalize_path(path);
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        if (const auto* text = std::get_if<std::string>(&it->second)) {
            return *text;
        }
        return std::nullopt;
    }

    bool Namespace::exists(std::string_view path) const {
        const std::string key = normalize_path(path);
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.find(key) != entries_.end();
    }

    std::vector<std::string> Namespace::paths() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> out;
        out.reserve(entries_.size());
        for (const auto& [path, value] : entries_) {
            (void)value;
            out.push_back(path);
        }
        return out;
    }

    void Namespace::mount(std::string_view source, std::string_view point) {
        std::string src = normalize_path(source);
        std::string dst = normalize_path(point);
        std::lock_guard<std::mutex> lock(mutex_);
        mounts_.insert_or_assign(std::move(dst), std::move(src));
    }

    std::optional<std::string> Namespace::mount_source(std::string_view point) const {
        const std::string key = normalize_path(point);
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = mounts_.find(key);
        if (it == mounts_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<Mount> Namespace::mounts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Mount> out;
        out.reserve(mounts_.size());
        for (const auto& [point, source] : mounts_) {
            out.push_back(Mount{point, source});
        }
        return out;
    }

    // ========================================================================
    // Message channel
    // ========================================================================

    void Namespace::enqueue(std::string message) {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            queue_.push_back(std::move(message));
        }
        queue_cv_.notify_one();
    }

    std::optional<std::string> Namespace::dequeue(std::chrono::milliseconds timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (!queue_cv_.wait_until(lock, deadline, [this] { return !queue_.empty(); })) {
            return std::nullopt;
        }
        std::string message = std::move(queue_.front());
        queue_.pop_front();
        return message;
    }

    std::size_t Namespace::pending() const {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        return queue_.size();
    }

    // ========================================================================
    // Event log
    // ========================================================================

    void Namespace::log(std::string_view kind, std::string_view detail) {
        std::lock_guard<std::mutex> lock(events_mutex_);
        events_.push_back(Event{std::string(kind), std::string(detail)});
    }

    std::vector<Event> Namespace::events() const {
        std::lock_guard<std::mutex> lock(events_mutex_);
        return events_;
    }

    std::vector<Event> Namespace::events_since(std::size_t index) const {
        std::lock_guard<std::mutex> lock(events_mutex_);
        if (index >= events_.size()) {
            return {};
        }
        return std::vector<Event>(events_.begin() + static_cast<std::ptrdiff_t>(index), events_.end());
    }

    std::size_t Namespace::event_count() const {
        std::lock_guard<std::mutex> lock(events_mutex_);
        return events_.size();
    }

} // namespace vb9::ns
