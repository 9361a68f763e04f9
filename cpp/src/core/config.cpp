#include "vb9/core/config.hpp"

#include <charconv>
#include <cstdlib>
#include <cstring>

namespace vb9::core {
    namespace {
        [[nodiscard]] bool parse_flag(const char* text, bool* out) noexcept {
            if (std::strcmp(text, "1") == 0 || std::strcmp(text, "true") == 0 || std::strcmp(text, "yes") == 0) {
                *out = true;
                return true;
            }
            if (std::strcmp(text, "0") == 0 || std::strcmp(text, "false") == 0 || std::strcmp(text, "no") == 0) {
                *out = false;
                return true;
            }
            return false;
        }
    } // namespace

    PipelineConfig config_defaults() {
        return PipelineConfig{};
    }

    bool parse_millis(const char* text, std::chrono::milliseconds* out) noexcept {
        if (text == nullptr || out == nullptr || *text == '\0') {
            return false;
        }
        const char* end = text + std::strlen(text);
        u32 v{};
        auto r = std::from_chars(text, end, v, 10);
        if (r.ec != std::errc() || r.ptr != end || v == 0) {
            return false;
        }
        *out = std::chrono::milliseconds{v};
        return true;
    }

    Status config_from_env(PipelineConfig* cfg) {
        if (cfg == nullptr) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }

        PipelineConfig next = *cfg;

        if (const char* poll = std::getenv("VB9_POLL_MS")) {
            if (!parse_millis(poll, &next.runtime.poll_interval)) {
                return make_status(StatusDomain::Core, StatusCode::Invalid, 1);
            }
        }
        if (const char* stop = std::getenv("VB9_STOP_TIMEOUT_MS")) {
            if (!parse_millis(stop, &next.runtime.stop_timeout)) {
                return make_status(StatusDomain::Core, StatusCode::Invalid, 2);
            }
        }
        if (const char* verbose = std::getenv("VB9_VERBOSE")) {
            if (!parse_flag(verbose, &next.verbose)) {
                return make_status(StatusDomain::Core, StatusCode::Invalid, 3);
            }
        }

        *cfg = next;
        return ok_status();
    }
} // namespace vb9::core
