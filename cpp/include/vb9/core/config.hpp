#pragma once

#include <chrono>
#include <string>

#include "vb9/core/errors.hpp"

namespace vb9::core {

    // Namespace paths shared by the designer, compiler and runtime stages.
    struct PathConfig {
        std::string source{"/form/source.scm"};
        std::string manifest{"/form/manifest.json"};
        std::string kernel_dir{"/form"};
        std::string last_message{"/last/msg.path"};
        std::string draw{"/dev/draw"};
    };

    struct RuntimeConfig {
        std::chrono::milliseconds poll_interval{100};
        std::chrono::milliseconds stop_timeout{1000};
        std::string mount_source{"/form"};
        std::string mount_point{"/mnt/app"};
    };

    struct PipelineConfig {
        PathConfig paths{};
        RuntimeConfig runtime{};
        bool verbose{false};
    };

    [[nodiscard]] PipelineConfig config_defaults();

    // Overlays VB9_POLL_MS, VB9_STOP_TIMEOUT_MS and VB9_VERBOSE.
    // On a malformed value nothing is applied and Invalid is returned.
    [[nodiscard]] Status config_from_env(PipelineConfig* cfg);

    // Strict decimal millisecond parse; rejects signs, junk and zero.
    [[nodiscard]] bool parse_millis(const char* text, std::chrono::milliseconds* out) noexcept;

} // namespace vb9::core
