#pragma once

#include <type_traits>

#include "vb9/core/errors.hpp"
#include "vb9/core/types.hpp"

namespace vb9::cli {
    using u8 = vb9::core::u8;
    using u32 = vb9::core::u32;
    using i64 = vb9::core::i64;

    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    enum class OptionType : u8 {
        Flag = 0,
        String = 1,
        I64 = 2,
    };

    enum class OptionId : u32 {
        None = 0,
        Help = 1,
        Verbose = 2,
        PollMs = 3,
        StopTimeoutMs = 4,
        Script = 5,
    };

    struct OptionSpec {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        const char* long_name{nullptr};
        char short_name{'\0'};
    };

    union OptionValue {
        const char* str;
        i64 i64v;
        u8 boolv;
    };

    struct ParsedOption {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        OptionValue value{};
    };

    // Caller-owned storage; parse_options never allocates.
    struct ParsedOptions {
        ParsedOption* data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    // Options accepted by the vb9 executable.
    inline constexpr OptionSpec kProgramOptions[] = {
        {OptionId::Help, OptionType::Flag, "help", 'h'},
        {OptionId::Verbose, OptionType::Flag, "verbose", 'v'},
        {OptionId::PollMs, OptionType::I64, "poll-ms", 'p'},
        {OptionId::StopTimeoutMs, OptionType::I64, "stop-timeout-ms", 't'},
        {OptionId::Script, OptionType::String, "script", 's'},
    };
    inline constexpr u32 kProgramOptionCount = sizeof(kProgramOptions) / sizeof(kProgramOptions[0]);

    // Consumes leading options; stops at the first non-option, a lone "-", or after "--".
    // Supports --name value, --name=value, -x value and -xvalue.
    vb9::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept;

    [[nodiscard]] const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept;

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);
    static_assert(std::is_trivially_copyable_v<ParsedOptions>);
    static_assert(std::is_standard_layout_v<CliArgs>);
    static_assert(std::is_standard_layout_v<OptionSpec>);
    static_assert(std::is_standard_layout_v<ParsedOption>);
    static_assert(std::is_standard_layout_v<ParsedOptions>);

} // namespace vb9::cli
