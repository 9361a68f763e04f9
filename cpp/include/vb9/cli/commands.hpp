#pragma once

#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "vb9/cli/options.hpp"
#include "vb9/core/errors.hpp"

namespace vb9::cli {
    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Design = 2,
        Source = 3,
        Compile = 4,
        Send = 5,
        Run = 6,
        Stop = 7,
        Read = 8,
        List = 9,
        Events = 10,
        Prove = 11,
        Seed = 12,
        Manifest = 13,
        Exit = 14,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
        u32 min_args{0};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    inline constexpr CommandSpec kCommands[] = {
        {CommandId::Help, "help", 0},
        {CommandId::Design, "design", 1},
        {CommandId::Source, "source", 1},
        {CommandId::Compile, "compile", 0},
        {CommandId::Send, "send", 1},
        {CommandId::Run, "run", 0},
        {CommandId::Stop, "stop", 0},
        {CommandId::Read, "read", 1},
        {CommandId::List, "ls", 0},
        {CommandId::Events, "events", 0},
        {CommandId::Prove, "prove", 1},
        {CommandId::Seed, "seed", 1},
        {CommandId::Manifest, "manifest", 0},
        {CommandId::Exit, "q", 0},
        {CommandId::Exit, "quit", 0},
        {CommandId::Exit, "exit", 0},
    };
    inline constexpr u32 kCommandCount = sizeof(kCommands) / sizeof(kCommands[0]);

    // Matches argv[0] against specs. Unknown names yield NotFound; too few
    // trailing arguments yield Invalid with aux = spec.min_args.
    vb9::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    // Whitespace tokenizer for REPL lines. Double quotes group a token.
    void split_line(std::string_view line, std::vector<std::string>* out);

    // Raw text after the first `skip` whitespace-separated words, trimmed.
    [[nodiscard]] std::string_view line_rest(std::string_view line, u32 skip) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace vb9::cli
