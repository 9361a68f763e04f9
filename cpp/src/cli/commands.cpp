#include "vb9/cli/commands.hpp"

#include <cstring>
#include <utility>

namespace vb9::cli {
    using vb9::core::Status;
    using vb9::core::StatusCode;
    using vb9::core::StatusDomain;

    namespace {
        [[nodiscard]] constexpr bool is_space(char c) noexcept {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r';
        }
    } // namespace

    Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return vb9::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        *consumed = 0;
        out->id = CommandId::None;
        out->args = CliArgs{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return vb9::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        if (spec_count > 0 && specs == nullptr) {
            return vb9::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        const char* cmd = args.argv[0];
        const CommandSpec* match = nullptr;
        for (u32 i = 0; i < spec_count; ++i) {
            if (specs[i].name != nullptr && std::strcmp(specs[i].name, cmd) == 0) {
                match = &specs[i];
                break;
            }
        }
        if (match == nullptr) {
            return vb9::core::make_status(StatusDomain::Cli, StatusCode::NotFound);
        }
        if (args.argc - 1 < match->min_args) {
            return vb9::core::make_status(StatusDomain::Cli, StatusCode::Invalid, match->min_args);
        }

        out->id = match->id;
        out->args.argv = args.argv + 1;
        out->args.argc = args.argc - 1;
        *consumed = 1;
        return vb9::core::ok_status();
    }

    void split_line(std::string_view line, std::vector<std::string>* out) {
        out->clear();
        size_t i = 0;
        while (i < line.size()) {
            while (i < line.size() && is_space(line[i])) {
                ++i;
            }
            if (i >= line.size()) {
                break;
            }
            std::string tok;
            if (line[i] == '"') {
                ++i;
                while (i < line.size() && line[i] != '"') {
                    tok.push_back(line[i++]);
                }
                if (i < line.size()) {
                    ++i;
                }
            } else {
                while (i < line.size() && !is_space(line[i])) {
                    tok.push_back(line[i++]);
                }
            }
            out->push_back(std::move(tok));
        }
    }

    std::string_view line_rest(std::string_view line, u32 skip) noexcept {
        size_t i = 0;
        for (u32 word = 0; word < skip; ++word) {
            while (i < line.size() && is_space(line[i])) {
                ++i;
            }
            while (i < line.size() && !is_space(line[i])) {
                ++i;
            }
        }
        while (i < line.size() && is_space(line[i])) {
            ++i;
        }
        size_t end = line.size();
        while (end > i && is_space(line[end - 1])) {
            --end;
        }
        return line.substr(i, end - i);
    }
} // namespace vb9::cli
