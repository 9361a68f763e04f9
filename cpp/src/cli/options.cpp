#include "vb9/cli/options.hpp"

#include <charconv>
#include <cstring>
#include <string_view>

namespace vb9::cli {
    using vb9::core::Status;

    namespace {
        [[nodiscard]] Status invalid(u32 at) noexcept {
            return vb9::core::make_status(vb9::core::StatusDomain::Cli, vb9::core::StatusCode::Invalid, at);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count, std::string_view name) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].long_name != nullptr && name == specs[i].long_name) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].short_name != '\0' && specs[i].short_name == c) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool parse_i64(const char* s, i64* out) noexcept {
            const char* end = s + std::strlen(s);
            i64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (s == end || r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        // Converts the textual value according to the option's declared type.
        [[nodiscard]] bool assign_value(const OptionSpec& spec, const char* value, ParsedOption* opt) noexcept {
            switch (spec.type) {
                case OptionType::Flag:
                    opt->value.boolv = 1;
                    return value == nullptr;
                case OptionType::String:
                    opt->value.str = value;
                    return value != nullptr;
                case OptionType::I64:
                    return value != nullptr && parse_i64(value, &opt->value.i64v);
            }
            return false;
        }

        [[nodiscard]] bool push_option(ParsedOptions* out, const ParsedOption& opt) noexcept {
            if (out->data == nullptr || out->len >= out->cap) {
                return false;
            }
            out->data[out->len++] = opt;
            return true;
        }
    } // namespace

    Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return invalid(0);
        }
        *consumed = 0;
        out->len = 0;

        if (args.argc > 0 && args.argv == nullptr) {
            return invalid(0);
        }
        if (spec_count > 0 && specs == nullptr) {
            return invalid(0);
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr || tok[0] != '-' || tok[1] == '\0') {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            const OptionSpec* spec = nullptr;
            const char* inline_value = nullptr;
            if (tok[1] == '-') {
                std::string_view name(tok + 2);
                if (const char* eq = std::strchr(tok + 2, '='); eq != nullptr) {
                    name = std::string_view(tok + 2, static_cast<size_t>(eq - (tok + 2)));
                    inline_value = eq + 1;
                }
                spec = find_long(specs, spec_count, name);
            } else {
                spec = find_short(specs, spec_count, tok[1]);
                if (tok[2] != '\0') {
                    inline_value = tok + 2;
                }
            }
            if (spec == nullptr) {
                return invalid(i);
            }

            const char* value = inline_value;
            u32 step = 1;
            if (spec->type != OptionType::Flag && value == nullptr) {
                if (i + 1 >= args.argc || args.argv[i + 1] == nullptr) {
                    return invalid(i);
                }
                value = args.argv[i + 1];
                step = 2;
            }

            ParsedOption opt{};
            opt.id = spec->id;
            opt.type = spec->type;
            if (!assign_value(*spec, value, &opt)) {
                return invalid(i);
            }
            if (!push_option(out, opt)) {
                return invalid(i);
            }
            i += step;
        }

        *consumed = i;
        return vb9::core::ok_status();
    }

    const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept {
        // Last occurrence wins, like repeated flags on most command lines.
        for (u32 i = opts.len; i > 0; --i) {
            if (opts.data[i - 1].id == id) {
                return &opts.data[i - 1];
            }
        }
        return nullptr;
    }
} // namespace vb9::cli
