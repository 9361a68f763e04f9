#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <unistd.h>

#include "vb9/cli/commands.hpp"
#include "vb9/cli/options.hpp"
#include "vb9/compiler/kernel.hpp"
#include "vb9/core/config.hpp"
#include "vb9/core/errors.hpp"
#include "vb9/core/hashing.hpp"
#include "vb9/ide/workbench.hpp"
#include "vb9/logic/kb.hpp"
#include "vb9/ns/namespace.hpp"
#include "vb9/seed/bootstrap.hpp"
#include "vb9/sexp/expr.hpp"
#include "vb9/sexp/parser.hpp"

// ========================================================================
// Global State
// ========================================================================

volatile sig_atomic_t g_running = 1;

void sigint_handler(int sig) {
    (void)sig;
    g_running = 0;
}

struct Session {
    vb9::ns::Namespace& ns;
    vb9::logic::KnowledgeBase& kb;
    vb9::ide::Workbench& wb;
    std::size_t event_cursor{0};
};

// ========================================================================
// File I/O
// ========================================================================

vb9::core::Status read_file(const char* path, std::string* out) {
    out->clear();
    FILE* f = fopen(path, "rb");
    if (!f) {
        return vb9::core::make_status(vb9::core::StatusDomain::Cli, vb9::core::StatusCode::NotFound);
    }
    char buf[4096];
    size_t n = 0;
    while ((n = fread(buf, 1, sizeof(buf), f)) > 0) {
        out->append(buf, n);
    }
    const bool failed = ferror(f) != 0;
    fclose(f);
    if (failed) {
        return vb9::core::make_status(vb9::core::StatusDomain::Cli, vb9::core::StatusCode::Io);
    }
    return vb9::core::ok_status();
}

// Reads one line without its terminator. False at end of input.
bool read_line(FILE* in, std::string* out) {
    out->clear();
    int c = 0;
    bool any = false;
    while ((c = fgetc(in)) != EOF) {
        any = true;
        if (c == '\n') {
            return true;
        }
        out->push_back(static_cast<char>(c));
    }
    return any;
}

// ========================================================================
// Error Reporting
// ========================================================================

void print_error(const char* msg) {
    fprintf(stderr, "error: %s\n", msg);
}

void print_status_error(const char* context, vb9::core::Status s) {
    fprintf(stderr, "error: %s failed (code=%s, domain=%s, aux=%u)\n",
            context,
            vb9::core::status_code_name(s.code),
            vb9::core::status_domain_name(s.domain),
            s.aux);
}

void print_parse_error(const char* context, vb9::core::Status s, const vb9::sexp::ParseError& err) {
    if (s.code != vb9::core::StatusCode::Parse) {
        print_status_error(context, s);
        return;
    }
    fprintf(stderr, "error: %s: parse error: %s at offset %u\n",
            context, vb9::sexp::parse_error_name(err.kind), err.offset);
}

// Echoes events appended since the previous call.
void flush_events(Session& session, bool verbose) {
    const std::vector<vb9::ns::Event> fresh = session.ns.events_since(session.event_cursor);
    session.event_cursor += fresh.size();
    if (!verbose) {
        return;
    }
    for (const vb9::ns::Event& e : fresh) {
        fprintf(stderr, "info: event %s: %s\n", e.kind.c_str(), e.detail.c_str());
    }
}

// ========================================================================
// Command Handlers
// ========================================================================

void handle_help() {
    printf("Commands:\n");
    printf("  design <file>        Parse a form file, store it and compile it\n");
    printf("  source <text...>     Same as design, with the form given inline\n");
    printf("  compile              Recompile the stored source\n");
    printf("  send <msg...>        Queue a message for the runtime loop\n");
    printf("  run [src] [mnt]      Record a mount and start the runtime loop\n");
    printf("  stop                 Stop the runtime loop\n");
    printf("  read <path>          Show a namespace entry\n");
    printf("  ls                   List namespace paths\n");
    printf("  events               Show the event log\n");
    printf("  prove <pred> <args>  Resolve a goal against the build knowledge base\n");
    printf("  seed <file>          Run the seed bootstrap chain on a file\n");
    printf("  manifest             Show the current manifest\n");
    printf("  help                 Show this help\n");
    printf("  q, quit, exit        Exit\n");
}

void print_kernels(const std::vector<vb9::compiler::KernelMeta>& kernels) {
    for (const vb9::compiler::KernelMeta& k : kernels) {
        printf("%-20s %s %s\n",
               k.symbol.c_str(),
               vb9::core::hash_to_hex(k.hash).c_str(),
               vb9::compiler::change_label(k));
    }
    printf("%zu kernels\n", kernels.size());
}

void handle_build(Session& session, std::string_view source) {
    std::vector<vb9::compiler::KernelMeta> kernels;
    vb9::sexp::ParseError err{};
    vb9::core::Status s = session.wb.build(source, &kernels, &err);
    if (!vb9::core::is_ok(s)) {
        print_parse_error("build", s, err);
        return;
    }
    print_kernels(kernels);
}

void handle_design(Session& session, const char* path) {
    std::string text;
    vb9::core::Status s = read_file(path, &text);
    if (!vb9::core::is_ok(s)) {
        fprintf(stderr, "error: design: cannot read %s\n", path);
        return;
    }
    handle_build(session, text);
}

void handle_compile(Session& session) {
    const std::string& source_path = session.wb.config().paths.source;
    std::optional<std::string> text = session.ns.read_text(source_path);
    if (!text) {
        fprintf(stderr, "error: compile: nothing at %s (use design or source first)\n", source_path.c_str());
        return;
    }
    vb9::sexp::ExprPtr expr;
    vb9::sexp::ParseError err{};
    vb9::core::Status s = vb9::sexp::parse(*text, &expr, &err);
    if (!vb9::core::is_ok(s)) {
        print_parse_error("compile", s, err);
        return;
    }
    std::vector<vb9::compiler::KernelMeta> kernels;
    s = session.wb.compiler(*expr, &kernels);
    if (!vb9::core::is_ok(s)) {
        print_status_error("compile", s);
        return;
    }
    print_kernels(kernels);
}

void handle_run(Session& session, const vb9::cli::CliArgs& args) {
    vb9::core::Status s{};
    if (args.argc == 0) {
        s = session.wb.runtime();
    } else {
        const vb9::core::RuntimeConfig& rt = session.wb.config().runtime;
        const char* src = args.argv[0];
        const char* mnt = args.argc > 1 ? args.argv[1] : rt.mount_point.c_str();
        s = session.wb.runtime(src, mnt);
    }
    if (!vb9::core::is_ok(s)) {
        print_status_error("run", s);
        return;
    }
    printf("runtime polling\n");
}

void handle_stop(Session& session) {
    vb9::core::Status s = session.wb.stop();
    if (!vb9::core::is_ok(s)) {
        print_status_error("stop", s);
        return;
    }
    printf("runtime stopped (%llu processed, %llu failed)\n",
           static_cast<unsigned long long>(session.wb.loop().processed()),
           static_cast<unsigned long long>(session.wb.loop().failures()));
}

void handle_read(Session& session, const char* path) {
    std::optional<vb9::ns::Value> v = session.ns.read(path);
    if (!v) {
        fprintf(stderr, "error: read: %s not found\n", path);
        return;
    }
    if (const std::string* text = std::get_if<std::string>(&*v)) {
        printf("%s\n", text->c_str());
        return;
    }
    const vb9::ns::Blob& blob = std::get<vb9::ns::Blob>(*v);
    printf("<blob %zu bytes> %.*s\n", blob.size(),
           static_cast<int>(blob.size()), reinterpret_cast<const char*>(blob.data()));
}

void handle_list(Session& session) {
    for (const std::string& p : session.ns.paths()) {
        printf("%s\n", p.c_str());
    }
    for (const vb9::ns::Mount& m : session.ns.mounts()) {
        printf("%s -> %s (mount)\n", m.point.c_str(), m.source.c_str());
    }
}

void handle_events(Session& session) {
    for (const vb9::ns::Event& e : session.ns.events()) {
        printf("%-18s %s\n", e.kind.c_str(), e.detail.c_str());
    }
}

void handle_prove(Session& session, const vb9::cli::CliArgs& args) {
    vb9::logic::Goal goal;
    goal.reserve(args.argc);
    for (vb9::cli::u32 i = 0; i < args.argc; ++i) {
        goal.emplace_back(args.argv[i]);
    }
    const bool ok = session.kb.prove(goal);
    printf("%s: %s\n", vb9::logic::goal_to_string(goal).c_str(), ok ? "proved" : "not proved");
}

void handle_seed(const char* path) {
    std::string text;
    vb9::core::Status s = read_file(path, &text);
    if (!vb9::core::is_ok(s)) {
        fprintf(stderr, "error: seed: cannot read %s\n", path);
        return;
    }
    vb9::seed::BootstrapChain chain;
    vb9::sexp::ParseError err{};
    s = vb9::seed::bootstrap_chain(text, &chain, &err);
    if (!vb9::core::is_ok(s)) {
        print_parse_error("seed", s, err);
        return;
    }
    printf("stage0 %s\n", vb9::core::hash_to_hex(chain.stage0.hash).c_str());
    printf("stage1 %s (%zu patterns)\n", vb9::core::hash_to_hex(chain.stage1.hash).c_str(),
           chain.stage1.patterns.size());
    printf("stage2 %s (%zu symbols)\n", vb9::core::hash_to_hex(chain.stage2.hash).c_str(),
           chain.stage2.symbols.size());
    printf("stage3 %s\n", vb9::core::hash_to_hex(chain.stage3.hash).c_str());
    vb9::sexp::ExprPtr result = chain.stage3.eval(chain.stage0.computation);
    printf("eval %s\n", vb9::sexp::to_string(*result).c_str());
}

void handle_manifest(Session& session) {
    const std::string& path = session.wb.config().paths.manifest;
    std::optional<std::string> text = session.ns.read_text(path);
    if (!text) {
        fprintf(stderr, "error: manifest: nothing at %s\n", path.c_str());
        return;
    }
    printf("%s\n", text->c_str());
}

// Returns false when the session should end.
bool dispatch(Session& session, const std::string& line) {
    std::vector<std::string> tokens;
    vb9::cli::split_line(line, &tokens);
    if (tokens.empty() || tokens[0][0] == ';') {
        return true;
    }

    std::vector<const char*> argv;
    argv.reserve(tokens.size());
    for (const std::string& t : tokens) {
        argv.push_back(t.c_str());
    }

    vb9::cli::CommandInvocation cmd;
    vb9::cli::u32 consumed = 0;
    vb9::cli::CliArgs args{argv.data(), static_cast<vb9::cli::u32>(argv.size())};
    vb9::core::Status s = vb9::cli::parse_command(args, vb9::cli::kCommands, vb9::cli::kCommandCount,
                                                  &cmd, &consumed);
    if (s.code == vb9::core::StatusCode::NotFound) {
        fprintf(stderr, "error: unknown command '%s'\n", tokens[0].c_str());
        return true;
    }
    if (!vb9::core::is_ok(s)) {
        fprintf(stderr, "error: %s: expected at least %u argument(s)\n", tokens[0].c_str(), s.aux);
        return true;
    }

    switch (cmd.id) {
        case vb9::cli::CommandId::Help:
            handle_help();
            break;
        case vb9::cli::CommandId::Design:
            handle_design(session, cmd.args.argv[0]);
            break;
        case vb9::cli::CommandId::Source:
            handle_build(session, vb9::cli::line_rest(line, 1));
            break;
        case vb9::cli::CommandId::Compile:
            handle_compile(session);
            break;
        case vb9::cli::CommandId::Send:
            session.wb.send(std::string(vb9::cli::line_rest(line, 1)));
            break;
        case vb9::cli::CommandId::Run:
            handle_run(session, cmd.args);
            break;
        case vb9::cli::CommandId::Stop:
            handle_stop(session);
            break;
        case vb9::cli::CommandId::Read:
            handle_read(session, cmd.args.argv[0]);
            break;
        case vb9::cli::CommandId::List:
            handle_list(session);
            break;
        case vb9::cli::CommandId::Events:
            handle_events(session);
            break;
        case vb9::cli::CommandId::Prove:
            handle_prove(session, cmd.args);
            break;
        case vb9::cli::CommandId::Seed:
            handle_seed(cmd.args.argv[0]);
            break;
        case vb9::cli::CommandId::Manifest:
            handle_manifest(session);
            break;
        case vb9::cli::CommandId::Exit:
            return false;
        case vb9::cli::CommandId::None:
            print_error("unknown command");
            break;
    }
    return true;
}

void print_usage(const char* prog) {
    printf("usage: %s [options]\n", prog);
    printf("  -h, --help                 Show this help\n");
    printf("  -v, --verbose              Echo pipeline events\n");
    printf("  -p, --poll-ms <ms>         Runtime poll interval\n");
    printf("  -t, --stop-timeout-ms <ms> Runtime stop timeout\n");
    printf("  -s, --script <file>        Read commands from a file instead of stdin\n");
}

// ========================================================================
// Main
// ========================================================================

int main(int argc, char** argv) {
    signal(SIGINT, sigint_handler);

    vb9::core::PipelineConfig cfg = vb9::core::config_defaults();
    vb9::core::Status s = vb9::core::config_from_env(&cfg);
    if (!vb9::core::is_ok(s)) {
        print_status_error("environment configuration", s);
        return EXIT_FAILURE;
    }

    vb9::cli::ParsedOption opt_storage[16];
    vb9::cli::ParsedOptions opts{opt_storage, 0, 16};
    vb9::cli::u32 consumed = 0;
    vb9::cli::CliArgs args{argc > 1 ? argv + 1 : nullptr, static_cast<vb9::cli::u32>(argc > 1 ? argc - 1 : 0)};
    s = vb9::cli::parse_options(args, vb9::cli::kProgramOptions, vb9::cli::kProgramOptionCount, &opts, &consumed);
    if (!vb9::core::is_ok(s)) {
        fprintf(stderr, "error: bad option '%s'\n", s.aux < args.argc ? args.argv[s.aux] : "");
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (consumed < args.argc) {
        fprintf(stderr, "error: unexpected argument '%s'\n", args.argv[consumed]);
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (vb9::cli::find_option(opts, vb9::cli::OptionId::Help) != nullptr) {
        print_usage(argv[0]);
        return EXIT_SUCCESS;
    }
    if (vb9::cli::find_option(opts, vb9::cli::OptionId::Verbose) != nullptr) {
        cfg.verbose = true;
    }
    if (const vb9::cli::ParsedOption* o = vb9::cli::find_option(opts, vb9::cli::OptionId::PollMs)) {
        if (o->value.i64v <= 0) {
            print_error("--poll-ms must be positive");
            return EXIT_FAILURE;
        }
        cfg.runtime.poll_interval = std::chrono::milliseconds(o->value.i64v);
    }
    if (const vb9::cli::ParsedOption* o = vb9::cli::find_option(opts, vb9::cli::OptionId::StopTimeoutMs)) {
        if (o->value.i64v <= 0) {
            print_error("--stop-timeout-ms must be positive");
            return EXIT_FAILURE;
        }
        cfg.runtime.stop_timeout = std::chrono::milliseconds(o->value.i64v);
    }

    FILE* in = stdin;
    const vb9::cli::ParsedOption* script = vb9::cli::find_option(opts, vb9::cli::OptionId::Script);
    if (script != nullptr) {
        in = fopen(script->value.str, "r");
        if (!in) {
            fprintf(stderr, "error: cannot open script %s\n", script->value.str);
            return EXIT_FAILURE;
        }
    }
    const bool interactive = script == nullptr && isatty(STDIN_FILENO) != 0;

    vb9::ns::Namespace ns;
    vb9::logic::KnowledgeBase kb = vb9::logic::example_build_kb();
    vb9::ide::Workbench wb(ns, kb, cfg);
    Session session{ns, kb, wb};

    if (interactive) {
        printf("vb9 workbench - interactive mode\n");
        printf("poll=%lldms stop_timeout=%lldms\n",
               static_cast<long long>(cfg.runtime.poll_interval.count()),
               static_cast<long long>(cfg.runtime.stop_timeout.count()));
        printf("Type 'help' for commands, 'q' to quit\n\n");
    }

    std::string line;
    while (g_running) {
        if (interactive) {
            printf("vb9> ");
            fflush(stdout);
        }
        if (!read_line(in, &line)) {
            break;
        }
        const bool keep_going = dispatch(session, line);
        fflush(stdout);
        flush_events(session, cfg.verbose);
        if (!keep_going) {
            break;
        }
    }

    if (wb.loop().state() == vb9::runtime::LoopState::Polling) {
        s = wb.stop();
        if (!vb9::core::is_ok(s)) {
            print_status_error("runtime shutdown", s);
        }
    }
    flush_events(session, cfg.verbose);

    if (in != stdin) {
        fclose(in);
    }
    if (interactive) {
        printf("Goodbye!\n");
    }
    return EXIT_SUCCESS;
}
