#include "storie/storie.hpp"
#include "storie/vm/vm.hpp"
#include "storie/lua_host.hpp"
#include <iostream>
#include <istream>
#include <fstream>
#include <sstream>
#include <memory>
#include <cstring>
#include <cstdlib>
#include <cstdint>

using namespace storie;

struct driver_options {
    const char *input = nullptr;
    const char *host_file = nullptr;
    const char *event = "render";
    int frames = 1;
    int width = 800;
    int height = 600;
    double dt = 1.0 / 60.0;
    bool dump_tokens = false;
};

static void print_usage() {
    std::cerr <<
        "usage: storie [options] <input>\n"
        "input is a markdown story, a bare script, or - for stdin\n"
        "  --host <file.lua>   load native functions from a Lua file\n"
        "  --event <name>      event name for a bare script (default: render)\n"
        "  --frames <n>        number of frames to run (default: 1)\n"
        "  --width <w>         screenWidth global (default: 800)\n"
        "  --height <h>        screenHeight global (default: 600)\n"
        "  --dt <seconds>      per-frame delta time (default: 1/60)\n"
        "  --tokens            print the token stream of every script and exit\n";
}

static bool parse_int_arg(const char *str, int *out) {
    char *str_end;
    long v = strtol(str, &str_end, 10);
    if (*str == '\0' || *str_end != '\0' || v < 0 || v > INT32_MAX)
        return false;

    *out = (int)v;
    return true;
}

static bool parse_args(int argc, const char *argv[], driver_options &opts) {
    for (int i = 1; i < argc; ++i) {
        const char *arg = argv[i];
        const char *next = i + 1 < argc ? argv[i + 1] : nullptr;

        if (!strcmp(arg, "--tokens")) {
            opts.dump_tokens = true;
        }
        else if (!strcmp(arg, "--host") && next) {
            opts.host_file = next;
            ++i;
        }
        else if (!strcmp(arg, "--event") && next) {
            opts.event = next;
            ++i;
        }
        else if (!strcmp(arg, "--frames") && next) {
            if (!parse_int_arg(next, &opts.frames)) return false;
            ++i;
        }
        else if (!strcmp(arg, "--width") && next) {
            if (!parse_int_arg(next, &opts.width)) return false;
            ++i;
        }
        else if (!strcmp(arg, "--height") && next) {
            if (!parse_int_arg(next, &opts.height)) return false;
            ++i;
        }
        else if (!strcmp(arg, "--dt") && next) {
            char *str_end;
            opts.dt = strtod(next, &str_end);
            if (*next == '\0' || *str_end != '\0') return false;
            ++i;
        }
        else if (arg[0] == '-' && arg[1] == '-') {
            return false;
        }
        else {
            if (opts.input) {
                std::cerr << "only one input file is accepted\n";
                return false;
            }

            opts.input = arg;
        }
    }

    return opts.input != nullptr;
}

static bool is_markdown(const char *path) {
    size_t len = strlen(path);
    return len >= 3 && !strcmp(path + len - 3, ".md");
}

// line numbers inside a story are relative to the code block
static void report_error(const std::string &event, int first_line,
                         const script_error &error) {
    std::cerr << "error in event '" << event << "' "
              << error.pos.line + first_line - 1 << ":" << error.pos.column
              << ": " << error_kind_str(error.kind) << ": " << error.errmsg
              << "\n";
}

static bool dump_tokens(const story::event_script &script) {
    std::istringstream stream(script.code);
    std::vector<ast::token> tokens;
    script_error error;

    if (!ast::parse_tokens(stream, tokens, &error)) {
        report_error(script.event, script.line, error);
        return false;
    }

    std::cout << "event '" << script.event << "':\n";
    for (auto &tok : tokens) {
        std::cout << "  " << tok.pos.line + script.line - 1 << ":"
                  << tok.pos.column << " " << ast::token_to_str(tok) << "\n";
    }

    return true;
}

static void register_builtins(vm::runner &runner) {
    runner.register_native("print",
        [](vm::environment &, const std::vector<vm::value> &args) {
            for (size_t i = 0; i < args.size(); ++i) {
                if (i > 0) std::cout << " ";
                std::cout << vm::to_string(args[i]);
            }

            std::cout << "\n";
            return vm::value();
        });
}

static void update_globals(vm::runner &runner, const driver_options &opts,
                           int frame, double dt) {
    runner.set_global_float("dt", dt);
    runner.set_global_int("frame", frame);
    runner.set_global_int("screenWidth", opts.width);
    runner.set_global_int("screenHeight", opts.height);
}

int main(int argc, const char *argv[]) {
    driver_options opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage();
        return 2;
    }

    bool use_cin = !strcmp(opts.input, "-");

    std::unique_ptr<std::istream> istream;
    if (use_cin) {
        istream = std::make_unique<std::istream>(std::cin.rdbuf());
    } else {
        auto fstream = std::make_unique<std::ifstream>(opts.input);
        if (!fstream->is_open()) {
            std::cerr << "could not open file " << opts.input << "\n";
            return 1;
        }

        istream = std::move(fstream);
    }

    std::vector<story::event_script> scripts;
    if (!use_cin && is_markdown(opts.input)) {
        scripts = story::extract_event_scripts(*istream);
    } else {
        std::stringstream buf;
        buf << istream->rdbuf();
        scripts.push_back(story::event_script { opts.event, buf.str(), 1 });
    }

    if (opts.dump_tokens) {
        for (auto &script : scripts) {
            if (!dump_tokens(script)) return 1;
        }

        return 0;
    }

    // declared before the runner so Lua natives outlive it
    lua_host host;
    vm::runner runner;
    register_builtins(runner);

    if (opts.host_file) {
        std::string errmsg;
        if (!host.load_file(opts.host_file, &errmsg)) {
            std::cerr << "error loading host " << opts.host_file << ": "
                      << errmsg << "\n";
            return 1;
        }

        host.bind(runner);
    }

    for (auto &script : scripts) {
        ast::ast_program program;
        script_error error;

        if (!compile_program(script.code, program, &error)) {
            report_error(script.event, script.line, error);
            return 1;
        }

        runner.register_event(script.event, std::move(program));
    }

    auto trigger = [&](const std::string &event) {
        script_error error;
        if (runner.trigger_event(event, &error))
            return true;

        int first_line = 1;
        for (auto &script : scripts) {
            if (script.event == event) first_line = script.line;
        }

        report_error(event, first_line, error);
        return false;
    };

    update_globals(runner, opts, 0, 0.0);
    if (!trigger("init")) return 1;

    for (int frame = 1; frame <= opts.frames; ++frame) {
        update_globals(runner, opts, frame, opts.dt);

        if (!trigger("update") || !trigger("render"))
            return 1;
    }

    return 0;
}
