#include <cstddef>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <ast/program.hpp>
#include <error.hpp>
#include <eval/environment.hpp>
#include <eval/interpreter.hpp>
#include <fmt/core.h>
#include <fmt/ostream.h>
#include <lexer/lexer.hpp>
#include <parser/parser.hpp>

namespace
{
constexpr auto prompt = ">> ";

struct command_line_args
{
    bool help {};
    bool debug {};
    std::string_view file;
};

[[noreturn]] auto show_usage(std::string_view program, std::string_view error_msg = {})
{
    auto exit_code = EXIT_SUCCESS;
    if (!error_msg.empty()) {
        fmt::print("Error: {}\n", error_msg);
        exit_code = EXIT_FAILURE;
    }
    fmt::print("Usage: {} [-d] [-h] [<file>]\n\n", program);
    // NOLINTBEGIN(concurrency-mt-unsafe)
    exit(exit_code);
    // NOLINTEND(concurrency-mt-unsafe)
}

auto parse_command_line(std::string_view program, int argc, char** argv) -> command_line_args
{
    command_line_args opts {};
    for (std::string_view arg : std::span(argv, static_cast<size_t>(argc))) {
        if (arg[0] == '-' && arg.size() == 1) {
            show_usage(program, fmt::format("invalid option {}", arg));
        }
        if (arg[0] == '-' && arg.size() > 1) {
            switch (arg[1]) {
                case 'h':
                    opts.help = true;
                    break;
                case 'd':
                    opts.debug = true;
                    break;
                default: {
                    show_usage(program, fmt::format("invalid option {}", arg));
                }
            }
        } else {
            if (opts.file.empty()) {
                opts.file = arg;
            } else {
                fmt::print("ignoring file argument {}, already have one set.\n", arg);
            }
        }
    }
    return opts;
}

auto print_error(const script_error& err)
{
    fmt::print(std::cerr, "{}\n", describe(err));
}

auto parse(std::string_view source, std::string_view filename) -> program_ptr
{
    auto lxr = lexer {source, filename};
    auto prsr = parser {lxr.scan_tokens()};
    return prsr.parse_program();
}

auto execute(interpreter& intrprtr, const program& prgrm, bool debug)
{
    if (debug) {
        fmt::print("{}\n", prgrm.string());
    }
    intrprtr.run(prgrm);
    if (debug) {
        intrprtr.globals()->debug();
    }
}

auto run_file(const command_line_args& opts) -> int
{
    std::ifstream ifs(std::string {opts.file});
    if (!ifs) {
        fmt::print(std::cerr, "ERROR: could not open file: {}\n", opts.file);
        return 1;
    }
    const std::string contents {(std::istreambuf_iterator<char>(ifs)), (std::istreambuf_iterator<char>())};
    try {
        const auto prgrm = parse(contents, opts.file);
        auto intrprtr = interpreter {};
        execute(intrprtr, *prgrm, opts.debug);
    } catch (const script_error& err) {
        print_error(err);
        return 1;
    }
    return 0;
}

auto run_repl(const command_line_args& opts) -> int
{
    fmt::print("This is gscript. Feel free to type in commands\n");
    auto intrprtr = interpreter {};
    // functions defined on one line are called from later ones, so every program stays alive
    std::vector<program_ptr> programs;
    auto show_prompt = []() { fmt::print("{}", prompt); };
    auto input = std::string {};
    show_prompt();
    while (getline(std::cin, input)) {
        try {
            const auto& prgrm = programs.emplace_back(parse(input, "<stdin>"));
            execute(intrprtr, *prgrm, opts.debug);
        } catch (const script_error& err) {
            print_error(err);
        }
        show_prompt();
    }
    return 0;
}
}  // namespace

auto main(int argc, char* argv[]) -> int
{
    auto program = std::string_view(*argv);
    auto opts = parse_command_line(program, argc - 1, ++argv);
    if (opts.help) {
        show_usage(program);
    }
    try {
        if (!opts.file.empty()) {
            return run_file(opts);
        }
        return run_repl(opts);
    } catch (const std::exception& e) {
        fmt::print(std::cerr, "Caught an exception: {}\n", e.what());
        return 1;
    }
}
