/*
    Strictbf - A bounds-checked brainfuck interpreter
    Main standalone file
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

#include "loader.hxx"
#include "render.hxx"
#include "strictbf.hxx"
#ifdef STRICTBF_ENABLE_REPL
#include "repl.hxx"
#endif

#ifdef _WIN32
#include <io.h>
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace {
struct CmdArgs {
    std::string filename;
    std::string evalCode;
    bool hasEval = false;
    bool debug = false;
    bool help = false;
    bool repl = false;
    bool profile = false;
    bool rawInput = false;
    bool noColor = false;
    int eof = STRICTBF_DEFAULT_EOF_BEHAVIOUR;
    std::string argError;
};

CmdArgs parseArgs(int argc, char* argv[]) {
    CmdArgs args;
    if (argc < 2) {
        args.help = true;
        return args;
    }
    for (int i = 1; i < argc && args.argError.empty(); ++i) {
        std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            args.help = true;
        } else if (arg == "-d" || arg == "--debug") {
            args.debug = true;
        } else if (arg == "-r" || arg == "--repl") {
            args.repl = true;
        } else if (arg == "--profile") {
            args.profile = true;
        } else if (arg == "--raw-input") {
            args.rawInput = true;
        } else if (arg == "--no-color") {
            args.noColor = true;
        } else if (arg == "-e") {
            if (i + 1 >= argc) {
                args.argError = "expected code after \"-e\".";
            } else if (args.hasEval || !args.filename.empty()) {
                args.argError = "only one program can be run at a time.";
            } else {
                args.evalCode = argv[++i];
                args.hasEval = true;
            }
        } else if (arg == "-eof") {
            if (i + 1 >= argc) {
                args.argError = "expected a value after \"-eof\".";
                continue;
            }
            const char* val = argv[++i];
            char* end = nullptr;
            long parsed = std::strtol(val, &end, 10);
            if (end == val || *end != '\0') {
                args.argError = "invalid EOF mode \"" + std::string(val) + "\".";
            } else if (parsed < 0 || parsed > 2) {
                std::cerr << "warning: EOF mode must be 0, 1 or 2; received " << parsed
                          << std::endl;
                args.help = true;
            } else {
                args.eof = static_cast<int>(parsed);
            }
        } else if (arg.size() > 1 && arg[0] == '-') {
            args.argError = "unknown option \"" + std::string(arg) +
                            "\"; expected '-d' or '--debug' after the file path.";
        } else if (args.hasEval || !args.filename.empty()) {
            args.argError =
                "too many arguments were provided. If this is meant to be a file path, wrap it "
                "in \"quotation marks\".";
        } else {
            args.filename = arg;
        }
    }
    if (args.argError.empty() && !args.help && !args.repl && !args.hasEval &&
        args.filename.empty()) {
        args.argError = "no source file was provided.";
    }
    return args;
}

void printHelp(const char* prog) {
    std::cout << "Usage: " << prog << " <file" STRICTBF_SOURCE_EXTENSION "> [options]\n"
              << "       " << prog << " -e <code> [options]\n"
              << "Options:\n"
              << "  -d, --debug      Print the memory breakdown after the run\n"
              << "  -e <code>        Execute code directly\n"
              << "  -eof <value>     End of input: 0 keep cell, 1 store 0, 2 store 255\n"
              << "  --raw-input      Read input as raw bytes instead of UTF-8 characters\n"
              << "  --profile        Print execution profile\n"
              << "  --no-color       Disable colored diagnostics\n"
              << "  -r, --repl       Start an interactive session\n"
              << "  -h, --help       Show this help message\n"
              << "\n"
              << "Comments: // to the end of the line, or /* ... */. Whitespace is ignored, so\n"
              << "reported positions count instructions only.\n"
              << "The tape has " << STRICTBF_TAPE_SIZE << " cells, each limited to 0-"
              << STRICTBF_CELL_MAX << "; leaving either range is an error." << std::endl;
}

bool terminalSupportsColor() {
#ifdef _WIN32
    HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
    if (hOut == INVALID_HANDLE_VALUE) return false;
    DWORD mode = 0;
    if (!GetConsoleMode(hOut, &mode)) return false;
    SetConsoleMode(hOut, mode | ENABLE_VIRTUAL_TERMINAL_PROCESSING);
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(STDOUT_FILENO) && isatty(STDERR_FILENO);
#endif
}
}  // namespace

int main(int argc, char* argv[]) {
    const CmdArgs opts = parseArgs(argc, argv);
    const bool color = !opts.noColor && terminalSupportsColor();
    if (!opts.argError.empty()) {
        strictbf::printError(std::cerr, "ArgumentError", opts.argError, color);
        return 1;
    }
    if (opts.help) {
        printHelp(argv[0]);
        return 0;
    }
    const auto input = opts.rawInput ? strictbf::InputEncoding::Byte : strictbf::InputEncoding::Utf8;
    if (opts.repl) {
#ifdef STRICTBF_ENABLE_REPL
        ReplConfig cfg{opts.eof, input, color};
        return runRepl(cfg);
#else
        strictbf::printError(std::cerr, "ArgumentError",
                             "REPL disabled; use a file path or -e <code> to run a program", color);
        return 1;
#endif
    }

    std::string source;
    if (opts.hasEval) {
        source = opts.evalCode;
    } else {
        std::string err;
        if (!strictbf::loadSource(opts.filename, source, err)) {
            strictbf::printError(std::cerr, "FileLoadError", err, color);
            return 1;
        }
    }

    strictbf::ProfileInfo profile;
    strictbf::RunOptions options;
    options.report = opts.debug;
    options.eof = opts.eof;
    options.input = input;
    options.profile = opts.profile ? &profile : nullptr;
    const strictbf::RunResult result = strictbf::run(source, options);

    if (!result.ok())
        strictbf::printFault(std::cerr, result.fault, color);
    else if (!result.producedOutput)
        strictbf::printNoOutput(std::cerr, color);
    if (opts.debug) strictbf::printReport(std::cout, result, color);
    if (opts.profile) {
        std::cout << "Instructions executed: " << profile.instructions << std::endl;
        std::cout << "Elapsed time: " << profile.seconds << "s" << std::endl;
        std::cout << "Deepest loop nesting: " << profile.maxLoopDepth << std::endl;
    }
    return result.ok() ? 0 : 1;
}
