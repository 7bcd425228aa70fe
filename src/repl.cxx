/*
    Strictbf - A bounds-checked brainfuck interpreter
    Simple line-based REPL implementation using linenoise-ng
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#ifdef STRICTBF_ENABLE_REPL
#include "repl.hxx"

#include <linenoise.h>

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

#include "render.hxx"

namespace {
constexpr int historyLen = 100;
}

int runRepl(ReplConfig& cfg) {
    linenoiseHistorySetMaxLen(historyLen);
    strictbf::RunResult last;
    bool haveLast = false;
    while (true) {
        char* line = linenoise("$ ");
        if (line == nullptr) {
            std::cout << std::endl;
            break;  // Ctrl-D or Ctrl-C
        }
        std::string input(line);
        linenoiseHistoryAdd(line);
        std::free(line);
        if (input.empty()) continue;
        if (input[0] == ':') {
            std::istringstream iss(input.substr(1));
            std::string cmd;
            iss >> cmd;
            if (cmd == "q" || cmd == "quit") {
                break;
            } else if (cmd == "dump") {
                if (haveLast)
                    strictbf::printReport(std::cout, last, cfg.color);
                else
                    std::cout << "Nothing has run yet" << std::endl;
            } else if (cmd == "help") {
                std::cout << "Commands:\n"
                          << ":dump             memory report of the last run\n"
                          << ":eof 0|1|2        EOF: keep cell, store 0, store 255\n"
                          << ":raw on|off       read raw bytes instead of UTF-8\n"
                          << ":q                quit" << std::endl;
            } else if (cmd == "eof") {
                int v{};
                if (iss >> v && v >= 0 && v <= 2) {
                    cfg.eof = v;
                } else {
                    std::cout << "Invalid EOF" << std::endl;
                }
            } else if (cmd == "raw") {
                std::string val;
                iss >> val;
                if (val == "on")
                    cfg.input = strictbf::InputEncoding::Byte;
                else if (val == "off")
                    cfg.input = strictbf::InputEncoding::Utf8;
            } else {
                std::cout << "Unknown command" << std::endl;
            }
            continue;
        }
        strictbf::RunOptions options;
        options.report = true;
        options.eof = cfg.eof;
        options.input = cfg.input;
        last = strictbf::run(input, options);
        haveLast = true;
        if (!last.ok()) {
            std::cout << std::endl;
            strictbf::printFault(std::cout, last.fault, cfg.color);
        } else if (!last.producedOutput) {
            strictbf::printNoOutput(std::cout, cfg.color);
        } else {
            std::cout << std::endl;
        }
    }
    return 0;
}
#endif  // STRICTBF_ENABLE_REPL
