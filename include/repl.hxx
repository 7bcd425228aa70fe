/*
    Strictbf - A bounds-checked brainfuck interpreter
    REPL API declarations
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once
#ifdef STRICTBF_ENABLE_REPL
#include "strictbf.hxx"

struct ReplConfig {
    int eof;
    strictbf::InputEncoding input;
    bool color;
};

// Reads lines until :q or end of input. Every line runs on a fresh tape.
int runRepl(ReplConfig& cfg);
#endif  // STRICTBF_ENABLE_REPL
