/*
    Strictbf - A bounds-checked brainfuck interpreter
    Terminal rendering of faults and memory reports
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once
#include <ostream>
#include <string_view>

#include "strictbf.hxx"

namespace strictbf {
// "<Name>: at position <p> - <message>"
void printFault(std::ostream& out, const Fault& fault, bool color);
// Faults raised outside a run (file loading, arguments): "<Name>: <message>"
void printError(std::ostream& out, std::string_view name, std::string_view message, bool color);
void printNoOutput(std::ostream& out, bool color);
void printReport(std::ostream& out, const RunResult& result, bool color);
}  // namespace strictbf
