/*
    Strictbf - A bounds-checked brainfuck interpreter
    Terminal rendering of faults and memory reports
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "render.hxx"

#include <iomanip>
#include <ostream>
#include <string>
#include <string_view>

#include "cpp-terminal/color.hpp"

namespace {
std::string fg(Term::Color::Name name, bool color) {
    return color ? Term::color_fg(name) : std::string{};
}
std::string reset(bool color) { return fg(Term::Color::Name::Default, color); }
}  // namespace

void strictbf::printFault(std::ostream& out, const Fault& fault, bool color) {
    out << fg(Term::Color::Name::Red, color) << faultName(fault.kind) << ": at position "
        << fault.position << " - " << fault.message << reset(color) << std::endl;
}

void strictbf::printError(std::ostream& out, std::string_view name, std::string_view message,
                          bool color) {
    out << fg(Term::Color::Name::Red, color) << name << ": " << message << reset(color)
        << std::endl;
}

void strictbf::printNoOutput(std::ostream& out, bool color) {
    out << fg(Term::Color::Name::Red, color) << "No output provided." << reset(color)
        << std::endl;
}

void strictbf::printReport(std::ostream& out, const RunResult& result, bool color) {
    out << "\n Memory Breakdown\n------------------\n";
    for (const auto& cell : result.report) {
        out << fg(Term::Color::Name::Cyan, color) << std::setw(7) << cell.index << reset(color)
            << " - " << fg(Term::Color::Name::Green, color) << '[' << +cell.value << ']'
            << reset(color) << '\n';
    }
    out << "\n    ptr => " << fg(Term::Color::Name::Cyan, color) << result.cellPtr << reset(color)
        << std::endl;
}
