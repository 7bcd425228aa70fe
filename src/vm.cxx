/*
    Strictbf - A bounds-checked brainfuck interpreter
    Execution engine
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "strictbf.hxx"

namespace {
using strictbf::InputEncoding;

constexpr long kEndOfInput = -1;
constexpr long kMalformedInput = -2;

// One byte, or one UTF-8 encoded code point, from `in`.
long readUnit(std::istream& in, InputEncoding encoding) {
    using Traits = std::istream::traits_type;
    const Traits::int_type lead = in.get();
    if (Traits::eq_int_type(lead, Traits::eof())) return kEndOfInput;
    if (encoding == InputEncoding::Byte || lead < 0x80) return lead;

    // Smallest code point each sequence length may encode; anything below is overlong.
    static constexpr long minimumForLength[] = {0, 0x80, 0x800, 0x10000};
    int continuation;
    long codePoint;
    if (lead == 0xC0 || lead == 0xC1) {
        return kMalformedInput;
    } else if ((lead & 0xE0) == 0xC0) {
        continuation = 1;
        codePoint = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        continuation = 2;
        codePoint = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        continuation = 3;
        codePoint = lead & 0x07;
    } else {
        return kMalformedInput;
    }
    const int length = continuation;
    while (continuation--) {
        const Traits::int_type next = in.get();
        if (Traits::eq_int_type(next, Traits::eof()) || (next & 0xC0) != 0x80)
            return kMalformedInput;
        codePoint = (codePoint << 6) | (next & 0x3F);
    }
    if (codePoint < minimumForLength[length]) return kMalformedInput;
    return codePoint;
}

std::string describeChar(char ch) {
    const auto byte = static_cast<unsigned char>(ch);
    if (std::isprint(byte)) return std::string{'\'', ch, '\''};
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02X", byte);
    return buf;
}

std::string describeCodePoint(long codePoint) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "U+%04lX", codePoint);
    return buf;
}

template <bool Profile>
strictbf::RunResult executeImpl(std::string_view code, std::istream& in, std::ostream& out,
                                const strictbf::RunOptions& options) {
    using namespace strictbf;
    auto tape = std::make_unique<Tape>();
    std::vector<std::size_t> loopStack;
    RunResult result;
    std::size_t ip = 0;

    auto finish = [&]() {
        out.flush();
        result.cellPtr = tape->pointer();
        result.furthestPtr = tape->furthestReached();
        if (options.report) result.report = tape->nonZeroCells();
        return std::move(result);
    };
    auto fail = [&](FaultKind kind, std::string message) {
        result.status = RunStatus::Faulted;
        result.fault = Fault{kind, ip, std::move(message)};
        return finish();
    };

    for (; ip < code.size(); ++ip) {
        if constexpr (Profile) ++options.profile->instructions;
        switch (code[ip]) {
            case '>':
                if (!tape->moveRight())
                    return fail(FaultKind::BoundsRight,
                                "cannot move the pointer past the last cell (" +
                                    std::to_string(Tape::size - 1) + ")");
                break;
            case '<':
                if (!tape->moveLeft())
                    return fail(FaultKind::BoundsLeft,
                                "cannot move the pointer before the first cell (0)");
                break;
            case '+':
                if (!tape->increment())
                    return fail(FaultKind::Overflow, "cannot increment a cell past " +
                                                         std::to_string(Tape::cellMax));
                break;
            case '-':
                if (!tape->decrement())
                    return fail(FaultKind::Underflow, "cannot decrement a cell below 0");
                break;
            case '[':
                if (tape->current() == 0) {
                    std::size_t depth = 1;
                    std::size_t close = ip;
                    while (depth && ++close < code.size()) {
                        if (code[close] == '[')
                            ++depth;
                        else if (code[close] == ']')
                            --depth;
                    }
                    if (depth)
                        return fail(FaultKind::UnmatchedLoop,
                                    "loop entry \"[\" has no matching \"]\" to skip to");
                    ip = close;
                    break;
                }
                loopStack.push_back(ip);
                if constexpr (Profile)
                    options.profile->maxLoopDepth =
                        std::max(options.profile->maxLoopDepth, loopStack.size());
                break;
            case ']':
                if (loopStack.empty()) [[unlikely]]
                    return fail(FaultKind::EmptyLoopStack,
                                "loop terminator \"]\" reached with no open loop");
                if (tape->current() > 0)
                    ip = loopStack.back();
                else
                    loopStack.pop_back();
                break;
            case ',': {
                out.flush();
                const long unit = readUnit(in, options.input);
                if (unit == kMalformedInput)
                    return fail(FaultKind::InputRange, "input is not valid UTF-8");
                if (unit == kEndOfInput) {
                    if (options.eof == 1)
                        tape->store(0);
                    else if (options.eof == 2)
                        tape->store(Tape::cellMax);
                    break;
                }
                if (unit > Tape::cellMax)
                    return fail(FaultKind::InputRange, "input character " +
                                                           describeCodePoint(unit) +
                                                           " exceeds the cell limit of " +
                                                           std::to_string(Tape::cellMax));
                tape->store(static_cast<std::uint8_t>(unit));
                break;
            }
            case '.':
                out.put(static_cast<char>(tape->current()));
                result.producedOutput = true;
                break;
            default:
                return fail(FaultKind::UnrecognisedInstruction,
                            "unrecognised instruction " + describeChar(code[ip]) +
                                "; comment text with // or wrap it in /* */");
        }
    }
    return finish();
}
}  // namespace

strictbf::RunResult strictbf::execute(std::string_view code, std::istream& in, std::ostream& out,
                                      const RunOptions& options) {
    if (!options.profile) return executeImpl<false>(code, in, out, options);

    *options.profile = ProfileInfo{};
    const auto start = std::chrono::steady_clock::now();
    RunResult result = executeImpl<true>(code, in, out, options);
    options.profile->seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    return result;
}

strictbf::RunResult strictbf::run(const std::string& source, std::istream& in, std::ostream& out) {
    return run(source, RunOptions{}, in, out);
}

strictbf::RunResult strictbf::run(const std::string& source, const RunOptions& options,
                                  std::istream& in, std::ostream& out) {
    std::string code;
    if (auto fault = sanitize(source, code)) {
        RunResult result;
        result.status = RunStatus::Faulted;
        result.fault = std::move(*fault);
        return result;
    }
    return execute(code, in, out, options);
}
