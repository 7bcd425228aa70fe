/*
    Strictbf - A bounds-checked brainfuck interpreter
    Interpreter API declarations
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once
#include "strictbf/config.hxx"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace strictbf {

enum class FaultKind : uint8_t {
    UnterminatedComment,
    StrayCommentClose,
    UnbalancedOpen,
    UnbalancedClose,
    UnrecognisedInstruction,
    BoundsLeft,
    BoundsRight,
    Overflow,
    Underflow,
    InputRange,
    EmptyLoopStack,
    UnmatchedLoop,
};

enum class FaultCategory : uint8_t { Syntax, Bounds, Overflow, Underflow, Input, Internal };

struct Fault {
    FaultKind kind{};
    std::size_t position = 0;  // zero-based, in the sanitized stream
    std::string message;
};

FaultCategory categoryOf(FaultKind kind) noexcept;
// Display name, e.g. "SyntaxError" or "SubZeroError"
std::string_view faultName(FaultKind kind) noexcept;

enum class InputEncoding : uint8_t { Byte, Utf8 };

struct ProfileInfo {
    std::uint64_t instructions = 0;
    double seconds = 0.0;
    std::size_t maxLoopDepth = 0;
};

struct RunOptions {
    bool report = false;
    int eof = STRICTBF_DEFAULT_EOF_BEHAVIOUR;
    InputEncoding input = InputEncoding::Byte;
    ProfileInfo* profile = nullptr;
};

struct CellValue {
    std::size_t index;
    std::uint8_t value;

    bool operator==(const CellValue&) const = default;
};

enum class RunStatus : uint8_t { Completed, Faulted };

struct RunResult {
    RunStatus status = RunStatus::Completed;
    Fault fault{};
    bool producedOutput = false;
    std::vector<CellValue> report{};
    std::size_t cellPtr = 0;
    std::size_t furthestPtr = 0;

    bool ok() const noexcept { return status == RunStatus::Completed; }
};

}  // namespace strictbf

#include "strictbf/executor.hxx"
#include "strictbf/sanitizer.hxx"
#include "strictbf/tape.hxx"
