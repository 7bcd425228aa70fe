/*
    Strictbf - A bounds-checked brainfuck interpreter
    Fault classification
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <string_view>

#include "strictbf.hxx"

namespace strictbf {

FaultCategory categoryOf(FaultKind kind) noexcept {
    switch (kind) {
        case FaultKind::UnterminatedComment:
        case FaultKind::StrayCommentClose:
        case FaultKind::UnbalancedOpen:
        case FaultKind::UnbalancedClose:
        case FaultKind::UnrecognisedInstruction:
            return FaultCategory::Syntax;
        case FaultKind::BoundsLeft:
        case FaultKind::BoundsRight:
            return FaultCategory::Bounds;
        case FaultKind::Overflow:
            return FaultCategory::Overflow;
        case FaultKind::Underflow:
            return FaultCategory::Underflow;
        case FaultKind::InputRange:
            return FaultCategory::Input;
        case FaultKind::EmptyLoopStack:
        case FaultKind::UnmatchedLoop:
            break;
    }
    return FaultCategory::Internal;
}

std::string_view faultName(FaultKind kind) noexcept {
    switch (categoryOf(kind)) {
        case FaultCategory::Syntax:
            return "SyntaxError";
        case FaultCategory::Bounds:
            return "OutOfBoundsError";
        case FaultCategory::Overflow:
            return "OverflowError";
        case FaultCategory::Underflow:
            return "SubZeroError";
        case FaultCategory::Input:
            return "InputError";
        case FaultCategory::Internal:
            break;
    }
    return "InternalError";
}

}  // namespace strictbf
