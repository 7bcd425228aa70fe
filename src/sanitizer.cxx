/*
    Strictbf - A bounds-checked brainfuck interpreter
    Source sanitizer and structural validation
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "strictbf.hxx"

namespace strictbf {

namespace {
std::optional<Fault> checkComments(std::string_view code) {
    const std::size_t open = code.find("/*");
    const std::size_t close = code.find("*/");
    if (open == std::string_view::npos && close == std::string_view::npos) return std::nullopt;
    if (open < close) {
        return Fault{FaultKind::UnterminatedComment, open,
                     "cannot run code with an unterminated block comment (\"/*\" has no "
                     "closing \"*/\")"};
    }
    return Fault{FaultKind::StrayCommentClose, close,
                 "cannot run code with a stray comment terminator (\"*/\" has no opening "
                 "\"/*\")"};
}

std::optional<Fault> checkBrackets(std::string_view code) {
    const auto opens = std::ranges::count(code, '[');
    const auto closes = std::ranges::count(code, ']');
    if (opens > closes) {
        return Fault{FaultKind::UnbalancedOpen, code.find('['),
                     "cannot run code with an unterminated loop (unmatched \"[\")"};
    }
    if (opens < closes) {
        return Fault{FaultKind::UnbalancedClose, code.rfind(']'),
                     "cannot run code with a trailing loop terminator (unmatched \"]\")"};
    }
    return std::nullopt;
}
}  // namespace

void stripLineComments(std::string& code) {
    std::string result;
    result.reserve(code.size());
    std::size_t pos = 0;
    while (pos < code.size()) {
        const std::size_t start = code.find("//", pos);
        if (start == std::string::npos) break;
        result.append(code, pos, start - pos);
        // the line break itself stays
        pos = code.find_first_of("\r\n", start + 2);
    }
    if (pos < code.size()) result.append(code, pos, std::string::npos);
    code = std::move(result);
}

void stripWhitespace(std::string& code) {
    std::erase_if(code, [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; });
}

void stripBlockComments(std::string& code) {
    std::string result;
    result.reserve(code.size());
    std::size_t pos = 0;
    while (pos < code.size()) {
        const std::size_t open = code.find("/*", pos);
        if (open == std::string::npos) break;
        const std::size_t close = code.find("*/", open + 2);
        if (close == std::string::npos) break;
        result.append(code, pos, open - pos);
        pos = close + 2;
    }
    if (pos < code.size()) result.append(code, pos, std::string::npos);
    code = std::move(result);
}

std::optional<Fault> sanitize(std::string_view source, std::string& code) {
    std::string cleaned{source};
    stripLineComments(cleaned);
    stripWhitespace(cleaned);
    stripBlockComments(cleaned);

    if (auto fault = checkComments(cleaned)) return fault;
    if (auto fault = checkBrackets(cleaned)) return fault;
    code = std::move(cleaned);
    return std::nullopt;
}

}  // namespace strictbf
