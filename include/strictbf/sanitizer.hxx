#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace strictbf {
struct Fault;

// Each pass runs in one linear scan over `code`.
void stripLineComments(std::string& code);
void stripWhitespace(std::string& code);
// Shortest match; an opening "/*" without a terminator is left in place.
void stripBlockComments(std::string& code);

/// Strips `//` line comments, whitespace and `/* */` block comments from raw source, in that
/// order, then checks comment and bracket structure.
/// On success `code` holds the cleaned stream and the return value is empty. On failure the
/// fault position refers to the whitespace-stripped text.
std::optional<Fault> sanitize(std::string_view source, std::string& code);

}  // namespace strictbf
