/*
    Strictbf - A bounds-checked brainfuck interpreter
    Source file loading
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once
#include <string>
#include <string_view>

namespace strictbf {
bool hasSourceExtension(std::string_view path) noexcept;

// Reads a whole source file. Fails on a missing extension, an unreadable file or empty contents.
// Returns true on success; on error, 'err' is set and 'out' left unchanged.
bool loadSource(const std::string& path, std::string& out, std::string& err);
}  // namespace strictbf
