#pragma once

#include <xxhash.h>

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>

#include "strictbf.hxx"

inline std::uint64_t hashOutput(std::string_view s) { return XXH64(s.data(), s.size(), 0); }

inline strictbf::RunResult runCode(const std::string& source, std::string& output,
                                   const std::string& input = "",
                                   const strictbf::RunOptions& options = {}) {
    std::istringstream in(input);
    std::ostringstream out;
    strictbf::RunResult result = strictbf::run(source, options, in, out);
    output = out.str();
    return result;
}
