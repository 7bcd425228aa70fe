#pragma once

#include <iostream>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>

namespace strictbf {
struct RunOptions;
struct RunResult;

/// @brief Runs an already sanitized instruction stream on a fresh tape.
/// @param code Output of sanitize(). Characters outside the instruction set are reported as
/// unrecognised instructions when the instruction pointer reaches them.
/// @param in Source for `,`. Read one byte (or one UTF-8 code point, see RunOptions::input) at a
/// time.
/// @param out Receives one byte per executed `.`. Flushed when the run ends.
/// @param options Report flag, EOF behaviour, input encoding and optional profile sink.
///
/// The tape is 30000 cells of [0, 255]. Moving off either end, incrementing 255 or decrementing
/// 0 stops the run with a fault; nothing wraps. The first fault is returned in the result and no
/// further instruction runs.
/// @return Completed or Faulted, with the memory report filled in when options.report is set.
RunResult execute(std::string_view code, std::istream& in, std::ostream& out,
                  const RunOptions& options);

/// @brief sanitize() then execute(). A validation fault is returned without running anything.
RunResult run(const std::string& source, std::istream& in = std::cin,
              std::ostream& out = std::cout);
RunResult run(const std::string& source, const RunOptions& options, std::istream& in = std::cin,
              std::ostream& out = std::cout);
}  // namespace strictbf
