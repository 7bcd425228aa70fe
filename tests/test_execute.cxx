#include <cassert>
#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

#include "helpers.hxx"
#include "strictbf.hxx"

using strictbf::FaultKind;

static void test_increment_limit() {
    std::string out;
    strictbf::RunOptions opts;
    opts.report = true;
    strictbf::RunResult r = runCode(std::string(255, '+'), out, "", opts);
    assert(r.ok());
    assert(r.report.size() == 1);
    assert(r.report[0] == (strictbf::CellValue{0, 255}));

    r = runCode(std::string(256, '+'), out);
    assert(!r.ok());
    assert(r.fault.kind == FaultKind::Overflow);
    assert(r.fault.position == 255);
}

static void test_decrement_limit() {
    std::string out;
    strictbf::RunResult r = runCode("-", out);
    assert(r.fault.kind == FaultKind::Underflow);
    assert(r.fault.position == 0);

    r = runCode("+++---", out);
    assert(r.ok());

    r = runCode("++>+<---", out);
    assert(r.fault.kind == FaultKind::Underflow);
    assert(r.fault.position == 7);
}

static void test_pointer_bounds() {
    std::string out;
    std::string toEnd(strictbf::Tape::size - 1, '>');
    strictbf::RunResult r = runCode(toEnd, out);
    assert(r.ok());
    assert(r.cellPtr == 29999);
    assert(r.furthestPtr == 29999);

    r = runCode(toEnd + ">", out);
    assert(r.fault.kind == FaultKind::BoundsRight);
    assert(r.fault.position == 29999);
    assert(r.cellPtr == 29999);

    r = runCode("<", out);
    assert(r.fault.kind == FaultKind::BoundsLeft);
    assert(r.fault.position == 0);

    r = runCode("><<", out);
    assert(r.fault.kind == FaultKind::BoundsLeft);
    assert(r.fault.position == 2);
    assert(strictbf::faultName(r.fault.kind) == "OutOfBoundsError");
}

static void test_clear_loop_iterations() {
    for (int n = 0; n <= 255; ++n) {
        std::string out;
        strictbf::ProfileInfo profile;
        strictbf::RunOptions opts;
        opts.report = true;
        opts.profile = &profile;
        strictbf::RunResult r = runCode(std::string(n, '+') + "[-]", out, "", opts);
        assert(r.ok());
        assert(r.report.empty());
        assert(!r.producedOutput);
        // n increments, one loop entry, then one "-" and one "]" per iteration
        assert(profile.instructions == static_cast<std::uint64_t>(3 * n + 1));
    }
}

static void test_byte_echo() {
    for (int v = 0; v <= 255; ++v) {
        std::string out;
        strictbf::RunResult r = runCode(",.", out, std::string(1, static_cast<char>(v)));
        assert(r.ok());
        assert(r.producedOutput);
        assert(out.size() == 1);
        assert(static_cast<unsigned char>(out[0]) == v);
    }
}

static void test_utf8_input() {
    strictbf::RunOptions opts;
    opts.input = strictbf::InputEncoding::Utf8;
    std::string out;
    strictbf::RunResult r = runCode(",.", out, "A", opts);
    assert(r.ok());
    assert(out == "A");

    r = runCode(",.", out, "\xC3\xA9", opts);  // U+00E9
    assert(r.ok());
    assert(out == "\xE9");

    r = runCode("+,.", out, "\xC4\x80", opts);  // U+0100
    assert(!r.ok());
    assert(r.fault.kind == FaultKind::InputRange);
    assert(r.fault.position == 1);
    assert(out.empty());
    assert(strictbf::faultName(r.fault.kind) == "InputError");

    r = runCode(",", out, "\xE2\x82\xAC", opts);  // U+20AC
    assert(r.fault.kind == FaultKind::InputRange);

    r = runCode(",", out, "\xC3", opts);
    assert(r.fault.kind == FaultKind::InputRange);

    // overlong two and three byte forms of 'A', two byte form of NUL
    r = runCode(",.", out, "\xC1\x81", opts);
    assert(r.fault.kind == FaultKind::InputRange);
    assert(out.empty());
    r = runCode(",.", out, "\xE0\x81\x81", opts);
    assert(r.fault.kind == FaultKind::InputRange);
    assert(out.empty());
    r = runCode(",.", out, "\xC0\x80", opts);
    assert(r.fault.kind == FaultKind::InputRange);
    assert(out.empty());
    r = runCode(",", out, "\xF0\x80\x80\x80", opts);
    assert(r.fault.kind == FaultKind::InputRange);

    // shortest forms at each length boundary still decode
    r = runCode(",.", out, "\xC2\x80", opts);  // U+0080
    assert(r.ok());
    assert(out == "\x80");
}

static void test_eof_behaviour() {
    std::string out;
    strictbf::RunOptions opts;
    opts.eof = 0;
    strictbf::RunResult r = runCode("+++,.", out, "", opts);
    assert(r.ok());
    assert(out == "\x03");

    opts.eof = 1;
    r = runCode("+++,.", out, "", opts);
    assert(out == std::string(1, '\0'));

    opts.eof = 2;
    r = runCode("+++,.", out, "", opts);
    assert(out == "\xFF");
}

static void test_end_to_end() {
    std::string out;
    strictbf::RunResult r = runCode("+++.", out);
    assert(r.ok());
    assert(out == "\x03");

    strictbf::RunOptions opts;
    opts.report = true;
    r = runCode("+++[-]", out, "", opts);
    assert(r.ok());
    assert(!r.producedOutput);
    assert(out.empty());
    assert(r.report.empty());
    assert(r.furthestPtr == 0);

    r = runCode("+++++[>++++++++<-]>.", out, "", opts);
    assert(r.ok());
    assert(out == "(");
    assert(r.cellPtr == 1);
    assert(r.report.size() == 1);
    assert(r.report[0] == (strictbf::CellValue{1, 40}));

    r = runCode("[[]", out);
    assert(!r.ok());
    assert(r.fault.kind == FaultKind::UnbalancedOpen);
    assert(out.empty());
}

static void test_hello_world() {
    const std::string hello =
        "++++++++[>++++[>++>+++>+++>+<<<<-]>+>+>->>+[<]<-]>>.>---.+++++++..+++.>>.<-.<.+++.------."
        "--------.>>+.>++.";
    std::string out1, out2;
    assert(runCode(hello, out1).ok());
    assert(runCode(hello, out2).ok());
    assert(hashOutput(out1) == hashOutput("Hello World!\n"));
    assert(hashOutput(out1) == hashOutput(out2));
}

static void test_nested_loops() {
    std::string out;
    strictbf::ProfileInfo profile;
    strictbf::RunOptions opts;
    opts.profile = &profile;
    strictbf::RunResult r = runCode("++[>++[>+<-]<-]>>.", out, "", opts);
    assert(r.ok());
    assert(out == "\x04");
    assert(profile.maxLoopDepth == 2);
}

static void test_unrecognised_instruction() {
    std::string out;
    strictbf::RunResult r = runCode("+.x.", out);
    assert(!r.ok());
    assert(r.fault.kind == FaultKind::UnrecognisedInstruction);
    assert(r.fault.position == 2);
    assert(r.fault.message.find("'x'") != std::string::npos);
    assert(out == "\x01");
    assert(strictbf::faultName(r.fault.kind) == "SyntaxError");
}

static void test_fault_stops_run() {
    std::string out;
    strictbf::RunOptions opts;
    opts.report = true;
    strictbf::RunResult r = runCode("+.<.", out, "", opts);
    assert(r.fault.kind == FaultKind::BoundsLeft);
    assert(r.fault.position == 2);
    assert(out == "\x01");
    assert(r.report.size() == 1);
}

static void test_empty_loop_stack() {
    std::string out;
    strictbf::RunResult r = runCode("][", out);
    assert(!r.ok());
    assert(r.fault.kind == FaultKind::EmptyLoopStack);
    assert(r.fault.position == 0);
    assert(strictbf::faultName(r.fault.kind) == "InternalError");

    r = runCode("+][", out);
    assert(r.fault.kind == FaultKind::EmptyLoopStack);
    assert(r.fault.position == 1);
}

static void test_unmatched_skip() {
    // sanitize() rejects this source; execute() alone has to catch it
    std::istringstream in;
    std::ostringstream out;
    strictbf::RunResult r = strictbf::execute("+-[", in, out, strictbf::RunOptions{});
    assert(!r.ok());
    assert(r.fault.kind == FaultKind::UnmatchedLoop);
    assert(r.fault.position == 2);
}

static void test_report_range() {
    std::string out;
    strictbf::RunOptions opts;
    opts.report = true;
    strictbf::RunResult r = runCode("+>>++<", out, "", opts);
    assert(r.ok());
    assert(r.cellPtr == 1);
    assert(r.furthestPtr == 2);
    assert(r.report.size() == 2);
    assert(r.report[0] == (strictbf::CellValue{0, 1}));
    assert(r.report[1] == (strictbf::CellValue{2, 2}));

    r = runCode(std::string(37, '>') + "+++>>>", out, "", opts);
    assert(r.furthestPtr == 40);
    assert(r.report.size() == 1);
    assert(r.report[0] == (strictbf::CellValue{37, 3}));

    r = runCode(std::string(20, '>') + "+" + std::string(20, '>'), out, "", opts);
    assert(r.furthestPtr == 40);
    assert(r.report.size() == 1);
    assert(r.report[0] == (strictbf::CellValue{20, 1}));

    r = runCode("+>+", out);
    assert(r.report.empty());
}

int main() {
    test_increment_limit();
    test_decrement_limit();
    test_pointer_bounds();
    test_clear_loop_iterations();
    test_byte_echo();
    test_utf8_input();
    test_eof_behaviour();
    test_end_to_end();
    test_hello_world();
    test_nested_loops();
    test_unrecognised_instruction();
    test_fault_stops_run();
    test_empty_loop_stack();
    test_unmatched_skip();
    test_report_range();
    return 0;
}
