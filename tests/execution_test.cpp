#include "run.h"
#include "test_support.h"
#include <gtest/gtest.h>
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <sstream>

namespace {

/* Runs `source` both ways and requires the two runs to be indistinguishable. */
RunOutput run_both(const std::string& source, const std::vector<std::string>& args = {}) {
    RunOutput walked = run_interpreted(source, args);
    RunOutput compiled = run_compiled(source, args);
    EXPECT_EQ(walked.ok, compiled.ok) << source;
    EXPECT_EQ(walked.out, compiled.out) << source;
    EXPECT_EQ(walked.err, compiled.err) << source;
    EXPECT_EQ(walked.exit_code, compiled.exit_code) << source;
    EXPECT_EQ(walked.vars, compiled.vars) << source;
    EXPECT_EQ(walked.error.kind, compiled.error.kind) << source;
    EXPECT_STREQ(walked.error.message, compiled.error.message) << source;
    EXPECT_EQ(walked.error.line, compiled.error.line) << source;
    return walked;
}

std::vector<std::string> sorted_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    std::sort(lines.begin(), lines.end());
    return lines;
}

}  // namespace

TEST(ExecutionTest, EchoPrintsArguments) {
    RunOutput r = run_both("echo hello world");
    EXPECT_TRUE(r.ok);
    EXPECT_EQ("hello world\n", r.out);
    EXPECT_EQ("", r.err);
    EXPECT_EQ(0, r.exit_code);
}

TEST(ExecutionTest, ArithmeticAndVariables) {
    RunOutput r = run_both("x = 2 + 3 * 4\ny = ($x - 4) / 2\necho $x $y");
    EXPECT_EQ("14 5\n", r.out);
    EXPECT_EQ("int:14", r.vars["x"]);
    EXPECT_EQ("int:5", r.vars["y"]);
}

TEST(ExecutionTest, FloatsAndUnary) {
    RunOutput r = run_both("a = 1 / 2.0\nb = -(2 + 3)\nc = not true\necho $a $b $c");
    EXPECT_EQ("0.5 -5 false\n", r.out);
    EXPECT_EQ("float:0.5", r.vars["a"]);
    EXPECT_EQ("bool:false", r.vars["c"]);
}

TEST(ExecutionTest, PlusConcatenatesStrings) {
    RunOutput r = run_both("name = \"luw\"\ngreeting = \"hi \" + $name\necho $greeting (\"n\" + 1)");
    EXPECT_EQ("hi luw n1\n", r.out);
    EXPECT_EQ("string:hi luw", r.vars["greeting"]);
}

TEST(ExecutionTest, PlusAddsNumericStrings) {
    RunOutput r = run_both("func inc { return $1 + 1 }\ninc 41\necho $?\nx = \"2\" + \"2.5\"\necho $x (\"v\" + \"2\")");
    EXPECT_EQ("42\n4.5 v2\n", r.out);
    EXPECT_EQ("float:4.5", r.vars["x"]);
}

TEST(ExecutionTest, StringInterpolation) {
    RunOutput r = run_both("who = world\nn = 3\necho \"hello $who x${n}!\"");
    EXPECT_EQ("hello world x3!\n", r.out);
}

TEST(ExecutionTest, IfElseChain) {
    const char* source =
        "x = 5\n"
        "if $x > 10 { echo big }\n"
        "else if $x > 3 { echo medium }\n"
        "else { echo small }\n";
    RunOutput r = run_both(source);
    EXPECT_EQ("medium\n", r.out);
}

TEST(ExecutionTest, WhileLoop) {
    RunOutput r = run_both("i = 0\nwhile $i < 3 {\n  echo $i\n  i = $i + 1\n}\necho done");
    EXPECT_EQ("0\n1\n2\ndone\n", r.out);
    EXPECT_EQ("int:3", r.vars["i"]);
}

TEST(ExecutionTest, ShortCircuitSkipsRightSide) {
    RunOutput r = run_both("a = false and $missing\nb = 0 or fallback\nc = yes and 7");
    EXPECT_TRUE(r.ok);
    EXPECT_EQ("bool:false", r.vars["a"]);
    EXPECT_EQ("string:fallback", r.vars["b"]);
    EXPECT_EQ("int:7", r.vars["c"]);
}

TEST(ExecutionTest, StatusReflectsLastCommand) {
    RunOutput r = run_both("false\necho $?\ntrue\necho $?");
    EXPECT_EQ("1\n0\n", r.out);
    EXPECT_EQ(0, r.exit_code);
}

TEST(ExecutionTest, RunEndsWithLastStatus) {
    RunOutput r = run_both("echo a\nfalse");
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(1, r.exit_code);
}

TEST(ExecutionTest, ScriptArguments) {
    RunOutput r = run_both("echo $0 $1 $2 $# \"[$3]\"", {"a", "b"});
    EXPECT_EQ("test.luw a b 2 []\n", r.out);
}

TEST(ExecutionTest, FunctionsTakePositionalArguments) {
    const char* source =
        "func greet {\n"
        "  echo \"hello $1 ($#)\"\n"
        "}\n"
        "greet bob\n"
        "greet\n";
    RunOutput r = run_both(source);
    EXPECT_EQ("hello bob (1)\nhello  (0)\n", r.out);
}

TEST(ExecutionTest, NestedFunctionArguments) {
    RunOutput r = run_both("func inner { echo $1 }\nfunc outer { inner x$1 }\nouter y\necho $1", {"top"});
    EXPECT_EQ("xy\ntop\n", r.out);
}

TEST(ExecutionTest, ReturnSetsStatus) {
    RunOutput r = run_both("func f { return 3 }\nf\necho $?\nfunc g { false }\ng\necho $?");
    EXPECT_EQ("3\n1\n", r.out);
}

TEST(ExecutionTest, ReturnFromInsideLoop) {
    const char* source =
        "func find {\n"
        "  i = 0\n"
        "  while true {\n"
        "    if $i == 3 { return $i }\n"
        "    i = $i + 1\n"
        "  }\n"
        "}\n"
        "find\n"
        "echo $?\n";
    RunOutput r = run_both(source);
    EXPECT_EQ("3\n", r.out);
}

TEST(ExecutionTest, FunctionsShareGlobalVariables) {
    RunOutput r = run_both("func bump { count = $count + 1 }\ncount = 0\nbump\nbump\necho $count");
    EXPECT_EQ("2\n", r.out);
}

TEST(ExecutionTest, CaptureTrimsTrailingNewlines) {
    RunOutput r = run_both("d = $(echo hi)\necho \"[$d]\"");
    EXPECT_EQ("[hi]\n", r.out);
    EXPECT_EQ("string:hi", r.vars["d"]);
}

TEST(ExecutionTest, CaptureOfFunctionOutput) {
    RunOutput r = run_both("func f { echo inner; echo second; return 4 }\nx = $(f)\ns = $?\necho $x\necho $s");
    EXPECT_EQ("inner\nsecond\n4\n", r.out);
}

TEST(ExecutionTest, CaptureInCondition) {
    RunOutput r = run_both("if $(echo yes) == yes { echo matched }");
    EXPECT_EQ("matched\n", r.out);
}

TEST(ExecutionTest, CaptureKeepsStderr) {
    RunOutput r = run_both("x = $(cat /definitely/not/here)\necho \"[$x]\" $?");
    EXPECT_EQ("[] 1\n", r.out);
    EXPECT_NE(std::string::npos, r.err.find("cat: /definitely/not/here"));
}

TEST(ExecutionTest, FlagsReachBuiltins) {
    TempDir dir;
    dir.write("lines.txt", "1\n2\n3\n4\n5\n");
    std::string source = "cd " + dir.path() + "\nhead lines.txt --n 2\ntail lines.txt --n 1";
    RunOutput r = run_both(source);
    EXPECT_EQ("1\n2\n5\n", r.out);
}

TEST(ExecutionTest, EnvironmentVariables) {
    RunOutput r = run_both("set LUW_EXEC_TEST hello there\necho $env:LUW_EXEC_TEST\necho \"[$env:LUW_EXEC_UNSET_X]\"");
    EXPECT_EQ("hello there\n[]\n", r.out);
    EXPECT_EQ(nullptr, getenv("LUW_EXEC_TEST"));
}

TEST(ExecutionTest, AliasesExpand) {
    RunOutput r = run_both("alias hi echo hello\nhi there");
    EXPECT_EQ("hello there\n", r.out);
}

TEST(ExecutionTest, ExitStopsTheRun) {
    RunOutput r = run_both("echo a\nexit 3\necho b");
    EXPECT_TRUE(r.ok);
    EXPECT_EQ("a\n", r.out);
    EXPECT_EQ(3, r.exit_code);
}

TEST(ExecutionTest, ExitInsideCaptureSkipsAssignment) {
    RunOutput r = run_both("x = before\nx = $(exit 4)\necho after");
    EXPECT_EQ("", r.out);
    EXPECT_EQ(4, r.exit_code);
    EXPECT_EQ("string:before", r.vars["x"]);
}

TEST(ExecutionTest, ExitInsideFunction) {
    RunOutput r = run_both("func quit { exit 9 }\nquit\necho unreachable");
    EXPECT_EQ("", r.out);
    EXPECT_EQ(9, r.exit_code);
}

TEST(ExecutionTest, UndefinedVariableFaults) {
    RunOutput r = run_both("echo start\necho $nope\necho after");
    EXPECT_FALSE(r.ok);
    EXPECT_EQ("start\n", r.out);
    EXPECT_EQ(ERR_RUNTIME, r.error.kind);
    EXPECT_STREQ("undefined variable 'nope'", r.error.message);
    EXPECT_EQ(2, r.error.line);
    EXPECT_EQ(LUW_EXIT_RUNTIME_FAULT, r.exit_code);
}

TEST(ExecutionTest, UnknownCommandStopsWith127) {
    RunOutput r = run_both("echo a\nfrobnicate now\necho b");
    EXPECT_FALSE(r.ok);
    EXPECT_EQ("a\n", r.out);
    EXPECT_EQ(ERR_DISPATCH, r.error.kind);
    EXPECT_EQ(DISPATCH_UNKNOWN_COMMAND, r.error.code);
    EXPECT_STREQ("unknown command 'frobnicate'", r.error.message);
    EXPECT_EQ(2, r.error.line);
    EXPECT_EQ(LUW_EXIT_UNKNOWN_CMD, r.exit_code);
}

TEST(ExecutionTest, FunctionMustBeDefinedBeforeUse) {
    RunOutput r = run_both("later\nfunc later { echo x }");
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(LUW_EXIT_UNKNOWN_CMD, r.exit_code);
}

TEST(ExecutionTest, DivisionByZeroFaults) {
    RunOutput r = run_both("x = 1\ny = $x / 0");
    EXPECT_FALSE(r.ok);
    EXPECT_STREQ("division by zero", r.error.message);
    EXPECT_EQ(2, r.error.line);
    EXPECT_EQ("int:1", r.vars["x"]);
    EXPECT_EQ(0u, r.vars.count("y"));
}

TEST(ExecutionTest, TypeErrorFaults) {
    RunOutput r = run_both("x = abc - 1");
    EXPECT_FALSE(r.ok);
    EXPECT_STREQ("operands of '-' must be numbers (got string and int)", r.error.message);
}

TEST(ExecutionTest, NonNumericReturnFaults) {
    RunOutput r = run_both("func f { return abc }\nf");
    EXPECT_FALSE(r.ok);
    EXPECT_STREQ("cannot return 'abc' as an exit code", r.error.message);
    EXPECT_EQ(LUW_EXIT_RUNTIME_FAULT, r.exit_code);
}

TEST(ExecutionTest, OutOfRangeReturnFaults) {
    RunOutput big = run_both("func f { return 4294967296 }\nf\necho unreachable");
    EXPECT_FALSE(big.ok);
    EXPECT_STREQ("exit code '4294967296' out of range", big.error.message);
    EXPECT_EQ(1, big.error.line);
    EXPECT_EQ(LUW_EXIT_RUNTIME_FAULT, big.exit_code);
    EXPECT_EQ("", big.out);

    RunOutput huge = run_both("func f { return 99999999999999999999.0 }\nf");
    EXPECT_FALSE(huge.ok);
    EXPECT_NE(nullptr, strstr(huge.error.message, "out of range"));

    RunOutput edge = run_both("func f { return 2147483647 }\nf\necho $?");
    EXPECT_TRUE(edge.ok);
    EXPECT_EQ("2147483647\n", edge.out);
}

TEST(ExecutionTest, ExitBuiltinRejectsOutOfRangeCodes) {
    RunOutput r = run_both("exit 4294967296\necho still-running");
    EXPECT_TRUE(r.ok);
    EXPECT_EQ("still-running\n", r.out);
    EXPECT_NE(std::string::npos, r.err.find("exit: 4294967296: out of range"));
}

TEST(ExecutionTest, RunawayRecursionFaults) {
    RunOutput r = run_both("func r { r }\nr");
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(ERR_RUNTIME, r.error.kind);
    EXPECT_STREQ("call depth exceeded 256 calling 'r'", r.error.message);
}

TEST(ExecutionTest, BuildErrorRunsNothing) {
    RunOutput r = run_both("echo should-not-print\nif {");
    EXPECT_FALSE(r.ok);
    EXPECT_EQ("", r.out);
    EXPECT_EQ(ERR_PARSE, r.error.kind);
    EXPECT_EQ(LUW_EXIT_BUILD_ERROR, r.exit_code);
}

TEST(ExecutionTest, CompileErrorRunsNothing) {
    RunOutput r = run_both("echo should-not-print\nreturn 1");
    EXPECT_FALSE(r.ok);
    EXPECT_EQ("", r.out);
    EXPECT_EQ(ERR_COMPILE, r.error.kind);
    EXPECT_EQ(LUW_EXIT_BUILD_ERROR, r.exit_code);
}

TEST(ExecutionTest, ClusterRunsEveryMember) {
    RunOutput r = run_both("!mt echo A & echo B & echo C\necho after");
    EXPECT_TRUE(r.ok);
    std::vector<std::string> expected = {"A", "B", "C", "after"};
    EXPECT_EQ(expected, sorted_lines(r.out));
    /* the parent resumes only after every member is done */
    EXPECT_EQ("after\n", r.out.substr(r.out.size() - 6));
}

TEST(ExecutionTest, ClusterStatusIsFirstFailure) {
    RunOutput r = run_both("!mt true & false\necho $?");
    EXPECT_EQ("1\n", r.out);
}

TEST(ExecutionTest, ClusterEscapedAmpersandReachesMember) {
    RunOutput r = run_both("!mt echo a\\&b & echo \"x & y\" & echo c\necho $?");
    EXPECT_TRUE(r.ok);
    EXPECT_EQ("", r.err);
    std::vector<std::string> expected = {"0", "a&b", "c", "x & y"};
    EXPECT_EQ(expected, sorted_lines(r.out));
}

TEST(ExecutionTest, ClusterMembersDoNotTouchParentState) {
    RunOutput r = run_both("x = 1\n!mt x = 2 & echo $x\necho $x");
    EXPECT_EQ("1\n1\n", r.out);
    EXPECT_EQ("int:1", r.vars["x"]);
}

TEST(ExecutionTest, ClusterMembersSeeParentFunctions) {
    RunOutput r = run_both("func shout { upper $1 }\n!mt shout a & shout b");
    std::vector<std::string> expected = {"A", "B"};
    EXPECT_EQ(expected, sorted_lines(r.out));
}

TEST(ExecutionTest, ClusterMemberBuildErrorIsItsOwn) {
    RunOutput r = run_both("!mt echo ok & if {\necho $?");
    EXPECT_TRUE(r.ok);
    std::vector<std::string> lines = sorted_lines(r.out);
    EXPECT_EQ(std::vector<std::string>({"65", "ok"}), lines);
    EXPECT_NE(std::string::npos, r.err.find("ParseError"));
}

TEST(ExecutionTest, DebugDirectivesAreAccepted) {
    RunOutput r = run_both("!suppressdebug\necho a\n!resumedebug");
    EXPECT_TRUE(r.ok);
    EXPECT_EQ("a\n", r.out);
}

TEST(ExecutionTest, FunctionsPersistAcrossRunsInOneContext) {
    for (ExecMode mode : {EXEC_INTERPRET, EXEC_COMPILED}) {
        CapturedContext ctx;
        LuwError err;
        ASSERT_TRUE(run_source(ctx.get(), "func hello { echo hi $1 }", mode, &err));
        ASSERT_TRUE(run_source(ctx.get(), "hello there", mode, &err));
        EXPECT_EQ("hi there\n", ctx.take_out());
    }
}

TEST(ExecutionTest, FailedRunKeepsEarlierState) {
    CapturedContext ctx;
    LuwError err;
    ASSERT_TRUE(run_source(ctx.get(), "x = 1", EXEC_INTERPRET, &err));
    EXPECT_FALSE(run_source(ctx.get(), "x = 2\nnope", EXEC_INTERPRET, &err));
    EXPECT_EQ("int:2", ctx.vars()["x"]);
    EXPECT_FALSE(run_source(ctx.get(), "x = 3\nif {", EXEC_INTERPRET, &err));
    EXPECT_EQ("int:2", ctx.vars()["x"]);
}
