#include "builtins.h"
#include "dispatch.h"
#include "run.h"
#include "test_support.h"
#include <gtest/gtest.h>
#include <chrono>
#include <cstring>
#include <unistd.h>
#include <string>

namespace {

class DispatchTest : public ::testing::Test {
protected:
    void SetUp() override { error_clear(&err_); }

    void alias(const char* name, const char* expansion) {
        Value v = value_cstring(expansion);
        table_set_cstr(&ctx_.get()->aliases, name, v);
        value_decref(v);
    }

    CapturedContext ctx_;
    LuwError        err_;
};

/* Runs scripts in one context and keeps the last run's observations. */
class BuiltinsTest : public ::testing::Test {
protected:
    int run(const std::string& source) {
        LuwError err;
        run_source(ctx_.get(), source.c_str(), EXEC_INTERPRET, &err);
        out_ = ctx_.take_out();
        err_ = ctx_.take_err();
        return ctx_.get()->exit_code;
    }

    int in_dir(const std::string& source) { return run("cd " + dir_.path() + "\n" + source); }

    CapturedContext ctx_;
    TempDir         dir_;
    std::string     out_;
    std::string     err_;
};

}  // namespace

TEST_F(DispatchTest, InvocationFlagsLastWriteWins) {
    Invocation call;
    invocation_init(&call, "cmd");
    invocation_set_flag(&call, "n", "1");
    invocation_set_flag(&call, "v", "");
    invocation_set_flag(&call, "n", "2");
    EXPECT_EQ(2, call.flagc);
    EXPECT_STREQ("n", call.flag_names[0]);
    EXPECT_STREQ("2", invocation_flag(&call, "n"));
    EXPECT_STREQ("", invocation_flag(&call, "v"));
    EXPECT_EQ(nullptr, invocation_flag(&call, "missing"));
    invocation_free(&call);
}

TEST_F(DispatchTest, ResolvesBuiltin) {
    Invocation call;
    invocation_init(&call, "echo");
    Resolved target;
    ASSERT_TRUE(dispatch_resolve(ctx_.get(), &call, &target, &err_));
    EXPECT_EQ(TARGET_BUILTIN, target.kind);
    EXPECT_STREQ("echo", target.builtin->name);
    dispatch_resolved_free(&target);
    invocation_free(&call);
}

TEST_F(DispatchTest, UnknownCommandLeavesContextUntouched) {
    ExecContext* ctx = ctx_.get();
    Value v = INT_VAL(1);
    table_set_cstr(&ctx->vars, "x", v);
    ctx->exit_code = 5;
    std::string cwd = ctx->cwd;
    int env_before = table_size(&ctx->env);

    Invocation call;
    invocation_init(&call, "definitely-not-a-command");
    invocation_add_arg(&call, "a");
    Resolved target;
    EXPECT_FALSE(dispatch_resolve(ctx, &call, &target, &err_));
    EXPECT_EQ(ERR_DISPATCH, err_.kind);
    EXPECT_EQ(DISPATCH_UNKNOWN_COMMAND, err_.code);
    EXPECT_STREQ("unknown command 'definitely-not-a-command'", err_.message);
    EXPECT_EQ(LUW_EXIT_UNKNOWN_CMD, error_exit_code(&err_));

    EXPECT_EQ(5, ctx->exit_code);
    EXPECT_EQ(cwd, ctx->cwd);
    EXPECT_EQ(env_before, table_size(&ctx->env));
    EXPECT_EQ(1u, ctx_.vars().size());
    EXPECT_EQ("", ctx_.take_out());
    EXPECT_EQ("", ctx_.take_err());
    invocation_free(&call);
}

TEST_F(DispatchTest, AliasPrependsWordsAndFlags) {
    alias("greet", "echo --tag x hello");
    Invocation call;
    invocation_init(&call, "greet");
    invocation_add_arg(&call, "bob");
    invocation_set_flag(&call, "tag", "y");
    Resolved target;
    ASSERT_TRUE(dispatch_resolve(ctx_.get(), &call, &target, &err_));
    EXPECT_EQ(TARGET_BUILTIN, target.kind);
    EXPECT_STREQ("echo", target.call.name);
    ASSERT_EQ(2, target.call.argc);
    EXPECT_STREQ("hello", target.call.args[0]);
    EXPECT_STREQ("bob", target.call.args[1]);
    EXPECT_STREQ("y", invocation_flag(&target.call, "tag"));
    dispatch_resolved_free(&target);
    invocation_free(&call);
}

TEST_F(DispatchTest, AliasChainsResolve) {
    alias("a", "b one");
    alias("b", "echo two");
    Invocation call;
    invocation_init(&call, "a");
    Resolved target;
    ASSERT_TRUE(dispatch_resolve(ctx_.get(), &call, &target, &err_));
    EXPECT_STREQ("echo", target.call.name);
    ASSERT_EQ(2, target.call.argc);
    EXPECT_STREQ("two", target.call.args[0]);
    EXPECT_STREQ("one", target.call.args[1]);
    dispatch_resolved_free(&target);
    invocation_free(&call);
}

TEST_F(DispatchTest, SelfReferentialAliasStops) {
    alias("ls", "ls --all");
    Invocation call;
    invocation_init(&call, "ls");
    Resolved target;
    ASSERT_TRUE(dispatch_resolve(ctx_.get(), &call, &target, &err_));
    EXPECT_EQ(TARGET_BUILTIN, target.kind);
    EXPECT_STREQ("", invocation_flag(&target.call, "all"));
    dispatch_resolved_free(&target);
    invocation_free(&call);
}

TEST_F(DispatchTest, AliasCycleIsRejected) {
    alias("ping", "pong");
    alias("pong", "ping");
    Invocation call;
    invocation_init(&call, "ping");
    Resolved target;
    EXPECT_FALSE(dispatch_resolve(ctx_.get(), &call, &target, &err_));
    EXPECT_EQ(ERR_DISPATCH, err_.kind);
    EXPECT_EQ(DISPATCH_UNKNOWN_COMMAND, err_.code);
    invocation_free(&call);
}

TEST_F(DispatchTest, BuiltinsWinOverFunctions) {
    LuwError err;
    ASSERT_TRUE(run_source(ctx_.get(), "func echo { upper shadowed }\nfunc mine { true }", EXEC_INTERPRET, &err));
    Invocation call;
    invocation_init(&call, "echo");
    Resolved target;
    ASSERT_TRUE(dispatch_resolve(ctx_.get(), &call, &target, &err_));
    EXPECT_EQ(TARGET_BUILTIN, target.kind);
    dispatch_resolved_free(&target);
    invocation_free(&call);

    invocation_init(&call, "mine");
    ASSERT_TRUE(dispatch_resolve(ctx_.get(), &call, &target, &err_));
    EXPECT_EQ(TARGET_FUNCTION, target.kind);
    EXPECT_STREQ("mine", target.function->name);
    dispatch_resolved_free(&target);
    invocation_free(&call);
}

TEST_F(DispatchTest, PassthroughNames) {
    Invocation call;
    invocation_init(&call, "!cmd");
    Resolved target;
    ASSERT_TRUE(dispatch_resolve(ctx_.get(), &call, &target, &err_));
    EXPECT_EQ(TARGET_PASSTHROUGH, target.kind);
    EXPECT_EQ(SHELL_CMD, target.shell);
    dispatch_resolved_free(&target);
    invocation_free(&call);

    invocation_init(&call, "!pwsh");
    ASSERT_TRUE(dispatch_resolve(ctx_.get(), &call, &target, &err_));
    EXPECT_EQ(SHELL_PWSH, target.shell);
    dispatch_resolved_free(&target);
    invocation_free(&call);
}

TEST_F(DispatchTest, FailingBuiltinWithoutCodeReportsOne) {
    Invocation call;
    invocation_init(&call, "get");
    invocation_add_arg(&call, "LUW_SURELY_UNSET_VARIABLE");
    Resolved target;
    ASSERT_TRUE(dispatch_resolve(ctx_.get(), &call, &target, &err_));
    DispatchResult result;
    dispatch_result_init(&result);
    dispatch_invoke(ctx_.get(), &target, &result);
    EXPECT_EQ(1, result.exit_code);
    dispatch_result_free(&result);
    dispatch_resolved_free(&target);
    invocation_free(&call);
}

TEST_F(DispatchTest, EmitRoutesStdoutToCapture) {
    DispatchResult result;
    dispatch_result_init(&result);
    buffer_append_str(&result.out, "to capture\n");
    buffer_append_str(&result.err, "to stderr\n");
    Buffer captured;
    buffer_init(&captured);
    dispatch_emit(ctx_.get(), &result, &captured);
    EXPECT_STREQ("to capture\n", buffer_cstr(&captured));
    EXPECT_EQ("", ctx_.take_out());
    EXPECT_EQ("to stderr\n", ctx_.take_err());
    buffer_free(&captured);
    dispatch_result_free(&result);
}

TEST_F(DispatchTest, BuiltinTableIsComplete) {
    int count = 0;
    const Builtin* table = builtins_table(&count);
    ASSERT_GT(count, 0);
    for (const char* name : {"echo", "pwd", "cd", "ls", "cat", "cp", "mv", "grep", "find", "env", "set", "alias", "sleep", "exit", "help",
                             "hostname", "uname"})
        EXPECT_NE(nullptr, builtins_find(name)) << name;
    for (int i = 0; i < count; i++) {
        EXPECT_NE(nullptr, table[i].fn);
        EXPECT_GT(strlen(table[i].summary), 0u);
    }
    EXPECT_EQ(nullptr, builtins_find("frobnicate"));
}

/* ── Builtins ─────────────────────────────────────── */
TEST_F(BuiltinsTest, CdChangesOnlyTheContext) {
    char before[4096];
    ASSERT_NE(nullptr, getcwd(before, sizeof(before)));
    EXPECT_EQ(0, in_dir("pwd"));
    EXPECT_EQ(dir_.path() + "\n", out_);
    char after[4096];
    ASSERT_NE(nullptr, getcwd(after, sizeof(after)));
    EXPECT_STREQ(before, after);
}

TEST_F(BuiltinsTest, CdNormalizesAndSetsPwd) {
    EXPECT_EQ(0, in_dir("mkdir sub\ncd sub/../sub/.\npwd\necho $env:PWD"));
    EXPECT_EQ(dir_.path() + "/sub\n" + dir_.path() + "/sub\n", out_);
}

TEST_F(BuiltinsTest, CdToMissingDirectory) {
    EXPECT_EQ(1, in_dir("cd nowhere"));
    EXPECT_NE(std::string::npos, err_.find("cd: nowhere:"));
    EXPECT_EQ(0, in_dir("cd made/deep --mkdir\npwd"));
    EXPECT_EQ(dir_.path() + "/made/deep\n", out_);
}

TEST_F(BuiltinsTest, LsIsSorted) {
    dir_.write("b.txt", "");
    dir_.write("a.txt", "");
    dir_.write("C.txt", "");
    EXPECT_EQ(0, in_dir("ls"));
    EXPECT_EQ("C.txt\na.txt\nb.txt\n", out_);
}

TEST_F(BuiltinsTest, CatHeadTailWc) {
    dir_.write("f.txt", "one two\nthree\n");
    EXPECT_EQ(0, in_dir("cat f.txt"));
    EXPECT_EQ("one two\nthree\n", out_);
    EXPECT_EQ(0, in_dir("head f.txt --n 1"));
    EXPECT_EQ("one two\n", out_);
    EXPECT_EQ(0, in_dir("tail f.txt --n 1"));
    EXPECT_EQ("three\n", out_);
    EXPECT_EQ(0, in_dir("wc f.txt"));
    EXPECT_EQ("2 3 14 f.txt\n", out_);
}

TEST_F(BuiltinsTest, MissingFileReportsErrno) {
    EXPECT_EQ(1, in_dir("cat absent.txt"));
    EXPECT_EQ("cat: absent.txt: No such file or directory\n", err_);
}

TEST_F(BuiltinsTest, UsageErrorsExitTwo) {
    EXPECT_EQ(2, run("cat"));
    EXPECT_EQ("usage: cat <file>...\n", err_);
    EXPECT_EQ(2, run("head f --n abc"));
    EXPECT_EQ(2, run("sleep soon"));
    EXPECT_EQ(2, run("set ONLYNAME"));
}

TEST_F(BuiltinsTest, TouchMkdirRm) {
    EXPECT_EQ(0, in_dir("touch new.txt\nmkdir a/b/c --p"));
    EXPECT_TRUE(dir_.exists("new.txt"));
    EXPECT_TRUE(dir_.exists("a/b/c"));
    EXPECT_EQ(1, in_dir("rm a"));
    EXPECT_NE(std::string::npos, err_.find("is a directory"));
    EXPECT_TRUE(dir_.exists("a"));
    EXPECT_EQ(0, in_dir("rm a --r\nrm new.txt"));
    EXPECT_FALSE(dir_.exists("a"));
    EXPECT_FALSE(dir_.exists("new.txt"));
}

TEST_F(BuiltinsTest, CpCopiesFilesAndIntoDirectories) {
    dir_.write("f.txt", "data\n");
    EXPECT_EQ(0, in_dir("cp f.txt g.txt\nmkdir sub\ncp f.txt sub\ncp --src g.txt --dst sub/h.txt"));
    EXPECT_EQ("data\n", dir_.read("g.txt"));
    EXPECT_EQ("data\n", dir_.read("sub/f.txt"));
    EXPECT_EQ("data\n", dir_.read("sub/h.txt"));
    EXPECT_EQ("data\n", dir_.read("f.txt"));

    EXPECT_EQ(1, in_dir("cp missing.txt x.txt"));
    EXPECT_EQ("cp: missing.txt: No such file or directory\n", err_);
    EXPECT_EQ(1, in_dir("cp sub x"));
    EXPECT_NE(std::string::npos, err_.find("Is a directory"));
    EXPECT_EQ(2, run("cp onlyone"));
}

TEST_F(BuiltinsTest, MvRenamesAndMovesIntoDirectories) {
    dir_.write("a.txt", "A");
    EXPECT_EQ(0, in_dir("mv a.txt b.txt\nmkdir d\nmv b.txt d"));
    EXPECT_FALSE(dir_.exists("a.txt"));
    EXPECT_FALSE(dir_.exists("b.txt"));
    EXPECT_EQ("A", dir_.read("d/b.txt"));
    EXPECT_EQ(1, in_dir("mv gone.txt d"));
    EXPECT_EQ("mv: gone.txt: No such file or directory\n", err_);
}

TEST_F(BuiltinsTest, GrepPrintsMatchingLines) {
    dir_.write("log.txt", "alpha\nBeta\ngamma beta\n");
    dir_.write("other.txt", "abc\n");
    EXPECT_EQ(0, in_dir("grep beta log.txt"));
    EXPECT_EQ("gamma beta\n", out_);
    EXPECT_EQ(0, in_dir("grep beta log.txt --i"));
    EXPECT_EQ("Beta\ngamma beta\n", out_);
    EXPECT_EQ(0, in_dir("grep \"^a\" log.txt other.txt"));
    EXPECT_EQ("log.txt:alpha\nother.txt:abc\n", out_);
    EXPECT_EQ(0, in_dir("grep --pattern alpha --file log.txt"));
    EXPECT_EQ("alpha\n", out_);

    EXPECT_EQ(1, in_dir("grep zzz log.txt"));
    EXPECT_EQ("", out_);
    EXPECT_EQ("", err_);
    EXPECT_EQ(2, in_dir("grep \"(\" log.txt"));
    EXPECT_NE(std::string::npos, err_.find("grep: bad pattern '('"));
    EXPECT_EQ(2, run("grep onlypattern"));
}

TEST_F(BuiltinsTest, FindWalksDirectories) {
    EXPECT_EQ(0, in_dir("mkdir d/e --p\ntouch d/x.txt d/e/y.txt d/e/z.log top.txt"));
    EXPECT_EQ(0, in_dir("find . --name .txt"));
    EXPECT_EQ("./d/e/y.txt\n./d/x.txt\n./top.txt\n", out_);
    EXPECT_EQ(0, in_dir("find d --name \"*.log\""));
    EXPECT_EQ("d/e/z.log\n", out_);
    EXPECT_EQ(0, in_dir("find d"));
    EXPECT_EQ("d/e/y.txt\nd/e/z.log\nd/x.txt\n", out_);
    EXPECT_EQ(1, in_dir("find nowhere"));
    EXPECT_NE(std::string::npos, err_.find("find: nowhere:"));
}

TEST_F(BuiltinsTest, HostnameAndUname) {
    EXPECT_EQ(0, run("hostname"));
    EXPECT_GT(out_.size(), 1u);
    EXPECT_EQ(0, run("uname"));
    EXPECT_EQ("Linux\n", out_);
    EXPECT_EQ(0, run("uname --a"));
    EXPECT_EQ(0u, out_.find("Linux "));
}

TEST_F(BuiltinsTest, PathPieces) {
    EXPECT_EQ(0, run("basename /usr/local/lib/\ndirname /usr/local/lib\ndirname file\nbasename /"));
    EXPECT_EQ("lib\n/usr/local\n.\n/\n", out_);
}

TEST_F(BuiltinsTest, TextTransforms) {
    EXPECT_EQ(0, run("upper Hello World\nlower MiXeD\nreverse abc def"));
    EXPECT_EQ("HELLO WORLD\nmixed\nfed cba\n", out_);
}

TEST_F(BuiltinsTest, EnvironmentBuiltins) {
    EXPECT_EQ(0, run("set LUW_A=1\nenv LUW_B two words\nget LUW_A\nenv '$env:LUW_B'"));
    EXPECT_EQ("1\ntwo words\n", out_);
    EXPECT_EQ(0, run("unset LUW_A\necho \"[$env:LUW_A]\""));
    EXPECT_EQ("[]\n", out_);
    EXPECT_EQ(1, run("get LUW_A"));
    EXPECT_EQ(0, run("env"));
    EXPECT_NE(std::string::npos, out_.find("LUW_B=two words\n"));
}

TEST_F(BuiltinsTest, AliasBuiltins) {
    EXPECT_EQ(0, run("alias hi echo hello\nalias bye=echo\naliases"));
    EXPECT_EQ("bye='echo'\nhi='echo hello'\n", out_);
    EXPECT_EQ(0, run("unalias hi\naliases"));
    EXPECT_EQ("bye='echo'\n", out_);
    EXPECT_EQ(1, run("unalias hi"));
    EXPECT_EQ("unalias: hi: not found\n", err_);
}

TEST_F(BuiltinsTest, ExitRequiresNumber) {
    EXPECT_EQ(2, run("exit later"));
    EXPECT_FALSE(ctx_.get()->halt);
    EXPECT_EQ(0, run("exit 0"));
    EXPECT_TRUE(ctx_.get()->halt);
}

TEST_F(BuiltinsTest, HelpListsAndDescribes) {
    EXPECT_EQ(0, run("help"));
    EXPECT_NE(std::string::npos, out_.find("  echo       print the arguments\n"));
    EXPECT_NE(std::string::npos, out_.find("!mt"));
    EXPECT_EQ(0, run("help cd"));
    EXPECT_EQ("cd: change the working directory [--mkdir]\n", out_);
    EXPECT_EQ(1, run("help nothing"));
}

TEST_F(BuiltinsTest, DateAndWhoami) {
    EXPECT_EQ(0, run("date --format \"%Y\""));
    ASSERT_EQ(5u, out_.size());
    EXPECT_EQ('2', out_[0]);
    EXPECT_EQ(0, run("whoami"));
    EXPECT_GT(out_.size(), 1u);
}

TEST_F(BuiltinsTest, SleepWaits) {
    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(0, run("sleep 0.05"));
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_GE(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 45);
}

TEST_F(BuiltinsTest, SystemShellPassthrough) {
    dir_.write("marker.txt", "");
    EXPECT_EQ(0, in_dir("!cmd ls; echo done"));
    EXPECT_EQ("marker.txt\ndone\n", out_);
    EXPECT_EQ(3, in_dir("!cmd exit 3"));
    EXPECT_EQ(0, run("set LUW_PASS_VAR abc\n!cmd echo \"$LUW_PASS_VAR\" 1>&2"));
    EXPECT_EQ("", out_);
    EXPECT_EQ("abc\n", err_);
}

TEST_F(BuiltinsTest, NestedCaptures) {
    EXPECT_EQ(0, run("x = $(echo $(upper abc))\necho $x"));
    EXPECT_EQ("ABC\n", out_);
}
