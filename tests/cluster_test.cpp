#include "cluster.h"
#include "run.h"
#include "test_support.h"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <string>
#include <vector>

namespace {

typedef std::chrono::steady_clock Clock;

class ClusterTest : public ::testing::TestWithParam<ExecMode> {
protected:
    void TearDown() override { cluster_results_free(results_.data(), (int)results_.size()); }

    /* Runs `lines` as one cluster under the fixture's context; returns wall time in ms. */
    long run(const std::vector<std::string>& lines, int timeout_ms = 0) {
        cluster_results_free(results_.data(), (int)results_.size());
        std::vector<char*> raw;
        for (const std::string& l : lines) raw.push_back(const_cast<char*>(l.c_str()));
        results_.assign(lines.size(), ClusterResult());
        Clock::time_point start = Clock::now();
        cluster_run(raw.data(), (int)raw.size(), ctx_.get(), GetParam(), timeout_ms, results_.data());
        return (long)std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
    }

    std::string out(int i) const { return buffer_cstr(&results_[i].out); }
    std::string err(int i) const { return buffer_cstr(&results_[i].err); }

    CapturedContext            ctx_;
    std::vector<ClusterResult> results_;
};

}  // namespace

TEST_P(ClusterTest, EveryMemberRunsAndReports) {
    run({"echo A", "echo B"});
    ASSERT_EQ(2u, results_.size());
    EXPECT_EQ("A\n", out(0));
    EXPECT_EQ("B\n", out(1));
    EXPECT_EQ(0, results_[0].exit_code);
    EXPECT_EQ(0, results_[1].exit_code);
    EXPECT_FALSE(results_[0].timed_out);
    EXPECT_EQ(0, ctx_.get()->exit_code);

    std::string forwarded = ctx_.take_out();
    EXPECT_EQ(4u, forwarded.size());
    EXPECT_NE(std::string::npos, forwarded.find("A\n"));
    EXPECT_NE(std::string::npos, forwarded.find("B\n"));
}

TEST_P(ClusterTest, MemberOutputKeepsItsOwnOrder) {
    run({"echo a; echo b; echo c", "echo x; echo y"});
    EXPECT_EQ("a\nb\nc\n", out(0));
    EXPECT_EQ("x\ny\n", out(1));
}

TEST_P(ClusterTest, MembersRunConcurrently) {
    long elapsed = run({"sleep 0.3", "sleep 0.3", "sleep 0.3"});
    EXPECT_GE(elapsed, 280);
    EXPECT_LT(elapsed, 800);
    for (const ClusterResult& r : results_) {
        EXPECT_EQ(0, r.exit_code);
        EXPECT_GE(r.elapsed_ms, 280);
    }
}

TEST_P(ClusterTest, TimeoutCancelsOnlyUnfinishedMembers) {
    long elapsed = run({"sleep 5", "echo quick"}, 150);
    EXPECT_LT(elapsed, 2000);
    EXPECT_TRUE(results_[0].timed_out);
    EXPECT_EQ(LUW_EXIT_TIMEOUT, results_[0].exit_code);
    EXPECT_FALSE(results_[1].timed_out);
    EXPECT_EQ(0, results_[1].exit_code);
    EXPECT_EQ("quick\n", out(1));
    EXPECT_EQ(LUW_EXIT_TIMEOUT, ctx_.get()->exit_code);
}

TEST_P(ClusterTest, TimeoutStopsLoopsBetweenInstructions) {
    run({"while true { x = 1 }"}, 100);
    EXPECT_TRUE(results_[0].timed_out);
    EXPECT_EQ(LUW_EXIT_TIMEOUT, results_[0].exit_code);
}

TEST_P(ClusterTest, EndlessSleepsStayCancellable) {
    long elapsed = run({"sleep '1e300'", "sleep inf"}, 100);
    EXPECT_LT(elapsed, 2000);
    EXPECT_TRUE(results_[0].timed_out);
    EXPECT_TRUE(results_[1].timed_out);
    EXPECT_EQ(LUW_EXIT_TIMEOUT, results_[0].exit_code);
}

TEST_P(ClusterTest, ParentCancellationReachesMembers) {
    std::atomic<bool> cancel(true);
    ctx_.get()->cancel = &cancel;
    long elapsed = run({"sleep 5"});
    ctx_.get()->cancel = nullptr;
    EXPECT_LT(elapsed, 2000);
    EXPECT_FALSE(results_[0].timed_out);
    EXPECT_EQ(LUW_EXIT_TIMEOUT, results_[0].exit_code);
}

TEST_P(ClusterTest, ParentStatusIsFirstFailureInMemberOrder) {
    run({"true", "exit 5", "exit 6"});
    EXPECT_EQ(0, results_[0].exit_code);
    EXPECT_EQ(5, results_[1].exit_code);
    EXPECT_EQ(6, results_[2].exit_code);
    EXPECT_EQ(5, ctx_.get()->exit_code);

    run({"true", "true"});
    EXPECT_EQ(0, ctx_.get()->exit_code);
}

TEST_P(ClusterTest, MembersAreIsolatedFromTheParent) {
    ExecContext* parent = ctx_.get();
    LuwError err;
    ASSERT_TRUE(run_source(parent, "x = 1\nset LUW_CLUSTER_VAR parent", GetParam(), &err));
    std::string cwd = parent->cwd;

    run({"x = 2\necho $x", "set LUW_CLUSTER_VAR member\necho $env:LUW_CLUSTER_VAR",
         "cd / \npwd", "alias zz echo\nfunc newfn { true }"});
    EXPECT_EQ("2\n", out(0));
    EXPECT_EQ("member\n", out(1));
    EXPECT_EQ("/\n", out(2));

    EXPECT_EQ("int:1", ctx_.vars()["x"]);
    EXPECT_STREQ("parent", context_getenv(parent, "LUW_CLUSTER_VAR"));
    EXPECT_EQ(cwd, parent->cwd);
    Value v;
    EXPECT_FALSE(table_get_cstr(&parent->aliases, "zz", &v));
    EXPECT_EQ(nullptr, context_find_function(parent, "newfn"));
}

TEST_P(ClusterTest, MembersInheritParentState) {
    LuwError err;
    ASSERT_TRUE(run_source(ctx_.get(), "greeting = hi\nfunc twice { echo $1$1 }\nalias say echo", GetParam(), &err));
    run({"echo $greeting", "twice ab", "say via-alias"});
    EXPECT_EQ("hi\n", out(0));
    EXPECT_EQ("abab\n", out(1));
    EXPECT_EQ("via-alias\n", out(2));
}

TEST_P(ClusterTest, BuildErrorsStayInTheirMember) {
    run({"if {", "echo fine"});
    EXPECT_EQ(LUW_EXIT_BUILD_ERROR, results_[0].exit_code);
    EXPECT_NE(std::string::npos, err(0).find("<mt>:1:"));
    EXPECT_NE(std::string::npos, err(0).find("ParseError"));
    EXPECT_EQ("", out(0));
    EXPECT_EQ(0, results_[1].exit_code);
    EXPECT_EQ("fine\n", out(1));
}

TEST_P(ClusterTest, FaultsAndUnknownCommands) {
    run({"echo $undefined", "no-such-command"});
    EXPECT_EQ(LUW_EXIT_RUNTIME_FAULT, results_[0].exit_code);
    EXPECT_NE(std::string::npos, err(0).find("undefined variable 'undefined'"));
    EXPECT_EQ(LUW_EXIT_UNKNOWN_CMD, results_[1].exit_code);
    EXPECT_EQ(LUW_EXIT_RUNTIME_FAULT, ctx_.get()->exit_code);
}

TEST_P(ClusterTest, ExternalMembersDoNotWaitForSiblings) {
    std::vector<std::string> lines;
    for (int i = 0; i < 12; i++) {
        lines.push_back("!cmd true");
        lines.push_back("!cmd sleep 1.5");
    }
    run(lines, 5000);
    for (size_t i = 0; i < lines.size(); i += 2) {
        EXPECT_EQ(0, results_[i].exit_code) << "member " << i;
        EXPECT_LT(results_[i].elapsed_ms, 1000) << "member " << i;
    }
    for (size_t i = 1; i < lines.size(); i += 2) EXPECT_EQ(0, results_[i].exit_code) << "member " << i;
}

TEST_P(ClusterTest, DebugReportsEachWorker) {
    ctx_.get()->debug = true;
    run({"true", "false"});
    std::string text = ctx_.take_err();
    EXPECT_NE(std::string::npos, text.find("[Worker 0] exited with code 0\n"));
    EXPECT_NE(std::string::npos, text.find("[Worker 1] exited with code 1\n"));
}

TEST_P(ClusterTest, NestedClusters) {
    run({"!mt echo inner1 & echo inner2", "echo outer"});
    EXPECT_EQ(0, results_[0].exit_code);
    std::string inner = out(0);
    EXPECT_NE(std::string::npos, inner.find("inner1\n"));
    EXPECT_NE(std::string::npos, inner.find("inner2\n"));
    EXPECT_EQ("outer\n", out(1));
}

INSTANTIATE_TEST_SUITE_P(BothModes, ClusterTest, ::testing::Values(EXEC_INTERPRET, EXEC_COMPILED));
