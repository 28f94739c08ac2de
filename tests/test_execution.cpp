#include <gtest/gtest.h>
#include <configuration/execution.hpp>
#include <configuration/stream_status.hpp>
#include <configuration/ansible_host.hpp>
#include <thread>
#include "fakes.hpp"

class ExecutionTest : public ::testing::Test {
protected:
    FakeEngine engine;
    CancelToken cancel;
    std::vector<std::string> lines;
    HostList hosts;

    void SetUp() override {
        hosts.push_back(std::make_shared<AnsibleHost>("n1", "10.0.0.7", "service-worker"));
        hosts.push_back(std::make_shared<AnsibleHost>("n2", "10.0.0.8", "service-worker"));
    }

    StatusCallback sink() {
        return [this](const std::string& line) { lines.push_back(line); };
    }
};

TEST_F(ExecutionTest, SuccessSkipsCleanup) {
    engine.configure_script.lines = {"PLAY [all]", "ok: [n1]", "ok: [n2]"};

    auto r = configure_or_cleanup_on_error(engine, hosts, "{}", cancel, sink());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(lines, (std::vector<std::string>{"PLAY [all]", "ok: [n1]", "ok: [n2]"}));
    EXPECT_EQ(engine.count("configure"), 1u);
    EXPECT_EQ(engine.count("cleanup"), 0u);
}

TEST_F(ExecutionTest, FailureRunsCleanupOnSameHosts) {
    engine.configure_script.lines = {"fatal: [n2]: UNREACHABLE!"};
    engine.configure_script.result =
        Result<void>::Err(ErrorCode::Configuration, "site.yml failed with exit status 4");
    engine.cleanup_script.lines = {"cleanup done"};

    auto r = configure_or_cleanup_on_error(engine, hosts, "{\"k\": \"v\"}", cancel, sink());
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::Configuration);
    EXPECT_EQ(r.error, "site.yml failed with exit status 4");

    auto calls = engine.calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].kind, "configure");
    EXPECT_EQ(calls[1].kind, "cleanup");
    EXPECT_EQ(calls[1].tags, calls[0].tags);
    EXPECT_EQ(calls[1].extra_vars, "{\"k\": \"v\"}");

    // cleanup output goes to the same sink
    EXPECT_EQ(lines, (std::vector<std::string>{"fatal: [n2]: UNREACHABLE!", "cleanup done"}));
}

TEST_F(ExecutionTest, CleanupFailureKeepsConfigureError) {
    engine.configure_script.result = Result<void>::Err(ErrorCode::Configuration, "configure broke");
    engine.cleanup_script.result = Result<void>::Err(ErrorCode::Configuration, "cleanup broke");

    auto r = configure_or_cleanup_on_error(engine, hosts, "", cancel, sink());
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "configure broke");
    EXPECT_EQ(engine.count("cleanup"), 1u);
}

TEST_F(ExecutionTest, CancelStopsEngineAndSkipsCleanup) {
    engine.configure_script.lines = {"PLAY [all]"};
    engine.configure_script.block = true;

    std::thread canceler([this] {
        EXPECT_TRUE(engine.wait_blocked());
        cancel.cancel();
    });

    auto r = configure_or_cleanup_on_error(engine, hosts, "", cancel, sink());
    canceler.join();

    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::Canceled);
    EXPECT_EQ(engine.cancel_count(), 1);
    EXPECT_EQ(engine.count("cleanup"), 0u);
}

TEST_F(ExecutionTest, CancelDuringCleanupKeepsConfigureError) {
    engine.configure_script.result = Result<void>::Err(ErrorCode::Configuration, "configure broke");
    engine.cleanup_script.lines = {"PLAY [cleanup]"};
    engine.cleanup_script.block = true;

    std::thread canceler([this] {
        EXPECT_TRUE(engine.wait_blocked());
        cancel.cancel();
    });

    auto r = configure_or_cleanup_on_error(engine, hosts, "", cancel, sink());
    canceler.join();

    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::Configuration);
    EXPECT_EQ(r.error, "configure broke");
    EXPECT_EQ(engine.count("configure"), 1u);
    EXPECT_EQ(engine.count("cleanup"), 1u);
    EXPECT_EQ(engine.cancel_count(), 1);
    EXPECT_EQ(lines, (std::vector<std::string>{"PLAY [cleanup]"}));
}

TEST_F(ExecutionTest, StreamWaitsForLateCompletion) {
    engine.configure_script.block = true;

    std::thread finisher([this] {
        EXPECT_TRUE(engine.wait_blocked());
        engine.release(Result<void>::Ok());
    });

    auto run = engine.configure(hosts, "");
    auto r = log_output_and_return_status(run, cancel, sink());
    finisher.join();
    EXPECT_TRUE(r.is_ok()) << r.error;
}

TEST_F(ExecutionTest, FailedEngineRunReportsError) {
    auto run = failed_engine_run(ErrorCode::Configuration, "failed to start ansible-playbook");
    auto r = log_output_and_return_status(run, cancel, sink());
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::Configuration);
    EXPECT_TRUE(lines.empty());
}

TEST_F(ExecutionTest, MissingCompletionSignalIsError) {
    EngineRun run;
    auto r = log_output_and_return_status(run, cancel, sink());
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::Internal);
}
