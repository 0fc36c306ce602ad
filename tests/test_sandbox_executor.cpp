#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <future>
#include <string>
#include <thread>

#include <signal.h>

#include "artifacts/marker_protocol.hpp"
#include "sandbox/sandbox_executor.hpp"

namespace anabox::sandbox {
namespace {

namespace fs = std::filesystem;

// Dead once it no longer exists or only its zombie is left for the reaper.
bool ProcessIsDead(pid_t pid) {
    if (::kill(pid, 0) != 0) {
        return true;
    }
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    std::string line;
    if (!std::getline(stat, line)) {
        return true;
    }
    const auto name_end = line.rfind(')');
    return name_end != std::string::npos && name_end + 2 < line.size() && line[name_end + 2] == 'Z';
}

// These tests launch real workers and need python3 on PATH.
class SandboxExecutorTest : public ::testing::Test {
protected:
    SandboxExecutorTest()
        : executor_(fs::temp_directory_path() / "anabox-tests", "python3", 2, OverflowPolicy::kBlock) {}

    ExecutionRequest Request(const std::string& source, const std::string& id = "exec") {
        ExecutionRequest request;
        request.candidate = normalizer::CodeCandidate::Accept(source);
        request.correlation_id = id;
        request.limits.max_wall_seconds = 10;
        request.limits.max_memory_bytes = 512ULL * 1024 * 1024;
        request.limits.isolate_network = false;
        request.limits.allowed_imports = {"math", "time", "json"};
        return request;
    }

    SandboxExecutor executor_;
};

TEST_F(SandboxExecutorTest, CapturesStdoutOfSuccessfulRun) {
    const auto outcome = executor_.Execute(Request("print(1+1)\n"));
    EXPECT_EQ(outcome.status, ExecutionStatus::kSuccess) << outcome.detail << outcome.raw_stderr;
    EXPECT_EQ(outcome.raw_stdout, "2\n");
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_FALSE(outcome.output_truncated);
    EXPECT_FALSE(outcome.scratch.Empty());
}

TEST_F(SandboxExecutorTest, NetworkIsolationIsBestEffort) {
    auto request = Request("import math\nprint(math.floor(2.5))\n");
    request.limits.isolate_network = true;
    const auto outcome = executor_.Execute(request);
    EXPECT_EQ(outcome.status, ExecutionStatus::kSuccess) << outcome.detail << outcome.raw_stderr;
    EXPECT_EQ(outcome.raw_stdout, "2\n");
}

TEST_F(SandboxExecutorTest, NonZeroExitIsRuntimeError) {
    const auto outcome = executor_.Execute(Request("print('before')\n1/0\n"));
    EXPECT_EQ(outcome.status, ExecutionStatus::kRuntimeError);
    EXPECT_EQ(outcome.exit_code, 1);
    EXPECT_EQ(outcome.detail, "process exited with code 1");
    EXPECT_EQ(outcome.raw_stdout, "before\n");
    EXPECT_NE(outcome.raw_stderr.find("ZeroDivisionError"), std::string::npos);
}

TEST_F(SandboxExecutorTest, InfiniteLoopTimesOutAndIsKilled) {
    auto request = Request("while True:\n    pass\n");
    request.limits.max_wall_seconds = 1;
    const auto started = std::chrono::steady_clock::now();
    const auto outcome = executor_.Execute(request);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    EXPECT_EQ(outcome.status, ExecutionStatus::kTimeout);
    EXPECT_EQ(outcome.detail, "execution timed out after 1s");
    EXPECT_EQ(outcome.exit_signal, SIGKILL);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_EQ(executor_.Pool().ActiveCount(), 0u);
}

TEST_F(SandboxExecutorTest, OutputCapIsEnforced) {
    auto request = Request("import sys\nfor _ in range(200):\n    sys.stdout.write('x' * 10000)\n");
    request.limits.allowed_imports.insert("sys");
    request.limits.max_output_bytes = 4096;
    const auto outcome = executor_.Execute(request);
    EXPECT_EQ(outcome.status, ExecutionStatus::kResourceExceeded);
    EXPECT_TRUE(outcome.output_truncated);
    EXPECT_LE(outcome.raw_stdout.size() + outcome.raw_stderr.size(), 4096u);
    EXPECT_EQ(outcome.detail, "output limit of 4096 bytes exceeded");
}

TEST_F(SandboxExecutorTest, OutputCapDoesNotSplitMultiByteCharacters) {
    auto request = Request("print('\\u00e9' * 200)\n");
    request.limits.max_output_bytes = 101;
    const auto outcome = executor_.Execute(request);
    EXPECT_EQ(outcome.status, ExecutionStatus::kResourceExceeded);
    std::string expected;
    for (int i = 0; i < 50; ++i) {
        expected += "\xC3\xA9";
    }
    EXPECT_EQ(outcome.raw_stdout, expected);
}

TEST_F(SandboxExecutorTest, MemoryLimitIsEnforced) {
    auto request = Request("x = bytearray(2 * 1024 * 1024 * 1024)\n");
    request.limits.max_memory_bytes = 256ULL * 1024 * 1024;
    const auto outcome = executor_.Execute(request);
    EXPECT_EQ(outcome.status, ExecutionStatus::kResourceExceeded) << outcome.detail << outcome.raw_stderr;
    EXPECT_EQ(outcome.detail, "memory limit of 256 MB exceeded");
    EXPECT_NE(outcome.raw_stderr.find("MemoryError"), std::string::npos);
}

TEST_F(SandboxExecutorTest, SpawnedProcessesDieWithNaturalExit) {
    auto request = Request("import subprocess\np = subprocess.Popen(['sleep', '30'])\nprint(p.pid)\n");
    request.limits.allowed_imports.insert("subprocess");
    const auto outcome = executor_.Execute(request);
    ASSERT_EQ(outcome.status, ExecutionStatus::kSuccess) << outcome.detail << outcome.raw_stderr;
    const pid_t spawned = static_cast<pid_t>(std::stoi(outcome.raw_stdout));
    ASSERT_GT(spawned, 0);
    bool gone = false;
    for (int i = 0; i < 200 && !gone; ++i) {
        gone = ProcessIsDead(spawned);
        if (!gone) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }
    EXPECT_TRUE(gone);
}

TEST_F(SandboxExecutorTest, RunnerBlocksImportsOutsideAllowList) {
    const auto outcome = executor_.Execute(Request("import socket\n"));
    EXPECT_EQ(outcome.status, ExecutionStatus::kRuntimeError);
    EXPECT_NE(outcome.raw_stderr.find("import of 'socket' is not allowed"), std::string::npos);
}

TEST_F(SandboxExecutorTest, EmitImageProducesInlineMarker) {
    const auto outcome = executor_.Execute(Request("emit_image(b'\\x89PNG-bytes')\nprint('done')\n"));
    ASSERT_EQ(outcome.status, ExecutionStatus::kSuccess) << outcome.raw_stderr;
    const auto segments = artifacts::SplitStream(outcome.raw_stdout);
    ASSERT_EQ(segments.size(), 2u);
    ASSERT_TRUE(segments[0].IsMarker());
    EXPECT_EQ(segments[0].marker.kind, artifacts::MarkerKind::kImageInline);
    EXPECT_EQ(segments[0].marker.payload, "\x89PNG-bytes");
    EXPECT_EQ(segments[1].text, "done\n");
}

TEST_F(SandboxExecutorTest, LargeImageIsWrittenToScratchAsReference) {
    auto request = Request("emit_image(b'A' * 5000)\n");
    request.limits.inline_artifact_max_bytes = 1024;
    const auto outcome = executor_.Execute(request);
    ASSERT_EQ(outcome.status, ExecutionStatus::kSuccess) << outcome.raw_stderr;
    const auto segments = artifacts::SplitStream(outcome.raw_stdout);
    ASSERT_EQ(segments.size(), 1u);
    ASSERT_TRUE(segments[0].IsMarker());
    EXPECT_EQ(segments[0].marker.kind, artifacts::MarkerKind::kImageRef);
    EXPECT_EQ(fs::file_size(outcome.scratch.WorkDir() / segments[0].marker.payload), 5000u);
}

TEST_F(SandboxExecutorTest, WorkingContextIsExposed) {
    auto request = Request("print(CONTEXT_PATH)\n");
    request.working_context = "datasets/sales.csv";
    const auto outcome = executor_.Execute(request);
    EXPECT_EQ(outcome.raw_stdout, "datasets/sales.csv\n");
}

TEST_F(SandboxExecutorTest, RejectedCandidateNeverRuns) {
    ExecutionRequest request;
    request.candidate = normalizer::CodeCandidate::Reject("disallowed import: os");
    request.correlation_id = "rejected";
    const auto outcome = executor_.Execute(request);
    EXPECT_EQ(outcome.status, ExecutionStatus::kRejected);
    EXPECT_EQ(outcome.detail, "code was rejected: disallowed import: os");
    EXPECT_TRUE(outcome.scratch.Empty());
}

TEST_F(SandboxExecutorTest, CancelStopsRunningWorker) {
    auto pending = std::async(std::launch::async, [this] {
        return executor_.Execute(Request("import time\ntime.sleep(30)\n", "slow"));
    });
    for (int i = 0; i < 400 && executor_.Pool().State("slow") != ExecutionState::kRunning; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_TRUE(executor_.Cancel("slow"));
    const auto outcome = pending.get();
    EXPECT_EQ(outcome.status, ExecutionStatus::kCancelled);
    EXPECT_EQ(outcome.detail, "execution was cancelled");
    EXPECT_FALSE(executor_.Cancel("slow"));
}

TEST_F(SandboxExecutorTest, DuplicateCorrelationIdIsRejectedWhileLive) {
    auto pending = std::async(std::launch::async, [this] {
        return executor_.Execute(Request("import time\ntime.sleep(30)\n", "dup"));
    });
    for (int i = 0; i < 400 && !executor_.Pool().State("dup").has_value(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    const auto duplicate = executor_.Execute(Request("print(1)\n", "dup"));
    EXPECT_EQ(duplicate.status, ExecutionStatus::kRejected);
    EXPECT_EQ(duplicate.detail, "an execution for 'dup' is already in progress");

    for (int i = 0; i < 400 && executor_.Pool().State("dup") != ExecutionState::kRunning; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_TRUE(executor_.Cancel("dup"));
    EXPECT_EQ(pending.get().status, ExecutionStatus::kCancelled);
}

TEST_F(SandboxExecutorTest, ScratchDirectoryIsRemovedWithOutcome) {
    fs::path root;
    {
        const auto outcome = executor_.Execute(Request("open('note.txt', 'w').write('x')\n"));
        ASSERT_EQ(outcome.status, ExecutionStatus::kSuccess) << outcome.raw_stderr;
        root = outcome.scratch.Root();
        EXPECT_TRUE(fs::exists(outcome.scratch.WorkDir() / "note.txt"));
    }
    EXPECT_FALSE(fs::exists(root));
}

}  // namespace
}  // namespace anabox::sandbox
