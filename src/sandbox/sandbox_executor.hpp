#pragma once

#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>

#include "config/config_schema.hpp"
#include "sandbox/sandbox_types.hpp"
#include "sandbox/worker_pool.hpp"

namespace anabox::sandbox {

// Runs candidates in throwaway worker processes under hard limits.
//
// Each execution gets its own scratch directory and process group, a scrubbed
// environment, rlimits for memory, CPU time, open files and file size, and
// (best effort) private user and network namespaces. The calling thread
// blocks until the worker is terminal; the wall-clock deadline, the output
// cap and cancellation all end in SIGKILL for the whole process group.
class SandboxExecutor {
public:
    SandboxExecutor(std::filesystem::path scratch_root,
                    std::string interpreter,
                    std::size_t pool_size,
                    OverflowPolicy policy);
    explicit SandboxExecutor(const config::SandboxConfig& config);

    ExecutionOutcome Execute(const ExecutionRequest& request);
    bool Cancel(const std::string& correlation_id);

    WorkerPool& Pool() { return pool_; }
    const WorkerPool& Pool() const { return pool_; }

    // Absolute interpreter path, probed once through sys.executable.
    const std::string& ResolvedInterpreter();

private:
    void RunWorker(const ExecutionRequest& request, WorkerPool::Lease& lease, ExecutionOutcome& outcome);

    std::filesystem::path scratch_root_;
    std::string interpreter_;
    std::string resolved_interpreter_;
    std::once_flag resolve_once_;
    WorkerPool pool_;
};

}  // namespace anabox::sandbox
