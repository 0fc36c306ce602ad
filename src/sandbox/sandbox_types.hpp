#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>

#include "config/config_schema.hpp"
#include "normalizer/code_candidate.hpp"
#include "sandbox/scratch_directory.hpp"

namespace anabox::sandbox {

enum class ExecutionStatus {
    kSuccess,
    kTimeout,
    kResourceExceeded,
    kRuntimeError,
    kRejected,
    kCancelled
};

enum class ExecutionState {
    kPending,
    kRunning,
    kCompleted,
    kTimedOut,
    kResourceExceeded,
    kCrashed,
    kCancelled
};

inline const char* ToString(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::kSuccess: return "success";
        case ExecutionStatus::kTimeout: return "timeout";
        case ExecutionStatus::kResourceExceeded: return "resource_exceeded";
        case ExecutionStatus::kRuntimeError: return "runtime_error";
        case ExecutionStatus::kRejected: return "rejected";
        case ExecutionStatus::kCancelled: return "cancelled";
    }
    return "unknown";
}

inline const char* ToString(ExecutionState state) {
    switch (state) {
        case ExecutionState::kPending: return "PENDING";
        case ExecutionState::kRunning: return "RUNNING";
        case ExecutionState::kCompleted: return "COMPLETED";
        case ExecutionState::kTimedOut: return "TIMED_OUT";
        case ExecutionState::kResourceExceeded: return "RESOURCE_EXCEEDED";
        case ExecutionState::kCrashed: return "CRASHED";
        case ExecutionState::kCancelled: return "CANCELLED";
    }
    return "UNKNOWN";
}

inline ExecutionState TerminalStateFor(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::kSuccess: return ExecutionState::kCompleted;
        case ExecutionStatus::kTimeout: return ExecutionState::kTimedOut;
        case ExecutionStatus::kResourceExceeded: return ExecutionState::kResourceExceeded;
        case ExecutionStatus::kCancelled: return ExecutionState::kCancelled;
        case ExecutionStatus::kRuntimeError:
        case ExecutionStatus::kRejected:
            break;
    }
    return ExecutionState::kCrashed;
}

struct ResourceLimits {
    int max_wall_seconds = 30;
    std::uint64_t max_memory_bytes = 512ULL * 1024 * 1024;
    std::size_t max_output_bytes = 1024 * 1024;
    std::set<std::string> allowed_imports;

    int max_open_files = 256;
    std::uint64_t max_file_bytes = 64ULL * 1024 * 1024;
    std::size_t inline_artifact_max_bytes = 256 * 1024;
    bool isolate_network = true;
    bool require_isolation = false;

    static ResourceLimits FromConfig(const config::SandboxConfig& config) {
        ResourceLimits limits;
        limits.max_wall_seconds = config.max_wall_seconds;
        limits.max_memory_bytes = config.max_memory_mb * 1024 * 1024;
        limits.max_output_bytes = config.max_output_bytes;
        limits.allowed_imports.insert(config.allowed_imports.begin(), config.allowed_imports.end());
        limits.max_open_files = config.max_open_files;
        limits.max_file_bytes = config.max_file_mb * 1024 * 1024;
        limits.inline_artifact_max_bytes = config.inline_artifact_max_bytes;
        limits.isolate_network = config.isolate_network;
        limits.require_isolation = config.require_isolation;
        return limits;
    }
};

struct ExecutionRequest {
    normalizer::CodeCandidate candidate;
    ResourceLimits limits;
    std::string correlation_id;
    // Opaque reference handed to the program as ANABOX_CONTEXT / CONTEXT_PATH.
    std::string working_context;
};

// Terminal result of one execution. Owns the scratch directory, so artifacts
// referenced from raw_stdout stay readable until the outcome is destroyed.
struct ExecutionOutcome {
    std::string correlation_id;
    ExecutionStatus status = ExecutionStatus::kRuntimeError;
    std::string raw_stdout;
    std::string raw_stderr;
    std::optional<int> exit_code;
    std::optional<int> exit_signal;
    bool output_truncated = false;
    std::string detail;
    std::chrono::milliseconds duration{0};
    ScratchDirectory scratch;

    ExecutionOutcome() = default;
    ExecutionOutcome(ExecutionOutcome&&) = default;
    ExecutionOutcome& operator=(ExecutionOutcome&&) = default;
    ExecutionOutcome(const ExecutionOutcome&) = delete;
    ExecutionOutcome& operator=(const ExecutionOutcome&) = delete;
};

}  // namespace anabox::sandbox
