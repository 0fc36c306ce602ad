#include "sandbox/sandbox_executor.hpp"

#include <boost/process.hpp>
#include <boost/process/extend.hpp>
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>
#include <fcntl.h>
#include <sched.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include "sandbox/runner_script.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace anabox::sandbox {
namespace bp = boost::process;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(25);
constexpr int kIsolationFailureExitCode = 125;
constexpr char kIsolationFailureMessage[] = "anabox: network isolation unavailable\n";

// Everything the forked child needs, computed before fork so the child does
// not allocate.
struct ChildSetup {
    rlim_t memory_bytes = RLIM_INFINITY;
    rlim_t cpu_seconds = RLIM_INFINITY;
    rlim_t open_files = RLIM_INFINITY;
    rlim_t file_bytes = RLIM_INFINITY;
    bool isolate_network = false;
    bool require_isolation = false;
    std::string uid_map;
    std::string gid_map;
};

enum class StopReason {
    kNone,
    kTimeout,
    kOutputLimit,
    kCancelled
};

void SetLimit(int resource, rlim_t value) {
    if (value == RLIM_INFINITY) {
        return;
    }
    struct rlimit limit;
    limit.rlim_cur = value;
    limit.rlim_max = value;
    ::setrlimit(resource, &limit);
}

bool WriteProcFile(const char* path, const std::string& content) {
    const int fd = ::open(path, O_WRONLY | O_CLOEXEC);
    if (fd < 0) {
        return false;
    }
    const auto written = ::write(fd, content.data(), content.size());
    ::close(fd);
    return written == static_cast<ssize_t>(content.size());
}

void ApplyChildSetup(const ChildSetup& setup) {
    ::setpgid(0, 0);
    SetLimit(RLIMIT_AS, setup.memory_bytes);
    SetLimit(RLIMIT_CPU, setup.cpu_seconds);
    SetLimit(RLIMIT_NOFILE, setup.open_files);
    SetLimit(RLIMIT_FSIZE, setup.file_bytes);
    SetLimit(RLIMIT_CORE, 0);

    if (!setup.isolate_network) {
        return;
    }
    bool isolated = ::unshare(CLONE_NEWUSER | CLONE_NEWNET) == 0;
    if (isolated) {
        WriteProcFile("/proc/self/setgroups", "deny");
        isolated = WriteProcFile("/proc/self/uid_map", setup.uid_map) &&
                   WriteProcFile("/proc/self/gid_map", setup.gid_map);
    }
    if (!isolated && setup.require_isolation) {
        [[maybe_unused]] const auto written =
            ::write(STDERR_FILENO, kIsolationFailureMessage, sizeof(kIsolationFailureMessage) - 1);
        ::_exit(kIsolationFailureExitCode);
    }
}

ChildSetup MakeChildSetup(const ResourceLimits& limits) {
    ChildSetup setup;
    if (limits.max_memory_bytes > 0) {
        setup.memory_bytes = static_cast<rlim_t>(limits.max_memory_bytes);
    }
    if (limits.max_wall_seconds > 0) {
        setup.cpu_seconds = static_cast<rlim_t>(limits.max_wall_seconds + 1);
    }
    if (limits.max_open_files > 0) {
        setup.open_files = static_cast<rlim_t>(limits.max_open_files);
    }
    // stdout and stderr are files too; keep them writable up to the cap.
    const auto file_bytes = std::max<std::uint64_t>(limits.max_file_bytes, limits.max_output_bytes + 4096);
    setup.file_bytes = static_cast<rlim_t>(file_bytes);
    setup.isolate_network = limits.isolate_network;
    setup.require_isolation = limits.require_isolation;
    setup.uid_map = std::to_string(::getuid()) + " " + std::to_string(::getuid()) + " 1\n";
    setup.gid_map = std::to_string(::getgid()) + " " + std::to_string(::getgid()) + " 1\n";
    return setup;
}

void WriteFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << content;
    output.close();
    if (!output) {
        throw std::filesystem::filesystem_error(
            "cannot write file", path, std::make_error_code(std::errc::io_error));
    }
}

std::uintmax_t FileSize(const std::filesystem::path& path) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    return ec ? 0 : size;
}

std::string ReadHead(const std::filesystem::path& path, std::size_t max_bytes) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open() || max_bytes == 0) {
        return {};
    }
    std::string data(max_bytes, '\0');
    input.read(&data[0], static_cast<std::streamsize>(max_bytes));
    data.resize(static_cast<std::size_t>(input.gcount()));
    if (data.size() == max_bytes && FileSize(path) > max_bytes) {
        data.resize(utils::Utf8PrefixLength(data, data.size()));
    }
    return data;
}

std::string ReadTail(const std::filesystem::path& path, std::size_t max_bytes) {
    const auto size = FileSize(path);
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open() || max_bytes == 0) {
        return {};
    }
    if (size > max_bytes) {
        input.seekg(static_cast<std::streamoff>(size - max_bytes));
    }
    std::ostringstream oss;
    oss << input.rdbuf();
    auto data = oss.str();
    if (data.size() > max_bytes) {
        data.erase(0, data.size() - max_bytes);
    }
    if (size > max_bytes) {
        data.erase(0, utils::Utf8SuffixStart(data, 0));
    }
    return data;
}

// The group outlives a reaped leader; the pid itself may already be reused.
void KillGroup(pid_t pid, bool reaped) {
    if (pid <= 0) {
        return;
    }
    ::kill(-pid, SIGKILL);
    if (!reaped) {
        ::kill(pid, SIGKILL);
    }
}

std::string ProbeInterpreter(const std::string& interpreter) {
    boost::filesystem::path exe = interpreter.find('/') != std::string::npos
        ? boost::filesystem::path(interpreter)
        : bp::search_path(interpreter);
    if (exe.empty()) {
        utils::LogWarn("sandbox", "interpreter '" + interpreter + "' not found on PATH");
        return interpreter;
    }
    try {
        bp::ipstream output;
        bp::child probe(exe, "-c", "import sys; print(sys.executable)",
                        bp::std_in.close(),
                        bp::std_out > output,
                        bp::std_err > bp::null);
        std::string line;
        std::getline(output, line);
        probe.wait();
        line = utils::Trim(line);
        if (probe.exit_code() == 0 && !line.empty()) {
            return line;
        }
    } catch (const bp::process_error& ex) {
        utils::LogWarn("sandbox", std::string("interpreter probe failed: ") + ex.what());
    }
    return exe.string();
}

std::string FormatBytes(std::uint64_t bytes) {
    if (bytes >= 1024 * 1024 && bytes % (1024 * 1024) == 0) {
        return std::to_string(bytes / (1024 * 1024)) + " MB";
    }
    return std::to_string(bytes) + " bytes";
}

}  // namespace

SandboxExecutor::SandboxExecutor(std::filesystem::path scratch_root,
                                 std::string interpreter,
                                 std::size_t pool_size,
                                 OverflowPolicy policy)
    : scratch_root_(std::move(scratch_root)),
      interpreter_(std::move(interpreter)),
      pool_(pool_size, policy) {}

SandboxExecutor::SandboxExecutor(const config::SandboxConfig& config)
    : SandboxExecutor(config.scratch_root.empty()
                          ? std::filesystem::temp_directory_path() / "anabox"
                          : std::filesystem::path(config.scratch_root),
                      config.interpreter,
                      config.pool_size,
                      ParseOverflowPolicy(config.overflow_policy)) {}

const std::string& SandboxExecutor::ResolvedInterpreter() {
    std::call_once(resolve_once_, [this] {
        resolved_interpreter_ = ProbeInterpreter(interpreter_);
        utils::LogDebug("sandbox", "using interpreter " + resolved_interpreter_);
    });
    return resolved_interpreter_;
}

bool SandboxExecutor::Cancel(const std::string& correlation_id) {
    const bool cancelled = pool_.Cancel(correlation_id);
    if (cancelled) {
        utils::LogInfo("sandbox", "cancel requested for " + correlation_id);
    }
    return cancelled;
}

ExecutionOutcome SandboxExecutor::Execute(const ExecutionRequest& request) {
    const auto started = std::chrono::steady_clock::now();
    ExecutionOutcome outcome;
    outcome.correlation_id = request.correlation_id;

    if (request.candidate.rejected) {
        outcome.status = ExecutionStatus::kRejected;
        outcome.detail = "code was rejected: " +
                         request.candidate.rejection_reason.value_or("no reason given");
        return outcome;
    }

    WorkerPool::Lease lease;
    switch (pool_.Admit(request.correlation_id, lease)) {
        case WorkerPool::AdmitResult::kDuplicate:
            outcome.status = ExecutionStatus::kRejected;
            outcome.detail = "an execution for '" + request.correlation_id + "' is already in progress";
            utils::LogWarn("sandbox", outcome.detail);
            return outcome;
        case WorkerPool::AdmitResult::kAtCapacity:
            outcome.status = ExecutionStatus::kRejected;
            outcome.detail = "all " + std::to_string(pool_.Capacity()) + " workers are busy";
            utils::LogWarn("sandbox", outcome.detail);
            return outcome;
        case WorkerPool::AdmitResult::kCancelled:
            outcome.status = ExecutionStatus::kCancelled;
            outcome.detail = "execution was cancelled before it started";
            return outcome;
        case WorkerPool::AdmitResult::kAdmitted:
            break;
    }

    try {
        RunWorker(request, lease, outcome);
    } catch (const bp::process_error& ex) {
        outcome.status = ExecutionStatus::kRuntimeError;
        outcome.detail = std::string("failed to launch worker: ") + ex.what();
    } catch (const std::filesystem::filesystem_error& ex) {
        outcome.status = ExecutionStatus::kRuntimeError;
        outcome.detail = std::string("scratch directory error: ") + ex.what();
    }

    lease.SetState(TerminalStateFor(outcome.status));
    outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    utils::LogInfo("sandbox", request.correlation_id + " finished: " + ToString(outcome.status) +
                                  " in " + std::to_string(outcome.duration.count()) + "ms");
    return outcome;
}

void SandboxExecutor::RunWorker(const ExecutionRequest& request,
                                WorkerPool::Lease& lease,
                                ExecutionOutcome& outcome) {
    const auto& limits = request.limits;
    const auto interpreter = ResolvedInterpreter();

    outcome.scratch = ScratchDirectory::Create(scratch_root_, request.correlation_id);
    const auto root = outcome.scratch.Root();
    const auto work = outcome.scratch.WorkDir();
    const auto runner_path = root / kRunnerFileName;
    const auto candidate_path = root / kCandidateFileName;
    const auto stdout_path = root / "stdout.log";
    const auto stderr_path = root / "stderr.log";
    WriteFile(runner_path, RunnerScript());
    WriteFile(candidate_path, request.candidate.source);

    bp::environment env;
    env["PATH"] = "/usr/local/bin:/usr/bin:/bin";
    env["HOME"] = work.string();
    env["TMPDIR"] = work.string();
    env["LANG"] = "C.UTF-8";
    env["MPLBACKEND"] = "Agg";
    env["MPLCONFIGDIR"] = (work / ".matplotlib").string();
    env["OPENBLAS_NUM_THREADS"] = "1";
    env["ANABOX_ARTIFACT_DIR"] = work.string();
    env["ANABOX_INLINE_MAX"] = std::to_string(limits.inline_artifact_max_bytes);
    if (!limits.allowed_imports.empty()) {
        env["ANABOX_ALLOWED_IMPORTS"] = utils::Join(
            std::vector<std::string>(limits.allowed_imports.begin(), limits.allowed_imports.end()), ",");
    }
    if (!request.working_context.empty()) {
        env["ANABOX_CONTEXT"] = request.working_context;
    }

    const auto setup = MakeChildSetup(limits);
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(limits.max_wall_seconds);

    bp::child child(
        bp::exe = interpreter,
        bp::args = std::vector<std::string>{"-I", "-B", runner_path.string(), candidate_path.string()},
        env,
        bp::start_dir = work.string(),
        bp::std_in.close(),
        bp::std_out > stdout_path.string(),
        bp::std_err > stderr_path.string(),
        bp::extend::on_exec_setup = [&setup](auto&) { ApplyChildSetup(setup); });

    const pid_t pid = child.id();
    lease.SetState(ExecutionState::kRunning);
    utils::LogDebug("sandbox", request.correlation_id + " running as pid " + std::to_string(pid));

    StopReason stop = StopReason::kNone;
    std::error_code ec;
    while (child.running(ec)) {
        if (lease.CancelRequested()) {
            stop = StopReason::kCancelled;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            stop = StopReason::kTimeout;
            break;
        }
        if (FileSize(stdout_path) + FileSize(stderr_path) > limits.max_output_bytes) {
            stop = StopReason::kOutputLimit;
            break;
        }
        std::this_thread::sleep_for(kPollInterval);
    }
    if (ec) {
        utils::LogWarn("sandbox", "waitpid failed for pid " + std::to_string(pid) + ": " + ec.message());
    }

    // Kill the whole group even after a natural exit so nothing the candidate
    // spawned outlives the execution. running() has reaped a child that exited.
    KillGroup(pid, stop == StopReason::kNone);
    if (stop != StopReason::kNone) {
        child.wait(ec);
    }

    const int raw_status = child.native_exit_code();
    if (WIFEXITED(raw_status)) {
        outcome.exit_code = WEXITSTATUS(raw_status);
    } else if (WIFSIGNALED(raw_status)) {
        outcome.exit_signal = WTERMSIG(raw_status);
    }

    const auto stdout_size = FileSize(stdout_path);
    const auto stderr_size = FileSize(stderr_path);
    const auto budget = limits.max_output_bytes;
    const bool over_limit = stdout_size + stderr_size > budget;
    std::size_t stderr_take = std::min<std::uintmax_t>(stderr_size, budget / 2);
    const std::size_t stdout_take = std::min<std::uintmax_t>(stdout_size, budget - stderr_take);
    stderr_take = std::min<std::uintmax_t>(stderr_size, budget - stdout_take);
    outcome.raw_stdout = ReadHead(stdout_path, stdout_take);
    outcome.raw_stderr = ReadTail(stderr_path, stderr_take);
    outcome.output_truncated = over_limit;

    const auto& stderr_text = outcome.raw_stderr;
    if (stop == StopReason::kCancelled) {
        outcome.status = ExecutionStatus::kCancelled;
        outcome.detail = "execution was cancelled";
    } else if (stop == StopReason::kTimeout) {
        outcome.status = ExecutionStatus::kTimeout;
        outcome.detail = "execution timed out after " + std::to_string(limits.max_wall_seconds) + "s";
    } else if (stop == StopReason::kOutputLimit || over_limit) {
        outcome.status = ExecutionStatus::kResourceExceeded;
        outcome.detail = "output limit of " + std::to_string(budget) + " bytes exceeded";
    } else if (outcome.exit_signal == SIGXCPU) {
        outcome.status = ExecutionStatus::kTimeout;
        outcome.detail = "CPU time limit of " + std::to_string(limits.max_wall_seconds) + "s exceeded";
    } else if (outcome.exit_signal == SIGXFSZ) {
        outcome.status = ExecutionStatus::kResourceExceeded;
        outcome.detail = "file size limit of " + FormatBytes(limits.max_file_bytes) + " exceeded";
    } else if (outcome.exit_signal == SIGKILL ||
               (outcome.exit_code.value_or(0) != 0 && stderr_text.find("MemoryError") != std::string::npos)) {
        outcome.status = ExecutionStatus::kResourceExceeded;
        outcome.detail = "memory limit of " + FormatBytes(limits.max_memory_bytes) + " exceeded";
    } else if (outcome.exit_code == kIsolationFailureExitCode && limits.require_isolation &&
               stderr_text.find(kIsolationFailureMessage) != std::string::npos) {
        outcome.status = ExecutionStatus::kRuntimeError;
        outcome.detail = "network isolation is required but unavailable on this host";
    } else if (outcome.exit_code == 0) {
        outcome.status = ExecutionStatus::kSuccess;
    } else if (outcome.exit_code) {
        outcome.status = ExecutionStatus::kRuntimeError;
        outcome.detail = "process exited with code " + std::to_string(*outcome.exit_code);
    } else if (outcome.exit_signal) {
        outcome.status = ExecutionStatus::kRuntimeError;
        outcome.detail = "process terminated by signal " + std::to_string(*outcome.exit_signal);
    } else {
        outcome.status = ExecutionStatus::kRuntimeError;
        outcome.detail = "worker exit status is unavailable";
    }
}

}  // namespace anabox::sandbox
