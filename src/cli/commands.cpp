#include <atomic>
#include <chrono>
#include <csignal>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>

#include "config/config_loader.hpp"
#include "content/html_renderer.hpp"
#include "gateway/gateway_api.hpp"
#include "gateway/gateway_server.hpp"
#include "history/execution_journal.hpp"
#include "normalizer/code_normalizer.hpp"
#include "pipeline/execution_pipeline.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "storage/artifact_store.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "nlohmann/json.hpp"

namespace {

std::atomic<bool> g_running{true};
volatile std::sig_atomic_t g_signal = 0;

constexpr const char* kUsage =
    "Usage: anabox run [FILE] [--html] | anabox normalize [FILE] | anabox history [LIMIT] | "
    "anabox cleanup [DAYS] | anabox gateway";

std::filesystem::path GetPidFilePath() {
    return anabox::config::GetHomePath() / ".anabox" / "gateway.pid";
}

bool IsProcessRunning(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

std::optional<pid_t> ReadPidFile() {
    std::ifstream input(GetPidFilePath());
    if (!input.is_open()) {
        return std::nullopt;
    }
    pid_t pid = 0;
    input >> pid;
    if (pid <= 0) {
        return std::nullopt;
    }
    return pid;
}

bool WritePidFile(pid_t pid) {
    const auto path = GetPidFilePath();
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    std::ofstream output(path, std::ios::trunc);
    if (!output.is_open()) {
        return false;
    }
    output << pid;
    return true;
}

void RemovePidFile() {
    std::error_code ec;
    std::filesystem::remove(GetPidFilePath(), ec);
}

void HandleSignal(int signal) {
    g_signal = signal;
}

// Reads FILE, or stdin when the path is empty or "-".
std::optional<std::string> ReadInput(const std::string& path) {
    if (path.empty() || path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return std::nullopt;
    }
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

std::unique_ptr<anabox::history::ExecutionJournal> OpenJournal(const anabox::config::Config& config) {
    if (!config.history.enabled) {
        return nullptr;
    }
    try {
        return std::make_unique<anabox::history::ExecutionJournal>(config.history.db_path);
    } catch (const anabox::history::JournalError& e) {
        anabox::utils::LogWarn("cli", std::string("execution history unavailable: ") + e.what());
        return nullptr;
    }
}

// Everything a submission needs, wired from configuration.
struct Runtime {
    explicit Runtime(const anabox::config::Config& config)
        : executor(config.sandbox),
          store(config.artifacts.store_dir, config.artifacts.base_url),
          journal(OpenJournal(config)),
          pipeline(anabox::sandbox::ResourceLimits::FromConfig(config.sandbox),
                   executor,
                   store,
                   anabox::result::ProcessorOptions{config.artifacts.max_artifact_bytes, 2000}) {
        pipeline.SetJournal(journal.get());
        pipeline.SetFailureReporter([](const std::string& correlation_id,
                                       anabox::sandbox::ExecutionStatus status,
                                       const std::string&) {
            anabox::utils::LogInfo("cli", correlation_id + " finished with status " +
                                              anabox::sandbox::ToString(status));
        });
    }

    anabox::sandbox::SandboxExecutor executor;
    anabox::storage::FileArtifactStore store;
    std::unique_ptr<anabox::history::ExecutionJournal> journal;
    anabox::pipeline::ExecutionPipeline pipeline;
};

int RunCode(const std::string& path, bool html) {
    const auto raw = ReadInput(path);
    if (!raw) {
        std::cout << "Cannot read " << path << std::endl;
        return 1;
    }
    const auto config = anabox::config::LoadConfig();
    Runtime runtime(config);

    const auto correlation_id = "cli-" + std::to_string(anabox::utils::NowMs());
    const auto result = runtime.pipeline.SubmitCodeForExecution(*raw, "", correlation_id, "cli");
    if (html) {
        std::cout << anabox::content::RenderHtml(result.blocks) << std::endl;
    } else {
        std::cout << anabox::gateway::Serialize(anabox::gateway::ToJson(result, false)) << std::endl;
    }
    if (result.rejected) {
        return 2;
    }
    return result.status == anabox::sandbox::ExecutionStatus::kSuccess ? 0 : 1;
}

int NormalizeCode(const std::string& path) {
    const auto raw = ReadInput(path);
    if (!raw) {
        std::cout << "Cannot read " << path << std::endl;
        return 1;
    }
    const auto config = anabox::config::LoadConfig();
    const anabox::normalizer::CodeNormalizer normalizer(config.sandbox.allowed_imports);
    const auto candidate = normalizer.Normalize(*raw);
    if (candidate.rejected) {
        std::cout << "rejected: " << candidate.rejection_reason.value_or("unknown reason") << std::endl;
        return 2;
    }
    if (candidate.repaired) {
        std::cerr << "[cli] indentation was repaired" << std::endl;
    }
    std::cout << candidate.source;
    return 0;
}

int ShowHistory(const std::string& limit_arg) {
    const auto config = anabox::config::LoadConfig();
    auto journal = OpenJournal(config);
    if (!journal) {
        std::cout << "Execution history is disabled." << std::endl;
        return 1;
    }
    std::size_t limit = 20;
    if (!limit_arg.empty()) {
        try {
            limit = static_cast<std::size_t>(std::stoul(limit_arg));
        } catch (const std::exception&) {
            std::cout << "LIMIT must be a number." << std::endl;
            return 1;
        }
    }
    try {
        for (const auto& record : journal->ListRecent(limit)) {
            std::cout << record.created_at_ms << "  " << record.correlation_id << "  " << record.status
                      << "  " << record.duration_ms << "ms";
            if (!record.detail.empty()) {
                std::cout << "  " << record.detail;
            }
            std::cout << std::endl;
        }
    } catch (const anabox::history::JournalError& e) {
        std::cout << "History query failed: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

int CleanupHistory(const std::string& days_arg) {
    const auto config = anabox::config::LoadConfig();
    auto journal = OpenJournal(config);
    if (!journal) {
        std::cout << "Execution history is disabled." << std::endl;
        return 1;
    }
    int days = config.history.retention_days;
    if (!days_arg.empty()) {
        try {
            days = std::stoi(days_arg);
        } catch (const std::exception&) {
            std::cout << "DAYS must be a number." << std::endl;
            return 1;
        }
    }
    try {
        const auto removed = journal->CleanupOlderThan(std::chrono::hours(24 * days));
        std::cout << "Removed " << removed << " records older than " << days << " days." << std::endl;
    } catch (const anabox::history::JournalError& e) {
        std::cout << "Cleanup failed: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

int RunGateway() {
    const auto config = anabox::config::LoadConfig();

    const auto existing_pid = ReadPidFile();
    if (existing_pid && IsProcessRunning(*existing_pid)) {
        std::cout << "anabox gateway already running (pid=" << *existing_pid << ")" << std::endl;
        return 1;
    }
    RemovePidFile();
    if (!WritePidFile(::getpid())) {
        std::cout << "Failed to write gateway pid file." << std::endl;
        return 1;
    }

    Runtime runtime(config);
    if (runtime.journal && config.history.retention_days > 0) {
        try {
            runtime.journal->CleanupOlderThan(std::chrono::hours(24 * config.history.retention_days));
        } catch (const anabox::history::JournalError& e) {
            anabox::utils::LogWarn("gateway", e.what());
        }
    }
    anabox::gateway::GatewayApi api(runtime.pipeline, runtime.journal.get());
    anabox::gateway::GatewayServer server(api, config.gateway);

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    std::atomic<bool> listen_failed{false};
    std::thread http_thread([&server, &listen_failed]() {
        if (!server.Listen()) {
            listen_failed.store(true);
        }
    });

    std::cout << "anabox gateway started on " << config.gateway.host << ":" << config.gateway.port
              << ". Press Ctrl+C to stop." << std::endl;
    bool shutdown_guard_started = false;
    while (g_running.load()) {
        if (listen_failed.load()) {
            g_running.store(false);
        }
        if (g_signal != 0) {
            g_running.store(false);
            if (!shutdown_guard_started) {
                shutdown_guard_started = true;
                std::thread([] {
                    std::this_thread::sleep_for(std::chrono::seconds(5));
                    std::_Exit(130);
                }).detach();
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    server.Stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    RemovePidFile();
    return listen_failed.load() ? 1 : 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cout << kUsage << std::endl;
        return 1;
    }
    const std::string command = argv[1];
    const std::string arg = argc >= 3 ? argv[2] : "";

    if (command == "run") {
        bool html = false;
        std::string path;
        for (int i = 2; i < argc; ++i) {
            const std::string value = argv[i];
            if (value == "--html") {
                html = true;
            } else {
                path = value;
            }
        }
        return RunCode(path, html);
    }
    if (command == "normalize") {
        return NormalizeCode(arg);
    }
    if (command == "history") {
        return ShowHistory(arg);
    }
    if (command == "cleanup") {
        return CleanupHistory(arg);
    }
    if (command == "gateway") {
        return RunGateway();
    }

    std::cout << kUsage << std::endl;
    return 1;
}
