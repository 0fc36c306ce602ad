#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace anabox::config {

struct SandboxConfig {
    std::string interpreter = "python3";
    std::string scratch_root;
    int max_wall_seconds = 30;
    std::uint64_t max_memory_mb = 512;
    std::size_t max_output_bytes = 1024 * 1024;
    std::vector<std::string> allowed_imports = {
        "pandas", "numpy", "matplotlib", "seaborn", "scipy", "sklearn",
        "math", "statistics", "json", "csv", "datetime", "time",
        "collections", "itertools", "functools", "operator"
    };
    std::size_t pool_size = 4;
    std::string overflow_policy = "block";
    bool isolate_network = true;
    bool require_isolation = false;
    std::size_t inline_artifact_max_bytes = 256 * 1024;
    int max_open_files = 256;
    std::uint64_t max_file_mb = 64;
};

struct ArtifactConfig {
    std::string store_dir;
    std::string base_url;
    std::size_t max_artifact_bytes = 16 * 1024 * 1024;
};

struct HistoryConfig {
    bool enabled = true;
    std::string db_path;
    int retention_days = 7;
};

struct GatewayConfig {
    std::string host = "127.0.0.1";
    int port = 18790;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    SandboxConfig sandbox;
    ArtifactConfig artifacts;
    HistoryConfig history;
    GatewayConfig gateway;
    LoggingConfig logging;
};

}  // namespace anabox::config
