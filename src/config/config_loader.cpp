#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "utils/logging.hpp"

namespace anabox::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

long long ParseInteger(const std::string& value, long long fallback) {
    try {
        return std::stoll(value);
    } catch (const std::invalid_argument&) {
        return fallback;
    } catch (const std::out_of_range&) {
        return fallback;
    }
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

template <typename T>
void ReadPositive(const nlohmann::json& source, const char* key, T& target) {
    if (source.contains(key) && source[key].is_number_integer()) {
        const auto value = source[key].get<long long>();
        if (value > 0) {
            target = static_cast<T>(value);
        }
    }
}

void ReadString(const nlohmann::json& source, const char* key, std::string& target) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ReadBool(const nlohmann::json& source, const char* key, bool& target) {
    if (source.contains(key) && source[key].is_boolean()) {
        target = source[key].get<bool>();
    }
}

void ApplySandboxConfig(SandboxConfig& sandbox, const nlohmann::json& source) {
    ReadString(source, "interpreter", sandbox.interpreter);
    ReadString(source, "scratchRoot", sandbox.scratch_root);
    ReadPositive(source, "maxWallSeconds", sandbox.max_wall_seconds);
    ReadPositive(source, "maxMemoryMb", sandbox.max_memory_mb);
    ReadPositive(source, "maxOutputBytes", sandbox.max_output_bytes);
    ReadPositive(source, "poolSize", sandbox.pool_size);
    ReadString(source, "overflowPolicy", sandbox.overflow_policy);
    ReadBool(source, "isolateNetwork", sandbox.isolate_network);
    ReadBool(source, "requireIsolation", sandbox.require_isolation);
    ReadPositive(source, "inlineArtifactMaxBytes", sandbox.inline_artifact_max_bytes);
    ReadPositive(source, "maxOpenFiles", sandbox.max_open_files);
    ReadPositive(source, "maxFileMb", sandbox.max_file_mb);
    if (source.contains("allowedImports") && source["allowedImports"].is_array()) {
        sandbox.allowed_imports.clear();
        for (const auto& item : source["allowedImports"]) {
            if (item.is_string()) {
                sandbox.allowed_imports.push_back(item.get<std::string>());
            }
        }
    }
}

}  // namespace

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetConfigPath() {
    return GetHomePath() / ".anabox" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        ApplySandboxConfig(config.sandbox, data["sandbox"]);
    }

    if (data.contains("artifacts") && data["artifacts"].is_object()) {
        const auto& artifacts = data["artifacts"];
        ReadString(artifacts, "storeDir", config.artifacts.store_dir);
        ReadString(artifacts, "baseUrl", config.artifacts.base_url);
        ReadPositive(artifacts, "maxArtifactBytes", config.artifacts.max_artifact_bytes);
    }

    if (data.contains("history") && data["history"].is_object()) {
        const auto& history = data["history"];
        ReadBool(history, "enabled", config.history.enabled);
        ReadString(history, "dbPath", config.history.db_path);
        ReadPositive(history, "retentionDays", config.history.retention_days);
    }

    if (data.contains("gateway") && data["gateway"].is_object()) {
        const auto& gateway = data["gateway"];
        ReadString(gateway, "host", config.gateway.host);
        ReadPositive(gateway, "port", config.gateway.port);
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ReadString(data["logging"], "level", config.logging.level);
    }
}

void ApplyConfigFromEnv(Config& config) {
    const auto interpreter = GetEnvFallback(
        "ANABOX_SANDBOX__INTERPRETER",
        "ANABOX_SANDBOX_INTERPRETER");
    if (!interpreter.empty()) {
        config.sandbox.interpreter = interpreter;
    }

    const auto scratch_root = GetEnvFallback(
        "ANABOX_SANDBOX__SCRATCH_ROOT",
        "ANABOX_SANDBOX_SCRATCH_ROOT");
    if (!scratch_root.empty()) {
        config.sandbox.scratch_root = scratch_root;
    }

    const auto max_wall = GetEnvFallback(
        "ANABOX_SANDBOX__MAX_WALL_SECONDS",
        "ANABOX_SANDBOX_MAX_WALL_SECONDS");
    if (!max_wall.empty()) {
        const auto value = ParseInteger(max_wall, config.sandbox.max_wall_seconds);
        if (value > 0) {
            config.sandbox.max_wall_seconds = static_cast<int>(value);
        }
    }

    const auto max_memory = GetEnvFallback(
        "ANABOX_SANDBOX__MAX_MEMORY_MB",
        "ANABOX_SANDBOX_MAX_MEMORY_MB");
    if (!max_memory.empty()) {
        const auto value = ParseInteger(max_memory, 0);
        if (value > 0) {
            config.sandbox.max_memory_mb = static_cast<std::uint64_t>(value);
        }
    }

    const auto max_output = GetEnvFallback(
        "ANABOX_SANDBOX__MAX_OUTPUT_BYTES",
        "ANABOX_SANDBOX_MAX_OUTPUT_BYTES");
    if (!max_output.empty()) {
        const auto value = ParseInteger(max_output, 0);
        if (value > 0) {
            config.sandbox.max_output_bytes = static_cast<std::size_t>(value);
        }
    }

    const auto allowed_imports = GetEnvFallback(
        "ANABOX_SANDBOX__ALLOWED_IMPORTS",
        "ANABOX_SANDBOX_ALLOWED_IMPORTS");
    if (!allowed_imports.empty()) {
        config.sandbox.allowed_imports = SplitCsv(allowed_imports);
    }

    const auto pool_size = GetEnvFallback(
        "ANABOX_SANDBOX__POOL_SIZE",
        "ANABOX_SANDBOX_POOL_SIZE");
    if (!pool_size.empty()) {
        const auto value = ParseInteger(pool_size, 0);
        if (value > 0) {
            config.sandbox.pool_size = static_cast<std::size_t>(value);
        }
    }

    const auto overflow_policy = GetEnvFallback(
        "ANABOX_SANDBOX__OVERFLOW_POLICY",
        "ANABOX_SANDBOX_OVERFLOW_POLICY");
    if (!overflow_policy.empty()) {
        config.sandbox.overflow_policy = overflow_policy;
    }

    const auto isolate_network = GetEnvFallback(
        "ANABOX_SANDBOX__ISOLATE_NETWORK",
        "ANABOX_SANDBOX_ISOLATE_NETWORK");
    if (!isolate_network.empty()) {
        config.sandbox.isolate_network = ParseBool(isolate_network);
    }

    const auto require_isolation = GetEnvFallback(
        "ANABOX_SANDBOX__REQUIRE_ISOLATION",
        "ANABOX_SANDBOX_REQUIRE_ISOLATION");
    if (!require_isolation.empty()) {
        config.sandbox.require_isolation = ParseBool(require_isolation);
    }

    const auto store_dir = GetEnvFallback(
        "ANABOX_ARTIFACTS__STORE_DIR",
        "ANABOX_ARTIFACTS_STORE_DIR");
    if (!store_dir.empty()) {
        config.artifacts.store_dir = store_dir;
    }

    const auto base_url = GetEnvFallback(
        "ANABOX_ARTIFACTS__BASE_URL",
        "ANABOX_ARTIFACTS_BASE_URL");
    if (!base_url.empty()) {
        config.artifacts.base_url = base_url;
    }

    const auto history_enabled = GetEnvFallback(
        "ANABOX_HISTORY__ENABLED",
        "ANABOX_HISTORY_ENABLED");
    if (!history_enabled.empty()) {
        config.history.enabled = ParseBool(history_enabled);
    }

    const auto history_db = GetEnvFallback(
        "ANABOX_HISTORY__DB_PATH",
        "ANABOX_HISTORY_DB_PATH");
    if (!history_db.empty()) {
        config.history.db_path = history_db;
    }

    const auto gateway_host = GetEnvFallback(
        "ANABOX_GATEWAY__HOST",
        "ANABOX_GATEWAY_HOST");
    if (!gateway_host.empty()) {
        config.gateway.host = gateway_host;
    }

    const auto gateway_port = GetEnvFallback(
        "ANABOX_GATEWAY__PORT",
        "ANABOX_GATEWAY_PORT");
    if (!gateway_port.empty()) {
        const auto value = ParseInteger(gateway_port, 0);
        if (value > 0 && value < 65536) {
            config.gateway.port = static_cast<int>(value);
        }
    }

    const auto log_level = GetEnvFallback(
        "ANABOX_LOGGING__LEVEL",
        "ANABOX_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
}

void ResolveDefaultPaths(Config& config) {
    const auto base = GetHomePath() / ".anabox";
    if (config.sandbox.scratch_root.empty()) {
        config.sandbox.scratch_root = (std::filesystem::temp_directory_path() / "anabox").string();
    }
    if (config.artifacts.store_dir.empty()) {
        config.artifacts.store_dir = (base / "artifacts").string();
    }
    if (config.history.db_path.empty()) {
        config.history.db_path = (base / "history.db").string();
    }
}

Config LoadConfig(const std::filesystem::path& config_path) {
    Config config{};

    std::error_code ec;
    if (std::filesystem::exists(config_path, ec)) {
        std::ifstream input(config_path);
        if (!input.is_open()) {
            utils::LogWarn("config", "cannot open " + config_path.string() + "; using defaults");
        } else {
            try {
                nlohmann::json data;
                input >> data;
                ApplyConfigFromJson(config, data);
            } catch (const nlohmann::json::exception& ex) {
                utils::LogWarn("config", "ignoring malformed " + config_path.string() + ": " + ex.what());
            }
        }
    }

    ApplyConfigFromEnv(config);
    ResolveDefaultPaths(config);
    utils::SetLogLevel(utils::ParseLogLevel(config.logging.level));
    return config;
}

Config LoadConfig() {
    return LoadConfig(GetConfigPath());
}

}  // namespace anabox::config
