#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>

#include "utils/common.hpp"

namespace klatsch::config {
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

int ParseInt(const std::string& name, const std::string& value) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw ConfigError(name + " is not an integer: " + value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigError(name + " is not an integer: " + value);
    }
}

std::size_t ParseSize(const std::string& name, const std::string& value) {
    const auto parsed = ParseInt(name, value);
    if (parsed <= 0) {
        throw ConfigError(name + " must be positive: " + value);
    }
    return static_cast<std::size_t>(parsed);
}

std::size_t JsonSize(const nlohmann::json& value, const std::string& name) {
    const auto parsed = value.get<long long>();
    if (parsed <= 0) {
        throw ConfigError(name + " must be positive");
    }
    return static_cast<std::size_t>(parsed);
}

}  // namespace

std::filesystem::path GetConfigPath() {
    const auto explicit_path = GetEnv("KLATSCH_CONFIG");
    if (!explicit_path.empty()) {
        return explicit_path;
    }
    return klatsch::utils::GetHomePath() / ".klatsch" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("server") && data["server"].is_object()) {
        const auto& server = data["server"];
        if (server.contains("host") && server["host"].is_string()) {
            config.server.host = server["host"].get<std::string>();
        }
        if (server.contains("port") && server["port"].is_number_integer()) {
            config.server.port = server["port"].get<int>();
        }
        if (server.contains("maxConnections") && server["maxConnections"].is_number_integer()) {
            config.server.max_connections = server["maxConnections"].get<int>();
        }
    }

    if (data.contains("store") && data["store"].is_object()) {
        const auto& store = data["store"];
        if (store.contains("databasePath") && store["databasePath"].is_string()) {
            config.store.database_path = store["databasePath"].get<std::string>();
        }
    }

    if (data.contains("stream") && data["stream"].is_object()) {
        const auto& stream = data["stream"];
        if (stream.contains("bufferSize") && stream["bufferSize"].is_number_integer()) {
            config.stream.buffer_size = JsonSize(stream["bufferSize"], "stream.bufferSize");
        }
        if (stream.contains("keepaliveMs") && stream["keepaliveMs"].is_number_integer()) {
            config.stream.keepalive_ms = stream["keepaliveMs"].get<int>();
        }
    }

    if (data.contains("limits") && data["limits"].is_object()) {
        const auto& limits = data["limits"];
        if (limits.contains("maxSenderLength") && limits["maxSenderLength"].is_number_integer()) {
            config.limits.max_sender_length = JsonSize(limits["maxSenderLength"], "limits.maxSenderLength");
        }
        if (limits.contains("maxContentLength") && limits["maxContentLength"].is_number_integer()) {
            config.limits.max_content_length = JsonSize(limits["maxContentLength"], "limits.maxContentLength");
        }
    }

    if (data.contains("log") && data["log"].is_object()) {
        const auto& log = data["log"];
        if (log.contains("level") && log["level"].is_string()) {
            config.log.level = log["level"].get<std::string>();
        }
    }
}

void ApplyConfigFromEnv(Config& config) {
    const auto host = GetEnvFallback("KLATSCH_SERVER__HOST", "HOST");
    if (!host.empty()) {
        config.server.host = host;
    }

    const auto port = GetEnvFallback("KLATSCH_SERVER__PORT", "PORT");
    if (!port.empty()) {
        config.server.port = ParseInt("PORT", port);
    }

    const auto max_connections = GetEnv("KLATSCH_SERVER__MAX_CONNECTIONS");
    if (!max_connections.empty()) {
        config.server.max_connections = ParseInt("KLATSCH_SERVER__MAX_CONNECTIONS", max_connections);
    }

    const auto database_path = GetEnvFallback("KLATSCH_STORE__DATABASE_PATH", "DATABASE_PATH");
    if (!database_path.empty()) {
        config.store.database_path = database_path;
    }

    const auto buffer_size = GetEnv("KLATSCH_STREAM__BUFFER_SIZE");
    if (!buffer_size.empty()) {
        config.stream.buffer_size = ParseSize("KLATSCH_STREAM__BUFFER_SIZE", buffer_size);
    }

    const auto keepalive_ms = GetEnv("KLATSCH_STREAM__KEEPALIVE_MS");
    if (!keepalive_ms.empty()) {
        config.stream.keepalive_ms = ParseInt("KLATSCH_STREAM__KEEPALIVE_MS", keepalive_ms);
    }

    const auto max_sender = GetEnv("KLATSCH_LIMITS__MAX_SENDER_LENGTH");
    if (!max_sender.empty()) {
        config.limits.max_sender_length = ParseSize("KLATSCH_LIMITS__MAX_SENDER_LENGTH", max_sender);
    }

    const auto max_content = GetEnv("KLATSCH_LIMITS__MAX_CONTENT_LENGTH");
    if (!max_content.empty()) {
        config.limits.max_content_length = ParseSize("KLATSCH_LIMITS__MAX_CONTENT_LENGTH", max_content);
    }

    const auto log_level = GetEnvFallback("KLATSCH_LOG__LEVEL", "KLATSCH_LOG_LEVEL");
    if (!log_level.empty()) {
        config.log.level = log_level;
    }
}

bool LoadDotEnv(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        return false;
    }
    std::string line;
    while (std::getline(input, line)) {
        line = klatsch::utils::Trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = klatsch::utils::Trim(line.substr(7));
        }
        const auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        const auto key = klatsch::utils::Trim(line.substr(0, eq));
        auto value = klatsch::utils::Trim(line.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'')
            && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        if (key.empty()) {
            continue;
        }
        ::setenv(key.c_str(), value.c_str(), 0);
    }
    return true;
}

Config LoadConfig() {
    Config config{};

    const auto config_path = GetConfigPath();
    if (std::filesystem::exists(config_path)) {
        std::ifstream input(config_path);
        auto data = nlohmann::json::parse(input, nullptr, false);
        if (data.is_discarded()) {
            throw ConfigError("config file is not valid JSON: " + config_path.string());
        }
        try {
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            throw ConfigError("invalid value in " + config_path.string() + ": " + ex.what());
        }
    }

    ApplyConfigFromEnv(config);
    return config;
}

void ValidateConfig(const Config& config) {
    if (config.store.database_path.empty()) {
        throw ConfigError("no database path configured; set DATABASE_PATH or store.databasePath");
    }
    if (config.server.port <= 0 || config.server.port > 65535) {
        throw ConfigError("port out of range: " + std::to_string(config.server.port));
    }
    if (config.server.max_connections <= 0) {
        throw ConfigError("server.maxConnections must be positive");
    }
    if (config.stream.buffer_size == 0) {
        throw ConfigError("stream.bufferSize must be positive");
    }
    if (config.stream.keepalive_ms <= 0) {
        throw ConfigError("stream.keepaliveMs must be positive");
    }
    if (config.limits.max_sender_length == 0 || config.limits.max_content_length == 0) {
        throw ConfigError("message length limits must be positive");
    }
}

}  // namespace klatsch::config
