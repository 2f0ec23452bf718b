#include "core/configuration.hpp"

#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

#include "core/logger.hpp"

namespace core {

ConfigurationManager::ConfigurationManager(std::string path)
    : path_(std::move(path)) {
    loadFromDisk();
}

bool ConfigurationManager::reloadIfChanged() {
    std::error_code ec;
    auto current = std::filesystem::last_write_time(path_, ec);
    if (ec) {
        return false;
    }
    if (current != lastWriteTime_) {
        loadFromDisk();
        lastWriteTime_ = current;
        LOG_INFO("config", "Configuration reloaded from ", path_);
        return true;
    }
    return false;
}

void ConfigurationManager::loadFromDisk() {
    std::ifstream in(path_);

    if (!in.good()) {
        // 文件不存在：写一份默认模板，本次使用默认值
        std::error_code ec;
        auto parent = std::filesystem::path(path_).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
        }
        std::ofstream out(path_);
        out << defaultJson();
        out.close();
        LOG_WARN("config", "Configuration file missing. A default template was created at ", path_);
        // 模板不带任何令牌，必须由运维在 auth.tokens 里显式配置
        config_ = fromJson(defaultJson());
        LOG_WARN("config", "No auth tokens configured; add entries under auth.tokens in ", path_);
        lastWriteTime_ = std::filesystem::last_write_time(path_, ec);
        return;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    config_ = fromJson(buffer.str());

    std::error_code ec;
    lastWriteTime_ = std::filesystem::last_write_time(path_, ec);
}

Configuration ConfigurationManager::fromJson(const std::string& jsonText) {
    Configuration cfg;
    try {
        auto json = nlohmann::json::parse(jsonText);

        if (auto it = json.find("gateway"); it != json.end()) {
            cfg.gateway.bindAddress = it->value("bindAddress", cfg.gateway.bindAddress);
            cfg.gateway.port = it->value("port", cfg.gateway.port);
            cfg.gateway.workerThreads = it->value("workerThreads", cfg.gateway.workerThreads);
            cfg.gateway.maxConnections = it->value("maxConnections", cfg.gateway.maxConnections);
            cfg.gateway.heartbeatIntervalSeconds = it->value("heartbeatIntervalSeconds", cfg.gateway.heartbeatIntervalSeconds);
            cfg.gateway.maxMissedHeartbeats = it->value("maxMissedHeartbeats", cfg.gateway.maxMissedHeartbeats);
            cfg.gateway.authTimeoutMs = it->value("authTimeoutMs", cfg.gateway.authTimeoutMs);
        }

        if (auto it = json.find("broker"); it != json.end()) {
            cfg.broker.host = it->value("host", cfg.broker.host);
            cfg.broker.port = it->value("port", cfg.broker.port);
            cfg.broker.password = it->value("password", cfg.broker.password);
            cfg.broker.pattern = it->value("pattern", cfg.broker.pattern);
            cfg.broker.reconnectBaseMs = it->value("reconnectBaseMs", cfg.broker.reconnectBaseMs);
            cfg.broker.reconnectMaxMs = it->value("reconnectMaxMs", cfg.broker.reconnectMaxMs);
            cfg.broker.maxReconnectAttempts = it->value("maxReconnectAttempts", cfg.broker.maxReconnectAttempts);
        }

        if (auto it = json.find("validation"); it != json.end()) {
            cfg.validation.maxFutureSkewSeconds = it->value("maxFutureSkewSeconds", cfg.validation.maxFutureSkewSeconds);
        }

        if (auto it = json.find("auth"); it != json.end()) {
            if (auto tokens = it->find("tokens"); tokens != it->end() && tokens->is_array()) {
                for (const auto& entry : *tokens) {
                    AuthTokenEntry token;
                    token.token = entry.value("token", std::string{});
                    token.tenantId = entry.value("tenantId", std::string{});
                    token.userId = entry.value("userId", std::string{});
                    token.role = entry.value("role", token.role);
                    if (auto exp = entry.find("expiresAt"); exp != entry.end() && exp->is_number_integer()) {
                        token.expiresAt = exp->get<int64_t>();
                    }
                    if (token.token.empty() || token.tenantId.empty() || token.userId.empty()) {
                        LOG_WARN("config", "Skipping auth token entry without token/tenantId/userId");
                        continue;
                    }
                    cfg.auth.tokens.push_back(std::move(token));
                }
            }
        }

        if (auto it = json.find("health"); it != json.end()) {
            cfg.health.statusFile = it->value("statusFile", cfg.health.statusFile);
            cfg.health.intervalSeconds = it->value("intervalSeconds", cfg.health.intervalSeconds);
        }

        if (auto it = json.find("logging"); it != json.end()) {
            cfg.logging.level = it->value("level", cfg.logging.level);
            cfg.logging.file = it->value("file", cfg.logging.file);
            cfg.logging.console = it->value("console", cfg.logging.console);
        }

    } catch (const std::exception& ex) {
        LOG_ERROR("config", "Failed to parse configuration. Using defaults. Error: ", ex.what());
        return Configuration{};
    }
    return cfg;
}

std::string ConfigurationManager::defaultJson() {
    nlohmann::json json{
        {"gateway",
         {{"bindAddress", "0.0.0.0"},
          {"port", 7600},
          {"workerThreads", 4},
          {"maxConnections", 10000},
          {"heartbeatIntervalSeconds", 10},
          {"maxMissedHeartbeats", 3},
          {"authTimeoutMs", 3000}}},
        {"broker",
         {{"host", "127.0.0.1"},
          {"port", 6379},
          {"password", ""},
          {"pattern", "readings:*"},
          {"reconnectBaseMs", 500},
          {"reconnectMaxMs", 30000},
          {"maxReconnectAttempts", 20}}},
        {"validation",
         {{"maxFutureSkewSeconds", 300}}},
        {"auth",
         {{"tokens", nlohmann::json::array()}}},
        {"health",
         {{"statusFile", "artifacts/health_status.json"},
          {"intervalSeconds", 5}}},
        {"logging",
         {{"level", "info"},
          {"file", "logs/wellstream_gateway.log"},
          {"console", true}}}
    };

    return json.dump(4);
}

} // namespace core
