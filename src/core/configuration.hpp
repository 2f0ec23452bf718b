#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace core {

// 网关（面向客户端的 TCP 服务）配置
struct GatewayConfig {
    std::string bindAddress = "0.0.0.0";
    uint16_t port = 7600;
    uint16_t workerThreads = 4;     // HPSocket 工作线程数
    uint32_t maxConnections = 10000;
    uint16_t heartbeatIntervalSeconds = 10;
    uint16_t maxMissedHeartbeats = 3;   // 连续错过多少个心跳周期后断开
    uint32_t authTimeoutMs = 3000;      // 鉴权调用超时，超时按 AUTH_FAILED 处理
};

// 消息代理（Redis）配置
struct BrokerConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 6379;
    std::string password;           // 为空则不发送 AUTH
    std::string pattern = "readings:*";
    uint32_t reconnectBaseMs = 500;
    uint32_t reconnectMaxMs = 30000;
    uint32_t maxReconnectAttempts = 20; // 0 表示不限次数
};

struct ValidationConfig {
    uint32_t maxFutureSkewSeconds = 300;
};

// 开发/测试用的静态令牌表（生产环境接入外部鉴权服务）
struct AuthTokenEntry {
    std::string token;
    std::string tenantId;
    std::string userId;
    std::string role = "viewer";
    std::optional<int64_t> expiresAt;   // Unix 秒，缺省为永不过期
};

struct AuthConfig {
    std::vector<AuthTokenEntry> tokens;
};

struct HealthConfig {
    std::string statusFile = "artifacts/health_status.json";
    uint16_t intervalSeconds = 5;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file = "logs/wellstream_gateway.log";
    bool console = true;
};

struct Configuration {
    GatewayConfig gateway;
    BrokerConfig broker;
    ValidationConfig validation;
    AuthConfig auth;
    HealthConfig health;
    LoggingConfig logging;
};

class ConfigurationManager {
public:
    explicit ConfigurationManager(std::string path);

    const Configuration& get() const { return config_; }

    // 配置文件修改时间变化时重新加载，返回是否发生了重载
    bool reloadIfChanged();

    // 从 JSON 文本解析，缺失的字段保留默认值；解析失败返回默认配置
    static Configuration fromJson(const std::string& jsonText);
    static std::string defaultJson();

private:
    void loadFromDisk();

    Configuration config_;
    std::string path_;
    std::filesystem::file_time_type lastWriteTime_{};
};

} // namespace core
