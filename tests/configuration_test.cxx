#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "core/configuration.hpp"

namespace fs = std::filesystem;

namespace {

fs::path scratchDir(const std::string& name)
{
    auto dir = fs::temp_directory_path() / ("wellstream_config_" + name);
    fs::remove_all(dir);
    return dir;
}

void writeFile(const fs::path& path, const std::string& text)
{
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    out << text;
}

std::string readFile(const fs::path& path)
{
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace

TEST(ConfigurationTest, PartialDocumentKeepsDefaults)
{
    auto cfg = core::ConfigurationManager::fromJson(R"({
        "gateway": {"port": 9100, "maxMissedHeartbeats": 5},
        "broker": {"host": "redis.internal", "maxReconnectAttempts": 0}
    })");

    EXPECT_EQ(cfg.gateway.port, 9100);
    EXPECT_EQ(cfg.gateway.maxMissedHeartbeats, 5);
    EXPECT_EQ(cfg.gateway.heartbeatIntervalSeconds, 10);
    EXPECT_EQ(cfg.gateway.bindAddress, "0.0.0.0");
    EXPECT_EQ(cfg.broker.host, "redis.internal");
    EXPECT_EQ(cfg.broker.port, 6379);
    EXPECT_EQ(cfg.broker.pattern, "readings:*");
    EXPECT_EQ(cfg.broker.maxReconnectAttempts, 0u);
    EXPECT_EQ(cfg.validation.maxFutureSkewSeconds, 300u);
    EXPECT_EQ(cfg.logging.level, "info");
}

TEST(ConfigurationTest, MalformedDocumentFallsBackToDefaults)
{
    auto cfg = core::ConfigurationManager::fromJson("{ not json");
    EXPECT_EQ(cfg.gateway.port, 7600);
    EXPECT_TRUE(cfg.auth.tokens.empty());
}

TEST(ConfigurationTest, ParsesTokensAndSkipsIncompleteEntries)
{
    auto cfg = core::ConfigurationManager::fromJson(R"({
        "auth": {"tokens": [
            {"token": "a", "tenantId": "t1", "userId": "u1", "role": "operator", "expiresAt": 1893456000},
            {"token": "b", "tenantId": "t2", "userId": "u2"},
            {"token": "c", "tenantId": "t3"}
        ]}
    })");

    ASSERT_EQ(cfg.auth.tokens.size(), 2u);
    EXPECT_EQ(cfg.auth.tokens[0].role, "operator");
    ASSERT_TRUE(cfg.auth.tokens[0].expiresAt.has_value());
    EXPECT_EQ(*cfg.auth.tokens[0].expiresAt, 1893456000);
    EXPECT_EQ(cfg.auth.tokens[1].role, "viewer");
    EXPECT_FALSE(cfg.auth.tokens[1].expiresAt.has_value());
}

TEST(ConfigurationTest, MissingFileWritesTemplate)
{
    auto dir = scratchDir("template");
    auto path = dir / "gateway.json";

    core::ConfigurationManager manager(path.string());
    EXPECT_TRUE(fs::exists(path));
    EXPECT_EQ(manager.get().gateway.port, 7600);
    // 模板里不能有可用的令牌
    EXPECT_TRUE(manager.get().auth.tokens.empty());
    auto written = nlohmann::json::parse(readFile(path));
    ASSERT_TRUE(written["auth"]["tokens"].is_array());
    EXPECT_TRUE(written["auth"]["tokens"].empty());

    // 模板本身必须能被解析回同样的配置
    auto reparsed = core::ConfigurationManager::fromJson(core::ConfigurationManager::defaultJson());
    EXPECT_EQ(reparsed.broker.reconnectMaxMs, manager.get().broker.reconnectMaxMs);

    fs::remove_all(dir);
}

TEST(ConfigurationTest, ReloadsWhenFileChanges)
{
    auto dir = scratchDir("reload");
    fs::create_directories(dir);
    auto path = dir / "gateway.json";
    writeFile(path, R"({"logging": {"level": "info"}})");

    core::ConfigurationManager manager(path.string());
    EXPECT_FALSE(manager.reloadIfChanged());

    writeFile(path, R"({"logging": {"level": "debug"}})");
    fs::last_write_time(path, fs::last_write_time(path) + std::chrono::seconds(5));

    EXPECT_TRUE(manager.reloadIfChanged());
    EXPECT_EQ(manager.get().logging.level, "debug");
    EXPECT_FALSE(manager.reloadIfChanged());

    fs::remove_all(dir);
}
