// 网关进程入口：wellstream_gateway [配置文件路径]
// 初始化顺序：日志 → 配置 → 健康监控 → 注册表/分发器/鉴权 → TCP 服务 → Redis 订阅
// 退出时逆序停止

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <string>
#include <thread>

#include "broker/redis_broker_client.hpp"
#include "core/configuration.hpp"
#include "core/logger.hpp"
#include "domain/reading_validator.hpp"
#include "gateway/auth_verifier.hpp"
#include "gateway/connection_registry.hpp"
#include "gateway/dispatcher.hpp"
#include "gateway/gateway.hpp"
#include "gateway/tcp_gateway_server.hpp"
#include "monitoring/health_monitor.hpp"
#include "pipeline/subscriber.hpp"

namespace {
std::atomic<bool>* g_shouldRun = nullptr;

void handleSignal(int)
{
    if (g_shouldRun) {
        g_shouldRun->store(false);
    }
}

void applyLogging(const core::LoggingConfig& logging, bool reconfigure)
{
    auto level = core::parseLogLevel(logging.level);
    if (!level) {
        LOG_WARN("bootstrap", "Unknown log level '", logging.level, "', using info");
        level = core::LogLevel::Info;
    }
    if (reconfigure) {
        core::Logger::instance().configure(*level, logging.file, logging.console);
    } else {
        core::Logger::instance().setLevel(*level);
    }
}
} // namespace

int main(int argc, char** argv)
{
    const std::string configPath = argc > 1 ? argv[1] : "config/wellstream_gateway.json";

    // 配置加载前先用默认设置，加载过程中的日志不会丢
    core::Logger::instance().configure(core::LogLevel::Info);

    core::ConfigurationManager configManager(configPath);
    const auto config = configManager.get();
    applyLogging(config.logging, true);

    monitoring::HealthMonitor healthMonitor(config.health.statusFile,
                                            std::chrono::seconds(config.health.intervalSeconds));
    healthMonitor.start();

    domain::ReadingValidator validator(std::chrono::seconds(config.validation.maxFutureSkewSeconds));
    gateway::ConnectionRegistry registry;
    gateway::Dispatcher dispatcher(registry);
    gateway::StaticTokenVerifier verifier(config.auth);
    if (verifier.size() == 0) {
        LOG_WARN("bootstrap", "No auth tokens configured; every client will be rejected");
    }

    gateway::TcpGatewayServer server(config.gateway, healthMonitor);
    gateway::Gateway gatewayCore(config.gateway, registry, verifier, server, healthMonitor);
    server.bind(gatewayCore);

    dispatcher.setDeliveryHandler([&](const gateway::ConnectionSet& recipients, const domain::Reading& reading) {
        gatewayCore.deliver(recipients, reading);
    });

    gatewayCore.start();
    if (!server.start()) {
        LOG_CRITICAL("bootstrap", "Failed to start gateway server");
        gatewayCore.stop();
        healthMonitor.stop();
        return EXIT_FAILURE;
    }

    broker::RedisBrokerClient brokerClient(config.broker);
    pipeline::Subscriber subscriber(config.broker, brokerClient, validator,
                                    [&](const domain::Reading& reading) { dispatcher.dispatch(reading); },
                                    healthMonitor);
    subscriber.start();

    std::atomic<bool> shouldRun{true};
    g_shouldRun = &shouldRun;
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    LOG_INFO("bootstrap", "WellStream gateway is running on ", config.gateway.bindAddress, ":", config.gateway.port);

    auto lastReloadCheck = std::chrono::steady_clock::now();
    while (shouldRun.load())
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        if (std::chrono::steady_clock::now() - lastReloadCheck < std::chrono::seconds(5)) {
            continue;
        }
        lastReloadCheck = std::chrono::steady_clock::now();

        // 热加载只调整日志级别，其余配置需要重启
        if (configManager.reloadIfChanged())
        {
            applyLogging(configManager.get().logging, false);
            LOG_INFO("bootstrap", "Configuration reloaded; only the log level is applied at runtime");
        }
    }

    LOG_INFO("bootstrap", "Shutting down");
    subscriber.stop();
    server.stop();
    gatewayCore.stop();
    healthMonitor.stop();

    return EXIT_SUCCESS;
}
