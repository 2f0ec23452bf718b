// 订阅端：网关进程启动时对 readings:* 做一次模式订阅，进程生命周期内一直持有
// 每条消息：反序列化 → 重新校验 → 核对 topic 租户与负载租户 → 交给分发器
// 代理断开后在后台线程指数退避重连并重新订阅；断开期间的读数直接丢失，不缓存不回放

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "broker/broker_client.hpp"
#include "core/configuration.hpp"
#include "domain/reading_validator.hpp"
#include "domain/telemetry_models.hpp"
#include "monitoring/health_monitor.hpp"

namespace pipeline {

class Subscriber {
public:
    using ReadingHandler = std::function<void(const domain::Reading&)>;

    enum class State {
        Stopped,
        Subscribed,
        Reconnecting,
        Exhausted   // 重连次数用尽，需要运维介入
    };

    Subscriber(core::BrokerConfig config,
               broker::BrokerClient& broker,
               const domain::ReadingValidator& validator,
               ReadingHandler handler,
               monitoring::HealthMonitor& monitor);
    ~Subscriber();

    Subscriber(const Subscriber&) = delete;
    Subscriber& operator=(const Subscriber&) = delete;

    // 首次订阅失败不会抛异常，而是转入后台重连
    void start();
    void stop();

    // 处理一条 (topic, payload)；代理回调线程调用，也可以在测试中直接调用
    void handleMessage(const std::string& topic, const std::string& payload);

    State state() const { return state_.load(); }

    uint64_t forwarded() const { return forwarded_.load(); }
    uint64_t rejected() const { return rejected_.load(); }
    uint64_t tenantMismatches() const { return tenantMismatches_.load(); }
    uint64_t reconnects() const { return reconnects_.load(); }

private:
    bool trySubscribe();
    void requestReconnect(const std::string& reason);
    void reconnectLoop();
    void processCandidate(const std::string& topicTenant, const nlohmann::json& candidate);

    core::BrokerConfig config_;
    broker::BrokerClient& broker_;
    const domain::ReadingValidator& validator_;
    ReadingHandler handler_;
    monitoring::HealthMonitor& monitor_;

    std::atomic<State> state_{State::Stopped};
    std::atomic<bool> running_{false};

    std::mutex mutex_;
    std::condition_variable cv_;
    bool reconnectRequested_{false};
    std::thread worker_;

    std::atomic<uint64_t> forwarded_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> tenantMismatches_{0};
    std::atomic<uint64_t> reconnects_{0};
};

} // namespace pipeline
