// 进程内代理：同一进程中的多个 BrokerClient 共享一个 hub
// 单进程部署和测试使用；支持 glob 模式订阅，可以模拟代理故障/恢复
// hub 的生命周期必须长于挂在它上面的所有客户端

#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "broker/broker_client.hpp"
#include "broker/glob_pattern.hpp"

namespace broker {

class InProcessBrokerClient;

class InProcessBroker {
public:
    InProcessBroker() = default;
    InProcessBroker(const InProcessBroker&) = delete;
    InProcessBroker& operator=(const InProcessBroker&) = delete;

    std::unique_ptr<InProcessBrokerClient> createClient();

    // 模拟代理宕机：断开所有已连接客户端，清空订阅，之后的 connect() 都会失败
    void simulateOutage(const std::string& reason);
    // 恢复后客户端可以重新 connect()
    void restore();
    bool online() const { return online_.load(); }

    std::size_t connectedClients() const;
    std::size_t patternSubscriptions() const;
    uint64_t publishedMessages() const { return published_.load(); }

private:
    friend class InProcessBrokerClient;

    struct Subscription {
        GlobPattern pattern;
        BrokerClient::MessageHandler handler;
    };

    void attach(InProcessBrokerClient* client);
    void detach(InProcessBrokerClient* client);
    void addSubscription(InProcessBrokerClient* client, const std::string& pattern,
                         BrokerClient::MessageHandler handler);
    void removeSubscription(InProcessBrokerClient* client, const std::string& pattern);
    // 返回命中的订阅数
    std::size_t deliver(const std::string& topic, const std::string& payload);

    mutable std::mutex mutex_;
    std::atomic<bool> online_{true};
    std::atomic<uint64_t> published_{0};
    // 客户端 → (pattern → 订阅)
    std::map<InProcessBrokerClient*, std::map<std::string, Subscription>> clients_;
};

class InProcessBrokerClient : public BrokerClient {
public:
    explicit InProcessBrokerClient(InProcessBroker& hub) : hub_(hub) {}
    ~InProcessBrokerClient() override;

    void connect() override;
    void close() override;
    bool isConnected() const override { return connected_.load(); }

    void publish(const std::string& topic, const std::string& payload) override;
    void publishPipelined(const std::vector<BrokerMessage>& messages) override;
    bool supportsPipelining() const override { return true; }

    void subscribePattern(const std::string& pattern, MessageHandler handler) override;
    void unsubscribePattern(const std::string& pattern) override;

    void setConnectionLostHandler(ConnectionLostHandler handler) override;

private:
    friend class InProcessBroker;

    // hub 宕机时调用
    void onConnectionLost(const std::string& reason);
    void ensureConnected(const char* operation) const;

    InProcessBroker& hub_;
    std::atomic<bool> connected_{false};
    std::mutex handlerMutex_;
    ConnectionLostHandler lostHandler_;
};

} // namespace broker
