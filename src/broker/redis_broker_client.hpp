// 基于 Redis PUBLISH / PSUBSCRIBE 的代理客户端
// 底层是两条 HPSocket TCP 客户端连接：
//   发布连接：PUBLISH，批量时多条命令拼成一次 Send（管道化）
//   订阅连接：PSUBSCRIBE / PUNSUBSCRIBE，接收 pmessage 推送
// Redis 规定进入订阅模式的连接不能再发 PUBLISH，所以必须分开

#pragma once

#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "HPSocket.h"

#include "broker/broker_client.hpp"
#include "broker/resp_codec.hpp"
#include "core/configuration.hpp"

namespace broker {

// 一条到 Redis 的 RESP 连接
class RedisConnection : public CTcpClientListener {
public:
    using ValueHandler = std::function<void(const resp::Value&)>;
    using CloseHandler = std::function<void(const std::string& reason)>;

    RedisConnection(std::string name, core::BrokerConfig config,
                    ValueHandler onValue, CloseHandler onClose);
    ~RedisConnection() override;

    // 同步连接，配置了密码时等待 AUTH 结果；失败抛 core::BrokerConnectionError
    void open();
    void shutdown();
    bool isOpen() const;

    // 失败抛 core::BrokerConnectionError
    void send(const std::string& bytes);

    uint64_t errorReplies() const { return errorReplies_.load(); }

protected:
    EnHandleResult OnConnect(ITcpClient* pSender, CONNID dwConnID) override;
    EnHandleResult OnReceive(ITcpClient* pSender, CONNID dwConnID, const BYTE* pData, int iLength) override;
    EnHandleResult OnClose(ITcpClient* pSender, CONNID dwConnID, EnSocketOperation enOperation, int iErrorCode) override;

private:
    std::string name_;
    core::BrokerConfig config_;
    ValueHandler onValue_;
    CloseHandler onClose_;

    std::mutex parserMutex_;
    resp::Parser parser_;

    // 握手（AUTH）阶段等待的第一条回复
    std::mutex handshakeMutex_;
    std::optional<std::promise<resp::Value>> handshakeReply_;

    std::atomic<bool> stopping_{false};
    std::atomic<uint64_t> errorReplies_{0};
    CTcpClientPtr client_;
};

class RedisBrokerClient : public BrokerClient {
public:
    explicit RedisBrokerClient(core::BrokerConfig config);
    ~RedisBrokerClient() override;

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
    void onSubscriptionValue(const resp::Value& value);
    void onConnectionClosed(const std::string& reason);
    void shutdownConnections();

    core::BrokerConfig config_;

    std::mutex connectionMutex_;
    std::unique_ptr<RedisConnection> publisher_;
    std::unique_ptr<RedisConnection> subscriber_;

    std::mutex handlerMutex_;
    std::map<std::string, MessageHandler> patternHandlers_;
    ConnectionLostHandler lostHandler_;

    std::atomic<bool> connected_{false};
    std::atomic<bool> closing_{false};
};

} // namespace broker
