// 消息代理的能力接口：基于 topic 的发布/订阅，支持通配符模式订阅
// 任何满足这些语义的传输（Redis、进程内 hub ...）都可以接入
// 不保证不同发布者之间的顺序，每条消息都是独立事件

#pragma once

#include <functional>
#include <string>
#include <vector>

#include "core/errors.hpp"

namespace broker {

struct BrokerMessage {
    std::string topic;
    std::string payload;
};

class BrokerClient {
public:
    // 模式订阅收到的每条 (topic, payload)
    using MessageHandler = std::function<void(const std::string& topic, const std::string& payload)>;
    // 连接意外断开时回调（主动 close() 不触发）
    using ConnectionLostHandler = std::function<void(const std::string& reason)>;

    virtual ~BrokerClient() = default;

    // 建立连接，失败抛出 core::BrokerConnectionError
    virtual void connect() = 0;
    virtual void close() = 0;
    virtual bool isConnected() const = 0;

    // 失败抛出 core::BrokerConnectionError
    virtual void publish(const std::string& topic, const std::string& payload) = 0;

    // 一次调用写出多条消息（管道化），要么全部交给传输层，要么整体失败抛异常
    virtual void publishPipelined(const std::vector<BrokerMessage>& messages) = 0;
    virtual bool supportsPipelining() const = 0;

    // 同一个 pattern 重复订阅会替换 handler
    virtual void subscribePattern(const std::string& pattern, MessageHandler handler) = 0;
    virtual void unsubscribePattern(const std::string& pattern) = 0;

    virtual void setConnectionLostHandler(ConnectionLostHandler handler) = 0;
};

} // namespace broker
