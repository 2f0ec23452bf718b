// 管道中的错误分类，均派生自 std::runtime_error
//   ValidationError       读数字段缺失/非法，丢弃并记录，不转发
//   TenantMismatchError   topic 租户与负载租户不一致，按安全事件记录，不投递
//   AuthenticationError   凭证无效/过期/超时，发送 error 帧后关闭连接
//   BrokerConnectionError 代理连接故障，订阅端退避重连，发布端上抛给调用者
//   SocketWriteError      单个连接写失败，不影响同一次扇出的其他连接
//   ConnectionError       客户端连不上网关或握手未完成，由重连管理器退避重试

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace core {

class ValidationError : public std::runtime_error {
public:
    ValidationError(std::string field, const std::string& reason)
        : std::runtime_error("invalid field '" + field + "': " + reason)
        , field_(std::move(field)) {}

    // 第一个校验失败的字段名
    const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

class TenantMismatchError : public std::runtime_error {
public:
    TenantMismatchError(std::string topicTenant, std::string payloadTenant)
        : std::runtime_error("topic tenant '" + topicTenant + "' does not match payload tenant '" + payloadTenant + "'")
        , topicTenant_(std::move(topicTenant))
        , payloadTenant_(std::move(payloadTenant)) {}

    const std::string& topicTenant() const noexcept { return topicTenant_; }
    const std::string& payloadTenant() const noexcept { return payloadTenant_; }

private:
    std::string topicTenant_;
    std::string payloadTenant_;
};

class AuthenticationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class BrokerConnectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class SocketWriteError : public std::runtime_error {
public:
    SocketWriteError(uint64_t connectionId, const std::string& reason)
        : std::runtime_error("write to connection " + std::to_string(connectionId) + " failed: " + reason)
        , connectionId_(connectionId) {}

    uint64_t connectionId() const noexcept { return connectionId_; }

private:
    uint64_t connectionId_;
};

class ConnectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace core
