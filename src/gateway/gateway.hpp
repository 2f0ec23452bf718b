// 网关：管理客户端连接的生命周期（握手鉴权、订阅井、心跳、关闭）并把读数扇出给接收者
// 传输层（HPSocket 或测试替身）只负责字节收发，通过 FrameTransport 接口解耦

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

#include "core/configuration.hpp"
#include "domain/telemetry_models.hpp"
#include "gateway/auth_verifier.hpp"
#include "gateway/connection.hpp"
#include "gateway/connection_registry.hpp"
#include "monitoring/health_monitor.hpp"

namespace gateway {

// 网关看到的传输层
class FrameTransport {
public:
    virtual ~FrameTransport() = default;

    // 写失败抛出 core::SocketWriteError
    virtual void send(ConnectionId id, const std::string& bytes) = 0;

    // 请求关闭连接，传输层之后会回调 Gateway::onTransportClosed
    virtual void disconnect(ConnectionId id) = 0;
};

// 单次扇出的结果
struct DeliveryStats {
    std::size_t recipients{0};
    std::size_t delivered{0};
    std::size_t failed{0};
    std::size_t skipped{0};     // 已关闭或尚未激活的连接
};

struct GatewayStats {
    uint64_t fanouts{0};
    uint64_t writes{0};
    uint64_t writeFailures{0};
    uint64_t authFailures{0};
    uint64_t heartbeatTimeouts{0};
};

class Gateway {
public:
    Gateway(core::GatewayConfig config,
            ConnectionRegistry& registry,
            AuthVerifier& verifier,
            FrameTransport& transport,
            monitoring::HealthMonitor& monitor);
    ~Gateway();

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    // 启动鉴权线程和心跳巡检线程
    void start();
    // 停止后台线程并关闭所有连接
    void stop();

    // 传输层回调，都不会阻塞
    void onAccept(ConnectionId id);
    void onData(ConnectionId id, std::string_view bytes);
    void onTransportClosed(ConnectionId id, const std::string& reason);

    // 读数只序列化一次；某个连接写失败不影响其余接收者
    DeliveryStats deliver(const ConnectionSet& recipients, const domain::Reading& reading);

    // 关闭心跳超时（以及握手超时）的连接，返回关闭数量；巡检线程定期调用
    std::size_t sweepHeartbeats(std::chrono::steady_clock::time_point now);

    std::optional<ConnectionState> stateOf(ConnectionId id) const;
    std::optional<AuthClaims> claimsOf(ConnectionId id) const;
    std::size_t activeConnections() const;
    std::size_t connectionCount() const;
    GatewayStats stats() const;

private:
    // 一次处理的结果：要发的帧，以及是否关闭连接
    struct Outcome {
        std::vector<std::string> frames;
        bool close{false};
        std::optional<std::string> finalFrame;
        std::string reason;

        void fail(ErrorCode code, const std::string& message, std::string why)
        {
            close = true;
            finalFrame = errorFrame(code, message);
            reason = std::move(why);
        }
    };

    struct AuthJob {
        ConnectionId id;
        std::string credential;
        std::chrono::steady_clock::time_point enqueuedAt;
    };

    // 已发出、尚未有结果的校验请求
    struct PendingAuth {
        ConnectionId id;
        std::future<AuthClaims> result;
        std::chrono::steady_clock::time_point deadline;
    };

    std::shared_ptr<Connection> find(ConnectionId id) const;

    void consumeHandshake(Connection& conn, std::string_view bytes, Outcome& outcome, std::optional<AuthJob>& job);
    void feedLines(Connection& conn, std::string_view bytes, Outcome& outcome);
    void handleLine(Connection& conn, const std::string& line, Outcome& outcome);

    // 调用时持有 stateLock；换成写锁后释放状态锁再写，保证帧序且不在状态锁内调传输层
    void flush(const std::shared_ptr<Connection>& conn, std::unique_lock<std::mutex>& stateLock, Outcome& outcome);

    void closeConnection(const std::shared_ptr<Connection>& conn,
                         std::optional<std::string> finalFrame,
                         const std::string& reason);
    void finalize(const std::shared_ptr<Connection>& conn, const std::string& reason);

    void beginAuthentication(AuthJob job);
    void settleAuthentication(PendingAuth& pending);
    void authLoop();
    void completeAuthentication(ConnectionId id, const AuthClaims& claims);
    void failAuthentication(ConnectionId id, const std::string& reason);

    void sweepLoop();
    void reportHealth();

    core::GatewayConfig config_;
    ConnectionRegistry& registry_;
    AuthVerifier& verifier_;
    FrameTransport& transport_;
    monitoring::HealthMonitor& monitor_;

    mutable std::mutex connectionsMutex_;
    std::unordered_map<ConnectionId, std::shared_ptr<Connection>> connections_;

    std::atomic<bool> running_{false};

    std::mutex authMutex_;
    std::condition_variable authCv_;
    std::vector<PendingAuth> authPending_;
    std::thread authWorker_;

    std::mutex sweepMutex_;
    std::condition_variable sweepCv_;
    std::thread sweepWorker_;

    std::atomic<uint64_t> fanouts_{0};
    std::atomic<uint64_t> writes_{0};
    std::atomic<uint64_t> writeFailures_{0};
    std::atomic<uint64_t> authFailures_{0};
    std::atomic<uint64_t> heartbeatTimeouts_{0};
};

} // namespace gateway
