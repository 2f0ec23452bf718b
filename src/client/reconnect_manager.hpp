// 客户端重连管理：维护与传输层无关的"逻辑订阅集合"
//   Disconnected → Connecting → Connected → Reconnecting → Connecting ...
// 每次进入 Connected 都把集合里的井重新订阅一遍；
// disconnect() 在任何状态下都立即回到 Disconnected 并取消等待中的重试

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "client/client_transport.hpp"
#include "core/backoff.hpp"

namespace client {

enum class ClientState {
    Disconnected,
    Connecting,
    Connected,
    Reconnecting
};

const char* clientStateName(ClientState state);

struct ReconnectPolicy {
    std::chrono::milliseconds baseDelay{500};
    std::chrono::milliseconds maxDelay{30000};
    uint32_t maxAttempts{0};    // 0 表示无限重试
};

class ReconnectManager {
public:
    using StateListener = std::function<void(ClientState)>;
    using FrameListener = std::function<void(const nlohmann::json& frame)>;

    explicit ReconnectManager(ClientTransport& transport, ReconnectPolicy policy = {});
    ~ReconnectManager();

    ReconnectManager(const ReconnectManager&) = delete;
    ReconnectManager& operator=(const ReconnectManager&) = delete;

    // 只在 Disconnected 时生效，连接在后台线程进行
    void connect();
    void disconnect();

    // 更新逻辑集合；只有 Connected 时才立即发送
    void subscribeWell(const std::string& wellId);
    void unsubscribeWell(const std::string& wellId);

    std::set<std::string> subscribedWells() const;
    ClientState state() const;

    // 等待进入指定状态，超时返回 false
    bool waitForState(ClientState expected, std::chrono::milliseconds timeout) const;

    // 监听器在内部锁之外调用
    void setStateListener(StateListener listener);
    void setFrameListener(FrameListener listener);

    uint32_t connectCount() const { return connects_.load(); }

private:
    void workerLoop();
    void transition(std::unique_lock<std::mutex>& lk, ClientState next);
    // 只改状态不回调，返回需要在所有锁外调用的监听器
    StateListener changeState(ClientState next);
    void notifyState(const StateListener& listener, ClientState state);
    void sendQuietly(const std::string& frame);
    void onFrame(const std::string& line);
    void onClosed(const std::string& reason);

    ClientTransport& transport_;
    ReconnectPolicy policy_;
    core::ExponentialBackoff backoff_;

    // 加锁顺序：sendMutex_ 在 mutex_ 之前
    // sendMutex_ 串行化订阅帧的发送，重放和应用的增量订阅不会交错
    std::mutex sendMutex_;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    ClientState state_{ClientState::Disconnected};
    bool stopRequested_{false};
    // 本次 connect() 返回前连接已经断开（关闭回调先于状态切换到达）
    bool lostWhileConnecting_{false};
    std::set<std::string> wells_;

    StateListener stateListener_;
    FrameListener frameListener_;

    std::thread worker_;
    std::atomic<uint32_t> connects_{0};
};

} // namespace client
