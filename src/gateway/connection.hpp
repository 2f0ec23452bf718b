// 网关内部的单个客户端连接状态
//   Handshaking → Authenticated → Active → Closing → Closed
// socket 本身归传输层（HPSocket）所有，这里只有 id 和协议状态

#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <string>

#include "gateway/connection_registry.hpp"
#include "gateway/frame_codec.hpp"

namespace gateway {

enum class ConnectionState {
    Handshaking,
    Authenticated,
    Active,
    Closing,
    Closed
};

inline const char* connectionStateName(ConnectionState state)
{
    switch (state)
    {
    case ConnectionState::Handshaking: return "Handshaking";
    case ConnectionState::Authenticated: return "Authenticated";
    case ConnectionState::Active: return "Active";
    case ConnectionState::Closing: return "Closing";
    case ConnectionState::Closed: return "Closed";
    default: return "Unknown";
    }
}

struct Connection {
    explicit Connection(ConnectionId connectionId)
        : id(connectionId)
        , acceptedAt(std::chrono::steady_clock::now())
        , lastHeartbeat(acceptedAt) {}

    const ConnectionId id;

    // 以下字段由 mutex 保护；state 另外做成原子量，扇出时无锁读取
    std::mutex mutex;
    std::atomic<ConnectionState> state{ConnectionState::Handshaking};
    std::string tenantId;
    std::string userId;
    std::string role;

    std::string handshakeBuffer;
    bool headComplete{false};
    LineSplitter lines;
    std::deque<std::string> pendingFrames;  // Active 之前收到的帧，激活后按序处理

    std::chrono::steady_clock::time_point acceptedAt;
    std::chrono::steady_clock::time_point lastHeartbeat;

    // 同一连接的写操作串行化，保证帧顺序
    std::mutex sendMutex;

    // Closing → Closed 只做一次
    std::atomic<bool> finalized{false};
};

} // namespace gateway
