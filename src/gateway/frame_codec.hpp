// 网关与客户端之间的线上帧：每帧一行 JSON，以 \n 结尾
//   {"type": "<类型>", "data": {...}}
// 服务端和客户端共用这里的编解码

#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "domain/telemetry_models.hpp"

namespace gateway {

// 帧类型
namespace frame_type {
constexpr const char* kSubscribeWell = "subscribe-well";
constexpr const char* kUnsubscribeWell = "unsubscribe-well";
constexpr const char* kPing = "ping";
constexpr const char* kClose = "close";
constexpr const char* kConnected = "connected";
constexpr const char* kSubscribed = "subscribed";
constexpr const char* kUnsubscribed = "unsubscribed";
constexpr const char* kReading = "reading";
constexpr const char* kError = "error";
constexpr const char* kPong = "pong";
} // namespace frame_type

enum class ErrorCode {
    AuthFailed,
    HeartbeatTimeout,
    InvalidFrame,
    UnknownType,
    RegistryFailed
};

const char* errorCodeName(ErrorCode code);

struct Frame {
    std::string type;
    nlohmann::json data = nlohmann::json::object();
};

// 单行上限，超过仍未见到换行说明对端不按协议发送
constexpr std::size_t kMaxFrameBytes = 64 * 1024;

// TCP 是字节流，一次 OnReceive 可能是半帧也可能是多帧，
// 每个连接一个拆分器，按 \n 切出完整的行
class LineSplitter {
public:
    using LineHandler = std::function<void(std::string)>;

    // 返回 false 表示缓冲区超过上限，连接应当关闭
    bool feed(std::string_view chunk, const LineHandler& onLine);

    std::size_t buffered() const { return buffer_.size(); }
    void reset() { buffer_.clear(); }

private:
    std::string buffer_;
};

// 解析一行；不是 JSON 对象、type 缺失或 data 不是对象时抛出 core::ValidationError
Frame parseFrame(std::string_view line);

std::string encodeFrame(const std::string& type, const nlohmann::json& data = nlohmann::json::object());

// 服务端 → 客户端
std::string connectedFrame(const std::string& tenantId, domain::Timestamp now);
std::string subscribedFrame(const std::string& wellId, domain::Timestamp now);
std::string unsubscribedFrame(const std::string& wellId, domain::Timestamp now);
std::string pongFrame(domain::Timestamp now);
std::string errorFrame(ErrorCode code, const std::string& message);

// serializedReading 是已经编码好的读数 JSON，扇出时只序列化一次
std::string readingFrame(const std::string& serializedReading);

// 客户端 → 服务端
std::string subscribeWellFrame(const std::string& wellId);
std::string unsubscribeWellFrame(const std::string& wellId);
std::string pingFrame();
std::string closeFrame();

} // namespace gateway
