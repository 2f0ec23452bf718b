// 客户端看到的传输层：连上网关并完成握手，然后按行收发帧

#pragma once

#include <functional>
#include <string>

namespace client {

class ClientTransport {
public:
    using FrameHandler = std::function<void(const std::string& line)>;
    using CloseHandler = std::function<void(const std::string& reason)>;

    virtual ~ClientTransport() = default;

    // 必须在 connect() 之前设置
    virtual void setHandlers(FrameHandler onFrame, CloseHandler onClosed) = 0;

    // 阻塞直到收到 connected 帧
    // 连接失败抛 core::ConnectionError，凭证被拒抛 core::AuthenticationError
    virtual void connect() = 0;

    // 写失败抛 core::SocketWriteError
    virtual void send(const std::string& frame) = 0;

    // 主动关闭，不触发 CloseHandler
    virtual void close() = 0;
};

} // namespace client
