// 基于 HPSocket CTcpClient 的网关客户端传输
// connect() 发送握手头后等待网关的第一帧：connected 表示成功，error 表示凭证被拒

#pragma once

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <optional>
#include <string>

#include "HPSocket.h"

#include "client/client_transport.hpp"
#include "gateway/frame_codec.hpp"

namespace client {

struct ClientOptions {
    std::string host = "127.0.0.1";
    uint16_t port = 7600;
    std::string path = "/stream";
    std::string token;
    std::chrono::milliseconds connectTimeout{5000};
};

class TcpClientTransport : public CTcpClientListener, public ClientTransport {
public:
    explicit TcpClientTransport(ClientOptions options);
    ~TcpClientTransport() override;

    void setHandlers(FrameHandler onFrame, CloseHandler onClosed) override;

    // 不能在本传输的回调线程里调用 connect()/close()，HPSocket 的 Stop 会等待回调线程退出
    void connect() override;
    void send(const std::string& frame) override;
    void close() override;

    // 握手成功后网关告知的租户
    std::string tenantId() const;

protected:
    EnHandleResult OnReceive(ITcpClient* pSender, CONNID dwConnID, const BYTE* pData, int iLength) override;
    EnHandleResult OnClose(ITcpClient* pSender, CONNID dwConnID, EnSocketOperation enOperation, int iErrorCode) override;

private:
    void abort();

    ClientOptions options_;

    std::mutex handlerMutex_;
    FrameHandler onFrame_;
    CloseHandler onClosed_;

    mutable std::mutex stateMutex_;
    gateway::LineSplitter lines_;
    std::optional<std::promise<std::string>> welcome_;     // 握手阶段等待的第一帧
    std::string tenantId_;

    std::atomic<bool> closing_{false};
    CTcpClientPtr client_;
};

} // namespace client
