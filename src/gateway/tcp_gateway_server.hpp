// HPSocket TCP 服务端：把 socket 事件转给 Gateway，并为 Gateway 提供写和断开
// 连接 id 直接使用 HPSocket 的 CONNID

#pragma once

#include <atomic>
#include <string>

#include "HPSocket.h"

#include "core/configuration.hpp"
#include "gateway/gateway.hpp"
#include "monitoring/health_monitor.hpp"

namespace gateway {

class TcpGatewayServer : public CTcpServerListener, public FrameTransport {
public:
    TcpGatewayServer(const core::GatewayConfig& config, monitoring::HealthMonitor& monitor);
    ~TcpGatewayServer() override;

    // 必须在 start() 之前绑定
    void bind(Gateway& gateway) { gateway_ = &gateway; }

    bool start();
    void stop();

    std::size_t connectionCount() const;

    // FrameTransport
    void send(ConnectionId id, const std::string& bytes) override;
    void disconnect(ConnectionId id) override;

protected:
    EnHandleResult OnPrepareListen(ITcpServer* pSender, SOCKET soListen) override;
    EnHandleResult OnAccept(ITcpServer* pSender, CONNID dwConnID, UINT_PTR soClient) override;
    EnHandleResult OnReceive(ITcpServer* pSender, CONNID dwConnID, const BYTE* pData, int iLength) override;
    EnHandleResult OnClose(ITcpServer* pSender, CONNID dwConnID, EnSocketOperation enOperation, int iErrorCode) override;

private:
    core::GatewayConfig config_;
    monitoring::HealthMonitor& monitor_;
    Gateway* gateway_{nullptr};
    CTcpServerPtr server_;  // 构造时传入监听器 this
};

} // namespace gateway
