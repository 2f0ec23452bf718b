#include "gateway/tcp_gateway_server.hpp"

#include "core/errors.hpp"
#include "core/logger.hpp"

namespace gateway {

TcpGatewayServer::TcpGatewayServer(const core::GatewayConfig& config, monitoring::HealthMonitor& monitor)
    : config_(config)
    , monitor_(monitor)
    , server_(this) {
}

TcpGatewayServer::~TcpGatewayServer()
{
    stop();
}

bool TcpGatewayServer::start()
{
    if (!gateway_) {
        LOG_ERROR("tcp_server", "No gateway bound, refusing to start");
        return false;
    }

    server_->SetMaxConnectionCount(config_.maxConnections);
    server_->SetWorkerThreadCount(config_.workerThreads);

    if (!server_->Start(config_.bindAddress.c_str(), config_.port))
    {
        LOG_ERROR("tcp_server", "Failed to listen on ", config_.bindAddress, ":", config_.port, ": ",
                  server_->GetLastErrorDesc(), " (", static_cast<int>(server_->GetLastError()), ")");
        monitor_.update("gateway", false, "Listen failed");
        return false;
    }
    monitor_.update("gateway", true, "Listening on " + config_.bindAddress + ":" + std::to_string(config_.port));
    LOG_INFO("tcp_server", "Listening on ", config_.bindAddress, ":", config_.port);
    return true;
}

void TcpGatewayServer::stop()
{
    if (server_->GetState() != SS_STOPPED) {
        server_->Stop();
        LOG_INFO("tcp_server", "Server stopped");
    }
}

std::size_t TcpGatewayServer::connectionCount() const
{
    return server_->GetConnectionCount();
}

void TcpGatewayServer::send(ConnectionId id, const std::string& bytes)
{
    auto connId = static_cast<CONNID>(id);
    if (!server_->Send(connId, reinterpret_cast<const BYTE*>(bytes.data()), static_cast<int>(bytes.size())))
    {
        throw core::SocketWriteError(id, std::string(server_->GetLastErrorDesc()) + " (" +
                                             std::to_string(static_cast<int>(server_->GetLastError())) + ")");
    }
}

void TcpGatewayServer::disconnect(ConnectionId id)
{
    // 非强制断开：已排队的数据（比如 error 帧）先发完
    server_->Disconnect(static_cast<CONNID>(id), FALSE);
}

EnHandleResult TcpGatewayServer::OnPrepareListen(ITcpServer*, SOCKET)
{
    return HR_OK;
}

EnHandleResult TcpGatewayServer::OnAccept(ITcpServer*, CONNID dwConnID, UINT_PTR)
{
    gateway_->onAccept(static_cast<ConnectionId>(dwConnID));
    return HR_OK;
}

EnHandleResult TcpGatewayServer::OnReceive(ITcpServer*, CONNID dwConnID, const BYTE* pData, int iLength)
{
    gateway_->onData(static_cast<ConnectionId>(dwConnID),
                     std::string_view(reinterpret_cast<const char*>(pData), static_cast<std::size_t>(iLength)));
    return HR_OK;
}

EnHandleResult TcpGatewayServer::OnClose(ITcpServer*, CONNID dwConnID, EnSocketOperation enOperation, int iErrorCode)
{
    gateway_->onTransportClosed(static_cast<ConnectionId>(dwConnID),
                                "socket closed (operation " + std::to_string(static_cast<int>(enOperation)) +
                                    ", error " + std::to_string(iErrorCode) + ")");
    return HR_OK;
}

} // namespace gateway
