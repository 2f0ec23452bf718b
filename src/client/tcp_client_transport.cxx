#include "client/tcp_client_transport.hpp"

#include <exception>
#include <vector>

#include "core/errors.hpp"
#include "core/logger.hpp"
#include "gateway/handshake.hpp"

namespace client {
namespace {

std::string describeLastError(ITcpClient* client)
{
    return std::string(client->GetLastErrorDesc()) + " (" + std::to_string(static_cast<int>(client->GetLastError())) + ")";
}

} // namespace

TcpClientTransport::TcpClientTransport(ClientOptions options)
    : options_(std::move(options))
    , client_(this) {
}

TcpClientTransport::~TcpClientTransport()
{
    close();
}

void TcpClientTransport::setHandlers(FrameHandler onFrame, CloseHandler onClosed)
{
    std::lock_guard<std::mutex> lk(handlerMutex_);
    onFrame_ = std::move(onFrame);
    onClosed_ = std::move(onClosed);
}

void TcpClientTransport::connect()
{
    // 上一次的连接可能还没停干净
    abort();
    closing_.store(false);

    std::future<std::string> welcome;
    {
        std::lock_guard<std::mutex> lk(stateMutex_);
        lines_.reset();
        tenantId_.clear();
        welcome_.emplace();
        welcome = welcome_->get_future();
    }

    const auto endpoint = options_.host + ":" + std::to_string(options_.port);
    if (!client_->Start(options_.host.c_str(), options_.port, FALSE))
    {
        auto reason = describeLastError(client_.Get());
        abort();
        throw core::ConnectionError("connect to " + endpoint + " failed: " + reason);
    }

    auto head = gateway::buildHandshake(options_.host, options_.path, options_.token);
    if (!client_->Send(reinterpret_cast<const BYTE*>(head.data()), static_cast<int>(head.size())))
    {
        auto reason = describeLastError(client_.Get());
        abort();
        throw core::ConnectionError("sending handshake to " + endpoint + " failed: " + reason);
    }

    if (welcome.wait_for(options_.connectTimeout) != std::future_status::ready)
    {
        abort();
        throw core::ConnectionError("gateway " + endpoint + " did not answer the handshake in time");
    }

    std::string line;
    try {
        line = welcome.get();
    } catch (const core::ConnectionError&) {
        abort();
        throw;
    }

    gateway::Frame frame;
    try {
        frame = gateway::parseFrame(line);
    } catch (const core::ValidationError& ex) {
        abort();
        throw core::ConnectionError(std::string("unexpected handshake reply: ") + ex.what());
    }

    if (frame.type == gateway::frame_type::kError)
    {
        abort();
        throw core::AuthenticationError(frame.data.value("code", std::string("AUTH_FAILED")) + ": " +
                                        frame.data.value("message", std::string()));
    }
    if (frame.type != gateway::frame_type::kConnected)
    {
        abort();
        throw core::ConnectionError("unexpected handshake reply type '" + frame.type + "'");
    }

    {
        std::lock_guard<std::mutex> lk(stateMutex_);
        tenantId_ = frame.data.value("tenant_id", std::string());
    }
    LOG_INFO("client", "Connected to gateway ", endpoint, " as tenant ", tenantId());
}

void TcpClientTransport::send(const std::string& frame)
{
    if (!client_->Send(reinterpret_cast<const BYTE*>(frame.data()), static_cast<int>(frame.size())))
    {
        throw core::SocketWriteError(static_cast<uint64_t>(client_->GetConnectionID()), describeLastError(client_.Get()));
    }
}

void TcpClientTransport::close()
{
    abort();
}

std::string TcpClientTransport::tenantId() const
{
    std::lock_guard<std::mutex> lk(stateMutex_);
    return tenantId_;
}

void TcpClientTransport::abort()
{
    closing_.store(true);
    if (client_->GetState() != SS_STOPPED) {
        client_->Stop();
    }
    std::lock_guard<std::mutex> lk(stateMutex_);
    welcome_.reset();
}

EnHandleResult TcpClientTransport::OnReceive(ITcpClient*, CONNID, const BYTE* pData, int iLength)
{
    std::vector<std::string> lines;
    {
        std::lock_guard<std::mutex> lk(stateMutex_);
        bool ok = lines_.feed(std::string_view(reinterpret_cast<const char*>(pData), static_cast<std::size_t>(iLength)),
                              [&](std::string line) { lines.push_back(std::move(line)); });
        if (!ok) {
            LOG_ERROR("client", "Gateway sent an oversized frame, dropping connection");
            return HR_ERROR;
        }

        // 握手阶段的第一帧交给 connect()
        if (welcome_ && !lines.empty())
        {
            welcome_->set_value(std::move(lines.front()));
            welcome_.reset();
            lines.erase(lines.begin());
        }
    }

    FrameHandler handler;
    {
        std::lock_guard<std::mutex> lk(handlerMutex_);
        handler = onFrame_;
    }
    if (handler) {
        for (const auto& line : lines) {
            handler(line);
        }
    }
    return HR_OK;
}

EnHandleResult TcpClientTransport::OnClose(ITcpClient*, CONNID, EnSocketOperation enOperation, int iErrorCode)
{
    auto reason = "gateway connection closed (operation " + std::to_string(static_cast<int>(enOperation)) +
                  ", error " + std::to_string(iErrorCode) + ")";
    {
        std::lock_guard<std::mutex> lk(stateMutex_);
        if (welcome_)
        {
            welcome_->set_exception(std::make_exception_ptr(core::ConnectionError(reason + " during handshake")));
            welcome_.reset();
            return HR_OK;
        }
    }

    if (closing_.load()) {
        return HR_OK;
    }

    CloseHandler handler;
    {
        std::lock_guard<std::mutex> lk(handlerMutex_);
        handler = onClosed_;
    }
    if (handler) {
        handler(reason);
    }
    return HR_OK;
}

} // namespace client
