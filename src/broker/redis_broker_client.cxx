#include "broker/redis_broker_client.hpp"

#include <chrono>

#include "core/logger.hpp"

namespace broker {
namespace {

constexpr auto kHandshakeTimeout = std::chrono::seconds(3);

std::string describeLastError(ITcpClient* client)
{
    return std::string(client->GetLastErrorDesc()) + " (" + std::to_string(static_cast<int>(client->GetLastError())) + ")";
}

} // namespace

// ------------------------------------------------------------------
// RedisConnection
// ------------------------------------------------------------------

RedisConnection::RedisConnection(std::string name, core::BrokerConfig config,
                                 ValueHandler onValue, CloseHandler onClose)
    : name_(std::move(name))
    , config_(std::move(config))
    , onValue_(std::move(onValue))
    , onClose_(std::move(onClose))
    , client_(this) {   // HPSocket 回调到 this
}

RedisConnection::~RedisConnection()
{
    shutdown();
}

void RedisConnection::open()
{
    stopping_.store(false);
    {
        std::lock_guard<std::mutex> lk(parserMutex_);
        parser_.reset();
    }

    // 第三个参数 FALSE：同步连接，返回时连接已建立或已失败
    if (!client_->Start(config_.host.c_str(), config_.port, FALSE))
    {
        throw core::BrokerConnectionError("redis " + name_ + " connect to " + config_.host + ":" +
                                          std::to_string(config_.port) + " failed: " + describeLastError(client_.Get()));
    }

    if (config_.password.empty()) {
        return;
    }

    std::future<resp::Value> reply;
    {
        std::lock_guard<std::mutex> lk(handshakeMutex_);
        handshakeReply_.emplace();
        reply = handshakeReply_->get_future();
    }
    send(resp::encodeCommand({"AUTH", config_.password}));

    if (reply.wait_for(kHandshakeTimeout) != std::future_status::ready)
    {
        {
            std::lock_guard<std::mutex> lk(handshakeMutex_);
            handshakeReply_.reset();
        }
        shutdown();
        throw core::BrokerConnectionError("redis " + name_ + " AUTH timed out");
    }

    auto value = reply.get();
    if (value.isError())
    {
        shutdown();
        throw core::BrokerConnectionError("redis " + name_ + " AUTH rejected: " + value.text);
    }
}

void RedisConnection::shutdown()
{
    stopping_.store(true);
    // Stop() 会等待 HPSocket 的通信线程退出，不能在本连接的回调里调用
    if (client_->GetState() != SS_STOPPED) {
        client_->Stop();
    }
}

bool RedisConnection::isOpen() const
{
    return client_->IsConnected();
}

void RedisConnection::send(const std::string& bytes)
{
    if (!client_->Send(reinterpret_cast<const BYTE*>(bytes.data()), static_cast<int>(bytes.size())))
    {
        throw core::BrokerConnectionError("redis " + name_ + " send failed: " + describeLastError(client_.Get()));
    }
}

EnHandleResult RedisConnection::OnConnect(ITcpClient*, CONNID)
{
    LOG_INFO("broker", "Redis ", name_, " connection established to ", config_.host, ":", config_.port);
    return HR_OK;
}

EnHandleResult RedisConnection::OnReceive(ITcpClient*, CONNID, const BYTE* pData, int iLength)
{
    std::vector<resp::Value> values;
    try
    {
        std::lock_guard<std::mutex> lk(parserMutex_);
        parser_.feed(std::string_view(reinterpret_cast<const char*>(pData), static_cast<std::size_t>(iLength)));
        while (auto value = parser_.next()) {
            values.push_back(std::move(*value));
        }
    }
    catch (const std::exception& ex)
    {
        // 协议错乱无法恢复，断开后由上层重连
        LOG_ERROR("broker", "Redis ", name_, " protocol error: ", ex.what());
        return HR_ERROR;
    }

    for (auto& value : values)
    {
        {
            std::lock_guard<std::mutex> lk(handshakeMutex_);
            if (handshakeReply_) {
                handshakeReply_->set_value(std::move(value));
                handshakeReply_.reset();
                continue;
            }
        }

        if (value.isError()) {
            ++errorReplies_;
            LOG_WARN("broker", "Redis ", name_, " error reply: ", value.text);
            continue;
        }
        if (onValue_) {
            onValue_(value);
        }
    }
    return HR_OK;
}

EnHandleResult RedisConnection::OnClose(ITcpClient*, CONNID, EnSocketOperation enOperation, int iErrorCode)
{
    if (stopping_.load()) {
        return HR_OK;
    }
    auto reason = "redis " + name_ + " connection closed (operation " + std::to_string(static_cast<int>(enOperation)) +
                  ", error " + std::to_string(iErrorCode) + ")";
    LOG_WARN("broker", reason);
    if (onClose_) {
        onClose_(reason);
    }
    return HR_OK;
}

// ------------------------------------------------------------------
// RedisBrokerClient
// ------------------------------------------------------------------

RedisBrokerClient::RedisBrokerClient(core::BrokerConfig config)
    : config_(std::move(config)) {
}

RedisBrokerClient::~RedisBrokerClient()
{
    close();
}

void RedisBrokerClient::connect()
{
    closing_.store(false);

    std::lock_guard<std::mutex> lk(connectionMutex_);
    // 重连时旧连接已经失效，整体重建
    publisher_.reset();
    subscriber_.reset();
    {
        std::lock_guard<std::mutex> hk(handlerMutex_);
        patternHandlers_.clear();
    }

    auto onClosed = [this](const std::string& reason) { onConnectionClosed(reason); };
    auto publisher = std::make_unique<RedisConnection>("publish", config_, nullptr, onClosed);
    auto subscriber = std::make_unique<RedisConnection>(
        "subscribe", config_,
        [this](const resp::Value& value) { onSubscriptionValue(value); },
        onClosed);

    publisher->open();
    try {
        subscriber->open();
    } catch (const core::BrokerConnectionError&) {
        publisher->shutdown();
        throw;
    }

    publisher_ = std::move(publisher);
    subscriber_ = std::move(subscriber);
    connected_.store(true);
    LOG_INFO("broker", "Connected to Redis at ", config_.host, ":", config_.port);
}

void RedisBrokerClient::close()
{
    closing_.store(true);
    connected_.store(false);
    shutdownConnections();
}

void RedisBrokerClient::shutdownConnections()
{
    std::lock_guard<std::mutex> lk(connectionMutex_);
    if (publisher_) {
        publisher_->shutdown();
    }
    if (subscriber_) {
        subscriber_->shutdown();
    }
}

void RedisBrokerClient::publish(const std::string& topic, const std::string& payload)
{
    std::lock_guard<std::mutex> lk(connectionMutex_);
    if (!connected_.load() || !publisher_) {
        throw core::BrokerConnectionError("publish: not connected to redis");
    }
    publisher_->send(resp::encodeCommand({"PUBLISH", topic, payload}));
}

void RedisBrokerClient::publishPipelined(const std::vector<BrokerMessage>& messages)
{
    if (messages.empty()) {
        return;
    }

    std::string batch;
    for (const auto& message : messages) {
        batch += resp::encodeCommand({"PUBLISH", message.topic, message.payload});
    }

    std::lock_guard<std::mutex> lk(connectionMutex_);
    if (!connected_.load() || !publisher_) {
        throw core::BrokerConnectionError("publishPipelined: not connected to redis");
    }
    publisher_->send(batch);
}

void RedisBrokerClient::subscribePattern(const std::string& pattern, MessageHandler handler)
{
    {
        std::lock_guard<std::mutex> hk(handlerMutex_);
        patternHandlers_[pattern] = std::move(handler);
    }

    std::lock_guard<std::mutex> lk(connectionMutex_);
    if (!connected_.load() || !subscriber_) {
        throw core::BrokerConnectionError("subscribePattern: not connected to redis");
    }
    subscriber_->send(resp::encodeCommand({"PSUBSCRIBE", pattern}));
}

void RedisBrokerClient::unsubscribePattern(const std::string& pattern)
{
    {
        std::lock_guard<std::mutex> hk(handlerMutex_);
        patternHandlers_.erase(pattern);
    }

    std::lock_guard<std::mutex> lk(connectionMutex_);
    if (connected_.load() && subscriber_) {
        subscriber_->send(resp::encodeCommand({"PUNSUBSCRIBE", pattern}));
    }
}

void RedisBrokerClient::setConnectionLostHandler(ConnectionLostHandler handler)
{
    std::lock_guard<std::mutex> hk(handlerMutex_);
    lostHandler_ = std::move(handler);
}

// 订阅连接上的推送：
//   ["psubscribe", pattern, count]          订阅确认
//   ["pmessage", pattern, channel, payload] 消息
void RedisBrokerClient::onSubscriptionValue(const resp::Value& value)
{
    if (!value.isArray() || value.elements.empty() || !value.elements[0].isString()) {
        LOG_DEBUG("broker", "Ignoring unexpected reply on subscribe connection");
        return;
    }

    const auto& kind = value.elements[0].text;
    if (kind == "pmessage" && value.elements.size() == 4)
    {
        MessageHandler handler;
        {
            std::lock_guard<std::mutex> hk(handlerMutex_);
            if (auto it = patternHandlers_.find(value.elements[1].text); it != patternHandlers_.end()) {
                handler = it->second;
            }
        }
        if (handler) {
            handler(value.elements[2].text, value.elements[3].text);
        }
        return;
    }

    if (kind == "psubscribe" || kind == "punsubscribe") {
        LOG_INFO("broker", "Redis ", kind, " ", value.elements.size() > 1 ? value.elements[1].text : "");
    }
}

void RedisBrokerClient::onConnectionClosed(const std::string& reason)
{
    if (closing_.load() || !connected_.exchange(false)) {
        return;
    }

    ConnectionLostHandler handler;
    {
        std::lock_guard<std::mutex> hk(handlerMutex_);
        handler = lostHandler_;
    }
    if (handler) {
        handler(reason);
    }
}

} // namespace broker
