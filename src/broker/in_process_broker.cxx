#include "broker/in_process_broker.hpp"

#include "core/logger.hpp"

namespace broker {

std::unique_ptr<InProcessBrokerClient> InProcessBroker::createClient()
{
    return std::make_unique<InProcessBrokerClient>(*this);
}

void InProcessBroker::simulateOutage(const std::string& reason)
{
    online_.store(false);

    std::vector<InProcessBrokerClient*> dropped;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        for (auto& [client, _] : clients_) {
            dropped.push_back(client);
        }
        clients_.clear();
    }

    LOG_WARN("broker", "In-process broker outage: ", reason, " (", dropped.size(), " clients dropped)");

    // 回调在锁外执行，回调里可能会尝试重连
    for (auto* client : dropped) {
        client->onConnectionLost(reason);
    }
}

void InProcessBroker::restore()
{
    online_.store(true);
    LOG_INFO("broker", "In-process broker restored");
}

std::size_t InProcessBroker::connectedClients() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return clients_.size();
}

std::size_t InProcessBroker::patternSubscriptions() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    std::size_t total = 0;
    for (const auto& [_, subs] : clients_) {
        total += subs.size();
    }
    return total;
}

void InProcessBroker::attach(InProcessBrokerClient* client)
{
    std::lock_guard<std::mutex> lk(mutex_);
    if (!online_.load()) {
        throw core::BrokerConnectionError("in-process broker is offline");
    }
    clients_.try_emplace(client);
}

void InProcessBroker::detach(InProcessBrokerClient* client)
{
    std::lock_guard<std::mutex> lk(mutex_);
    clients_.erase(client);
}

void InProcessBroker::addSubscription(InProcessBrokerClient* client, const std::string& pattern,
                                      BrokerClient::MessageHandler handler)
{
    // 先编译，非法模式直接抛 invalid_argument，不影响已有订阅
    GlobPattern compiled(pattern);

    std::lock_guard<std::mutex> lk(mutex_);
    auto it = clients_.find(client);
    if (it == clients_.end()) {
        throw core::BrokerConnectionError("client is not attached to the broker");
    }
    it->second.insert_or_assign(pattern, Subscription{std::move(compiled), std::move(handler)});
}

void InProcessBroker::removeSubscription(InProcessBrokerClient* client, const std::string& pattern)
{
    std::lock_guard<std::mutex> lk(mutex_);
    if (auto it = clients_.find(client); it != clients_.end()) {
        it->second.erase(pattern);
    }
}

std::size_t InProcessBroker::deliver(const std::string& topic, const std::string& payload)
{
    if (!online_.load()) {
        throw core::BrokerConnectionError("in-process broker is offline");
    }

    // 拷贝命中的 handler，锁外投递
    std::vector<BrokerClient::MessageHandler> targets;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        for (const auto& [_, subs] : clients_) {
            for (const auto& [pattern, sub] : subs) {
                if (sub.pattern.match(topic)) {
                    targets.push_back(sub.handler);
                }
            }
        }
    }

    ++published_;
    for (const auto& handler : targets) {
        if (handler) {
            handler(topic, payload);
        }
    }
    return targets.size();
}

InProcessBrokerClient::~InProcessBrokerClient()
{
    close();
}

void InProcessBrokerClient::connect()
{
    if (connected_.load()) {
        return;
    }
    hub_.attach(this);
    connected_.store(true);
}

void InProcessBrokerClient::close()
{
    if (!connected_.exchange(false)) {
        return;
    }
    hub_.detach(this);
}

void InProcessBrokerClient::ensureConnected(const char* operation) const
{
    if (!connected_.load()) {
        throw core::BrokerConnectionError(std::string(operation) + ": not connected to broker");
    }
}

void InProcessBrokerClient::publish(const std::string& topic, const std::string& payload)
{
    ensureConnected("publish");
    hub_.deliver(topic, payload);
}

void InProcessBrokerClient::publishPipelined(const std::vector<BrokerMessage>& messages)
{
    ensureConnected("publishPipelined");
    if (!hub_.online()) {
        throw core::BrokerConnectionError("publishPipelined: in-process broker is offline");
    }
    for (const auto& message : messages) {
        hub_.deliver(message.topic, message.payload);
    }
}

void InProcessBrokerClient::subscribePattern(const std::string& pattern, MessageHandler handler)
{
    ensureConnected("subscribePattern");
    hub_.addSubscription(this, pattern, std::move(handler));
}

void InProcessBrokerClient::unsubscribePattern(const std::string& pattern)
{
    if (!connected_.load()) {
        return;
    }
    hub_.removeSubscription(this, pattern);
}

void InProcessBrokerClient::setConnectionLostHandler(ConnectionLostHandler handler)
{
    std::lock_guard<std::mutex> lk(handlerMutex_);
    lostHandler_ = std::move(handler);
}

void InProcessBrokerClient::onConnectionLost(const std::string& reason)
{
    connected_.store(false);

    ConnectionLostHandler handler;
    {
        std::lock_guard<std::mutex> lk(handlerMutex_);
        handler = lostHandler_;
    }
    if (handler) {
        handler(reason);
    }
}

} // namespace broker
