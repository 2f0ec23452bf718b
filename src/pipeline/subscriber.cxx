#include "pipeline/subscriber.hpp"

#include "broker/glob_pattern.hpp"
#include "core/backoff.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "domain/topic.hpp"

namespace pipeline {

Subscriber::Subscriber(core::BrokerConfig config,
                       broker::BrokerClient& broker,
                       const domain::ReadingValidator& validator,
                       ReadingHandler handler,
                       monitoring::HealthMonitor& monitor)
    : config_(std::move(config))
    , broker_(broker)
    , validator_(validator)
    , handler_(std::move(handler))
    , monitor_(monitor) {
}

Subscriber::~Subscriber()
{
    stop();
}

void Subscriber::start()
{
    // 配置的模式非法时直接抛 std::invalid_argument，而不是在重连线程里才发现
    broker::GlobPattern validated(config_.pattern);

    if (running_.exchange(true)) {
        return;
    }

    // 代理断线的通知统一走重连线程
    broker_.setConnectionLostHandler([this](const std::string& reason) {
        requestReconnect(reason);
    });

    worker_ = std::thread(&Subscriber::reconnectLoop, this);

    // 首次订阅失败不算启动失败，交给重连线程继续尝试
    if (!trySubscribe()) {
        requestReconnect("initial subscribe failed");
    }
}

void Subscriber::stop()
{
    if (!running_.exchange(false)) {
        return;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }

    // 先摘掉回调，关闭连接时不会再触发重连
    broker_.setConnectionLostHandler(nullptr);
    broker_.unsubscribePattern(config_.pattern);
    broker_.close();
    state_.store(State::Stopped);
    monitor_.update("subscriber", false, "Stopped");
}

bool Subscriber::trySubscribe()
{
    try
    {
        // 重连后旧的模式订阅已失效，每次都重新订阅
        broker_.connect();
        monitor_.update("broker", true, "Connected");
        broker_.subscribePattern(config_.pattern, [this](const std::string& topic, const std::string& payload) {
            handleMessage(topic, payload);
        });
    }
    catch (const core::BrokerConnectionError& ex)
    {
        LOG_WARN("subscriber", "Subscribe to ", config_.pattern, " failed: ", ex.what());
        monitor_.update("broker", broker_.isConnected(), ex.what());
        monitor_.update("subscriber", false, std::string("Subscribe failed: ") + ex.what());
        return false;
    }

    state_.store(State::Subscribed);
    monitor_.update("subscriber", true, "Subscribed to " + config_.pattern);
    LOG_INFO("subscriber", "Subscribed to ", config_.pattern);
    return true;
}

void Subscriber::requestReconnect(const std::string& reason)
{
    if (!running_.load()) {
        return;
    }
    LOG_WARN("subscriber", "Broker connection lost: ", reason);
    {
        std::lock_guard<std::mutex> lk(mutex_);
        reconnectRequested_ = true;
    }
    state_.store(State::Reconnecting);
    monitor_.update("broker", false, reason);
    monitor_.update("subscriber", false, "Broker connection lost: " + reason);
    cv_.notify_all();
}

// 后台线程：平时阻塞等待重连请求，收到后按指数退避重试
void Subscriber::reconnectLoop()
{
    while (running_.load())
    {
        {
            std::unique_lock<std::mutex> lk(mutex_);
            cv_.wait(lk, [this] { return reconnectRequested_ || !running_.load(); });
            if (!running_.load()) {
                break;
            }
            reconnectRequested_ = false;
        }

        // 每次断线都从基础延迟重新开始退避
        state_.store(State::Reconnecting);
        core::ExponentialBackoff backoff(std::chrono::milliseconds(config_.reconnectBaseMs),
                                         std::chrono::milliseconds(config_.reconnectMaxMs),
                                         config_.maxReconnectAttempts);

        while (running_.load())
        {
            if (backoff.exhausted())
            {
                // 运维告警：严重日志 + 健康状态置为不健康
                state_.store(State::Exhausted);
                LOG_CRITICAL("subscriber", "Giving up on broker after ", backoff.attempts(),
                             " reconnect attempts; no readings will be delivered");
                monitor_.update("subscriber", false, "Reconnect attempts exhausted");
                break;
            }

            auto delay = backoff.next();
            LOG_INFO("subscriber", "Reconnecting to broker in ", delay.count(), "ms (attempt ",
                     backoff.attempts(), ")");
            // stop() 可以打断等待
            {
                std::unique_lock<std::mutex> lk(mutex_);
                cv_.wait_for(lk, delay, [this] { return !running_.load(); });
            }
            if (!running_.load()) {
                break;
            }

            if (trySubscribe())
            {
                ++reconnects_;
                break;
            }
        }
    }
}

void Subscriber::handleMessage(const std::string& topic, const std::string& payload)
{
    // 租户以 topic 为准，负载里的 tenant_id 只用来交叉核对
    auto topicTenant = domain::tenantFromTopic(topic);
    if (!topicTenant)
    {
        ++rejected_;
        LOG_WARN("subscriber", "Dropping message on unexpected topic '", topic, "'");
        return;
    }

    // 解析时同时拒绝非法 UTF-8
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::parse_error& ex) {
        ++rejected_;
        LOG_WARN("subscriber", "Dropping malformed payload on ", topic, ": ", ex.what());
        return;
    }

    // 批量负载是数组，逐条独立校验
    if (parsed.is_array())
    {
        for (const auto& element : parsed) {
            processCandidate(*topicTenant, element);
        }
        return;
    }
    processCandidate(*topicTenant, parsed);
}

void Subscriber::processCandidate(const std::string& topicTenant, const nlohmann::json& candidate)
{
    try
    {
        auto reading = validator_.validate(candidate);
        // 负载声明的租户必须和 topic 一致，否则可能串租户
        if (reading.tenantId != topicTenant) {
            throw core::TenantMismatchError(topicTenant, reading.tenantId);
        }
        handler_(reading);
        ++forwarded_;
    }
    catch (const core::ValidationError& ex)
    {
        ++rejected_;
        LOG_WARN("subscriber", "Dropping invalid reading on tenant ", topicTenant, ": ", ex.what());
    }
    catch (const core::TenantMismatchError& ex)
    {
        // 可能是配置错误或伪造的发布者，按安全事件记录
        ++tenantMismatches_;
        LOG_WARN("security", "Discarding forged/corrupted reading: ", ex.what());
    }
}

} // namespace pipeline
