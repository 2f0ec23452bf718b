#include "client/reconnect_manager.hpp"

#include "core/errors.hpp"
#include "core/logger.hpp"
#include "gateway/frame_codec.hpp"

namespace client {

const char* clientStateName(ClientState state)
{
    switch (state)
    {
    case ClientState::Disconnected: return "Disconnected";
    case ClientState::Connecting: return "Connecting";
    case ClientState::Connected: return "Connected";
    case ClientState::Reconnecting: return "Reconnecting";
    default: return "Unknown";
    }
}

ReconnectManager::ReconnectManager(ClientTransport& transport, ReconnectPolicy policy)
    : transport_(transport)
    , policy_(policy)
    , backoff_(policy.baseDelay, policy.maxDelay, policy.maxAttempts)
{
    transport_.setHandlers(
        [this](const std::string& line) { onFrame(line); },
        [this](const std::string& reason) { onClosed(reason); });
}

ReconnectManager::~ReconnectManager()
{
    disconnect();
    transport_.setHandlers(nullptr, nullptr);
}

void ReconnectManager::connect()
{
    std::thread previous;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (state_ != ClientState::Disconnected) {
            return;
        }
        previous = std::move(worker_);
    }
    // 上一轮的工作线程（重试用尽或已断开）可能还没退出
    if (previous.joinable()) {
        previous.join();
    }

    // join 期间可能有别的线程抢先 connect()
    std::unique_lock<std::mutex> lk(mutex_);
    if (state_ != ClientState::Disconnected || worker_.joinable()) {
        return;
    }
    stopRequested_ = false;
    backoff_.reset();
    transition(lk, ClientState::Connecting);
    worker_ = std::thread(&ReconnectManager::workerLoop, this);
}

void ReconnectManager::disconnect()
{
    std::thread worker;
    ClientState previous;
    {
        std::unique_lock<std::mutex> lk(mutex_);
        // 先置停止标志，工作线程在任何等待点都会退出
        stopRequested_ = true;
        previous = state_;
        worker = std::move(worker_);
        transition(lk, ClientState::Disconnected);
        cv_.notify_all();
    }

    if (previous != ClientState::Disconnected) {
        transport_.close();
        LOG_INFO("client", "Disconnected from gateway");
    }

    if (worker.joinable())
    {
        // 监听器里调用 disconnect() 时就在工作线程上，不能 join 自己
        if (worker.get_id() == std::this_thread::get_id()) {
            worker.detach();
        } else {
            worker.join();
        }
    }
}

void ReconnectManager::subscribeWell(const std::string& wellId)
{
    // 持有 sendMutex_ 直到帧发出，避免与重连后的重放交错
    std::lock_guard<std::mutex> sendLock(sendMutex_);
    bool sendNow = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        wells_.insert(wellId);
        sendNow = state_ == ClientState::Connected;
    }
    if (sendNow) {
        sendQuietly(gateway::subscribeWellFrame(wellId));
    }
}

void ReconnectManager::unsubscribeWell(const std::string& wellId)
{
    std::lock_guard<std::mutex> sendLock(sendMutex_);
    bool sendNow = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        wells_.erase(wellId);
        sendNow = state_ == ClientState::Connected;
    }
    if (sendNow) {
        sendQuietly(gateway::unsubscribeWellFrame(wellId));
    }
}

std::set<std::string> ReconnectManager::subscribedWells() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return wells_;
}

ClientState ReconnectManager::state() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return state_;
}

bool ReconnectManager::waitForState(ClientState expected, std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lk(mutex_);
    return cv_.wait_for(lk, timeout, [&] { return state_ == expected; });
}

void ReconnectManager::setStateListener(StateListener listener)
{
    std::lock_guard<std::mutex> lk(mutex_);
    stateListener_ = std::move(listener);
}

void ReconnectManager::setFrameListener(FrameListener listener)
{
    std::lock_guard<std::mutex> lk(mutex_);
    frameListener_ = std::move(listener);
}

// 调用时持有 lk；监听器在锁外调用，返回前重新加锁
void ReconnectManager::transition(std::unique_lock<std::mutex>& lk, ClientState next)
{
    if (state_ == next) {
        return;
    }
    auto listener = changeState(next);
    lk.unlock();
    notifyState(listener, next);
    lk.lock();
}

// 调用时持有 mutex_
ReconnectManager::StateListener ReconnectManager::changeState(ClientState next)
{
    auto previous = state_;
    state_ = next;
    cv_.notify_all();
    LOG_DEBUG("client", clientStateName(previous), " -> ", clientStateName(next));
    return stateListener_;
}

void ReconnectManager::notifyState(const StateListener& listener, ClientState state)
{
    if (listener) {
        listener(state);
    }
}

void ReconnectManager::workerLoop()
{
    std::unique_lock<std::mutex> lk(mutex_);
    while (!stopRequested_)
    {
        switch (state_)
        {
        case ClientState::Connecting:
        {
            lostWhileConnecting_ = false;
            lk.unlock();
            bool ok = false;
            std::string error;
            try {
                transport_.connect();
                ok = true;
            } catch (const core::AuthenticationError& ex) {
                error = std::string("authentication failed: ") + ex.what();
            } catch (const core::ConnectionError& ex) {
                error = ex.what();
            }

            // 成功时先拿 sendMutex_，应用的订阅调用要等重放结束
            std::unique_lock<std::mutex> sendLock(sendMutex_, std::defer_lock);
            if (ok) {
                sendLock.lock();
            }
            lk.lock();

            if (stopRequested_ || state_ != ClientState::Connecting)
            {
                // 连接过程中被 disconnect() 了
                if (ok) {
                    lk.unlock();
                    sendLock.unlock();
                    transport_.close();
                    lk.lock();
                }
                break;
            }

            if (ok && lostWhileConnecting_)
            {
                // connect() 返回前对端已经关闭，这条连接不能用
                sendLock.unlock();
                LOG_WARN("client", "Connection to gateway lost before it was established");
                transition(lk, ClientState::Reconnecting);
                break;
            }

            if (ok)
            {
                backoff_.reset();
                ++connects_;
                // 快照和状态切换在同一临界区，之后的增量订阅都排在重放之后
                auto wells = wells_;
                auto listener = changeState(ClientState::Connected);
                lk.unlock();

                // 重放逻辑订阅集合
                LOG_INFO("client", "Connected to gateway, replaying ", wells.size(), " well subscription(s)");
                for (const auto& well : wells) {
                    sendQuietly(gateway::subscribeWellFrame(well));
                }
                sendLock.unlock();

                // 重放期间连接又断了就不再报告 Connected
                lk.lock();
                bool stillConnected = state_ == ClientState::Connected;
                lk.unlock();
                if (stillConnected) {
                    notifyState(listener, ClientState::Connected);
                }
                lk.lock();
            }
            else
            {
                LOG_WARN("client", "Connect attempt failed: ", error);
                transition(lk, ClientState::Reconnecting);
            }
            break;
        }

        case ClientState::Connected:
            // 等断线（onClosed）或 disconnect()
            cv_.wait(lk, [this] { return stopRequested_ || state_ != ClientState::Connected; });
            break;

        case ClientState::Reconnecting:
        {
            // 重试用尽后停在 Disconnected，由应用决定是否再次 connect()
            if (backoff_.exhausted())
            {
                LOG_ERROR("client", "Giving up after ", backoff_.attempts(), " reconnect attempts");
                transition(lk, ClientState::Disconnected);
                return;
            }
            auto delay = backoff_.next();
            LOG_INFO("client", "Reconnecting in ", delay.count(), "ms (attempt ", backoff_.attempts(), ")");
            // 可被 disconnect() 打断的定时器
            cv_.wait_for(lk, delay, [this] { return stopRequested_ || state_ != ClientState::Reconnecting; });
            if (stopRequested_ || state_ != ClientState::Reconnecting) {
                break;
            }
            transition(lk, ClientState::Connecting);
            break;
        }

        case ClientState::Disconnected:
            return;
        }
    }
}

void ReconnectManager::sendQuietly(const std::string& frame)
{
    try {
        transport_.send(frame);
    } catch (const core::SocketWriteError& ex) {
        // 连接断了会走 onClosed，重连后整体重放
        LOG_WARN("client", "Send failed, will resend after reconnect: ", ex.what());
    }
}

void ReconnectManager::onFrame(const std::string& line)
{
    nlohmann::json frame;
    try {
        frame = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& ex) {
        LOG_WARN("client", "Ignoring malformed frame from gateway: ", ex.what());
        return;
    }

    // 拷贝一份监听器，在锁外回调
    FrameListener listener;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        listener = frameListener_;
    }
    if (listener) {
        listener(frame);
    }
}

void ReconnectManager::onClosed(const std::string& reason)
{
    std::unique_lock<std::mutex> lk(mutex_);
    // connect() 还没返回就断开：记下来，由工作线程在连接成功后处理
    if (state_ == ClientState::Connecting) {
        lostWhileConnecting_ = true;
        return;
    }
    // 其余状态下的关闭通知都属于旧连接
    if (state_ != ClientState::Connected) {
        return;
    }
    LOG_WARN("client", "Connection to gateway lost: ", reason);
    transition(lk, ClientState::Reconnecting);
}

} // namespace client
