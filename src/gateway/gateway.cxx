#include "gateway/gateway.hpp"

#include <algorithm>

#include "core/errors.hpp"
#include "core/logger.hpp"
#include "domain/reading_validator.hpp"
#include "gateway/handshake.hpp"

namespace gateway {
namespace {

// 激活前最多缓存的帧数
constexpr std::size_t kMaxPendingFrames = 256;

// 鉴权结果的轮询间隔
constexpr std::chrono::milliseconds kAuthPollInterval{5};

domain::Timestamp wallNow()
{
    return std::chrono::system_clock::now();
}

} // namespace

Gateway::Gateway(core::GatewayConfig config,
                 ConnectionRegistry& registry,
                 AuthVerifier& verifier,
                 FrameTransport& transport,
                 monitoring::HealthMonitor& monitor)
    : config_(std::move(config))
    , registry_(registry)
    , verifier_(verifier)
    , transport_(transport)
    , monitor_(monitor) {
}

Gateway::~Gateway()
{
    stop();
}

void Gateway::start()
{
    if (running_.exchange(true)) {
        return;
    }
    authWorker_ = std::thread(&Gateway::authLoop, this);
    sweepWorker_ = std::thread(&Gateway::sweepLoop, this);
    reportHealth();
    LOG_INFO("gateway", "Gateway started (heartbeat ", config_.heartbeatIntervalSeconds, "s x ",
             config_.maxMissedHeartbeats, ", auth timeout ", config_.authTimeoutMs, "ms)");
}

void Gateway::stop()
{
    if (!running_.exchange(false)) {
        return;
    }
    // 先停后台线程，再关连接，关闭过程中不会再有鉴权结算或心跳扫描
    authCv_.notify_all();
    sweepCv_.notify_all();
    if (authWorker_.joinable()) {
        authWorker_.join();
    }
    if (sweepWorker_.joinable()) {
        sweepWorker_.join();
    }
    {
        std::lock_guard<std::mutex> lk(authMutex_);
        authPending_.clear();
    }

    std::vector<std::shared_ptr<Connection>> all;
    {
        std::lock_guard<std::mutex> lk(connectionsMutex_);
        for (const auto& [_, conn] : connections_) {
            all.push_back(conn);
        }
    }
    // 快照后逐个关闭，closeConnection 会修改 connections_
    for (const auto& conn : all) {
        closeConnection(conn, std::nullopt, "gateway shutting down");
    }

    monitor_.update("gateway", false, "Gateway stopped");
    LOG_INFO("gateway", "Gateway stopped");
}

std::shared_ptr<Connection> Gateway::find(ConnectionId id) const
{
    std::lock_guard<std::mutex> lk(connectionsMutex_);
    auto it = connections_.find(id);
    return it == connections_.end() ? nullptr : it->second;
}

// ------------------------------------------------------------------
// 传输层回调
// ------------------------------------------------------------------

void Gateway::onAccept(ConnectionId id)
{
    std::lock_guard<std::mutex> lk(connectionsMutex_);
    auto [it, inserted] = connections_.try_emplace(id, std::make_shared<Connection>(id));
    if (!inserted) {
        LOG_WARN("gateway", "Duplicate accept for connection ", id, ", ignoring");
        return;
    }
    LOG_DEBUG("gateway", "Connection ", id, " accepted, awaiting handshake");
}

void Gateway::onData(ConnectionId id, std::string_view bytes)
{
    auto conn = find(id);
    if (!conn) {
        return;
    }

    Outcome outcome;
    std::optional<AuthJob> job;

    std::unique_lock<std::mutex> lk(conn->mutex);
    auto state = conn->state.load();
    // 已在关闭的连接，剩余数据直接丢弃
    if (state == ConnectionState::Closing || state == ConnectionState::Closed) {
        return;
    }

    // 任何入站数据都算心跳
    conn->lastHeartbeat = std::chrono::steady_clock::now();

    if (!conn->headComplete) {
        consumeHandshake(*conn, bytes, outcome, job);
    } else {
        feedLines(*conn, bytes, outcome);
    }

    // flush 会消费 outcome，先记下是否要关闭
    bool closing = outcome.close;
    flush(conn, lk, outcome);

    // 握手完整且没有失败，立即发出校验请求
    if (job && !closing) {
        beginAuthentication(std::move(*job));
    }
}

void Gateway::onTransportClosed(ConnectionId id, const std::string& reason)
{
    auto conn = find(id);
    if (!conn) {
        return;
    }
    {
        std::lock_guard<std::mutex> lk(conn->mutex);
        auto state = conn->state.load();
        // 对端先断开：不再发最终帧，直接清理
        if (state != ConnectionState::Closing && state != ConnectionState::Closed)
        {
            conn->state = ConnectionState::Closing;
            conn->pendingFrames.clear();
        }
    }
    finalize(conn, reason);
}

// ------------------------------------------------------------------
// 入站处理
// ------------------------------------------------------------------

void Gateway::consumeHandshake(Connection& conn, std::string_view bytes, Outcome& outcome, std::optional<AuthJob>& job)
{
    // 握手头可能分多次到达，先累积再找结束标记
    conn.handshakeBuffer.append(bytes.data(), bytes.size());

    auto end = findHeadEnd(conn.handshakeBuffer);
    if (!end)
    {
        if (conn.handshakeBuffer.size() > kMaxHandshakeBytes) {
            ++authFailures_;
            outcome.fail(ErrorCode::AuthFailed, "handshake too large", "oversized handshake");
        }
        return;
    }
    if (end->first > kMaxHandshakeBytes) {
        ++authFailures_;
        outcome.fail(ErrorCode::AuthFailed, "handshake too large", "oversized handshake");
        return;
    }

    // 握手头之后的字节属于帧流
    std::string head = conn.handshakeBuffer.substr(0, end->first);
    std::string rest = conn.handshakeBuffer.substr(end->second);
    conn.handshakeBuffer.clear();
    conn.handshakeBuffer.shrink_to_fit();
    conn.headComplete = true;

    try
    {
        auto request = parseHandshake(head);
        auto credential = extractCredential(request);
        if (!credential) {
            throw core::AuthenticationError("missing credential");
        }
        job = AuthJob{conn.id, std::move(*credential), std::chrono::steady_clock::now()};
    }
    catch (const core::AuthenticationError& ex)
    {
        ++authFailures_;
        LOG_WARN("gateway", "Connection ", conn.id, " handshake rejected: ", ex.what());
        outcome.fail(ErrorCode::AuthFailed, ex.what(), "handshake rejected");
        return;
    }

    // 握手头后面紧跟的帧先缓存，激活后再处理
    if (!rest.empty()) {
        feedLines(conn, rest, outcome);
    }
}

void Gateway::feedLines(Connection& conn, std::string_view bytes, Outcome& outcome)
{
    bool ok = conn.lines.feed(bytes, [&](std::string line) {
        if (outcome.close) {
            return;
        }
        // 鉴权未完成前只缓存，不处理
        if (conn.state.load() != ConnectionState::Active)
        {
            if (conn.pendingFrames.size() >= kMaxPendingFrames) {
                outcome.fail(ErrorCode::InvalidFrame, "too many frames before connection is active",
                             "pending frame limit exceeded");
                return;
            }
            conn.pendingFrames.push_back(std::move(line));
            return;
        }
        handleLine(conn, line, outcome);
    });

    if (!ok && !outcome.close) {
        outcome.fail(ErrorCode::InvalidFrame, "frame exceeds " + std::to_string(kMaxFrameBytes) + " bytes",
                     "oversized frame");
    }
}

void Gateway::handleLine(Connection& conn, const std::string& line, Outcome& outcome)
{
    Frame frame;
    try {
        frame = parseFrame(line);
    } catch (const core::ValidationError& ex) {
        // 非法帧只回错误，不断开
        outcome.frames.push_back(errorFrame(ErrorCode::InvalidFrame, ex.what()));
        return;
    }

    if (frame.type == frame_type::kPing)
    {
        outcome.frames.push_back(pongFrame(wallNow()));
        return;
    }

    if (frame.type == frame_type::kClose)
    {
        outcome.close = true;
        outcome.reason = "client requested close";
        return;
    }

    // 订阅只作用于本连接所属租户，租户来自鉴权结果而不是帧内容
    bool subscribe = frame.type == frame_type::kSubscribeWell;
    if (subscribe || frame.type == frame_type::kUnsubscribeWell)
    {
        auto well = frame.data.find("well_id");
        if (well == frame.data.end() || !well->is_string() || well->get<std::string>().empty()) {
            outcome.frames.push_back(errorFrame(ErrorCode::InvalidFrame, "well_id must be a non-empty string"));
            return;
        }
        const auto wellId = well->get<std::string>();

        bool ok = subscribe ? registry_.subscribeWell(conn.id, wellId)
                            : registry_.unsubscribeWell(conn.id, wellId);
        if (!ok) {
            LOG_ERROR("gateway", "Registry rejected ", frame.type, " for connection ", conn.id);
            outcome.frames.push_back(errorFrame(ErrorCode::RegistryFailed, "registry update failed"));
            return;
        }

        LOG_DEBUG("gateway", "Connection ", conn.id, " ", frame.type, " ", conn.tenantId, "/", wellId);
        outcome.frames.push_back(subscribe ? subscribedFrame(wellId, wallNow())
                                           : unsubscribedFrame(wellId, wallNow()));
        return;
    }

    outcome.frames.push_back(errorFrame(ErrorCode::UnknownType, "unknown frame type '" + frame.type + "'"));
}

void Gateway::flush(const std::shared_ptr<Connection>& conn, std::unique_lock<std::mutex>& stateLock, Outcome& outcome)
{
    // 先拿写锁再放状态锁，同一连接的帧按产生顺序写出
    std::unique_lock<std::mutex> sendLock(conn->sendMutex);
    stateLock.unlock();

    // 一帧写失败就停止，后面的帧没有意义
    bool writeFailed = false;
    for (const auto& frame : outcome.frames)
    {
        try {
            transport_.send(conn->id, frame);
            ++writes_;
        } catch (const core::SocketWriteError& ex) {
            ++writeFailures_;
            LOG_WARN("gateway", ex.what());
            writeFailed = true;
            break;
        }
    }
    sendLock.unlock();

    // 关闭在写锁外进行，closeConnection 自己会拿写锁发最终帧
    if (writeFailed) {
        closeConnection(conn, std::nullopt, "socket write failed");
    } else if (outcome.close) {
        closeConnection(conn, outcome.finalFrame, outcome.reason);
    }
}

// ------------------------------------------------------------------
// 关闭
// ------------------------------------------------------------------

void Gateway::closeConnection(const std::shared_ptr<Connection>& conn,
                              std::optional<std::string> finalFrame,
                              const std::string& reason)
{
    {
        std::lock_guard<std::mutex> lk(conn->mutex);
        auto state = conn->state.load();
        if (state == ConnectionState::Closing || state == ConnectionState::Closed) {
            return;
        }
        conn->state = ConnectionState::Closing;
        // 未处理的入站帧直接丢弃
        conn->pendingFrames.clear();
        conn->lines.reset();
    }

    LOG_INFO("gateway", "Closing connection ", conn->id, ": ", reason);

    // 尽力发送最终帧，失败不影响关闭
    if (finalFrame)
    {
        std::lock_guard<std::mutex> sk(conn->sendMutex);
        try {
            transport_.send(conn->id, *finalFrame);
            ++writes_;
        } catch (const core::SocketWriteError& ex) {
            ++writeFailures_;
            LOG_DEBUG("gateway", "Final frame not delivered: ", ex.what());
        }
    }

    transport_.disconnect(conn->id);
    finalize(conn, reason);
}

void Gateway::finalize(const std::shared_ptr<Connection>& conn, const std::string& reason)
{
    // 本地关闭和对端关闭可能同时到达，只清理一次
    if (conn->finalized.exchange(true)) {
        return;
    }

    // 先移出注册表，之后的扇出不会再选中这个连接
    registry_.removeConnection(conn->id);
    {
        std::lock_guard<std::mutex> lk(conn->mutex);
        conn->state = ConnectionState::Closed;
    }
    {
        std::lock_guard<std::mutex> lk(connectionsMutex_);
        connections_.erase(conn->id);
    }
    LOG_DEBUG("gateway", "Connection ", conn->id, " closed (", reason, ")");
}

// ------------------------------------------------------------------
// 鉴权
// ------------------------------------------------------------------

void Gateway::beginAuthentication(AuthJob job)
{
    // 截止时间从握手完成开始算
    const auto deadline = job.enqueuedAt + std::chrono::milliseconds(config_.authTimeoutMs);

    // 各连接的校验互不等待，一个卡住的请求不会拖住后面的连接
    std::future<AuthClaims> result;
    try {
        result = verifier_.verify(job.credential);
    } catch (const core::AuthenticationError& ex) {
        ++authFailures_;
        LOG_WARN("auth", "Connection ", job.id, " rejected: ", ex.what());
        failAuthentication(job.id, ex.what());
        return;
    } catch (const std::exception& ex) {
        ++authFailures_;
        monitor_.update("auth", false, std::string("Verifier error: ") + ex.what());
        LOG_ERROR("auth", "Verifier failed for connection ", job.id, ": ", ex.what());
        failAuthentication(job.id, "authentication unavailable");
        return;
    }

    {
        std::lock_guard<std::mutex> lk(authMutex_);
        authPending_.push_back(PendingAuth{job.id, std::move(result), deadline});
    }
    authCv_.notify_one();
}

void Gateway::authLoop()
{
    while (running_)
    {
        std::vector<PendingAuth> settled;
        {
            std::unique_lock<std::mutex> lk(authMutex_);
            authCv_.wait(lk, [this] { return !authPending_.empty() || !running_.load(); });
            if (!running_) {
                break;
            }

            // 取出已出结果或已过截止时间的请求
            const auto now = std::chrono::steady_clock::now();
            auto earliest = std::chrono::steady_clock::time_point::max();
            for (auto it = authPending_.begin(); it != authPending_.end();)
            {
                bool ready = it->result.wait_for(std::chrono::seconds(0)) != std::future_status::timeout;
                if (ready || it->deadline <= now) {
                    settled.push_back(std::move(*it));
                    it = authPending_.erase(it);
                } else {
                    earliest = std::min(earliest, it->deadline);
                    ++it;
                }
            }

            if (settled.empty())
            {
                // 等到最早的截止时间，期间定期检查结果；新请求进来也会唤醒
                authCv_.wait_until(lk, std::min(earliest, now + kAuthPollInterval));
                continue;
            }
        }

        // 在鉴权锁外结算，结算会拿连接锁并写帧
        for (auto& pending : settled) {
            settleAuthentication(pending);
        }
    }
}

void Gateway::settleAuthentication(PendingAuth& pending)
{
    const auto id = pending.id;
    try
    {
        if (pending.result.wait_for(std::chrono::seconds(0)) == std::future_status::timeout)
        {
            ++authFailures_;
            monitor_.update("auth", false, "Verifier timed out");
            LOG_WARN("auth", "Verification for connection ", id, " timed out after ", config_.authTimeoutMs, "ms");
            failAuthentication(id, "authentication timed out");
            return;
        }
        auto claims = pending.result.get();
        monitor_.update("auth", true, "Verifier responding");
        completeAuthentication(id, claims);
    }
    catch (const core::AuthenticationError& ex)
    {
        ++authFailures_;
        monitor_.update("auth", true, "Verifier responding");
        LOG_WARN("auth", "Connection ", id, " rejected: ", ex.what());
        failAuthentication(id, ex.what());
    }
    catch (const std::exception& ex)
    {
        // 校验方自身故障也按鉴权失败处理
        ++authFailures_;
        monitor_.update("auth", false, std::string("Verifier error: ") + ex.what());
        LOG_ERROR("auth", "Verifier failed for connection ", id, ": ", ex.what());
        failAuthentication(id, "authentication unavailable");
    }
}

void Gateway::completeAuthentication(ConnectionId id, const AuthClaims& claims)
{
    auto conn = find(id);
    if (!conn) {
        return;
    }

    Outcome outcome;
    std::unique_lock<std::mutex> lk(conn->mutex);
    if (conn->state.load() != ConnectionState::Handshaking) {
        return;
    }

    if (!domain::isValidTenantId(claims.tenantId))
    {
        ++authFailures_;
        LOG_ERROR("auth", "Verifier returned invalid tenant id '", claims.tenantId, "' for connection ", id);
        outcome.fail(ErrorCode::AuthFailed, "invalid tenant", "invalid tenant id from verifier");
        flush(conn, lk, outcome);
        return;
    }

    // 身份在激活后不再改变
    conn->tenantId = claims.tenantId;
    conn->userId = claims.userId;
    conn->role = claims.role;
    conn->state = ConnectionState::Authenticated;

    if (!registry_.addConnection(conn->tenantId, id))
    {
        LOG_ERROR("gateway", "Registry refused connection ", id, " for tenant ", conn->tenantId);
        outcome.fail(ErrorCode::RegistryFailed, "registry rejected connection", "registry add failed");
        flush(conn, lk, outcome);
        return;
    }

    conn->state = ConnectionState::Active;
    conn->lastHeartbeat = std::chrono::steady_clock::now();
    outcome.frames.push_back(connectedFrame(conn->tenantId, wallNow()));
    LOG_INFO("gateway", "Connection ", id, " active: tenant=", conn->tenantId, " user=", conn->userId,
             " role=", conn->role);

    // 激活前缓存的帧按到达顺序处理，排在 connected 帧之后
    while (!conn->pendingFrames.empty() && !outcome.close)
    {
        auto line = std::move(conn->pendingFrames.front());
        conn->pendingFrames.pop_front();
        handleLine(*conn, line, outcome);
    }
    conn->pendingFrames.clear();

    flush(conn, lk, outcome);
}

void Gateway::failAuthentication(ConnectionId id, const std::string& reason)
{
    auto conn = find(id);
    if (!conn) {
        return;
    }

    Outcome outcome;
    std::unique_lock<std::mutex> lk(conn->mutex);
    // 结果到达前连接可能已经关闭
    if (conn->state.load() != ConnectionState::Handshaking) {
        return;
    }
    outcome.fail(ErrorCode::AuthFailed, reason, "authentication failed");
    flush(conn, lk, outcome);
}

// ------------------------------------------------------------------
// 扇出
// ------------------------------------------------------------------

DeliveryStats Gateway::deliver(const ConnectionSet& recipients, const domain::Reading& reading)
{
    DeliveryStats stats;
    stats.recipients = recipients.size();
    if (recipients.empty()) {
        return stats;
    }

    // 帧只编码一次，所有接收方共用
    const auto frame = readingFrame(domain::toJson(reading).dump());

    // 在表锁内取出连接，写操作放到表锁外
    std::vector<std::shared_ptr<Connection>> targets;
    targets.reserve(recipients.size());
    {
        std::lock_guard<std::mutex> lk(connectionsMutex_);
        for (auto id : recipients)
        {
            auto it = connections_.find(id);
            if (it == connections_.end()) {
                ++stats.skipped;
                continue;
            }
            targets.push_back(it->second);
        }
    }

    std::vector<std::shared_ptr<Connection>> broken;
    for (const auto& conn : targets)
    {
        // 只投递给已激活的连接
        if (conn->state.load() != ConnectionState::Active) {
            ++stats.skipped;
            continue;
        }
        // 单个连接写失败不影响其余接收方
        try {
            std::lock_guard<std::mutex> sk(conn->sendMutex);
            transport_.send(conn->id, frame);
            ++stats.delivered;
        } catch (const core::SocketWriteError& ex) {
            ++stats.failed;
            LOG_WARN("gateway", ex.what());
            broken.push_back(conn);
        }
    }

    // 写失败的连接进入关闭流程，放到扇出结束后做
    for (const auto& conn : broken) {
        closeConnection(conn, std::nullopt, "socket write failed");
    }

    ++fanouts_;
    writes_ += stats.delivered;
    writeFailures_ += stats.failed;
    return stats;
}

// ------------------------------------------------------------------
// 心跳
// ------------------------------------------------------------------

std::size_t Gateway::sweepHeartbeats(std::chrono::steady_clock::time_point now)
{
    const auto interval = std::chrono::seconds(std::max<uint16_t>(config_.heartbeatIntervalSeconds, 1));
    const auto limit = interval * std::max<uint16_t>(config_.maxMissedHeartbeats, 1);

    std::vector<std::shared_ptr<Connection>> all;
    {
        std::lock_guard<std::mutex> lk(connectionsMutex_);
        all.reserve(connections_.size());
        for (const auto& [_, conn] : connections_) {
            all.push_back(conn);
        }
    }

    std::size_t closed = 0;
    for (const auto& conn : all)
    {
        std::string frame;
        std::string reason;
        {
            std::lock_guard<std::mutex> lk(conn->mutex);
            auto state = conn->state.load();
            if (state == ConnectionState::Closing || state == ConnectionState::Closed) {
                continue;
            }
            if (now - conn->lastHeartbeat <= limit) {
                continue;
            }
            // 握手一直没完成的连接也在这里回收
            if (state == ConnectionState::Handshaking) {
                frame = errorFrame(ErrorCode::AuthFailed, "handshake not completed in time");
                reason = "handshake timeout";
            } else {
                frame = errorFrame(ErrorCode::HeartbeatTimeout,
                                   "missed " + std::to_string(config_.maxMissedHeartbeats) + " heartbeats");
                reason = "heartbeat timeout";
                ++heartbeatTimeouts_;
            }
        }
        // 在连接锁外关闭
        closeConnection(conn, frame, reason);
        ++closed;
    }
    return closed;
}

void Gateway::sweepLoop()
{
    const auto interval = std::chrono::seconds(std::max<uint16_t>(config_.heartbeatIntervalSeconds, 1));
    while (running_)
    {
        {
            std::unique_lock<std::mutex> lk(sweepMutex_);
            sweepCv_.wait_for(lk, interval, [this] { return !running_.load(); });
        }
        if (!running_) {
            break;
        }
        auto closed = sweepHeartbeats(std::chrono::steady_clock::now());
        if (closed > 0) {
            LOG_INFO("gateway", "Heartbeat sweep closed ", closed, " connection(s)");
        }
        reportHealth();
    }
}

void Gateway::reportHealth()
{
    auto s = stats();
    monitor_.update("gateway", true,
                    "active=" + std::to_string(activeConnections()) +
                    " fanouts=" + std::to_string(s.fanouts) +
                    " writes=" + std::to_string(s.writes) +
                    " write_failures=" + std::to_string(s.writeFailures) +
                    " auth_failures=" + std::to_string(s.authFailures) +
                    " heartbeat_timeouts=" + std::to_string(s.heartbeatTimeouts));
}

// ------------------------------------------------------------------
// 查询
// ------------------------------------------------------------------

std::optional<ConnectionState> Gateway::stateOf(ConnectionId id) const
{
    auto conn = find(id);
    if (!conn) {
        return std::nullopt;
    }
    return conn->state.load();
}

std::optional<AuthClaims> Gateway::claimsOf(ConnectionId id) const
{
    auto conn = find(id);
    if (!conn) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lk(conn->mutex);
    if (conn->tenantId.empty()) {
        return std::nullopt;
    }
    return AuthClaims{conn->tenantId, conn->userId, conn->role};
}

std::size_t Gateway::activeConnections() const
{
    std::lock_guard<std::mutex> lk(connectionsMutex_);
    return static_cast<std::size_t>(std::count_if(connections_.begin(), connections_.end(), [](const auto& entry) {
        return entry.second->state.load() == ConnectionState::Active;
    }));
}

std::size_t Gateway::connectionCount() const
{
    std::lock_guard<std::mutex> lk(connectionsMutex_);
    return connections_.size();
}

GatewayStats Gateway::stats() const
{
    return GatewayStats{fanouts_.load(), writes_.load(), writeFailures_.load(),
                        authFailures_.load(), heartbeatTimeouts_.load()};
}

} // namespace gateway
