#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include "core/errors.hpp"
#include "core/logger.hpp"
#include "gateway/handshake.hpp"

namespace testing_support {
namespace {

// 测试输出里只保留严重错误
class QuietLogs : public ::testing::Environment {
public:
    void SetUp() override { core::Logger::instance().configure(core::LogLevel::Critical, "", true); }
};

const auto* const kQuietLogs = ::testing::AddGlobalTestEnvironment(new QuietLogs);

std::vector<nlohmann::json> splitFrames(const std::string& written)
{
    std::vector<nlohmann::json> out;
    std::size_t start = 0;
    std::size_t pos;
    while ((pos = written.find('\n', start)) != std::string::npos)
    {
        out.push_back(nlohmann::json::parse(written.substr(start, pos - start)));
        start = pos + 1;
    }
    return out;
}

} // namespace

domain::Timestamp fixedNow()
{
    return *domain::parseUtc("2025-01-01T00:00:00Z");
}

domain::ReadingValidator makeValidator()
{
    return domain::ReadingValidator(std::chrono::minutes(5), [] { return fixedNow(); });
}

nlohmann::json readingJson(const std::string& tenant, const std::string& well,
                           const std::string& tag, double value, const std::string& quality)
{
    return nlohmann::json{
        {"tenant_id", tenant},
        {"well_id", well},
        {"source_connection_id", "modbus-gw-1"},
        {"tag_name", tag},
        {"value", value},
        {"quality", quality},
        {"timestamp", "2024-12-31T23:59:30.250Z"},
        {"source_protocol", "modbus"}
    };
}

domain::Reading reading(const std::string& tenant, const std::string& well,
                        const std::string& tag, double value)
{
    domain::Reading r;
    r.tenantId = tenant;
    r.wellId = well;
    r.sourceConnectionId = "modbus-gw-1";
    r.tagName = tag;
    r.value = value;
    r.quality = domain::Quality::Good;
    r.timestamp = fixedNow() - std::chrono::seconds(30);
    r.sourceProtocol = "modbus";
    return r;
}

bool waitUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

// ------------------------------------------------------------------

void FakeTransport::send(gateway::ConnectionId id, const std::string& bytes)
{
    std::lock_guard<std::mutex> lk(mutex_);
    if (failing_.count(id) != 0) {
        throw core::SocketWriteError(id, "simulated broken pipe");
    }
    written_[id] += bytes;
}

void FakeTransport::disconnect(gateway::ConnectionId id)
{
    std::lock_guard<std::mutex> lk(mutex_);
    ++disconnects_[id];
}

void FakeTransport::failWritesTo(gateway::ConnectionId id)
{
    std::lock_guard<std::mutex> lk(mutex_);
    failing_.insert(id);
}

std::vector<nlohmann::json> FakeTransport::frames(gateway::ConnectionId id) const
{
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = written_.find(id);
    return it == written_.end() ? std::vector<nlohmann::json>{} : splitFrames(it->second);
}

std::vector<nlohmann::json> FakeTransport::framesOfType(gateway::ConnectionId id, const std::string& type) const
{
    std::vector<nlohmann::json> out;
    for (auto& frame : frames(id)) {
        if (frame.value("type", std::string{}) == type) {
            out.push_back(std::move(frame));
        }
    }
    return out;
}

std::size_t FakeTransport::disconnectCount(gateway::ConnectionId id) const
{
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = disconnects_.find(id);
    return it == disconnects_.end() ? 0 : it->second;
}

// ------------------------------------------------------------------

void FakeVerifier::allow(const std::string& token, gateway::AuthClaims claims)
{
    std::lock_guard<std::mutex> lk(mutex_);
    tokens_[token] = std::move(claims);
}

void FakeVerifier::allow(const std::string& token, gateway::AuthClaims claims, std::chrono::milliseconds delay)
{
    std::lock_guard<std::mutex> lk(mutex_);
    tokens_[token] = std::move(claims);
    delays_[token] = delay;
}

std::future<gateway::AuthClaims> FakeVerifier::verify(const std::string& credential)
{
    std::lock_guard<std::mutex> lk(mutex_);
    ++calls_;

    if (credential.rfind("slow", 0) == 0)
    {
        // promise 留在这里不兑现，模拟鉴权服务无响应
        stalled_.emplace_back();
        return stalled_.back().get_future();
    }

    auto delayed = delays_.find(credential);
    if (delayed != delays_.end() && delayed->second.count() > 0)
    {
        auto claims = tokens_.at(credential);
        auto delay = delayed->second;
        return std::async(std::launch::async, [claims, delay] {
            std::this_thread::sleep_for(delay);
            return claims;
        });
    }

    std::promise<gateway::AuthClaims> promise;
    auto it = tokens_.find(credential);
    if (it == tokens_.end()) {
        promise.set_exception(std::make_exception_ptr(core::AuthenticationError("unknown credential")));
    } else {
        promise.set_value(it->second);
    }
    return promise.get_future();
}

int FakeVerifier::calls() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return calls_;
}

std::string handshakeFor(const std::string& token)
{
    return gateway::buildHandshake("localhost", "/stream", token);
}

} // namespace testing_support
