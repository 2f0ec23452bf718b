// 鉴权边界：网关只把握手中拿到的凭证交给外部校验方，
// 得到 (tenant_id, user_id, role)，之后这三个属性在连接生命周期内不可变

#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <string>
#include <unordered_map>

#include "core/configuration.hpp"

namespace gateway {

struct AuthClaims {
    std::string tenantId;
    std::string userId;
    std::string role;
};

class AuthVerifier {
public:
    virtual ~AuthVerifier() = default;

    // 必须立即返回，耗时的校验放进 future 里完成
    // 失败时 future 中保存 core::AuthenticationError；网关按各自的截止时间轮询结果
    virtual std::future<AuthClaims> verify(const std::string& credential) = 0;
};

// 配置文件中的静态令牌表，用于开发和测试
class StaticTokenVerifier : public AuthVerifier {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit StaticTokenVerifier(const core::AuthConfig& config,
                                 Clock clock = [] { return std::chrono::system_clock::now(); });

    std::future<AuthClaims> verify(const std::string& credential) override;

    std::size_t size() const { return tokens_.size(); }

private:
    AuthClaims check(const std::string& credential) const;

    std::unordered_map<std::string, core::AuthTokenEntry> tokens_;
    Clock clock_;
};

} // namespace gateway
