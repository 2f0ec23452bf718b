#include "gateway/auth_verifier.hpp"

#include "core/errors.hpp"
#include "core/logger.hpp"
#include "domain/reading_validator.hpp"

namespace gateway {

StaticTokenVerifier::StaticTokenVerifier(const core::AuthConfig& config, Clock clock)
    : clock_(std::move(clock))
{
    for (const auto& entry : config.tokens)
    {
        // 令牌表里租户 id 不合法属于配置错误，跳过该项
        if (entry.token.empty() || !domain::isValidTenantId(entry.tenantId)) {
            LOG_WARN("auth", "Ignoring token entry for tenant '", entry.tenantId, "': invalid token or tenant id");
            continue;
        }
        tokens_[entry.token] = entry;
    }
}

std::future<AuthClaims> StaticTokenVerifier::verify(const std::string& credential)
{
    std::promise<AuthClaims> promise;
    try {
        promise.set_value(check(credential));
    } catch (const core::AuthenticationError&) {
        promise.set_exception(std::current_exception());
    }
    return promise.get_future();
}

AuthClaims StaticTokenVerifier::check(const std::string& credential) const
{
    if (credential.empty()) {
        throw core::AuthenticationError("missing credential");
    }

    auto it = tokens_.find(credential);
    if (it == tokens_.end()) {
        throw core::AuthenticationError("unknown credential");
    }

    const auto& entry = it->second;
    if (entry.expiresAt)
    {
        auto now = std::chrono::duration_cast<std::chrono::seconds>(clock_().time_since_epoch()).count();
        if (now >= *entry.expiresAt) {
            throw core::AuthenticationError("credential expired");
        }
    }
    return AuthClaims{entry.tenantId, entry.userId, entry.role};
}

} // namespace gateway
