// 读数校验：把边界上无类型的 JSON 候选值规范化成 Reading，或给出第一个失败的字段
// 纯函数，无副作用；调用方负责丢弃和记录，绝不转发半合法的读数

#pragma once

#include <chrono>
#include <functional>

#include <nlohmann/json.hpp>

#include "core/errors.hpp"
#include "domain/telemetry_models.hpp"

namespace domain {

class ReadingValidator {
public:
    using Clock = std::function<Timestamp()>;

    // maxFutureSkew: 时间戳允许超前当前时间的最大值
    // clock: 当前时间来源，测试中可以注入固定时间
    explicit ReadingValidator(std::chrono::seconds maxFutureSkew = std::chrono::minutes(5),
                              Clock clock = [] { return std::chrono::system_clock::now(); });

    // 解析并校验候选 JSON，失败抛出 core::ValidationError
    Reading validate(const nlohmann::json& candidate) const;

    // 校验一个已经有类型的读数（发布前使用），失败抛出 core::ValidationError
    void validate(const Reading& reading) const;

    std::chrono::seconds maxFutureSkew() const { return maxFutureSkew_; }

private:
    void checkTimestamp(Timestamp ts) const;

    std::chrono::seconds maxFutureSkew_;
    Clock clock_;
};

// 租户 id 会拼进 topic，不能含空白、控制字符和 glob 元字符
bool isValidTenantId(std::string_view tenantId);

} // namespace domain
