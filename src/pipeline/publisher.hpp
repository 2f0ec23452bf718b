// 发布端：校验读数 → 序列化 → 发布到租户 topic（readings:{tenant_id}）
// 代理连接失败直接抛给调用者（采集适配器），由它决定重试还是丢弃，这里不缓存

#pragma once

#include <atomic>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "broker/broker_client.hpp"
#include "core/errors.hpp"
#include "domain/reading_validator.hpp"
#include "domain/telemetry_models.hpp"

namespace pipeline {

// 校验未通过的候选读数
struct Rejection {
    std::size_t index;          // 在输入批次中的位置
    std::string field;          // 第一个失败字段
    std::string message;
};

struct BatchPublishResult {
    std::size_t published{0};                 // 已交给代理的读数条数
    std::size_t topics{0};                    // 实际发布的 topic 数（按租户分组后）
    std::vector<domain::Reading> failed;      // 代理发布失败的读数（调用者可重试）
    std::vector<Rejection> rejected;          // 校验失败的读数（不应重试）
    std::string brokerError;                  // 最后一次代理错误

    bool ok() const { return failed.empty() && rejected.empty(); }
};

class Publisher {
public:
    Publisher(broker::BrokerClient& broker, const domain::ReadingValidator& validator);

    // 失败抛出 core::ValidationError 或 core::BrokerConnectionError
    void publish(const domain::Reading& reading);
    domain::Reading publish(const nlohmann::json& candidate);

    // 按租户分组，每个租户一个负载（JSON 数组）；传输支持时一次管道化写出
    // 不会悄悄丢掉任何一条：失败的和被拒绝的都在结果里
    BatchPublishResult publishBatch(const std::vector<domain::Reading>& readings);
    BatchPublishResult publishBatch(const std::vector<nlohmann::json>& candidates);

    uint64_t publishedCount() const { return published_.load(); }

    // 单条读数的线上编码
    static std::string serialize(const domain::Reading& reading);

private:
    BatchPublishResult publishValidated(std::vector<domain::Reading> readings, BatchPublishResult result);

    broker::BrokerClient& broker_;
    const domain::ReadingValidator& validator_;
    std::atomic<uint64_t> published_{0};
};

} // namespace pipeline
