#include "pipeline/publisher.hpp"

#include <map>

#include "core/logger.hpp"
#include "domain/topic.hpp"

namespace pipeline {

Publisher::Publisher(broker::BrokerClient& broker, const domain::ReadingValidator& validator)
    : broker_(broker)
    , validator_(validator) {
}

std::string Publisher::serialize(const domain::Reading& reading)
{
    return domain::toJson(reading).dump();
}

void Publisher::publish(const domain::Reading& reading)
{
    // 先校验再序列化，序列化依赖字段已是合法 UTF-8
    validator_.validate(reading);
    broker_.publish(domain::topicForTenant(reading.tenantId), serialize(reading));
    ++published_;
}

domain::Reading Publisher::publish(const nlohmann::json& candidate)
{
    auto reading = validator_.validate(candidate);
    broker_.publish(domain::topicForTenant(reading.tenantId), serialize(reading));
    ++published_;
    return reading;
}

BatchPublishResult Publisher::publishBatch(const std::vector<domain::Reading>& readings)
{
    BatchPublishResult result;
    std::vector<domain::Reading> valid;
    valid.reserve(readings.size());

    // 逐条校验，坏读数只记入 rejected，不影响同批其他读数

    for (std::size_t i = 0; i < readings.size(); ++i)
    {
        try {
            validator_.validate(readings[i]);
            valid.push_back(readings[i]);
        } catch (const core::ValidationError& ex) {
            LOG_WARN("publisher", "Dropping reading #", i, " of batch: ", ex.what());
            result.rejected.push_back(Rejection{i, ex.field(), ex.what()});
        }
    }
    return publishValidated(std::move(valid), std::move(result));
}

BatchPublishResult Publisher::publishBatch(const std::vector<nlohmann::json>& candidates)
{
    BatchPublishResult result;
    std::vector<domain::Reading> valid;
    valid.reserve(candidates.size());

    for (std::size_t i = 0; i < candidates.size(); ++i)
    {
        try {
            valid.push_back(validator_.validate(candidates[i]));
        } catch (const core::ValidationError& ex) {
            LOG_WARN("publisher", "Dropping reading #", i, " of batch: ", ex.what());
            result.rejected.push_back(Rejection{i, ex.field(), ex.what()});
        }
    }
    return publishValidated(std::move(valid), std::move(result));
}

BatchPublishResult Publisher::publishValidated(std::vector<domain::Reading> readings, BatchPublishResult result)
{
    // 按租户分组：每个租户只发一次 topic
    std::map<std::string, std::vector<domain::Reading>> groups;
    for (auto& reading : readings) {
        groups[reading.tenantId].push_back(std::move(reading));
    }
    if (groups.empty()) {
        return result;
    }

    // 每个租户一条消息，payload 是该租户读数的 JSON 数组
    std::vector<broker::BrokerMessage> messages;
    messages.reserve(groups.size());
    for (const auto& [tenant, group] : groups)
    {
        auto payload = nlohmann::json::array();
        for (const auto& reading : group) {
            payload.push_back(domain::toJson(reading));
        }
        messages.push_back(broker::BrokerMessage{domain::topicForTenant(tenant), payload.dump()});
    }

    if (broker_.supportsPipelining())
    {
        // 管道化是整体成功或整体失败
        try {
            broker_.publishPipelined(messages);
            for (const auto& [_, group] : groups) {
                result.published += group.size();
            }
            result.topics = messages.size();
        } catch (const core::BrokerConnectionError& ex) {
            LOG_ERROR("publisher", "Pipelined batch of ", messages.size(), " topics failed: ", ex.what());
            result.brokerError = ex.what();
            for (auto& [_, group] : groups) {
                result.failed.insert(result.failed.end(), group.begin(), group.end());
            }
        }
    }
    else
    {
        // 逐 topic 发布，失败只影响对应租户
        std::size_t i = 0;
        for (auto& [tenant, group] : groups)
        {
            try {
                broker_.publish(messages[i].topic, messages[i].payload);
                result.published += group.size();
                ++result.topics;
            } catch (const core::BrokerConnectionError& ex) {
                LOG_ERROR("publisher", "Publishing ", group.size(), " readings for tenant ", tenant, " failed: ", ex.what());
                result.brokerError = ex.what();
                result.failed.insert(result.failed.end(), group.begin(), group.end());
            }
            ++i;
        }
    }

    published_ += result.published;
    return result;
}

} // namespace pipeline
