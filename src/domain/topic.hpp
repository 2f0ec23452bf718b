// 租户 topic 命名：readings:{tenant_id}
// 网关进程用 readings:* 一次性模式订阅所有租户

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace domain {

inline constexpr std::string_view kReadingsTopicPrefix = "readings:";
inline constexpr std::string_view kAllReadingsPattern = "readings:*";

inline std::string topicForTenant(std::string_view tenantId)
{
    std::string topic(kReadingsTopicPrefix);
    topic.append(tenantId);
    return topic;
}

// 从 topic 中解析租户；不在 readings: 命名空间或租户为空时返回 nullopt
inline std::optional<std::string> tenantFromTopic(std::string_view topic)
{
    if (topic.size() <= kReadingsTopicPrefix.size() ||
        topic.substr(0, kReadingsTopicPrefix.size()) != kReadingsTopicPrefix) {
        return std::nullopt;
    }
    return std::string(topic.substr(kReadingsTopicPrefix.size()));
}

} // namespace domain
