// 连接注册表：只记录连接 id 与租户、井的归属关系，不持有 socket
// 订阅线程（分发查询）、连接回调线程（增删订阅）和诊断读取会并发访问，
// 内部用一把读写锁保护全部索引，所以每个操作都是原子的

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace gateway {

using ConnectionId = uint64_t;
using ConnectionSet = std::set<ConnectionId>;

class ConnectionRegistry {
public:
    // 已存在的 id 返回 false，注册表保持不变
    bool addConnection(const std::string& tenantId, ConnectionId id);

    // 幂等：未知 id 返回 false；清理该连接出现过的所有井集合
    bool removeConnection(ConnectionId id);

    // 未注册的连接返回 false；重复订阅同一口井不算错误
    bool subscribeWell(ConnectionId id, const std::string& wellId);
    bool unsubscribeWell(ConnectionId id, const std::string& wellId);

    std::optional<std::string> tenantOf(ConnectionId id) const;
    std::set<std::string> wellsOf(ConnectionId id) const;
    ConnectionSet tenantConnections(const std::string& tenantId) const;
    ConnectionSet wellSubscribers(const std::string& tenantId, const std::string& wellId) const;

    // 两级路由：井有专门订阅者就只发给它们，否则发给整个租户
    ConnectionSet recipientsFor(const std::string& tenantId, const std::string& wellId) const;

    std::size_t connectionCount() const;
    std::size_t tenantCount() const;
    std::size_t wellSubscriptionCount() const;

private:
    // 井 id 只在租户内唯一，所以键是 (tenant, well)
    using WellKey = std::pair<std::string, std::string>;

    struct Membership {
        std::string tenantId;
        std::set<std::string> wells;
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<ConnectionId, Membership> connections_;
    std::map<std::string, ConnectionSet> tenants_;
    std::map<WellKey, ConnectionSet> wells_;
};

} // namespace gateway
