#include "gateway/connection_registry.hpp"

#include <mutex>

namespace gateway {

bool ConnectionRegistry::addConnection(const std::string& tenantId, ConnectionId id)
{
    std::unique_lock<std::shared_mutex> lk(mutex_);
    auto [it, inserted] = connections_.try_emplace(id, Membership{tenantId, {}});
    if (!inserted) {
        return false;
    }
    tenants_[tenantId].insert(id);
    return true;
}

bool ConnectionRegistry::removeConnection(ConnectionId id)
{
    std::unique_lock<std::shared_mutex> lk(mutex_);
    auto it = connections_.find(id);
    if (it == connections_.end()) {
        return false;
    }

    const auto& membership = it->second;
    // 只遍历这个连接自己订阅过的井
    for (const auto& well : membership.wells)
    {
        auto wit = wells_.find(WellKey{membership.tenantId, well});
        if (wit == wells_.end()) {
            continue;
        }
        wit->second.erase(id);
        if (wit->second.empty()) {
            wells_.erase(wit);
        }
    }

    if (auto tit = tenants_.find(membership.tenantId); tit != tenants_.end())
    {
        tit->second.erase(id);
        if (tit->second.empty()) {
            tenants_.erase(tit);
        }
    }

    connections_.erase(it);
    return true;
}

bool ConnectionRegistry::subscribeWell(ConnectionId id, const std::string& wellId)
{
    std::unique_lock<std::shared_mutex> lk(mutex_);
    auto it = connections_.find(id);
    if (it == connections_.end()) {
        return false;
    }
    it->second.wells.insert(wellId);
    wells_[WellKey{it->second.tenantId, wellId}].insert(id);
    return true;
}

bool ConnectionRegistry::unsubscribeWell(ConnectionId id, const std::string& wellId)
{
    std::unique_lock<std::shared_mutex> lk(mutex_);
    auto it = connections_.find(id);
    if (it == connections_.end()) {
        return false;
    }
    it->second.wells.erase(wellId);

    auto wit = wells_.find(WellKey{it->second.tenantId, wellId});
    if (wit != wells_.end())
    {
        wit->second.erase(id);
        if (wit->second.empty()) {
            wells_.erase(wit);
        }
    }
    return true;
}

std::optional<std::string> ConnectionRegistry::tenantOf(ConnectionId id) const
{
    std::shared_lock<std::shared_mutex> lk(mutex_);
    auto it = connections_.find(id);
    if (it == connections_.end()) {
        return std::nullopt;
    }
    return it->second.tenantId;
}

std::set<std::string> ConnectionRegistry::wellsOf(ConnectionId id) const
{
    std::shared_lock<std::shared_mutex> lk(mutex_);
    auto it = connections_.find(id);
    if (it == connections_.end()) {
        return {};
    }
    return it->second.wells;
}

ConnectionSet ConnectionRegistry::tenantConnections(const std::string& tenantId) const
{
    std::shared_lock<std::shared_mutex> lk(mutex_);
    auto it = tenants_.find(tenantId);
    return it == tenants_.end() ? ConnectionSet{} : it->second;
}

ConnectionSet ConnectionRegistry::wellSubscribers(const std::string& tenantId, const std::string& wellId) const
{
    std::shared_lock<std::shared_mutex> lk(mutex_);
    auto it = wells_.find(WellKey{tenantId, wellId});
    return it == wells_.end() ? ConnectionSet{} : it->second;
}

ConnectionSet ConnectionRegistry::recipientsFor(const std::string& tenantId, const std::string& wellId) const
{
    // 两次查找在同一把读锁下完成，不会看到半更新的状态
    std::shared_lock<std::shared_mutex> lk(mutex_);
    if (auto wit = wells_.find(WellKey{tenantId, wellId}); wit != wells_.end() && !wit->second.empty()) {
        return wit->second;
    }
    auto tit = tenants_.find(tenantId);
    return tit == tenants_.end() ? ConnectionSet{} : tit->second;
}

std::size_t ConnectionRegistry::connectionCount() const
{
    std::shared_lock<std::shared_mutex> lk(mutex_);
    return connections_.size();
}

std::size_t ConnectionRegistry::tenantCount() const
{
    std::shared_lock<std::shared_mutex> lk(mutex_);
    return tenants_.size();
}

std::size_t ConnectionRegistry::wellSubscriptionCount() const
{
    std::shared_lock<std::shared_mutex> lk(mutex_);
    std::size_t total = 0;
    for (const auto& [_, subscribers] : wells_) {
        total += subscribers.size();
    }
    return total;
}

} // namespace gateway
