// 分发器：订阅端每收到一条合法读数就调用 dispatch()，
// 算出接收者集合后交给网关做扇出写

#pragma once

#include <atomic>
#include <functional>
#include <mutex>

#include "domain/telemetry_models.hpp"
#include "gateway/connection_registry.hpp"

namespace gateway {

class Dispatcher {
public:
    using DeliveryHandler = std::function<void(const ConnectionSet&, const domain::Reading&)>;

    explicit Dispatcher(const ConnectionRegistry& registry);

    // 井级订阅者非空时只返回它们，否则返回整个租户的连接
    ConnectionSet recipientsFor(const domain::Reading& reading) const;

    void setDeliveryHandler(DeliveryHandler handler);

    // 返回接收者数量；没有接收者时不调用投递回调
    std::size_t dispatch(const domain::Reading& reading);

    uint64_t dispatched() const { return dispatched_.load(); }
    uint64_t unrouted() const { return unrouted_.load(); }

private:
    const ConnectionRegistry& registry_;

    std::mutex handlerMutex_;
    DeliveryHandler handler_;

    std::atomic<uint64_t> dispatched_{0};
    std::atomic<uint64_t> unrouted_{0};
};

} // namespace gateway
