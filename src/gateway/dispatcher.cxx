#include "gateway/dispatcher.hpp"

#include "core/logger.hpp"

namespace gateway {

Dispatcher::Dispatcher(const ConnectionRegistry& registry)
    : registry_(registry) {
}

ConnectionSet Dispatcher::recipientsFor(const domain::Reading& reading) const
{
    return registry_.recipientsFor(reading.tenantId, reading.wellId);
}

void Dispatcher::setDeliveryHandler(DeliveryHandler handler)
{
    std::lock_guard<std::mutex> lk(handlerMutex_);
    handler_ = std::move(handler);
}

std::size_t Dispatcher::dispatch(const domain::Reading& reading)
{
    auto recipients = recipientsFor(reading);
    if (recipients.empty())
    {
        ++unrouted_;
        LOG_TRACE("dispatcher", "No recipients for ", reading.tenantId, "/", reading.wellId);
        return 0;
    }

    DeliveryHandler handler;
    {
        std::lock_guard<std::mutex> lk(handlerMutex_);
        handler = handler_;
    }
    if (handler) {
        handler(recipients, reading);
    }
    ++dispatched_;
    return recipients.size();
}

} // namespace gateway
