// 指数退避：第 n 次重试等待 base * 2^n，封顶 maxDelay
// 订阅端重连代理、客户端重连网关都用它

#pragma once

#include <chrono>
#include <cstdint>

namespace core {

class ExponentialBackoff {
public:
    // maxAttempts 为 0 表示不限次数
    ExponentialBackoff(std::chrono::milliseconds base,
                       std::chrono::milliseconds maxDelay,
                       uint32_t maxAttempts = 0)
        : base_(base)
        , maxDelay_(maxDelay < base ? base : maxDelay)
        , maxAttempts_(maxAttempts) {}

    // 第 attempt 次（从 0 开始）重试前应等待的时间
    std::chrono::milliseconds delayFor(uint32_t attempt) const
    {
        auto delay = base_;
        for (uint32_t i = 0; i < attempt && delay < maxDelay_; ++i) {
            delay *= 2;
        }
        return delay < maxDelay_ ? delay : maxDelay_;
    }

    // 取下一次等待时间并计数
    std::chrono::milliseconds next() { return delayFor(attempts_++); }

    bool exhausted() const { return maxAttempts_ != 0 && attempts_ >= maxAttempts_; }

    void reset() { attempts_ = 0; }

    uint32_t attempts() const { return attempts_; }
    uint32_t maxAttempts() const { return maxAttempts_; }

private:
    std::chrono::milliseconds base_;
    std::chrono::milliseconds maxDelay_;
    uint32_t maxAttempts_;
    uint32_t attempts_{0};
};

} // namespace core
