#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace monitoring {

// 单个组件的健康状态
struct HealthState {
    bool healthy{false};
    std::string detail;
    std::chrono::system_clock::time_point updatedAt;
};

// 网关各组件（gateway / subscriber / broker / auth）上报自己的状态，
// 后台线程定期把快照写成 JSON 文件，供外部探针读取
class HealthMonitor {
public:
    // path 为空时只在内存里维护，不落盘
    HealthMonitor(std::string path, std::chrono::seconds interval);
    ~HealthMonitor();

    void start();
    void stop();

    void update(const std::string& component, bool healthy, const std::string& detail);

    std::map<std::string, HealthState> snapshot() const;
    std::optional<HealthState> stateOf(const std::string& component) const;

    // 没有上报过的组件不算不健康
    bool allHealthy() const;

    // 立即写一次文件
    void flush();

private:
    void writerLoop();

    std::string filePath_;
    std::chrono::seconds interval_;

    std::map<std::string, HealthState> states_;
    mutable std::mutex mutex_;

    // 只用于打断写盘线程的等待
    std::mutex waitMutex_;
    std::condition_variable cv_;

    std::thread worker_;
    std::atomic<bool> running_{false};
};

} // namespace monitoring
