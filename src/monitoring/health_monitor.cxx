// 定期把各组件的健康状态写入本地 JSON 文件，供外部监控（k8s 探针、运维脚本）读取

#include "monitoring/health_monitor.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

#include "core/logger.hpp"
#include "domain/time_format.hpp"

namespace monitoring {

HealthMonitor::HealthMonitor(std::string path, std::chrono::seconds interval)
    : filePath_(std::move(path))
    , interval_(interval) {
}

HealthMonitor::~HealthMonitor() {
    stop();
}

void HealthMonitor::start() {
    if (running_.exchange(true)) {
        return;
    }
    worker_ = std::thread(&HealthMonitor::writerLoop, this);
}

void HealthMonitor::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void HealthMonitor::update(const std::string& component, bool healthy, const std::string& detail) {
    bool changed = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = states_.find(component);
        changed = (it == states_.end() || it->second.healthy != healthy);
        states_[component] = HealthState{healthy, detail, std::chrono::system_clock::now()};
    }
    // 只在健康状态翻转时记日志，避免刷屏
    if (changed) {
        if (healthy) {
            LOG_INFO("health_monitor", component, " is healthy: ", detail);
        } else {
            LOG_WARN("health_monitor", component, " is unhealthy: ", detail);
        }
    }
}

std::map<std::string, HealthState> HealthMonitor::snapshot() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return states_;
}

std::optional<HealthState> HealthMonitor::stateOf(const std::string& component) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = states_.find(component);
    if (it == states_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool HealthMonitor::allHealthy() const {
    std::lock_guard<std::mutex> lk(mutex_);
    for (const auto& [_, state] : states_) {
        if (!state.healthy) {
            return false;
        }
    }
    return true;
}

void HealthMonitor::writerLoop() {
    while (running_) {
        flush();

        std::unique_lock<std::mutex> lk(waitMutex_);
        cv_.wait_for(lk, interval_, [this] { return !running_.load(); });
    }

    // 线程退出前最后写一次
    flush();
}

void HealthMonitor::flush() {
    if (filePath_.empty()) {
        return;
    }

    auto states = snapshot();

    nlohmann::json json;
    bool overall = true;
    json["components"] = nlohmann::json::object();
    for (const auto& [component, state] : states) {
        overall = overall && state.healthy;
        json["components"][component] = {
            {"healthy", state.healthy},
            {"detail", state.detail},
            {"updated_at", domain::formatUtc(state.updatedAt)}
        };
    }
    json["healthy"] = overall;
    json["generated_at"] = domain::formatUtc(std::chrono::system_clock::now());

    try {
        auto target = std::filesystem::path(filePath_);
        if (target.has_parent_path()) {
            std::filesystem::create_directories(target.parent_path());
        }

        // 先写临时文件再改名，读取方不会看到写了一半的内容
        auto tmp = target;
        tmp += ".tmp";
        {
            std::ofstream out(tmp, std::ios::out | std::ios::trunc);
            out << json.dump(4);
        }
        std::filesystem::rename(tmp, target);
    } catch (const std::exception& ex) {
        LOG_ERROR("health_monitor", "Failed to persist health information: ", ex.what());
    }
}

} // namespace monitoring
