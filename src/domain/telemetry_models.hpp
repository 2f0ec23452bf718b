// 遥测读数模型以及 JSON 序列化
// Reading 由外部采集适配器（Modbus/OPC-UA/MQTT 等）产生，本系统只读不改

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "domain/time_format.hpp"

namespace domain {

// 读数质量
enum class Quality
{
    Good,
    Bad,
    Uncertain
};

// 单条读数（不可变值，构造后只以 const 引用传递）
struct Reading
{
    std::string tenantId;
    std::string wellId;
    std::string sourceConnectionId;    // 采集端的连接标识（比如某个 Modbus 网关）
    std::string tagName;               // "pressure"、"temperature" 等
    double value{0.0};
    Quality quality{Quality::Good};
    Timestamp timestamp{};
    std::string sourceProtocol;        // "modbus"、"opcua" ...
};

inline const char* qualityName(Quality quality)
{
    switch (quality)
    {
    case Quality::Good: return "Good";
    case Quality::Bad: return "Bad";
    case Quality::Uncertain: return "Uncertain";
    default: return "Unknown";
    }
}

// 只认三个固定的名字，大小写敏感
inline std::optional<Quality> qualityFromName(std::string_view name)
{
    if (name == "Good") return Quality::Good;
    if (name == "Bad") return Quality::Bad;
    if (name == "Uncertain") return Quality::Uncertain;
    return std::nullopt;
}

// Reading → JSON，字段名与线上协议一致
inline nlohmann::json toJson(const Reading& reading)
{
    return nlohmann::json
    {
        {"tenant_id", reading.tenantId},
        {"well_id", reading.wellId},
        {"source_connection_id", reading.sourceConnectionId},
        {"tag_name", reading.tagName},
        {"value", reading.value},
        {"quality", qualityName(reading.quality)},
        {"timestamp", formatUtc(reading.timestamp)},
        {"source_protocol", reading.sourceProtocol}
    };
}

} // namespace domain
