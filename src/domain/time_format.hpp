// UTC 时间点 <-> ISO-8601 字符串（2024-01-14T10:30:45.123Z）

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace domain {

using Timestamp = std::chrono::system_clock::time_point;

// 输出毫秒精度，以 Z 结尾
std::string formatUtc(Timestamp tp);

// 接受 YYYY-MM-DDTHH:MM:SS[.fraction](Z|+00:00)，日期和时间之间也可以是空格
std::optional<Timestamp> parseUtc(std::string_view text);

inline std::string nowUtc()
{
    return formatUtc(std::chrono::system_clock::now());
}

} // namespace domain
