// 连接建立后客户端先发一个 HTTP/1.1 风格的请求头：
//   GET /stream?token=xxx HTTP/1.1\r\n
//   Authorization: Bearer xxx\r\n
//   \r\n
// 之后才是按行分隔的 JSON 帧

#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace gateway {

constexpr std::size_t kMaxHandshakeBytes = 8 * 1024;

struct HandshakeRequest {
    std::string method;
    std::string target;     // 原始请求目标，含查询串
    std::string path;
    std::string version;
    std::map<std::string, std::string> headers;     // 头名已转小写
    std::map<std::string, std::string> query;       // 已做百分号解码
};

// 在缓冲区里找请求头结束位置，返回 (头长度, 包含空行在内的总长度)
// 兼容只用 \n 换行的客户端
std::optional<std::pair<std::size_t, std::size_t>> findHeadEnd(std::string_view buffer);

// 格式错误抛出 core::AuthenticationError
HandshakeRequest parseHandshake(std::string_view head);

// 先看 Authorization: Bearer，再看查询参数 token / access_token
std::optional<std::string> extractCredential(const HandshakeRequest& request);

// 客户端使用：构造握手请求头
std::string buildHandshake(const std::string& host, const std::string& path, const std::string& token);

} // namespace gateway
