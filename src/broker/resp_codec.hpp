// RESP2 编解码（Redis 线上协议）
// 命令：*<n>\r\n 后跟 n 个 $<len>\r\n<bytes>\r\n
// 解析器是增量的：TCP 分包到达时先 feed，再循环 next() 取完整的值

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace broker::resp {

// 把参数编码成一条命令，例如 {"PUBLISH", "readings:t1", "{...}"}
std::string encodeCommand(const std::vector<std::string>& args);

struct Value {
    enum class Type { SimpleString, Error, Integer, BulkString, Null, Array };

    Type type{Type::Null};
    std::string text;           // SimpleString / Error / BulkString
    int64_t integer{0};         // Integer
    std::vector<Value> elements;    // Array

    bool isArray() const { return type == Type::Array; }
    bool isError() const { return type == Type::Error; }
    bool isString() const { return type == Type::SimpleString || type == Type::BulkString; }
};

class Parser {
public:
    void feed(std::string_view data) { buffer_.append(data.data(), data.size()); }

    // 取下一个完整的值；数据不够返回 nullopt
    // 协议错误抛出 std::runtime_error，调用方应断开连接
    std::optional<Value> next();

    void reset() { buffer_.clear(); }
    std::size_t buffered() const { return buffer_.size(); }

private:
    // 从 pos 开始解析一个值，成功时 pos 移到值之后
    std::optional<Value> parseAt(std::size_t& pos, int depth) const;
    std::optional<std::string_view> readLine(std::size_t& pos) const;

    std::string buffer_;
};

} // namespace broker::resp
