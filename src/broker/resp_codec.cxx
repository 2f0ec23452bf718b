#include "broker/resp_codec.hpp"

#include <stdexcept>

namespace broker::resp {
namespace {

constexpr int kMaxDepth = 8;
constexpr std::string_view kCrlf = "\r\n";

int64_t parseInteger(std::string_view text)
{
    if (text.empty()) {
        throw std::runtime_error("RESP: empty integer");
    }
    bool negative = false;
    std::size_t i = 0;
    if (text[0] == '-' || text[0] == '+') {
        negative = text[0] == '-';
        i = 1;
    }
    if (i >= text.size()) {
        throw std::runtime_error("RESP: malformed integer");
    }
    int64_t value = 0;
    for (; i < text.size(); ++i) {
        char c = text[i];
        if (c < '0' || c > '9') {
            throw std::runtime_error("RESP: malformed integer '" + std::string(text) + "'");
        }
        value = value * 10 + (c - '0');
    }
    return negative ? -value : value;
}

} // namespace

std::string encodeCommand(const std::vector<std::string>& args)
{
    std::string out;
    out += '*';
    out += std::to_string(args.size());
    out += kCrlf;
    for (const auto& arg : args) {
        out += '$';
        out += std::to_string(arg.size());
        out += kCrlf;
        out += arg;
        out += kCrlf;
    }
    return out;
}

std::optional<Value> Parser::next()
{
    std::size_t pos = 0;
    auto value = parseAt(pos, 0);
    if (value) {
        buffer_.erase(0, pos);
    }
    return value;
}

std::optional<std::string_view> Parser::readLine(std::size_t& pos) const
{
    auto end = buffer_.find(kCrlf, pos);
    if (end == std::string::npos) {
        return std::nullopt;
    }
    std::string_view line(buffer_.data() + pos, end - pos);
    pos = end + kCrlf.size();
    return line;
}

std::optional<Value> Parser::parseAt(std::size_t& pos, int depth) const
{
    if (depth > kMaxDepth) {
        throw std::runtime_error("RESP: nesting too deep");
    }
    if (pos >= buffer_.size()) {
        return std::nullopt;
    }

    char marker = buffer_[pos];
    std::size_t cursor = pos + 1;
    auto line = readLine(cursor);
    if (!line) {
        return std::nullopt;
    }

    Value value;
    switch (marker)
    {
    case '+':
        value.type = Value::Type::SimpleString;
        value.text = std::string(*line);
        break;
    case '-':
        value.type = Value::Type::Error;
        value.text = std::string(*line);
        break;
    case ':':
        value.type = Value::Type::Integer;
        value.integer = parseInteger(*line);
        break;
    case '$':
    {
        auto length = parseInteger(*line);
        if (length < 0) {
            value.type = Value::Type::Null;
            break;
        }
        auto needed = static_cast<std::size_t>(length) + kCrlf.size();
        if (buffer_.size() - cursor < needed) {
            return std::nullopt;
        }
        if (buffer_.compare(cursor + static_cast<std::size_t>(length), kCrlf.size(), kCrlf) != 0) {
            throw std::runtime_error("RESP: bulk string not terminated by CRLF");
        }
        value.type = Value::Type::BulkString;
        value.text = buffer_.substr(cursor, static_cast<std::size_t>(length));
        cursor += needed;
        break;
    }
    case '*':
    {
        auto count = parseInteger(*line);
        if (count < 0) {
            value.type = Value::Type::Null;
            break;
        }
        value.type = Value::Type::Array;
        value.elements.reserve(static_cast<std::size_t>(count));
        for (int64_t i = 0; i < count; ++i) {
            auto element = parseAt(cursor, depth + 1);
            if (!element) {
                return std::nullopt;
            }
            value.elements.push_back(std::move(*element));
        }
        break;
    }
    default:
        throw std::runtime_error(std::string("RESP: unknown type marker '") + marker + "'");
    }

    pos = cursor;
    return value;
}

} // namespace broker::resp
