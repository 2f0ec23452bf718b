#include "gateway/handshake.hpp"

#include <algorithm>
#include <cctype>

#include "core/errors.hpp"

namespace gateway {
namespace {

std::string toLower(std::string_view text)
{
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view text)
{
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r')) {
        text.remove_suffix(1);
    }
    return text;
}

int hexValue(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// 百分号解码，'+' 视为空格
std::string percentDecode(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        char c = text[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < text.size() && hexValue(text[i + 1]) >= 0 && hexValue(text[i + 2]) >= 0) {
            out.push_back(static_cast<char>(hexValue(text[i + 1]) * 16 + hexValue(text[i + 2])));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

void parseQuery(std::string_view query, std::map<std::string, std::string>& out)
{
    while (!query.empty())
    {
        auto amp = query.find('&');
        auto pair = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);
        if (pair.empty()) {
            continue;
        }
        auto eq = pair.find('=');
        auto key = percentDecode(pair.substr(0, eq));
        auto value = eq == std::string_view::npos ? std::string{} : percentDecode(pair.substr(eq + 1));
        out.emplace(std::move(key), std::move(value));
    }
}

} // namespace

std::optional<std::pair<std::size_t, std::size_t>> findHeadEnd(std::string_view buffer)
{
    auto crlf = buffer.find("\r\n\r\n");
    auto lf = buffer.find("\n\n");
    if (crlf == std::string_view::npos && lf == std::string_view::npos) {
        return std::nullopt;
    }
    if (lf == std::string_view::npos || (crlf != std::string_view::npos && crlf < lf)) {
        return std::make_pair(crlf, crlf + 4);
    }
    return std::make_pair(lf, lf + 2);
}

HandshakeRequest parseHandshake(std::string_view head)
{
    if (head.size() > kMaxHandshakeBytes) {
        throw core::AuthenticationError("handshake head exceeds " + std::to_string(kMaxHandshakeBytes) + " bytes");
    }

    HandshakeRequest request;

    auto lineEnd = head.find('\n');
    auto requestLine = trim(head.substr(0, lineEnd));
    auto rest = lineEnd == std::string_view::npos ? std::string_view{} : head.substr(lineEnd + 1);

    // 请求行：METHOD SP TARGET SP VERSION
    auto sp1 = requestLine.find(' ');
    auto sp2 = sp1 == std::string_view::npos ? std::string_view::npos : requestLine.find(' ', sp1 + 1);
    if (sp1 == std::string_view::npos || sp2 == std::string_view::npos) {
        throw core::AuthenticationError("malformed handshake request line");
    }
    request.method = std::string(requestLine.substr(0, sp1));
    request.target = std::string(requestLine.substr(sp1 + 1, sp2 - sp1 - 1));
    request.version = std::string(trim(requestLine.substr(sp2 + 1)));
    if (request.method.empty() || request.target.empty() || request.version.rfind("HTTP/", 0) != 0) {
        throw core::AuthenticationError("malformed handshake request line");
    }

    auto q = request.target.find('?');
    request.path = request.target.substr(0, q);
    if (q != std::string::npos) {
        parseQuery(std::string_view(request.target).substr(q + 1), request.query);
    }

    while (!rest.empty())
    {
        auto end = rest.find('\n');
        auto line = trim(rest.substr(0, end));
        rest = end == std::string_view::npos ? std::string_view{} : rest.substr(end + 1);
        if (line.empty()) {
            continue;
        }
        auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            throw core::AuthenticationError("malformed handshake header line");
        }
        request.headers[toLower(trim(line.substr(0, colon)))] = std::string(trim(line.substr(colon + 1)));
    }
    return request;
}

std::optional<std::string> extractCredential(const HandshakeRequest& request)
{
    if (auto it = request.headers.find("authorization"); it != request.headers.end())
    {
        std::string_view value = it->second;
        // 认证方案名大小写不敏感
        if (value.size() > 7 && toLower(value.substr(0, 7)) == "bearer ")
        {
            auto token = trim(value.substr(7));
            if (!token.empty()) {
                return std::string(token);
            }
        }
    }

    for (const char* key : {"token", "access_token"})
    {
        if (auto it = request.query.find(key); it != request.query.end() && !it->second.empty()) {
            return it->second;
        }
    }
    return std::nullopt;
}

std::string buildHandshake(const std::string& host, const std::string& path, const std::string& token)
{
    std::string head = "GET " + (path.empty() ? std::string("/") : path) + " HTTP/1.1\r\n";
    head += "Host: " + host + "\r\n";
    head += "Authorization: Bearer " + token + "\r\n";
    head += "\r\n";
    return head;
}

} // namespace gateway
