#include "gateway/frame_codec.hpp"

#include "core/errors.hpp"

namespace gateway {

const char* errorCodeName(ErrorCode code)
{
    switch (code)
    {
    case ErrorCode::AuthFailed: return "AUTH_FAILED";
    case ErrorCode::HeartbeatTimeout: return "HEARTBEAT_TIMEOUT";
    case ErrorCode::InvalidFrame: return "INVALID_FRAME";
    case ErrorCode::UnknownType: return "UNKNOWN_TYPE";
    case ErrorCode::RegistryFailed: return "REGISTRY_FAILED";
    default: return "UNKNOWN";
    }
}

bool LineSplitter::feed(std::string_view chunk, const LineHandler& onLine)
{
    buffer_.append(chunk.data(), chunk.size());

    std::size_t pos;
    while ((pos = buffer_.find('\n')) != std::string::npos)
    {
        std::string line = buffer_.substr(0, pos);
        buffer_.erase(0, pos + 1);

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        // 空行当作保活，不算帧
        if (!line.empty()) {
            onLine(std::move(line));
        }
    }
    return buffer_.size() <= kMaxFrameBytes;
}

Frame parseFrame(std::string_view line)
{
    nlohmann::json msg;
    try {
        msg = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error&) {
        throw core::ValidationError("frame", "not valid JSON");
    }
    if (!msg.is_object()) {
        throw core::ValidationError("frame", "must be a JSON object");
    }

    auto type = msg.find("type");
    if (type == msg.end() || !type->is_string() || type->get<std::string>().empty()) {
        throw core::ValidationError("type", "missing or not a string");
    }

    Frame frame;
    frame.type = type->get<std::string>();
    if (auto data = msg.find("data"); data != msg.end() && !data->is_null())
    {
        if (!data->is_object()) {
            throw core::ValidationError("data", "must be an object");
        }
        frame.data = *data;
    }
    return frame;
}

std::string encodeFrame(const std::string& type, const nlohmann::json& data)
{
    nlohmann::json msg{{"type", type}, {"data", data}};
    return msg.dump() + "\n";
}

std::string connectedFrame(const std::string& tenantId, domain::Timestamp now)
{
    return encodeFrame(frame_type::kConnected, {{"tenant_id", tenantId}, {"timestamp", domain::formatUtc(now)}});
}

std::string subscribedFrame(const std::string& wellId, domain::Timestamp now)
{
    return encodeFrame(frame_type::kSubscribed, {{"well_id", wellId}, {"timestamp", domain::formatUtc(now)}});
}

std::string unsubscribedFrame(const std::string& wellId, domain::Timestamp now)
{
    return encodeFrame(frame_type::kUnsubscribed, {{"well_id", wellId}, {"timestamp", domain::formatUtc(now)}});
}

std::string pongFrame(domain::Timestamp now)
{
    return encodeFrame(frame_type::kPong, {{"timestamp", domain::formatUtc(now)}});
}

std::string errorFrame(ErrorCode code, const std::string& message)
{
    return encodeFrame(frame_type::kError, {{"message", message}, {"code", errorCodeName(code)}});
}

std::string readingFrame(const std::string& serializedReading)
{
    std::string out;
    out.reserve(serializedReading.size() + 32);
    out += R"({"type":"reading","data":)";
    out += serializedReading;
    out += "}\n";
    return out;
}

std::string subscribeWellFrame(const std::string& wellId)
{
    return encodeFrame(frame_type::kSubscribeWell, {{"well_id", wellId}});
}

std::string unsubscribeWellFrame(const std::string& wellId)
{
    return encodeFrame(frame_type::kUnsubscribeWell, {{"well_id", wellId}});
}

std::string pingFrame()
{
    return encodeFrame(frame_type::kPing);
}

std::string closeFrame()
{
    return encodeFrame(frame_type::kClose);
}

} // namespace gateway
