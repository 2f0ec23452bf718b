#include "domain/reading_validator.hpp"

#include <cctype>
#include <cmath>

namespace domain {
namespace {

// 严格 UTF-8：拒绝过长编码、代理区和超过 U+10FFFF 的码点
bool isValidUtf8(const std::string& text)
{
    std::size_t i = 0;
    const std::size_t n = text.size();
    while (i < n) {
        auto c = static_cast<unsigned char>(text[i]);
        std::size_t extra = 0;
        unsigned char lo = 0x80, hi = 0xBF;
        if (c < 0x80) {
            ++i;
            continue;
        } else if (c >= 0xC2 && c <= 0xDF) {
            extra = 1;
        } else if (c >= 0xE0 && c <= 0xEF) {
            extra = 2;
            if (c == 0xE0) lo = 0xA0;
            if (c == 0xED) hi = 0x9F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            extra = 3;
            if (c == 0xF0) lo = 0x90;
            if (c == 0xF4) hi = 0x8F;
        } else {
            return false;
        }
        if (i + extra >= n) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            auto cc = static_cast<unsigned char>(text[i + k]);
            unsigned char min = (k == 1) ? lo : 0x80;
            unsigned char max = (k == 1) ? hi : 0xBF;
            if (cc < min || cc > max) {
                return false;
            }
        }
        i += extra + 1;
    }
    return true;
}

// 读数最终要 dump 成 JSON，非法 UTF-8 必须在这里挡掉
void requireUtf8(const std::string& value, const char* field)
{
    if (!isValidUtf8(value)) {
        throw core::ValidationError(field, "not valid UTF-8");
    }
}

// 按字段声明顺序检查，保证“第一个失败字段”是确定的
const std::string& requireString(const nlohmann::json& candidate, const char* field)
{
    auto it = candidate.find(field);
    if (it == candidate.end() || it->is_null()) {
        throw core::ValidationError(field, "missing");
    }
    if (!it->is_string()) {
        throw core::ValidationError(field, "must be a string");
    }
    const auto& text = it->get_ref<const std::string&>();
    if (text.empty()) {
        throw core::ValidationError(field, "must not be empty");
    }
    requireUtf8(text, field);
    return text;
}

void requireNonEmpty(const std::string& value, const char* field)
{
    if (value.empty()) {
        throw core::ValidationError(field, "must not be empty");
    }
    requireUtf8(value, field);
}

void requireTenant(const std::string& tenantId)
{
    if (!isValidTenantId(tenantId)) {
        throw core::ValidationError("tenant_id", "contains whitespace, control or wildcard characters");
    }
}

} // namespace

bool isValidTenantId(std::string_view tenantId)
{
    if (tenantId.empty()) {
        return false;
    }
    for (char c : tenantId) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isspace(uc) || std::iscntrl(uc) ||
            c == '*' || c == '?' || c == '[' || c == ']') {
            return false;
        }
    }
    return true;
}

ReadingValidator::ReadingValidator(std::chrono::seconds maxFutureSkew, Clock clock)
    : maxFutureSkew_(maxFutureSkew)
    , clock_(std::move(clock)) {
}

Reading ReadingValidator::validate(const nlohmann::json& candidate) const
{
    if (!candidate.is_object()) {
        throw core::ValidationError("reading", "must be a JSON object");
    }

    Reading reading;
    reading.tenantId = requireString(candidate, "tenant_id");
    requireTenant(reading.tenantId);
    reading.wellId = requireString(candidate, "well_id");
    reading.sourceConnectionId = requireString(candidate, "source_connection_id");
    reading.tagName = requireString(candidate, "tag_name");

    auto value = candidate.find("value");
    if (value == candidate.end() || value->is_null()) {
        throw core::ValidationError("value", "missing");
    }
    if (!value->is_number()) {
        throw core::ValidationError("value", "must be a number");
    }
    reading.value = value->get<double>();
    if (!std::isfinite(reading.value)) {
        throw core::ValidationError("value", "must be finite");
    }

    const auto& quality = requireString(candidate, "quality");
    auto parsedQuality = qualityFromName(quality);
    if (!parsedQuality) {
        throw core::ValidationError("quality", "unknown quality '" + quality + "'");
    }
    reading.quality = *parsedQuality;

    const auto& timestamp = requireString(candidate, "timestamp");
    auto parsedTime = parseUtc(timestamp);
    if (!parsedTime) {
        throw core::ValidationError("timestamp", "not an ISO-8601 UTC instant");
    }
    checkTimestamp(*parsedTime);
    reading.timestamp = *parsedTime;

    reading.sourceProtocol = requireString(candidate, "source_protocol");
    return reading;
}

void ReadingValidator::validate(const Reading& reading) const
{
    requireNonEmpty(reading.tenantId, "tenant_id");
    requireTenant(reading.tenantId);
    requireNonEmpty(reading.wellId, "well_id");
    requireNonEmpty(reading.sourceConnectionId, "source_connection_id");
    requireNonEmpty(reading.tagName, "tag_name");
    if (!std::isfinite(reading.value)) {
        throw core::ValidationError("value", "must be finite");
    }
    if (reading.quality != Quality::Good && reading.quality != Quality::Bad &&
        reading.quality != Quality::Uncertain) {
        throw core::ValidationError("quality", "unknown quality");
    }
    checkTimestamp(reading.timestamp);
    requireNonEmpty(reading.sourceProtocol, "source_protocol");
}

void ReadingValidator::checkTimestamp(Timestamp ts) const
{
    if (ts > clock_() + maxFutureSkew_) {
        throw core::ValidationError("timestamp", "more than " + std::to_string(maxFutureSkew_.count()) +
                                                 "s in the future");
    }
}

} // namespace domain
