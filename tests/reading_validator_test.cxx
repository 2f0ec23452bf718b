#include <gtest/gtest.h>

#include <limits>

#include "core/errors.hpp"
#include "domain/reading_validator.hpp"
#include "test_helpers.hpp"

using namespace testing_support;

namespace {

std::string failingField(const domain::ReadingValidator& validator, const nlohmann::json& candidate)
{
    try {
        validator.validate(candidate);
    } catch (const core::ValidationError& ex) {
        return ex.field();
    }
    return "";
}

} // namespace

TEST(ReadingValidatorTest, AcceptsWellFormedReading)
{
    auto validator = makeValidator();
    auto reading = validator.validate(readingJson("t1", "w1"));

    EXPECT_EQ(reading.tenantId, "t1");
    EXPECT_EQ(reading.wellId, "w1");
    EXPECT_EQ(reading.sourceConnectionId, "modbus-gw-1");
    EXPECT_EQ(reading.tagName, "pressure");
    EXPECT_DOUBLE_EQ(reading.value, 120.5);
    EXPECT_EQ(reading.quality, domain::Quality::Good);
    EXPECT_EQ(domain::formatUtc(reading.timestamp), "2024-12-31T23:59:30.250Z");
    EXPECT_EQ(reading.sourceProtocol, "modbus");
}

TEST(ReadingValidatorTest, AcceptsIntegerValues)
{
    auto candidate = readingJson("t1", "w1");
    candidate["value"] = 42;
    EXPECT_DOUBLE_EQ(makeValidator().validate(candidate).value, 42.0);
}

TEST(ReadingValidatorTest, ReportsMissingField)
{
    auto candidate = readingJson("t1", "w1");
    candidate.erase("tenant_id");
    EXPECT_EQ(failingField(makeValidator(), candidate), "tenant_id");
}

TEST(ReadingValidatorTest, ReportsFirstFailingFieldInDeclarationOrder)
{
    auto candidate = readingJson("t1", "w1");
    candidate.erase("well_id");
    candidate["value"] = "high";
    candidate["quality"] = "Excellent";
    EXPECT_EQ(failingField(makeValidator(), candidate), "well_id");
}

TEST(ReadingValidatorTest, RejectsNonNumericValue)
{
    auto candidate = readingJson("t1", "w1");
    candidate["value"] = "120.5";
    EXPECT_EQ(failingField(makeValidator(), candidate), "value");
}

TEST(ReadingValidatorTest, QualityIsCaseSensitive)
{
    auto validator = makeValidator();
    EXPECT_EQ(failingField(validator, readingJson("t1", "w1", "pressure", 1.0, "good")), "quality");
    EXPECT_NO_THROW(validator.validate(readingJson("t1", "w1", "pressure", 1.0, "Uncertain")));
    EXPECT_NO_THROW(validator.validate(readingJson("t1", "w1", "pressure", 1.0, "Bad")));
}

TEST(ReadingValidatorTest, RejectsTimestampTooFarInTheFuture)
{
    auto validator = makeValidator();

    auto candidate = readingJson("t1", "w1");
    candidate["timestamp"] = "2025-01-01T00:06:00Z";
    EXPECT_EQ(failingField(validator, candidate), "timestamp");

    candidate["timestamp"] = "2025-01-01T00:04:00Z";
    EXPECT_NO_THROW(validator.validate(candidate));
}

TEST(ReadingValidatorTest, RejectsUnparseableTimestamp)
{
    auto candidate = readingJson("t1", "w1");
    candidate["timestamp"] = "2024-12-31T23:59:30+08:00";
    EXPECT_EQ(failingField(makeValidator(), candidate), "timestamp");
}

TEST(ReadingValidatorTest, RejectsTenantIdsThatWouldBreakTopicRouting)
{
    auto validator = makeValidator();
    EXPECT_EQ(failingField(validator, readingJson("t*", "w1")), "tenant_id");
    EXPECT_EQ(failingField(validator, readingJson("t 1", "w1")), "tenant_id");
    EXPECT_EQ(failingField(validator, readingJson("t[1]", "w1")), "tenant_id");
    EXPECT_TRUE(domain::isValidTenantId("acme-energy_01"));
}

TEST(ReadingValidatorTest, RejectsNonObjectCandidates)
{
    auto validator = makeValidator();
    EXPECT_EQ(failingField(validator, nlohmann::json::array()), "reading");
    EXPECT_EQ(failingField(validator, nlohmann::json("text")), "reading");
}

TEST(ReadingValidatorTest, ValidatesTypedReadings)
{
    auto validator = makeValidator();
    EXPECT_NO_THROW(validator.validate(reading("t1", "w1")));

    auto bad = reading("t1", "w1");
    bad.value = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(validator.validate(bad), core::ValidationError);

    bad = reading("t1", "");
    try {
        validator.validate(bad);
        FAIL() << "expected ValidationError";
    } catch (const core::ValidationError& ex) {
        EXPECT_EQ(ex.field(), "well_id");
    }
}

TEST(ReadingValidatorTest, RejectsMalformedUtf8InStringFields)
{
    auto validator = makeValidator();

    auto candidate = readingJson("t1", "w1");
    candidate["tag_name"] = std::string("pres\xffsure");
    EXPECT_EQ(failingField(validator, candidate), "tag_name");

    // 截断的多字节序列
    candidate = readingJson("t1", "w1");
    candidate["source_protocol"] = std::string("modbus\xe2\x82");
    EXPECT_EQ(failingField(validator, candidate), "source_protocol");

    // 过长编码和代理区码点
    candidate = readingJson("t1", "w1");
    candidate["well_id"] = std::string("\xc0\xaf");
    EXPECT_EQ(failingField(validator, candidate), "well_id");
    candidate["well_id"] = std::string("\xed\xa0\x80");
    EXPECT_EQ(failingField(validator, candidate), "well_id");

    auto typed = reading("t1", "w1");
    typed.sourceConnectionId = std::string("gw-\x80");
    try {
        validator.validate(typed);
        FAIL() << "expected ValidationError";
    } catch (const core::ValidationError& ex) {
        EXPECT_EQ(ex.field(), "source_connection_id");
    }
}

TEST(ReadingValidatorTest, AcceptsMultiByteUtf8)
{
    auto candidate = readingJson("t1", "井-07");
    candidate["tag_name"] = "压力°C \xf0\x9f\x9b\xa2";
    EXPECT_EQ(makeValidator().validate(candidate).wellId, "井-07");
}
