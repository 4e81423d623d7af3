#include "codec/Iso8601Decoder.hpp"

#include <gtest/gtest.h>

#include <string>
#include <variant>

using namespace isots::domain;
using isots::codec::DecodeResult;
using isots::codec::Iso8601Decoder;

class DecoderTest : public ::testing::Test {
protected:
    int64_t decode_ms(const std::string& text) const {
        auto result = decoder.decode(text);
        if (auto* error = std::get_if<ParseError>(&result)) {
            ADD_FAILURE() << text << ": " << error->message;
            return 0;
        }
        return std::get<Timestamp>(result).milliseconds();
    }

    ParseError decode_error(const std::string& text) const {
        auto result = decoder.decode(text);
        if (!std::holds_alternative<ParseError>(result)) {
            ADD_FAILURE() << text << " decoded unexpectedly";
            return ParseError::syntax(0, "failure");
        }
        return std::get<ParseError>(result);
    }

    Iso8601Decoder decoder;
};

// --- Valid input ---

TEST_F(DecoderTest, DecodesUtc) {
    EXPECT_EQ(decode_ms("2016-01-01T00:00:00.000Z"), 1451606400000);
}

TEST_F(DecoderTest, DecodesEpoch) {
    EXPECT_EQ(decode_ms("1970-01-01T00:00:00.000Z"), 0);
}

TEST_F(DecoderTest, DecodesTimeOfDay) {
    EXPECT_EQ(decode_ms("1970-01-01T01:02:03.004Z"), 3'723'004);
}

TEST_F(DecoderTest, ReversesPositiveOffset) {
    EXPECT_EQ(decode_ms("2016-01-01T00:00:00.000+01:30"), 1451606400000 - 90 * 60000);
}

TEST_F(DecoderTest, ReversesNegativeOffset) {
    EXPECT_EQ(decode_ms("2016-01-01T00:00:00.000-05:00"), 1451606400000 + 5 * 3600000);
    EXPECT_EQ(decode_ms("1969-12-31T23:00:00.000-01:00"), 0);
}

TEST_F(DecoderTest, AcceptsUnpaddedOffset) {
    EXPECT_EQ(decode_ms("2016-01-01T00:00:00.000+1:5"), 1451606400000 - 65 * 60000);
    EXPECT_EQ(decode_ms("2016-01-01T00:00:00.000+00:00"), 1451606400000);
}

TEST_F(DecoderTest, DecodesLeapDay) {
    EXPECT_EQ(decode_ms("2016-02-29T00:00:00.000Z"), 1456704000000);
}

TEST_F(DecoderTest, DecodesPreEpoch) {
    EXPECT_EQ(decode_ms("1969-12-31T23:59:59.999Z"), -1);
    EXPECT_EQ(decode_ms("1900-01-01T00:00:00.000Z"), -2208988800000);
    EXPECT_EQ(decode_ms("0000-01-01T00:00:00.000Z"), -62167219200000);
}

TEST_F(DecoderTest, DecodesFarFuture) {
    EXPECT_EQ(decode_ms("2100-03-01T00:00:00.000Z"), 4107542400000);
    EXPECT_EQ(decode_ms("9999-12-31T23:59:59.999Z"), 253402300799999);
}

// --- Calendar errors ---

TEST_F(DecoderTest, RejectsFebruary30) {
    auto error = decode_error("2016-02-30T00:00:00.000Z");
    EXPECT_EQ(error.kind, ErrorKind::INVALID_DAY);
    EXPECT_EQ(error.value, 30);
    EXPECT_EQ(error.position, 8u);
}

TEST_F(DecoderTest, RejectsMonth13) {
    auto error = decode_error("2016-13-01T00:00:00.000Z");
    EXPECT_EQ(error.kind, ErrorKind::INVALID_MONTH);
    EXPECT_EQ(error.value, 13);
    EXPECT_EQ(error.position, 5u);
}

TEST_F(DecoderTest, RejectsFebruary29InCommonYear) {
    EXPECT_EQ(decode_error("2015-02-29T00:00:00.000Z").kind, ErrorKind::INVALID_DAY);
    EXPECT_EQ(decode_error("1900-02-29T00:00:00.000Z").kind, ErrorKind::INVALID_DAY);
}

TEST_F(DecoderTest, RejectsDayZeroAndDay32) {
    EXPECT_EQ(decode_error("2016-01-00T00:00:00.000Z").kind, ErrorKind::INVALID_DAY);
    EXPECT_EQ(decode_error("2016-01-32T00:00:00.000Z").kind, ErrorKind::INVALID_DAY);
}

TEST_F(DecoderTest, InvalidDateFailsBeforeTimeIsRead) {
    EXPECT_EQ(decode_error("2016-02-30").kind, ErrorKind::INVALID_DAY);
    EXPECT_EQ(decode_error("2016-02-30 not a time").kind, ErrorKind::INVALID_DAY);
}

// --- Syntax errors ---

TEST_F(DecoderTest, RejectsEmptyInput) {
    auto error = decode_error("");
    EXPECT_EQ(error.kind, ErrorKind::SYNTAX);
    EXPECT_EQ(error.position, 0u);
}

TEST_F(DecoderTest, RejectsShortYear) {
    auto error = decode_error("16-01-01T00:00:00.000Z");
    EXPECT_EQ(error.kind, ErrorKind::SYNTAX);
    EXPECT_EQ(error.position, 2u);
}

TEST_F(DecoderTest, RejectsUnpaddedMonth) {
    auto error = decode_error("2016-1-01T00:00:00.000Z");
    EXPECT_EQ(error.kind, ErrorKind::SYNTAX);
    EXPECT_EQ(error.position, 6u);
}

TEST_F(DecoderTest, RejectsLeadingWhitespace) {
    EXPECT_EQ(decode_error(" 2016-01-01T00:00:00.000Z").kind, ErrorKind::SYNTAX);
}

TEST_F(DecoderTest, RejectsSpaceSeparator) {
    auto error = decode_error("2016-01-01 00:00:00.000Z");
    EXPECT_EQ(error.kind, ErrorKind::SYNTAX);
    EXPECT_EQ(error.position, 10u);
}

TEST_F(DecoderTest, RejectsMissingMillis) {
    auto error = decode_error("2016-01-01T00:00:00Z");
    EXPECT_EQ(error.kind, ErrorKind::SYNTAX);
    EXPECT_EQ(error.position, 19u);
}

TEST_F(DecoderTest, RejectsShortMillis) {
    auto error = decode_error("2016-01-01T00:00:00.00Z");
    EXPECT_EQ(error.kind, ErrorKind::SYNTAX);
    EXPECT_EQ(error.position, 22u);
}

TEST_F(DecoderTest, RejectsMissingOffset) {
    auto error = decode_error("2016-01-01T00:00:00.000");
    EXPECT_EQ(error.kind, ErrorKind::SYNTAX);
    EXPECT_EQ(error.position, 23u);
}

TEST_F(DecoderTest, RejectsLowercaseZ) {
    EXPECT_EQ(decode_error("2016-01-01T00:00:00.000z").kind, ErrorKind::SYNTAX);
}

TEST_F(DecoderTest, RejectsTrailingCharacters) {
    auto error = decode_error("2016-01-01T00:00:00.000Zjunk");
    EXPECT_EQ(error.kind, ErrorKind::SYNTAX);
    EXPECT_EQ(error.position, 24u);
    EXPECT_EQ(decode_error("2016-01-01T00:00:00.000+01:00 ").kind, ErrorKind::SYNTAX);
}

TEST_F(DecoderTest, RejectsOffsetWithoutColon) {
    auto error = decode_error("2016-01-01T00:00:00.000+0100");
    EXPECT_EQ(error.kind, ErrorKind::SYNTAX);
    EXPECT_EQ(error.position, 28u);
    EXPECT_EQ(decode_error("2016-01-01T00:00:00.000+01").kind, ErrorKind::SYNTAX);
}

TEST_F(DecoderTest, RejectsOffsetWithoutHours) {
    auto error = decode_error("2016-01-01T00:00:00.000+:30");
    EXPECT_EQ(error.kind, ErrorKind::SYNTAX);
    EXPECT_EQ(error.position, 24u);
}

TEST_F(DecoderTest, RejectsOverlongOffsetHours) {
    EXPECT_EQ(decode_error("2016-01-01T00:00:00.000+0000000001:00").kind, ErrorKind::SYNTAX);
}

// --- Time of day ---

TEST_F(DecoderTest, RejectsHour24) {
    auto error = decode_error("2016-01-01T24:00:00.000Z");
    EXPECT_EQ(error.kind, ErrorKind::INVALID_TIME_OF_DAY);
    EXPECT_EQ(error.value, 24);
    EXPECT_EQ(error.position, 11u);
}

TEST_F(DecoderTest, RejectsMinute60AndSecond60) {
    auto minute = decode_error("2016-01-01T00:60:00.000Z");
    EXPECT_EQ(minute.kind, ErrorKind::INVALID_TIME_OF_DAY);
    EXPECT_EQ(minute.position, 14u);

    auto second = decode_error("2016-01-01T23:59:60.000Z");
    EXPECT_EQ(second.kind, ErrorKind::INVALID_TIME_OF_DAY);
    EXPECT_EQ(second.position, 17u);
}

TEST_F(DecoderTest, RejectsOutOfRangeOffset) {
    auto hours = decode_error("2016-01-01T00:00:00.000+24:00");
    EXPECT_EQ(hours.kind, ErrorKind::INVALID_TIME_OF_DAY);
    EXPECT_EQ(hours.position, 24u);

    auto minutes = decode_error("2016-01-01T00:00:00.000+01:60");
    EXPECT_EQ(minutes.kind, ErrorKind::INVALID_TIME_OF_DAY);
    EXPECT_EQ(minutes.position, 27u);
}

TEST(DecoderPermissive, FoldsOutOfRangeFieldsIntoArithmetic) {
    Iso8601Decoder permissive(false);

    auto hour24 = permissive.decode("2016-01-01T24:00:00.000Z");
    ASSERT_TRUE(std::holds_alternative<Timestamp>(hour24));
    EXPECT_EQ(std::get<Timestamp>(hour24).milliseconds(), 1451606400000 + 86400000);

    auto offset = permissive.decode("2016-01-01T00:00:00.000+1:90");
    ASSERT_TRUE(std::holds_alternative<Timestamp>(offset));
    EXPECT_EQ(std::get<Timestamp>(offset).milliseconds(), 1451606400000 - 150 * 60000);
}

TEST(DecoderPermissive, StillValidatesCalendarDate) {
    Iso8601Decoder permissive(false);
    auto result = permissive.decode("2015-02-29T00:00:00.000Z");
    ASSERT_TRUE(std::holds_alternative<ParseError>(result));
    EXPECT_EQ(std::get<ParseError>(result).kind, ErrorKind::INVALID_DAY);
}
