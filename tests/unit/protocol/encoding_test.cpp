#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <limits>
#include <string>
#include <wirebind/protocol/encoding.h>

using namespace wirebind;
using namespace std::chrono;

namespace {

TimePoint atMillis(int64_t millis) {
    return TimePoint{duration_cast<TimePoint::duration>(milliseconds{millis})};
}

constexpr int64_t kNewYear2020 = 1577836800; // 2020-01-01T00:00:00Z, a Wednesday
constexpr int64_t kNewYear3000 = 32503680000; // 3000-01-01T00:00:00Z

// Whether the system clock can represent `seconds` past the epoch
bool clockHolds(int64_t secs) {
    return secs <= duration_cast<seconds>(TimePoint::duration::max()).count();
}

// Far-future text either round-trips exactly or is rejected, never wrapped
void expectRoundTripOrOutOfRange(const std::string& text, TimestampFormat format,
                                 int64_t epochSeconds) {
    auto r = encoding::parseTimestamp(text, format);
    if (clockHolds(epochSeconds)) {
        ASSERT_TRUE(r) << r.error().message;
        EXPECT_EQ(encoding::formatTimestamp(r.value(), format).value(), text);
    } else {
        ASSERT_FALSE(r) << text << " was accepted by a clock that cannot hold it";
        EXPECT_EQ(r.error().code, ErrorCode::DecodeError);
        EXPECT_NE(r.error().message.find("out of range"), std::string::npos);
    }
}

} // namespace

TEST(Base64Test, EncodesWithPadding) {
    EXPECT_EQ(encoding::base64Encode(encoding::toBytes("")), "");
    EXPECT_EQ(encoding::base64Encode(encoding::toBytes("f")), "Zg==");
    EXPECT_EQ(encoding::base64Encode(encoding::toBytes("fo")), "Zm8=");
    EXPECT_EQ(encoding::base64Encode(encoding::toBytes("foo")), "Zm9v");
    EXPECT_EQ(encoding::base64Encode(encoding::toBytes("foobar")), "Zm9vYmFy");
}

TEST(Base64Test, DecodesValidText) {
    auto r = encoding::base64Decode("aGVsbG8gd29ybGQ=");
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(encoding::toString(r.value()), "hello world");

    auto empty = encoding::base64Decode("");
    ASSERT_TRUE(empty);
    EXPECT_TRUE(empty.value().empty());
}

TEST(Base64Test, RejectsBadLength) {
    auto r = encoding::base64Decode("Zm9");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::DecodeError);
}

TEST(Base64Test, RejectsCharactersOutsideAlphabet) {
    auto r = encoding::base64Decode("Zm9v!A==");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::DecodeError);
}

TEST(Base64Test, RejectsPaddingInTheMiddle) {
    EXPECT_FALSE(encoding::base64Decode("Zg==Zm9v"));
    EXPECT_FALSE(encoding::base64Decode("Z=9v"));
    EXPECT_FALSE(encoding::base64Decode("===="));
}

TEST(UrlEncodeTest, EscapesReservedCharacters) {
    EXPECT_EQ(encoding::urlEncode("a b&c=d"), "a%20b%26c%3Dd");
    EXPECT_EQ(encoding::urlEncode("safe-_.~"), "safe-_.~");
    EXPECT_EQ(encoding::urlEncode("dir/file"), "dir%2Ffile");
    EXPECT_EQ(encoding::urlEncode("dir/file name", true), "dir/file%20name");
}

TEST(TimestampTest, FormatsEveryRepresentation) {
    auto tp = atMillis(kNewYear2020 * 1000);

    EXPECT_EQ(encoding::formatTimestamp(tp, TimestampFormat::Iso8601).value(),
              "2020-01-01T00:00:00Z");
    EXPECT_EQ(encoding::formatTimestamp(tp, TimestampFormat::Rfc822).value(),
              "Wed, 01 Jan 2020 00:00:00 GMT");
    EXPECT_EQ(encoding::formatTimestamp(tp, TimestampFormat::UnixSeconds).value(), "1577836800");
    EXPECT_EQ(encoding::formatTimestamp(tp, TimestampFormat::UnixMillis).value(),
              "1577836800000");
}

TEST(TimestampTest, KeepsMilliseconds) {
    auto tp = atMillis(kNewYear2020 * 1000 + 250);
    EXPECT_EQ(encoding::formatTimestamp(tp, TimestampFormat::Iso8601).value(),
              "2020-01-01T00:00:00.250Z");
    EXPECT_EQ(encoding::formatTimestamp(tp, TimestampFormat::UnixSeconds).value(),
              "1577836800.25");
}

TEST(TimestampTest, FormatsNegativeEpochSeconds) {
    EXPECT_EQ(encoding::formatTimestamp(atMillis(-1500), TimestampFormat::UnixSeconds).value(),
              "-1.5");
}

TEST(TimestampTest, FormatWithoutFormatFails) {
    auto r = encoding::formatTimestamp(atMillis(0), TimestampFormat::None);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::EncodeError);
}

TEST(TimestampTest, ParsesIso8601Variants) {
    auto expected = atMillis(kNewYear2020 * 1000);
    EXPECT_EQ(encoding::parseTimestamp("2020-01-01T00:00:00Z", TimestampFormat::Iso8601).value(),
              expected);
    EXPECT_EQ(
        encoding::parseTimestamp("2020-01-01T02:00:00+02:00", TimestampFormat::Iso8601).value(),
        expected);
    EXPECT_EQ(
        encoding::parseTimestamp("2019-12-31T19:00:00-0500", TimestampFormat::Iso8601).value(),
        expected);
    EXPECT_EQ(
        encoding::parseTimestamp("2020-01-01T00:00:00.125Z", TimestampFormat::Iso8601).value(),
        atMillis(kNewYear2020 * 1000 + 125));
}

TEST(TimestampTest, RejectsMalformedIso8601) {
    EXPECT_FALSE(encoding::parseTimestamp("2020-01-01 00:00:00Z", TimestampFormat::Iso8601));
    EXPECT_FALSE(encoding::parseTimestamp("2020-01-01T00:00:00", TimestampFormat::Iso8601));
    EXPECT_FALSE(encoding::parseTimestamp("2020-02-30T00:00:00Z", TimestampFormat::Iso8601));
    EXPECT_FALSE(encoding::parseTimestamp("2020-01-01T24:00:00Z", TimestampFormat::Iso8601));
}

TEST(TimestampTest, ParsesRfc822) {
    auto expected = atMillis(kNewYear2020 * 1000);
    EXPECT_EQ(
        encoding::parseTimestamp("Wed, 01 Jan 2020 00:00:00 GMT", TimestampFormat::Rfc822).value(),
        expected);
    EXPECT_EQ(encoding::parseTimestamp("1 Jan 2020 00:00:00 UTC", TimestampFormat::Rfc822).value(),
              expected);
    EXPECT_FALSE(encoding::parseTimestamp("01 Foo 2020 00:00:00 GMT", TimestampFormat::Rfc822));
    EXPECT_FALSE(encoding::parseTimestamp("01 Jan 2020 00:00:00 PST", TimestampFormat::Rfc822));
}

TEST(TimestampTest, ParsesEpochForms) {
    EXPECT_EQ(encoding::parseTimestamp("1577836800", TimestampFormat::UnixSeconds).value(),
              atMillis(kNewYear2020 * 1000));
    EXPECT_EQ(encoding::parseTimestamp("1577836800.5", TimestampFormat::UnixSeconds).value(),
              atMillis(kNewYear2020 * 1000 + 500));
    EXPECT_EQ(encoding::parseTimestamp("1.5778368E9", TimestampFormat::UnixSeconds).value(),
              atMillis(kNewYear2020 * 1000));
    EXPECT_EQ(encoding::parseTimestamp("1577836800123", TimestampFormat::UnixMillis).value(),
              atMillis(kNewYear2020 * 1000 + 123));
}

TEST(TimestampTest, EpochUnitsAreNeverInferred) {
    // Same digits, two different instants
    auto secs = encoding::parseTimestamp("1577836800", TimestampFormat::UnixSeconds).value();
    auto millis = encoding::parseTimestamp("1577836800", TimestampFormat::UnixMillis).value();
    EXPECT_NE(secs, millis);

    EXPECT_FALSE(encoding::parseTimestamp("1577836800.5", TimestampFormat::UnixMillis));
    EXPECT_FALSE(encoding::parseTimestamp("soon", TimestampFormat::UnixSeconds));
    EXPECT_FALSE(encoding::parseTimestamp("1577836800", TimestampFormat::None));
}

TEST(TimestampTest, FarFutureIsNeverWrapped) {
    expectRoundTripOrOutOfRange("3000-01-01T00:00:00Z", TimestampFormat::Iso8601, kNewYear3000);
    expectRoundTripOrOutOfRange("9999-12-31T23:59:59Z", TimestampFormat::Iso8601, 253402300799);
    expectRoundTripOrOutOfRange("Wed, 01 Jan 3000 00:00:00 GMT", TimestampFormat::Rfc822,
                                kNewYear3000);
    expectRoundTripOrOutOfRange("32503680000", TimestampFormat::UnixSeconds, kNewYear3000);
    expectRoundTripOrOutOfRange("99999999999999", TimestampFormat::UnixMillis, 99999999999);
}

TEST(TimestampTest, RejectsEpochBeyondAnyClock) {
    for (auto text : {"9223372036854775", "-9223372036854775", "1e300", "-1.5e18"}) {
        auto r = encoding::parseTimestamp(text, TimestampFormat::UnixSeconds);
        ASSERT_FALSE(r) << text;
        EXPECT_EQ(r.error().code, ErrorCode::DecodeError);
    }
    EXPECT_FALSE(encoding::parseTimestamp("92233720368547758", TimestampFormat::UnixSeconds));
    EXPECT_FALSE(encoding::parseTimestamp("9223372036854775807", TimestampFormat::UnixMillis));
}

TEST(FormatDoubleTest, ShortestRoundTrip) {
    EXPECT_EQ(encoding::formatDouble(0.1).value(), "0.1");
    EXPECT_EQ(encoding::formatDouble(2.5).value(), "2.5");
    EXPECT_EQ(encoding::formatDouble(-3.0).value(), "-3");
}

TEST(FormatDoubleTest, RejectsNonFinite) {
    EXPECT_FALSE(encoding::formatDouble(std::numeric_limits<double>::infinity()));
    EXPECT_FALSE(encoding::formatDouble(std::nan("")));
}
