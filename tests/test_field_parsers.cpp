// EN: Unit tests for the typed cell parsers
// FR: Tests unitaires pour les parsers de cellules typés

#include <gtest/gtest.h>
#include "csv/field_parsers.hpp"
#include "csv/reader_errors.hpp"

#include <cmath>

using namespace VPR;
using namespace VPR::CSV;

// EN: Cell cleaning
// FR: Nettoyage des cellules

TEST(CleanCellValueTest, TrimsWhitespace) {
    EXPECT_EQ(cleanCellValue("  329  "), "329");
    EXPECT_EQ(cleanCellValue("\t329\t"), "329");
}

TEST(CleanCellValueTest, StripsQuotesAndCommasFromBothEnds) {
    EXPECT_EQ(cleanCellValue("\"MATCH\""), "MATCH");
    EXPECT_EQ(cleanCellValue("'169808'"), "169808");
    EXPECT_EQ(cleanCellValue(",,0.25,"), "0.25");
    EXPECT_EQ(cleanCellValue("\" ' value ' \""), "value");
}

TEST(CleanCellValueTest, KeepsInnerCharacters) {
    EXPECT_EQ(cleanCellValue("\"a, 'b' c\""), "a, 'b' c");
    EXPECT_EQ(cleanCellValue("2023-01-02 04:43:05"), "2023-01-02 04:43:05");
}

TEST(CleanCellValueTest, EmptyAndFullyRemovableValues) {
    EXPECT_EQ(cleanCellValue(""), "");
    EXPECT_EQ(cleanCellValue("   "), "");
    EXPECT_EQ(cleanCellValue("\"\""), "");
    EXPECT_EQ(cleanCellValue(", ,"), "");
}

// EN: Epoch milliseconds
// FR: Millisecondes epoch

TEST(ParseEpochMillisTest, ParsesSignedIntegers) {
    EXPECT_EQ(toEpochMillis(parseEpochMillis("1672617824041")), 1672617824041);
    EXPECT_EQ(toEpochMillis(parseEpochMillis("0")), 0);
    EXPECT_EQ(toEpochMillis(parseEpochMillis("-1000")), -1000);
    EXPECT_EQ(toEpochMillis(parseEpochMillis("+42")), 42);
}

TEST(ParseEpochMillisTest, RoundTripsThroughTimestamp) {
    for (std::int64_t millis : {std::int64_t{-86400001}, std::int64_t{1}, std::int64_t{1672641842709},
                                kMinEpochMillis, kMaxEpochMillis}) {
        EXPECT_EQ(toEpochMillis(parseEpochMillis(std::to_string(millis))), millis);
    }
}

TEST(ParseEpochMillisTest, RejectsNonIntegers) {
    EXPECT_THROW(parseEpochMillis(""), FieldParseError);
    EXPECT_THROW(parseEpochMillis("abc"), FieldParseError);
    EXPECT_THROW(parseEpochMillis("12.5"), FieldParseError);
    EXPECT_THROW(parseEpochMillis("12abc"), FieldParseError);
    EXPECT_THROW(parseEpochMillis("+-12"), FieldParseError);
    EXPECT_THROW(parseEpochMillis("2023-01-02 04:43:05"), FieldParseError);
}

TEST(ParseEpochMillisTest, RejectsOutOfRangeValues) {
    EXPECT_THROW(parseEpochMillis(std::to_string(kMaxEpochMillis + 1)), FieldParseError);
    EXPECT_THROW(parseEpochMillis(std::to_string(kMinEpochMillis - 1)), FieldParseError);
    EXPECT_THROW(parseEpochMillis("9223372036854775807"), FieldParseError);
    EXPECT_THROW(parseEpochMillis("9223372036854775808"), FieldParseError);
}

TEST(ParseEpochMillisTest, ErrorCarriesTheValue) {
    try {
        parseEpochMillis("not-a-number");
        FAIL() << "Expected FieldParseError";
    } catch (const FieldParseError& e) {
        EXPECT_EQ(e.getValue(), "not-a-number");
        EXPECT_EQ(e.getLineNumber(), 0u);
        EXPECT_NE(std::string(e.what()).find("not-a-number"), std::string::npos);
    }
}

// EN: Fixed-format datetimes
// FR: Dates au format fixe

TEST(ParseDateTimeTest, ParsesWholeSeconds) {
    EXPECT_EQ(toEpochMillis(parseDateTime("2023-01-02 00:03:44")), 1672617824000);
    EXPECT_EQ(toEpochMillis(parseDateTime("2000-01-01 00:00:00")), 946684800000);
    EXPECT_EQ(toEpochMillis(parseDateTime("1970-01-01 00:00:00")), 0);
}

TEST(ParseDateTimeTest, ParsesMilliseconds) {
    EXPECT_EQ(toEpochMillis(parseDateTime("2023-01-12 13:50:00.123")), 1673531400123);
    EXPECT_EQ(toEpochMillis(parseDateTime("1969-12-31 23:59:59.999")), -1);
}

TEST(ParseDateTimeTest, ShortFractionsAreScaled) {
    EXPECT_EQ(toEpochMillis(parseDateTime("2023-01-12 13:50:00.1")), 1673531400100);
    EXPECT_EQ(toEpochMillis(parseDateTime("2023-01-12 13:50:00.12")), 1673531400120);
}

TEST(ParseDateTimeTest, LongFractionsAreRoundedToMilliseconds) {
    EXPECT_EQ(toEpochMillis(parseDateTime("2023-01-12 13:50:00.123456")), 1673531400123);
    EXPECT_EQ(toEpochMillis(parseDateTime("2023-01-12 13:50:00.1235")), 1673531400124);
    EXPECT_EQ(toEpochMillis(parseDateTime("2023-01-12 13:50:00.123499999")), 1673531400123);
    // EN: Rounding may carry into the next day / FR: L'arrondi peut passer au jour suivant
    EXPECT_EQ(toEpochMillis(parseDateTime("2024-02-29 23:59:59.9995")), 1709251200000);
}

TEST(ParseDateTimeTest, AcceptsLeapDay) {
    EXPECT_NO_THROW(parseDateTime("2024-02-29 12:00:00"));
    EXPECT_NO_THROW(parseDateTime("2000-02-29 12:00:00"));
    EXPECT_THROW(parseDateTime("2023-02-29 12:00:00"), FieldParseError);
    EXPECT_THROW(parseDateTime("1900-02-29 12:00:00"), FieldParseError);
}

TEST(ParseDateTimeTest, RejectsOtherLayouts) {
    EXPECT_THROW(parseDateTime(""), FieldParseError);
    EXPECT_THROW(parseDateTime("2023-01-02T00:03:44"), FieldParseError);
    EXPECT_THROW(parseDateTime("2023-01-02 00:03:44Z"), FieldParseError);
    EXPECT_THROW(parseDateTime("2023-1-2 00:03:44"), FieldParseError);
    EXPECT_THROW(parseDateTime("2023-01-02"), FieldParseError);
    EXPECT_THROW(parseDateTime("2023-01-02 00:03:44."), FieldParseError);
    EXPECT_THROW(parseDateTime("2023-01-02 00:03:44.1234567890"), FieldParseError);
    EXPECT_THROW(parseDateTime("1672617824041"), FieldParseError);
}

TEST(ParseDateTimeTest, RejectsOutOfRangeFields) {
    EXPECT_THROW(parseDateTime("2023-13-02 00:00:00"), FieldParseError);
    EXPECT_THROW(parseDateTime("2023-00-02 00:00:00"), FieldParseError);
    EXPECT_THROW(parseDateTime("2023-04-31 00:00:00"), FieldParseError);
    EXPECT_THROW(parseDateTime("2023-01-00 00:00:00"), FieldParseError);
    EXPECT_THROW(parseDateTime("2023-01-02 24:00:00"), FieldParseError);
    EXPECT_THROW(parseDateTime("2023-01-02 00:60:00"), FieldParseError);
    EXPECT_THROW(parseDateTime("2023-01-02 00:00:60"), FieldParseError);
}

// EN: Durations
// FR: Durées

TEST(DurationParsersTest, MillisecondsAreIntegers) {
    EXPECT_EQ(durationFromMillis("12928").count(), 12928);
    EXPECT_EQ(durationFromMillis("-250").count(), -250);
    EXPECT_EQ(durationFromMillis("0").count(), 0);
    EXPECT_THROW(durationFromMillis("12.9"), FieldParseError);
    EXPECT_THROW(durationFromMillis(""), FieldParseError);
    EXPECT_THROW(durationFromMillis("1e3"), FieldParseError);
}

TEST(DurationParsersTest, SecondsAreFlooredToMilliseconds) {
    EXPECT_EQ(durationFromSeconds("12.928").count(), 12928);
    EXPECT_EQ(durationFromSeconds("2.5").count(), 2500);
    EXPECT_EQ(durationFromSeconds("1.9999").count(), 1999);
    EXPECT_EQ(durationFromSeconds("-1.5").count(), -1500);
    EXPECT_EQ(durationFromSeconds("-0.0005").count(), -1);
    EXPECT_EQ(durationFromSeconds("3").count(), 3000);
}

TEST(DurationParsersTest, SecondsRejectGarbage) {
    EXPECT_THROW(durationFromSeconds(""), FieldParseError);
    EXPECT_THROW(durationFromSeconds("abc"), FieldParseError);
    EXPECT_THROW(durationFromSeconds("1.5s"), FieldParseError);
    EXPECT_THROW(durationFromSeconds("nan"), FieldParseError);
    EXPECT_THROW(durationFromSeconds("inf"), FieldParseError);
    EXPECT_THROW(durationFromSeconds("1e300"), FieldParseError);
}

TEST(DurationParsersTest, SecondsRejectHexadecimalFloats) {
    EXPECT_THROW(durationFromSeconds("0x10"), FieldParseError);
    EXPECT_THROW(durationFromSeconds("0X1A"), FieldParseError);
    EXPECT_THROW(durationFromSeconds("0x1p3"), FieldParseError);
    EXPECT_THROW(durationFromSeconds("-0x1.8p1"), FieldParseError);
}

// EN: Bit error rate, valid flag and no-match stream identifiers
// FR: Taux d'erreur binaire, drapeau valid et identifiants de flux sans correspondance

TEST(ParseBerTest, ParsesFloats) {
    EXPECT_NEAR(parseBer("0.247597"), 0.247597f, 1e-6);
    EXPECT_FLOAT_EQ(parseBer("0"), 0.0f);
    EXPECT_FLOAT_EQ(parseBer("-1.5"), -1.5f);
    EXPECT_FLOAT_EQ(parseBer("1e-3"), 0.001f);
}

TEST(ParseBerTest, RejectsGarbage) {
    EXPECT_THROW(parseBer(""), FieldParseError);
    EXPECT_THROW(parseBer("high"), FieldParseError);
    EXPECT_THROW(parseBer("0.25%"), FieldParseError);
}

TEST(ParseBerTest, RejectsHexadecimalFloats) {
    EXPECT_THROW(parseBer("0x10"), FieldParseError);
    EXPECT_THROW(parseBer("0x1A"), FieldParseError);
    EXPECT_THROW(parseBer("0x1p-3"), FieldParseError);
}

TEST(ParseValidTest, OnlyThreeTokensAreTrue) {
    EXPECT_TRUE(parseValid("VALID"));
    EXPECT_TRUE(parseValid("true"));
    EXPECT_TRUE(parseValid("1"));

    EXPECT_FALSE(parseValid("valid"));
    EXPECT_FALSE(parseValid("TRUE"));
    EXPECT_FALSE(parseValid("0"));
    EXPECT_FALSE(parseValid("yes"));
    EXPECT_FALSE(parseValid(""));
}

TEST(NoMatchStreamIdTest, RecognizesNoMatchTokens) {
    EXPECT_TRUE(isNoMatchStreamId(""));
    EXPECT_TRUE(isNoMatchStreamId("0"));
    EXPECT_TRUE(isNoMatchStreamId("NO_DATA"));
    EXPECT_TRUE(isNoMatchStreamId("NO_MATCH"));
    EXPECT_TRUE(isNoMatchStreamId("NO_SOUND"));

    EXPECT_FALSE(isNoMatchStreamId("329"));
    EXPECT_FALSE(isNoMatchStreamId("no_match"));
    EXPECT_FALSE(isNoMatchStreamId("00"));
}
