/**
 * @file test_coordinate_parser.cpp
 * @brief Unit tests for coordinate text parsing and classification
 */

#include <gtest/gtest.h>
#include "CoordinateParser.hpp"
#include <sstream>
#include <string>

using namespace SCS;

class CoordinateParserTest : public ::testing::Test {
protected:
    void SetUp() override {}

    void expectPair(const ParsedCoordinate& parsed, double easting, double northing) {
        ASSERT_TRUE(parsed.success) << "error: " << parsed.error;
        EXPECT_DOUBLE_EQ(parsed.easting, easting);
        EXPECT_DOUBLE_EQ(parsed.northing, northing);
    }
};

// ============================================================================
// Format detection
// ============================================================================

TEST_F(CoordinateParserTest, DetectInputFormat) {
    EXPECT_EQ(detectInputFormat("E 500000 N 6500000"), InputFormat::LABELED);
    EXPECT_EQ(detectInputFormat("n:6500000"), InputFormat::LABELED);
    EXPECT_EQ(detectInputFormat("500000, 6500000"), InputFormat::COMMA_SEPARATED);
    EXPECT_EQ(detectInputFormat("500000 6500000"), InputFormat::SPACE_SEPARATED);
    EXPECT_EQ(detectInputFormat("500000;6500000"), InputFormat::UNKNOWN);
}

TEST_F(CoordinateParserTest, ExtractNumericCandidates) {
    auto candidates = extractNumericCandidates("500000 6500000");
    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_EQ(candidates[0], "500000");
    EXPECT_EQ(candidates[1], "6500000");

    candidates = extractNumericCandidates("500000,6500000");
    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_EQ(candidates[0], "500000");
    EXPECT_EQ(candidates[1], "6500000");

    candidates = extractNumericCandidates("500000;6500000");
    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_EQ(candidates[1], "6500000");
}

// ============================================================================
// Parsing
// ============================================================================

TEST_F(CoordinateParserTest, EmptyInput) {
    EXPECT_EQ(parse("").error, ErrorKey::EMPTY);
    EXPECT_EQ(parse("   ").error, ErrorKey::EMPTY);
    EXPECT_EQ(parse("<b></b>").error, ErrorKey::EMPTY);
}

TEST_F(CoordinateParserTest, TooLongInput) {
    std::string input = std::string(150, '1') + " " + std::string(60, '2');
    ParsedCoordinate parsed = parse(input);
    EXPECT_FALSE(parsed.success);
    EXPECT_EQ(parsed.error, ErrorKey::TOO_LONG);
}

TEST_F(CoordinateParserTest, SpaceSeparated) {
    ParsedCoordinate parsed = parse("500000 6500000");
    expectPair(parsed, 500000.0, 6500000.0);
    EXPECT_EQ(parsed.format, InputFormat::SPACE_SEPARATED);
    EXPECT_FALSE(parsed.warning.has_value());
}

TEST_F(CoordinateParserTest, NorthingFirstIsSwapped) {
    ParsedCoordinate parsed = parse("6500000 500000");
    expectPair(parsed, 500000.0, 6500000.0);
    EXPECT_EQ(parsed.format, InputFormat::SPACE_SEPARATED);
}

TEST_F(CoordinateParserTest, CommaSeparated) {
    ParsedCoordinate parsed = parse("500000,6500000");
    expectPair(parsed, 500000.0, 6500000.0);
    EXPECT_EQ(parsed.format, InputFormat::COMMA_SEPARATED);

    parsed = parse("500000, 6500000");
    expectPair(parsed, 500000.0, 6500000.0);
    EXPECT_EQ(parsed.format, InputFormat::COMMA_SEPARATED);
}

TEST_F(CoordinateParserTest, TabSeparated) {
    ParsedCoordinate parsed = parse("500000\t6500000");
    expectPair(parsed, 500000.0, 6500000.0);
    EXPECT_EQ(parsed.format, InputFormat::SPACE_SEPARATED);
}

TEST_F(CoordinateParserTest, UnknownFormatResolvedFromText) {
    ParsedCoordinate parsed = parse("500000;6500000");
    expectPair(parsed, 500000.0, 6500000.0);
    EXPECT_EQ(parsed.format, InputFormat::SPACE_SEPARATED);
}

TEST_F(CoordinateParserTest, DecimalValues) {
    ParsedCoordinate parsed = parse("500000,5 6500000,25");
    expectPair(parsed, 500000.5, 6500000.25);
}

TEST_F(CoordinateParserTest, Labeled) {
    ParsedCoordinate parsed = parse("E 500000 N 6500000");
    expectPair(parsed, 500000.0, 6500000.0);
    EXPECT_EQ(parsed.format, InputFormat::LABELED);

    expectPair(parse("N: 6500000, E: 500000"), 500000.0, 6500000.0);
    expectPair(parse("e=500000 n=6500000"), 500000.0, 6500000.0);
}

TEST_F(CoordinateParserTest, LabeledThousandsGrouping) {
    expectPair(parse("N 6 500 000 E 500 000"), 500000.0, 6500000.0);
}

TEST_F(CoordinateParserTest, LabeledLastValueWins) {
    expectPair(parse("E 100000 E 500000 N 6500000"), 500000.0, 6500000.0);
}

TEST_F(CoordinateParserTest, LabeledIncomplete) {
    EXPECT_EQ(parse("E 500000").error, ErrorKey::PARSE);
}

TEST_F(CoordinateParserTest, LabeledOutOfRange) {
    EXPECT_EQ(parse("E 900000 N 6500000").error, ErrorKey::OUT_OF_RANGE);
}

TEST_F(CoordinateParserTest, GeographicRejected) {
    EXPECT_EQ(parse("59.3293 18.0686").error, ErrorKey::NOT_SWEREF);
    EXPECT_EQ(parse("59,3293 18,0686").error, ErrorKey::NOT_SWEREF);
    EXPECT_EQ(parse("E 18.07 N 59.33").error, ErrorKey::NOT_SWEREF);
}

TEST_F(CoordinateParserTest, NotTwoNumbers) {
    EXPECT_EQ(parse("500000").error, ErrorKey::PARSE);
    EXPECT_EQ(parse("500000 6500000 100").error, ErrorKey::PARSE);
    EXPECT_EQ(parse("hello world").error, ErrorKey::PARSE);
}

TEST_F(CoordinateParserTest, UndeterminableOrder) {
    EXPECT_EQ(parse("6500000 6600000").error, ErrorKey::PARSE);
}

TEST_F(CoordinateParserTest, OutsideGlobalEnvelope) {
    EXPECT_EQ(parse("500000 9000000").error, ErrorKey::OUT_OF_RANGE);
}

TEST_F(CoordinateParserTest, SanitizedTextKept) {
    ParsedCoordinate parsed = parse("  <b>500000</b>   6500000 ");
    ASSERT_TRUE(parsed.success);
    EXPECT_EQ(parsed.sanitized, "500000 6500000");
}

TEST_F(CoordinateParserTest, ValidPairsParseInEveryFormat) {
    const double eastings[] = {30000.0, 150000.0, 500000.0, 799999.0};
    const double northings[] = {5900000.0, 6500000.0, 7800000.0};

    for (double e : eastings) {
        for (double n : northings) {
            std::ostringstream space, comma, labeled, swapped;
            space << static_cast<long>(e) << " " << static_cast<long>(n);
            comma << static_cast<long>(e) << "," << static_cast<long>(n);
            labeled << "N: " << static_cast<long>(n) << " E: " << static_cast<long>(e);
            swapped << static_cast<long>(n) << " " << static_cast<long>(e);

            for (const auto& text : {space.str(), comma.str(), labeled.str(), swapped.str()}) {
                ParsedCoordinate parsed = parse(text);
                ASSERT_TRUE(parsed.success) << text << ": " << parsed.error;
                EXPECT_DOUBLE_EQ(parsed.easting, e) << text;
                EXPECT_DOUBLE_EQ(parsed.northing, n) << text;
            }
        }
    }
}

// ============================================================================
// Direct normalization
// ============================================================================

TEST_F(CoordinateParserTest, NormalizeCoordinates) {
    ParsedCoordinate parsed = normalizeCoordinates(500000.0, 6500000.0);
    expectPair(parsed, 500000.0, 6500000.0);
    EXPECT_EQ(parsed.format, InputFormat::UNKNOWN);

    EXPECT_EQ(normalizeCoordinates(18.07, 59.33).error, ErrorKey::NOT_SWEREF);
    EXPECT_EQ(normalizeCoordinates(900000.0, 6500000.0).error, ErrorKey::OUT_OF_RANGE);
}

// ============================================================================
// Classification
// ============================================================================

TEST_F(CoordinateParserTest, ClassifyTooShort) {
    InputClassification c = classifyInput("abc");
    EXPECT_FALSE(c.is_coordinate);
    EXPECT_EQ(c.reason, ClassificationReason::INPUT_TOO_SHORT);
}

TEST_F(CoordinateParserTest, ClassifyPlaceNames) {
    InputClassification c = classifyInput("hello world");
    EXPECT_FALSE(c.is_coordinate);
    EXPECT_EQ(c.reason, ClassificationReason::UNSUPPORTED_CHARACTERS);
    EXPECT_EQ(c.confidence, InputConfidence::HIGH);

    // Letters decide on their own, with or without an address match
    c = classifyInput("xyz 500000 6500000");
    EXPECT_FALSE(c.is_coordinate);
    EXPECT_EQ(c.reason, ClassificationReason::UNSUPPORTED_CHARACTERS);
    EXPECT_EQ(c.confidence, InputConfidence::HIGH);

    c = classifyInput("Kungsgatan 12, Stockholm");
    EXPECT_FALSE(c.is_coordinate);
    EXPECT_EQ(c.reason, ClassificationReason::UNSUPPORTED_CHARACTERS);
    EXPECT_EQ(c.confidence, InputConfidence::HIGH);

    c = classifyInput("G\xC3\xB6teborg");
    EXPECT_FALSE(c.is_coordinate);
    EXPECT_EQ(c.confidence, InputConfidence::HIGH);
}

TEST_F(CoordinateParserTest, ClassifyPostalCode) {
    InputClassification c = classifyInput("123 45");
    EXPECT_FALSE(c.is_coordinate);
    EXPECT_EQ(c.reason, ClassificationReason::ADDRESS_PATTERN_DETECTED);
}

TEST_F(CoordinateParserTest, ClassifySweref) {
    InputClassification c = classifyInput("500000 6500000");
    EXPECT_TRUE(c.is_coordinate);
    EXPECT_EQ(c.confidence, InputConfidence::HIGH);
    EXPECT_EQ(c.reason, ClassificationReason::SWEREF_RANGE);

    c = classifyInput("E 500000 N 6500000");
    EXPECT_TRUE(c.is_coordinate);
    EXPECT_EQ(c.reason, ClassificationReason::SWEREF_RANGE);
}

TEST_F(CoordinateParserTest, ClassifyWgs84) {
    InputClassification c = classifyInput("59.33 18.07");
    EXPECT_TRUE(c.is_coordinate);
    EXPECT_EQ(c.confidence, InputConfidence::MEDIUM);
    EXPECT_EQ(c.reason, ClassificationReason::WGS84_RANGE);
}

TEST_F(CoordinateParserTest, ClassifyRejections) {
    EXPECT_EQ(classifyInput("1000000 2000000").reason, ClassificationReason::OUT_OF_RANGE);

    InputClassification c = classifyInput("500000 6500000 100");
    EXPECT_EQ(c.reason, ClassificationReason::NOT_TWO_NUMBERS);
    EXPECT_EQ(c.confidence, InputConfidence::MEDIUM);

    EXPECT_EQ(classifyInput("1,,,2 3").reason, ClassificationReason::INVALID_NUMBERS);
    EXPECT_EQ(toString(ClassificationReason::WGS84_RANGE), "wgs84_range");
}
