/**
 * @file test_input_sanitizer.cpp
 * @brief Unit tests for coordinate and search-term sanitizing
 */

#include <gtest/gtest.h>
#include "InputSanitizer.hpp"
#include <string>
#include <vector>

using namespace SCS;

class InputSanitizerTest : public ::testing::Test {
protected:
    void SetUp() override {}
};

TEST_F(InputSanitizerTest, CollapsesAndTrimsWhitespace) {
    EXPECT_EQ(sanitize("  500000   6500000  "), "500000 6500000");
    EXPECT_EQ(sanitize("500000\t6500000"), "500000 6500000");
    EXPECT_EQ(sanitize("500000\r\n6500000"), "500000 6500000");
}

TEST_F(InputSanitizerTest, EmptyInput) {
    EXPECT_EQ(sanitize(""), "");
    EXPECT_EQ(sanitize("   \t  "), "");
}

TEST_F(InputSanitizerTest, RemovesTags) {
    EXPECT_EQ(sanitize("<b>500000</b> 6500000"), "500000 6500000");
    EXPECT_EQ(sanitize("<script>x</script>"), "x");
    // No closing bracket: not a tag
    EXPECT_EQ(sanitize("a < b"), "a < b");
}

TEST_F(InputSanitizerTest, DropsControlCharacters) {
    EXPECT_EQ(sanitize(std::string("5000\x01" "00")), "500000");
    EXPECT_EQ(sanitize(std::string("500000\x7f")), "500000");
}

TEST_F(InputSanitizerTest, NoBreakSpaceBecomesSpace) {
    EXPECT_EQ(sanitize("500\xC2\xA0" "000"), "500 000");
}

TEST_F(InputSanitizerTest, KeepsLatin1Letters) {
    EXPECT_EQ(sanitize("G\xC3\xB6teborg"), "G\xC3\xB6teborg");
}

TEST_F(InputSanitizerTest, DropsCodePointsOutsideLatin1) {
    // U+1F600 and U+20AC
    EXPECT_EQ(sanitize("500000 \xF0\x9F\x98\x80 6500000"), "500000 6500000");
    EXPECT_EQ(sanitize("\xE2\x82\xAC" "100"), "100");
}

TEST_F(InputSanitizerTest, TruncatesToMaxLength) {
    std::string long_input(250, 'a');
    EXPECT_EQ(sanitize(long_input).size(), 200u);
    EXPECT_EQ(sanitize(long_input, 10), std::string(10, 'a'));

    // The cut lands right after a space
    std::string spaced = std::string(199, 'a') + " bbbb";
    EXPECT_EQ(sanitize(spaced), std::string(199, 'a'));
}

TEST_F(InputSanitizerTest, Idempotent) {
    std::vector<std::string> inputs = {
        "  500000   6500000  ",
        "<i>E</i>: 500 000\tN: 6 500 000",
        std::string(199, 'a') + " bbbb",
        "a < b > c",
        "G\xC3\xB6teborg \xF0\x9F\x98\x80 12",
        "\xC2\xA0\xC2\xA0" "1,5",
    };
    for (const auto& input : inputs) {
        std::string once = sanitize(input);
        EXPECT_EQ(sanitize(once), once) << "input: " << input;
    }
}

TEST_F(InputSanitizerTest, CleanCoordinateTextDoesNotTruncate) {
    std::string long_input(250, '1');
    EXPECT_EQ(cleanCoordinateText(long_input).size(), 250u);
}

TEST_F(InputSanitizerTest, CodePointLength) {
    EXPECT_EQ(codePointLength(""), 0u);
    EXPECT_EQ(codePointLength("abc"), 3u);
    EXPECT_EQ(codePointLength("\xC3\xA5\xC3\xA4\xC3\xB6"), 3u);
}

// ============================================================================
// Search-term sanitizing
// ============================================================================

TEST_F(InputSanitizerTest, SearchTermRemovesAngleBrackets) {
    EXPECT_EQ(sanitizeSearchTerm("  Storgatan <b>1</b> "), "Storgatan b1/b");
}

TEST_F(InputSanitizerTest, SearchTermTruncatesTo256) {
    std::string long_term(300, 'x');
    EXPECT_EQ(sanitizeSearchTerm(long_term).size(), 256u);
}

TEST_F(InputSanitizerTest, SuggestableTerm) {
    EXPECT_FALSE(isSuggestableTerm("ab"));
    EXPECT_FALSE(isSuggestableTerm("  a  "));
    EXPECT_TRUE(isSuggestableTerm("abc"));
    EXPECT_TRUE(isSuggestableTerm("a b"));
}
