/**
 * @file test_text_normalizer.cpp
 * @brief Unit tests for text normalization
 */

#include <gtest/gtest.h>
#include <fiscalcode/utils/text_normalizer.h>

using namespace fiscalcode::utils;

class TextNormalizerTest : public ::testing::Test {
protected:
    // Test setup if needed
};

// trim tests
TEST_F(TextNormalizerTest, Trim_BothEnds) {
    EXPECT_EQ(trim("   hello   "), "hello");
}

TEST_F(TextNormalizerTest, Trim_OnlySpaces) {
    EXPECT_EQ(trim("     "), "");
}

TEST_F(TextNormalizerTest, Trim_TabsAndNewlines) {
    EXPECT_EQ(trim("\t\nhello\n\t"), "hello");
}

TEST_F(TextNormalizerTest, Trim_KeepsInnerSpaces) {
    EXPECT_EQ(trim(" De Angelis "), "De Angelis");
}

// toUpper tests
TEST_F(TextNormalizerTest, ToUpper_Mixed) {
    EXPECT_EQ(toUpper("HeLLo WoRLd"), "HELLO WORLD");
}

TEST_F(TextNormalizerTest, ToUpper_WithNumbers) {
    EXPECT_EQ(toUpper("h501"), "H501");
}

TEST_F(TextNormalizerTest, ToUpper_LeavesNonAsciiBytes) {
    EXPECT_EQ(toUpper("caf\xC3\xA9"), "CAF\xC3\xA9");
}

// normalize tests
TEST_F(TextNormalizerTest, Normalize_Empty) {
    EXPECT_EQ(normalize("", true), "");
    EXPECT_EQ(normalize("", false), "");
}

TEST_F(TextNormalizerTest, Normalize_TrimsAndUppercases) {
    EXPECT_EQ(normalize("  rossi ", false), "ROSSI");
}

TEST_F(TextNormalizerTest, Normalize_Utf8Uppercase) {
    // ÀÈÉÌÒÙ
    EXPECT_EQ(normalize("\xC3\x80\xC3\x88\xC3\x89\xC3\x8C\xC3\x92\xC3\x99", true), "AEEIOU");
}

TEST_F(TextNormalizerTest, Normalize_Utf8Lowercase) {
    // àèéìòù
    EXPECT_EQ(normalize("\xC3\xA0\xC3\xA8\xC3\xA9\xC3\xAC\xC3\xB2\xC3\xB9", true), "AEEIOU");
}

TEST_F(TextNormalizerTest, Normalize_Utf8Name) {
    // Niccolò
    EXPECT_EQ(normalize("Niccol\xC3\xB2", true), "NICCOLO");
}

TEST_F(TextNormalizerTest, Normalize_Latin1Bytes) {
    // "Niccolò" and "Pérez" in ISO-8859-1
    EXPECT_EQ(normalize("Niccol\xF2", true), "NICCOLO");
    EXPECT_EQ(normalize("P\xE9rez", true), "PEREZ");
}

TEST_F(TextNormalizerTest, Normalize_WithoutStrippingKeepsAccents) {
    EXPECT_EQ(normalize("Niccol\xC3\xB2", false), "NICCOL\xC3\xB2");
}

TEST_F(TextNormalizerTest, Normalize_OtherUtf8Untouched) {
    // ü (C3 BC) is not in the mapping
    EXPECT_EQ(normalize("M\xC3\xBCller", true), "M\xC3\xBCLLER");
    // € (E2 82 AC): lead byte must not be read as Latin-1
    EXPECT_EQ(normalize("a\xE2\x82\xAC", true), "A\xE2\x82\xAC");
}

TEST_F(TextNormalizerTest, Normalize_Idempotent) {
    std::string once = normalize("  d'Am\xC3\xAC" "co ", true);
    EXPECT_EQ(normalize(once, true), once);
}

// isAsciiAlnum tests
TEST_F(TextNormalizerTest, IsAsciiAlnum) {
    EXPECT_TRUE(isAsciiAlnum("H501"));
    EXPECT_TRUE(isAsciiAlnum("z404"));
    EXPECT_FALSE(isAsciiAlnum(""));
    EXPECT_FALSE(isAsciiAlnum("H-01"));
    EXPECT_FALSE(isAsciiAlnum("H 01"));
}
