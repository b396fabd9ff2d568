/**
 * @file test_omocode.cpp
 * @brief Unit tests for omocode substitution
 */

#include <gtest/gtest.h>
#include <fiscalcode/exceptions.h>
#include <fiscalcode/fiscal_code.h>
#include <fiscalcode/omocode.h>

using namespace fiscalcode;

class OmocodeTest : public ::testing::Test {
protected:
    const std::string plain_ = "RSSMRA50E04A131O";
};

// ============================================================================
// stripOmocode
// ============================================================================

TEST_F(OmocodeTest, Strip_PlainCodeUnchanged) {
    EXPECT_EQ(stripOmocode(plain_), plain_);
}

TEST_F(OmocodeTest, Strip_ReplacesEveryDigitPosition) {
    EXPECT_EQ(stripOmocode("RSSMRARLELQAMPMY"), "RSSMRA50E04A131Y");
}

TEST_F(OmocodeTest, Strip_AlphabetMapping) {
    // Position 14 takes each omocode letter in turn
    const std::string letters = "LMNPQRSTUV";
    for (size_t d = 0; d < letters.size(); ++d) {
        std::string code = "RSSMRA50E04A13" + std::string(1, letters[d]) + "X";
        EXPECT_EQ(stripOmocode(code)[14], static_cast<char>('0' + d)) << letters[d];
    }
}

TEST_F(OmocodeTest, Strip_LeavesOtherPositions) {
    // Letters outside digit positions are never touched, even omocode letters
    EXPECT_EQ(stripOmocode("LMNPQR50E04L131L"), "LMNPQR50E04L131L");
}

TEST_F(OmocodeTest, Strip_LeavesForeignLetters) {
    // 'A' is not an omocode letter: kept so the grammar check rejects it
    EXPECT_EQ(stripOmocode("RSSMRA5AE04A131O"), "RSSMRA5AE04A131O");
}

TEST_F(OmocodeTest, Strip_ShortInputSkipsMissingPositions) {
    EXPECT_EQ(stripOmocode(""), "");
    EXPECT_EQ(stripOmocode("RSSMRARL"), "RSSMRA50");
}

TEST_F(OmocodeTest, Strip_Idempotent) {
    for (const std::string code : {"RSSMRARLELQAMPMY", "RSSMRA50E04A13MG", "RSSMRA5AE04A131O", "short"}) {
        std::string once = stripOmocode(code);
        EXPECT_EQ(stripOmocode(once), once) << code;
    }
}

// ============================================================================
// omocodeLevel / isOmocode
// ============================================================================

TEST_F(OmocodeTest, Level) {
    EXPECT_EQ(omocodeLevel(plain_), 0);
    EXPECT_EQ(omocodeLevel("RSSMRA50E04A13MG"), 1);
    EXPECT_EQ(omocodeLevel("RSSMRARLELQAMPMY"), 7);
    EXPECT_FALSE(isOmocode(plain_));
    EXPECT_TRUE(isOmocode("RSSMRA50E04A13MG"));
}

// ============================================================================
// applyOmocode
// ============================================================================

TEST_F(OmocodeTest, Apply_KnownVariants) {
    EXPECT_EQ(applyOmocode(plain_, 0), plain_);
    EXPECT_EQ(applyOmocode(plain_, 1), "RSSMRA50E04A13MG");
    EXPECT_EQ(applyOmocode(plain_, 2), "RSSMRA50E04A1PMS");
    EXPECT_EQ(applyOmocode(plain_, 3), "RSSMRA50E04AMPMK");
    EXPECT_EQ(applyOmocode(plain_, 4), "RSSMRA50E0QAMPMH");
    EXPECT_EQ(applyOmocode(plain_, 5), "RSSMRA50ELQAMPMS");
    EXPECT_EQ(applyOmocode(plain_, 6), "RSSMRA5LELQAMPMD");
    EXPECT_EQ(applyOmocode(plain_, 7), "RSSMRARLELQAMPMY");
}

TEST_F(OmocodeTest, Apply_EveryLevelIsValidAndStripsBack) {
    for (int level = 0; level <= MAX_OMOCODE_LEVEL; ++level) {
        std::string variant = applyOmocode(plain_, level);
        EXPECT_TRUE(isValid(variant)) << variant;
        EXPECT_EQ(omocodeLevel(variant), level) << variant;
        EXPECT_EQ(stripOmocode(variant).substr(0, 15), plain_.substr(0, 15)) << variant;
    }
}

TEST_F(OmocodeTest, Apply_FromOmocodeInputRecomputes) {
    EXPECT_EQ(applyOmocode("RSSMRARLELQAMPMY", 1), "RSSMRA50E04A13MG");
}

TEST_F(OmocodeTest, Apply_NormalizesInput) {
    EXPECT_EQ(applyOmocode(" rssmra50e04a131o ", 1), "RSSMRA50E04A13MG");
}

TEST_F(OmocodeTest, Apply_LevelOutOfRange_Throws) {
    EXPECT_THROW(applyOmocode(plain_, -1), InvalidInputException);
    EXPECT_THROW(applyOmocode(plain_, 8), InvalidInputException);
}

TEST_F(OmocodeTest, Apply_InvalidCode_Throws) {
    EXPECT_THROW(applyOmocode("RSSMRA50E04A131A", 1), InvalidInputException);
    EXPECT_THROW(applyOmocode("", 1), InvalidInputException);
}
