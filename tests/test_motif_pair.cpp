#include <gtest/gtest.h>

#include "core/Errors.hpp"
#include "core/MotifPair.hpp"

using namespace Memopair;

namespace {

std::string failing_field(const std::string& token) {
    try {
        MotifPairSpec::parse(token);
    } catch (const InvalidSpecError& e) {
        EXPECT_EQ(e.token(), token);
        return e.field();
    }
    return "";
}

}  // namespace

TEST(MotifPairTest, ParsesToken) {
    MotifPairSpec spec = MotifPairSpec::parse("CCWGG_4mC_0_5mC_3");
    EXPECT_EQ(spec.motif, "CCWGG");
    EXPECT_EQ(spec.mod1.mod_type, "4mC");
    EXPECT_EQ(spec.mod1.offset, 0u);
    EXPECT_EQ(spec.mod2.mod_type, "5mC");
    EXPECT_EQ(spec.mod2.offset, 3u);
    EXPECT_EQ(spec.motif_length(), 5u);
}

TEST(MotifPairTest, MotifIsUpperCased) {
    MotifPairSpec spec = MotifPairSpec::parse("gatc_a_1_a_2");
    EXPECT_EQ(spec.motif, "GATC");
    EXPECT_EQ(spec.to_string(), "GATC_a_1_a_2");
}

TEST(MotifPairTest, CanonicalFormRoundTrips) {
    for (const char* token : {"ACGT_a_0_m_3", "CCWGG_4mC_0_5mC_3", "GANTC_a_1_a_3", "RGATCY_m_4_21839_1"}) {
        MotifPairSpec spec = MotifPairSpec::parse(token);
        EXPECT_EQ(spec.to_string(), token);
        EXPECT_EQ(MotifPairSpec::parse(spec.to_string()), spec);
    }

    // Leading zeros are accepted but not kept
    MotifPairSpec padded = MotifPairSpec::parse("ACGT_a_00_m_03");
    EXPECT_EQ(padded.to_string(), "ACGT_a_0_m_3");
    EXPECT_EQ(MotifPairSpec::parse(padded.to_string()), padded);
}

TEST(MotifPairTest, RejectsWrongFieldCount) {
    EXPECT_EQ(failing_field("ACGT_a_0"), "field_count");
    EXPECT_EQ(failing_field("ACGT_a_0_m_3_x"), "field_count");
    EXPECT_EQ(failing_field("ACGT_a_0_m_3_"), "field_count");
    EXPECT_EQ(failing_field(""), "field_count");
}

TEST(MotifPairTest, RejectsBadMotif) {
    EXPECT_EQ(failing_field("_a_0_m_3"), "motif");
    EXPECT_EQ(failing_field("ACXT_a_0_m_3"), "motif");
    EXPECT_EQ(failing_field("AC-T_a_0_m_3"), "motif");
}

TEST(MotifPairTest, RejectsBadTypes) {
    EXPECT_EQ(failing_field("ACGT__0_m_3"), "mod_type_1");
    EXPECT_EQ(failing_field("ACGT_a_0__3"), "mod_type_2");
}

TEST(MotifPairTest, RejectsBadPositions) {
    EXPECT_EQ(failing_field("ACGT_a_4_m_3"), "mod_position_1");
    EXPECT_EQ(failing_field("ACGT_a_-1_m_3"), "mod_position_1");
    EXPECT_EQ(failing_field("ACGT_a_x_m_3"), "mod_position_1");
    EXPECT_EQ(failing_field("ACGT_a__m_3"), "mod_position_1");
    EXPECT_EQ(failing_field("ACGT_a_0_m_4"), "mod_position_2");
    EXPECT_EQ(failing_field("ACGT_a_0_m_99999999999999999999999"), "mod_position_2");
    EXPECT_EQ(failing_field("ACGT_a_0_m_+1"), "mod_position_2");
}

TEST(MotifPairTest, RejectsEqualOffsets) {
    EXPECT_EQ(failing_field("ACGT_a_2_m_2"), "mod_position_2");
}

TEST(MotifPairTest, ErrorMessageNamesToken) {
    try {
        MotifPairSpec::parse("ACGT_a_9_m_3");
        FAIL() << "expected InvalidSpecError";
    } catch (const InvalidSpecError& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("ACGT_a_9_m_3"), std::string::npos);
        EXPECT_NE(msg.find("mod_position_1"), std::string::npos);
    }
}

TEST(MotifPairTest, Palindromes) {
    EXPECT_TRUE(MotifPairSpec::parse("GATC_a_1_a_2").is_palindromic());
    EXPECT_TRUE(MotifPairSpec::parse("CCWGG_4mC_0_5mC_3").is_palindromic());
    EXPECT_FALSE(MotifPairSpec::parse("GAAC_a_1_a_2").is_palindromic());
    EXPECT_EQ(MotifPairSpec::parse("GAAC_a_1_a_2").reverse_complement_motif(), "GTTC");
}

TEST(MotifPairTest, ParseListAllOrNothing) {
    auto specs = parse_motif_pairs({"ACGT_a_0_m_3", "CCWGG_4mC_0_5mC_3"});
    ASSERT_EQ(specs.size(), 2u);
    EXPECT_EQ(specs[0].motif, "ACGT");
    EXPECT_EQ(specs[1].motif, "CCWGG");

    EXPECT_THROW(parse_motif_pairs({"ACGT_a_0_m_3", "ACGT_a_0"}), InvalidSpecError);
}

TEST(MotifPairTest, ParseListRejectsDuplicates) {
    EXPECT_THROW(parse_motif_pairs({"ACGT_a_0_m_3", "acgt_a_0_m_3"}), InvalidSpecError);
    EXPECT_NO_THROW(parse_motif_pairs({"ACGT_a_0_m_3", "ACGT_m_0_a_3"}));
}
