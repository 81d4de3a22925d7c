#include <gtest/gtest.h>

#include <random>

#include "core/MotifScanner.hpp"

using namespace Memopair;

namespace {

std::vector<MotifOccurrence> scan(const std::string& sequence, const std::string& token) {
    ReferenceSequence reference{0, "seq1", sequence};
    MotifPairSpec spec = MotifPairSpec::parse(token);
    MotifScanner scanner(reference, spec);
    return scanner.scan_all();
}

std::vector<MotifOccurrence> on_strand(const std::vector<MotifOccurrence>& occurrences, Strand strand) {
    std::vector<MotifOccurrence> selected;
    for (const auto& occ : occurrences) {
        if (occ.strand == strand) selected.push_back(occ);
    }
    return selected;
}

}  // namespace

TEST(MotifScannerTest, ForwardOccurrenceSites) {
    auto occurrences = on_strand(scan("ACCWGGT", "CCWGG_a_0_m_4"), Strand::FORWARD);
    ASSERT_EQ(occurrences.size(), 1u);
    EXPECT_EQ(occurrences[0].start, 1);
    EXPECT_EQ(occurrences[0].mod1_pos, 1);
    EXPECT_EQ(occurrences[0].mod2_pos, 5);
    EXPECT_EQ(occurrences[0].ref_id, 0);
}

TEST(MotifScannerTest, AmbiguousMotifMatchesConcreteBases) {
    auto occurrences = on_strand(scan("TTCCAGGTTCCTGGTTCCCGG", "CCWGG_4mC_0_5mC_3"), Strand::FORWARD);
    ASSERT_EQ(occurrences.size(), 2u);
    EXPECT_EQ(occurrences[0].start, 2);
    EXPECT_EQ(occurrences[1].start, 9);
}

TEST(MotifScannerTest, ReverseOccurrenceMirrorsOffsets) {
    // ACGT is its own reverse complement, so it is found on both strands
    std::string sequence = "GGGGGGGGGGACGTGGGGGG";
    auto occurrences = scan(sequence, "ACGT_a_0_m_3");

    auto reverse = on_strand(occurrences, Strand::REVERSE);
    ASSERT_EQ(reverse.size(), 1u);
    EXPECT_EQ(reverse[0].start, 10);
    EXPECT_EQ(reverse[0].mod1_pos, 13);
    EXPECT_EQ(reverse[0].mod2_pos, 10);

    auto forward = on_strand(occurrences, Strand::FORWARD);
    ASSERT_EQ(forward.size(), 1u);
    EXPECT_EQ(forward[0].mod1_pos, 10);
    EXPECT_EQ(forward[0].mod2_pos, 13);
}

TEST(MotifScannerTest, NonPalindromicReverseHit) {
    // GTTC is the reverse complement of GAAC
    auto occurrences = scan("AAGTTCAA", "GAAC_a_1_m_2");
    ASSERT_EQ(occurrences.size(), 1u);
    EXPECT_EQ(occurrences[0].strand, Strand::REVERSE);
    EXPECT_EQ(occurrences[0].start, 2);
    EXPECT_EQ(occurrences[0].mod1_pos, 2 + (3 - 1));
    EXPECT_EQ(occurrences[0].mod2_pos, 2 + (3 - 2));
}

TEST(MotifScannerTest, OverlappingOccurrencesAreKept) {
    auto occurrences = scan("CAAAAC", "AAA_a_0_a_2");
    auto forward = on_strand(occurrences, Strand::FORWARD);
    ASSERT_EQ(forward.size(), 2u);
    EXPECT_EQ(forward[0].start, 1);
    EXPECT_EQ(forward[1].start, 2);
    EXPECT_TRUE(on_strand(occurrences, Strand::REVERSE).empty());
}

TEST(MotifScannerTest, CaseInsensitive) {
    EXPECT_EQ(on_strand(scan("accaggt", "CCWGG_a_0_m_4"), Strand::FORWARD).size(), 1u);
}

TEST(MotifScannerTest, NoMatchAtSequenceEnd) {
    EXPECT_TRUE(scan("TTTTCCAG", "CCWGG_a_0_m_4").empty());
    EXPECT_TRUE(scan("CCW", "CCWGG_a_0_m_4").empty());
    EXPECT_TRUE(scan("", "CCWGG_a_0_m_4").empty());

    // Exact fit at the very end is still reported
    EXPECT_EQ(on_strand(scan("TTCCAGG", "CCWGG_a_0_m_4"), Strand::FORWARD).size(), 1u);
}

TEST(MotifScannerTest, ReferenceNDoesNotMatchConcreteMotifBase) {
    EXPECT_TRUE(scan("CCNGG", "CCWGG_a_0_m_4").empty());
    EXPECT_EQ(scan("CCNGG", "CCNGG_a_0_m_4").size(), 2u);
}

TEST(MotifScannerTest, LazyAndRestartable) {
    ReferenceSequence reference{3, "chrX", "GATCGATC"};
    MotifPairSpec spec = MotifPairSpec::parse("GATC_a_1_a_2");
    MotifScanner scanner(reference, spec, 7);

    MotifOccurrence occ;
    std::vector<int64_t> first_pass;
    while (scanner.next(occ)) {
        EXPECT_EQ(occ.ref_id, 3);
        EXPECT_EQ(occ.spec_index, 7u);
        first_pass.push_back(occ.start);
    }
    // Forward and reverse hit at 0 and at 4
    EXPECT_EQ(first_pass, (std::vector<int64_t>{0, 0, 4, 4}));
    EXPECT_FALSE(scanner.next(occ));

    scanner.reset();
    std::vector<int64_t> second_pass;
    while (scanner.next(occ)) {
        second_pass.push_back(occ.start);
    }
    EXPECT_EQ(first_pass, second_pass);
}

TEST(MotifScannerTest, SitesAlwaysWithinReference) {
    std::mt19937 rng(42);
    const std::string bases = "ACGTN";
    std::uniform_int_distribution<int> pick(0, 3);
    std::uniform_int_distribution<int> pick_n(0, 40);

    for (const char* token : {"CCWGG_4mC_0_5mC_3", "GANTC_a_1_a_3", "ACGT_a_0_m_3", "RGATCY_m_5_a_0"}) {
        MotifPairSpec spec = MotifPairSpec::parse(token);
        for (int trial = 0; trial < 20; ++trial) {
            std::string sequence(500, 'A');
            for (auto& c : sequence) {
                c = pick_n(rng) == 0 ? bases[4] : bases[pick(rng)];
            }
            ReferenceSequence reference{0, "r", sequence};
            MotifScanner scanner(reference, spec);
            for (const auto& occ : scanner.scan_all()) {
                EXPECT_GE(occ.mod1_pos, 0);
                EXPECT_GE(occ.mod2_pos, 0);
                EXPECT_LT(occ.mod1_pos, static_cast<int64_t>(sequence.size()));
                EXPECT_LT(occ.mod2_pos, static_cast<int64_t>(sequence.size()));
                EXPECT_LE(occ.start + static_cast<int64_t>(spec.motif_length()),
                          static_cast<int64_t>(sequence.size()));
            }
        }
    }
}
