#include <gtest/gtest.h>

#include "core/Iupac.hpp"

using namespace Memopair;

TEST(IupacTest, ValidCodesAnyCase) {
    for (char c : std::string("ACGTRYSWKMBDHVN")) {
        EXPECT_TRUE(Iupac::is_valid(c)) << c;
        EXPECT_TRUE(Iupac::is_valid(static_cast<char>(c - 'A' + 'a'))) << c;
    }
    EXPECT_FALSE(Iupac::is_valid('X'));
    EXPECT_FALSE(Iupac::is_valid('U'));
    EXPECT_FALSE(Iupac::is_valid('-'));
    EXPECT_FALSE(Iupac::is_valid('\0'));
}

TEST(IupacTest, ComplementPairs) {
    EXPECT_EQ(Iupac::complement('A'), 'T');
    EXPECT_EQ(Iupac::complement('c'), 'G');
    EXPECT_EQ(Iupac::complement('R'), 'Y');
    EXPECT_EQ(Iupac::complement('K'), 'M');
    EXPECT_EQ(Iupac::complement('B'), 'V');
    EXPECT_EQ(Iupac::complement('D'), 'H');
    EXPECT_EQ(Iupac::complement('W'), 'W');
    EXPECT_EQ(Iupac::complement('S'), 'S');
    EXPECT_EQ(Iupac::complement('N'), 'N');

    // Complement is an involution over the whole table
    for (char c : std::string("ACGTRYSWKMBDHVN")) {
        EXPECT_EQ(Iupac::complement(Iupac::complement(c)), c);
    }
}

TEST(IupacTest, ReverseComplement) {
    EXPECT_EQ(Iupac::reverse_complement("CCWGG"), "CCWGG");
    EXPECT_EQ(Iupac::reverse_complement("GATC"), "GATC");
    EXPECT_EQ(Iupac::reverse_complement("ACCT"), "AGGT");
    EXPECT_EQ(Iupac::reverse_complement("gantc"), "GANTC");
    EXPECT_EQ(Iupac::reverse_complement("RAA"), "TTY");
    EXPECT_EQ(Iupac::reverse_complement(""), "");
}

TEST(IupacTest, AmbiguityMatching) {
    EXPECT_TRUE(Iupac::matches('W', 'A'));
    EXPECT_TRUE(Iupac::matches('W', 't'));
    EXPECT_FALSE(Iupac::matches('W', 'C'));
    EXPECT_FALSE(Iupac::matches('W', 'G'));

    // A reference ambiguity code matches when its set is inside the motif's
    EXPECT_TRUE(Iupac::matches('W', 'W'));
    EXPECT_TRUE(Iupac::matches('N', 'W'));
    EXPECT_FALSE(Iupac::matches('A', 'W'));

    for (char c : std::string("ACGTRYSWKMBDHVN")) {
        EXPECT_TRUE(Iupac::matches('N', c)) << c;
    }
    EXPECT_FALSE(Iupac::matches('A', 'N'));
    EXPECT_FALSE(Iupac::matches('N', 'X'));
    EXPECT_TRUE(Iupac::matches('c', 'C'));
}
