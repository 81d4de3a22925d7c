#pragma once

#include <string>
#include <vector>

namespace Memopair {

/**
 * @brief One declared modification site within a motif.
 */
struct ModSite {
    std::string mod_type;  ///< Opaque label, e.g. "a", "m", "4mC", "5mC"
    size_t offset;         ///< 0-based offset into the motif

    bool operator==(const ModSite& other) const {
        return mod_type == other.mod_type && offset == other.offset;
    }
};

/**
 * @brief A motif plus the two complementary modification sites it carries.
 *
 * Parsed from tokens of the form MOTIF_TYPE1_POS1_TYPE2_POS2, e.g.
 * "CCWGG_4mC_0_5mC_3". The motif is stored upper-cased.
 *
 * Invariants: motif non-empty and made of IUPAC codes, both offsets lie in
 * [0, motif length) and differ.
 */
struct MotifPairSpec {
    std::string motif;
    ModSite mod1;
    ModSite mod2;

    /**
     * @brief Parses a motif-pair token.
     * @throws InvalidSpecError naming the offending field.
     */
    static MotifPairSpec parse(const std::string& token);

    /**
     * @brief Canonical string form; parse(to_string()) reproduces the spec.
     */
    std::string to_string() const;

    size_t motif_length() const { return motif.size(); }

    std::string reverse_complement_motif() const;

    /**
     * @brief True if the motif equals its own reverse complement (e.g. GATC).
     */
    bool is_palindromic() const;

    bool operator==(const MotifPairSpec& other) const {
        return motif == other.motif && mod1 == other.mod1 && mod2 == other.mod2;
    }
    bool operator!=(const MotifPairSpec& other) const { return !(*this == other); }
};

/**
 * @brief Parses every token; nothing is returned unless all of them validate.
 *
 * @throws InvalidSpecError on the first invalid or duplicated token.
 */
std::vector<MotifPairSpec> parse_motif_pairs(const std::vector<std::string>& tokens);

}  // namespace Memopair
