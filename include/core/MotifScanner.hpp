#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/MotifPair.hpp"
#include "core/Types.hpp"

namespace Memopair {

/**
 * @brief A named reference record with 0-based coordinates.
 */
struct ReferenceSequence {
    int ref_id;            ///< Index of the record in reference input order
    std::string name;      ///< Record name (FASTA header up to first whitespace)
    std::string sequence;  ///< Nucleotide sequence, any case
};

/**
 * @brief One place where a motif pair matched a reference.
 */
struct MotifOccurrence {
    int ref_id;         ///< Reference the occurrence lies on
    size_t spec_index;  ///< Index of the matched MotifPairSpec
    int64_t start;      ///< Leftmost reference position covered by the match
    Strand strand;      ///< Strand the motif was read on
    int64_t mod1_pos;   ///< Genomic position of the mod1 site
    int64_t mod2_pos;   ///< Genomic position of the mod2 site
};

/**
 * @brief Lazily enumerates occurrences of one motif pair on one reference.
 *
 * Matching is position-wise with IUPAC equivalence classes (Iupac::matches)
 * and case-insensitive. At each start position the forward strand is tested
 * before the reverse complement; the scan advances by one base, so
 * overlapping occurrences are all reported.
 *
 * Forward hit at p: sites at p + off1 and p + off2.
 * Reverse hit at p: sites at p + (L-1-off1) and p + (L-1-off2), each site
 * keeping the label declared for its offset.
 *
 * The scanner only holds references to its inputs; both must outlive it.
 */
class MotifScanner {
public:
    MotifScanner(const ReferenceSequence& reference, const MotifPairSpec& spec, size_t spec_index = 0);

    /**
     * @brief Produces the next occurrence.
     * @return false once the reference is exhausted.
     */
    bool next(MotifOccurrence& occurrence);

    /**
     * @brief Restarts the scan from the beginning of the reference.
     */
    void reset();

    /**
     * @brief Runs a fresh scan to completion.
     */
    std::vector<MotifOccurrence> scan_all();

private:
    bool matches_at(const std::string& pattern, size_t pos) const;
    MotifOccurrence make_occurrence(size_t pos, Strand strand) const;

    const ReferenceSequence& reference_;
    const MotifPairSpec& spec_;
    size_t spec_index_;
    std::string reverse_motif_;

    size_t pos_;
    bool reverse_pending_;
};

}  // namespace Memopair
