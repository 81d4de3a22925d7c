#pragma once

#include <cstdint>
#include <vector>

#include "core/MotifPair.hpp"
#include "core/MotifScanner.hpp"
#include "core/PileupIndex.hpp"
#include "core/Types.hpp"

namespace Memopair {

/**
 * @brief A motif occurrence together with its paired state.
 *
 * site1/site2 point into the PileupIndex and stay valid for the index's
 * lifetime. Each is the site's row for the expected code when there is one,
 * otherwise another row at that site; nullptr when the site has no row.
 */
struct ClassifiedOccurrence {
    MotifOccurrence occurrence;
    PairedState state;
    const PileupRecord* site1;
    const PileupRecord* site2;
};

/**
 * @brief Joins motif occurrences with pileup calls and assigns a PairedState.
 *
 * Order of checks:
 *   1. either site missing from the pileup      -> NO_CALL
 *   2. either site coverage below min_cov       -> LOW_COVERAGE
 *   3. compare each site's call with the type declared for it:
 *      both match -> BOTH_MODIFIED, only mod1 -> MOD1_ONLY,
 *      only mod2 -> MOD2_ONLY, none -> NEITHER_MODIFIED.
 * Each site is read from the pileup row for the code declared for it. A
 * site that only has rows for other codes, or whose row is a no-call,
 * counts as "not the expected type".
 *
 * Stateless after construction; safe to share across threads.
 */
class PairClassifier {
public:
    PairClassifier(const PileupIndex& index, const std::vector<MotifPairSpec>& specs, uint32_t min_cov);

    ClassifiedOccurrence classify(const MotifOccurrence& occurrence) const;

    uint32_t min_cov() const { return min_cov_; }

private:
    struct ExpectedCodes {
        int mod1;
        int mod2;
    };

    static bool is_expected(const PileupRecord& record, int expected_code);

    /// Row for the expected code, else any other row at the site, else nullptr
    const PileupRecord* lookup_site(const MotifOccurrence& occurrence, int64_t position, int expected_code) const;

    const PileupIndex& index_;
    std::vector<ExpectedCodes> expected_;
    uint32_t min_cov_;
};

}  // namespace Memopair
