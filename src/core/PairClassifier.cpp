#include "core/PairClassifier.hpp"

#include <stdexcept>

namespace Memopair {

PairClassifier::PairClassifier(const PileupIndex& index, const std::vector<MotifPairSpec>& specs, uint32_t min_cov)
    : index_(index), min_cov_(min_cov) {
    expected_.reserve(specs.size());
    for (const auto& spec : specs) {
        // -1 when no pileup row carries the label: nothing can match it
        expected_.push_back({index_.find_mod_code(spec.mod1.mod_type), index_.find_mod_code(spec.mod2.mod_type)});
    }
}

bool PairClassifier::is_expected(const PileupRecord& record, int expected_code) {
    return record.call == CallKind::MODIFIED && expected_code >= 0 && record.mod_code == expected_code;
}

const PileupRecord* PairClassifier::lookup_site(const MotifOccurrence& occurrence, int64_t position,
                                                int expected_code) const {
    const PileupRecord* record = index_.find(occurrence.ref_id, position, occurrence.strand, expected_code);
    if (record) {
        return record;
    }
    // Only other codes at this site: covered, but not the expected type
    const std::vector<PileupRecord>* site = index_.find_site(occurrence.ref_id, position, occurrence.strand);
    if (site && !site->empty()) {
        return &site->front();
    }
    return nullptr;
}

ClassifiedOccurrence PairClassifier::classify(const MotifOccurrence& occurrence) const {
    if (occurrence.spec_index >= expected_.size()) {
        throw std::out_of_range("Motif occurrence refers to unknown motif pair " +
                                std::to_string(occurrence.spec_index));
    }

    const ExpectedCodes& expected = expected_[occurrence.spec_index];

    ClassifiedOccurrence result;
    result.occurrence = occurrence;
    result.site1 = lookup_site(occurrence, occurrence.mod1_pos, expected.mod1);
    result.site2 = lookup_site(occurrence, occurrence.mod2_pos, expected.mod2);

    if (!result.site1 || !result.site2) {
        result.state = PairedState::NO_CALL;
        return result;
    }
    if (result.site1->coverage < min_cov_ || result.site2->coverage < min_cov_) {
        result.state = PairedState::LOW_COVERAGE;
        return result;
    }

    bool mod1 = is_expected(*result.site1, expected.mod1);
    bool mod2 = is_expected(*result.site2, expected.mod2);

    if (mod1 && mod2) {
        result.state = PairedState::BOTH_MODIFIED;
    } else if (mod1) {
        result.state = PairedState::MOD1_ONLY;
    } else if (mod2) {
        result.state = PairedState::MOD2_ONLY;
    } else {
        result.state = PairedState::NEITHER_MODIFIED;
    }
    return result;
}

}  // namespace Memopair
