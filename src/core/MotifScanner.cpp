#include "core/MotifScanner.hpp"

#include "core/Iupac.hpp"

namespace Memopair {

MotifScanner::MotifScanner(const ReferenceSequence& reference, const MotifPairSpec& spec, size_t spec_index)
    : reference_(reference),
      spec_(spec),
      spec_index_(spec_index),
      reverse_motif_(spec.reverse_complement_motif()),
      pos_(0),
      reverse_pending_(false) {
}

void MotifScanner::reset() {
    pos_ = 0;
    reverse_pending_ = false;
}

bool MotifScanner::matches_at(const std::string& pattern, size_t pos) const {
    for (size_t i = 0; i < pattern.size(); ++i) {
        if (!Iupac::matches(pattern[i], reference_.sequence[pos + i])) {
            return false;
        }
    }
    return true;
}

MotifOccurrence MotifScanner::make_occurrence(size_t pos, Strand strand) const {
    const size_t last = spec_.motif_length() - 1;

    MotifOccurrence occ;
    occ.ref_id = reference_.ref_id;
    occ.spec_index = spec_index_;
    occ.start = static_cast<int64_t>(pos);
    occ.strand = strand;
    if (strand == Strand::FORWARD) {
        occ.mod1_pos = static_cast<int64_t>(pos + spec_.mod1.offset);
        occ.mod2_pos = static_cast<int64_t>(pos + spec_.mod2.offset);
    } else {
        occ.mod1_pos = static_cast<int64_t>(pos + (last - spec_.mod1.offset));
        occ.mod2_pos = static_cast<int64_t>(pos + (last - spec_.mod2.offset));
    }
    return occ;
}

bool MotifScanner::next(MotifOccurrence& occurrence) {
    const size_t motif_len = spec_.motif_length();
    const size_t seq_len = reference_.sequence.size();
    if (motif_len == 0 || seq_len < motif_len) {
        return false;
    }
    const size_t last_start = seq_len - motif_len;

    while (pos_ <= last_start) {
        if (!reverse_pending_) {
            reverse_pending_ = true;
            if (matches_at(spec_.motif, pos_)) {
                occurrence = make_occurrence(pos_, Strand::FORWARD);
                return true;
            }
        }

        size_t pos = pos_;
        reverse_pending_ = false;
        ++pos_;
        if (matches_at(reverse_motif_, pos)) {
            occurrence = make_occurrence(pos, Strand::REVERSE);
            return true;
        }
    }
    return false;
}

std::vector<MotifOccurrence> MotifScanner::scan_all() {
    reset();
    std::vector<MotifOccurrence> occurrences;
    MotifOccurrence occ;
    while (next(occ)) {
        occurrences.push_back(occ);
    }
    return occurrences;
}

}  // namespace Memopair
