#include "core/AggregateReport.hpp"

#include <stdexcept>

namespace Memopair {

AggregateReport::AggregateReport(const std::vector<std::string>& reference_names,
                                 const std::vector<std::string>& motif_pairs)
    : reference_names_(reference_names),
      motif_pairs_(motif_pairs),
      cells_(reference_names.size() * motif_pairs.size()) {
}

void AggregateReport::merge(int ref_id, const std::vector<StateCounts>& per_pair) {
    if (ref_id < 0 || static_cast<size_t>(ref_id) >= reference_names_.size()) {
        throw std::out_of_range("Reference ID " + std::to_string(ref_id) + " outside report");
    }
    if (per_pair.size() != motif_pairs_.size()) {
        throw std::out_of_range("Expected " + std::to_string(motif_pairs_.size()) + " motif pair tallies, got " +
                                std::to_string(per_pair.size()));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    size_t base = static_cast<size_t>(ref_id) * motif_pairs_.size();
    for (size_t i = 0; i < per_pair.size(); ++i) {
        cells_[base + i] += per_pair[i];
    }
}

std::vector<ReportRow> AggregateReport::rows() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ReportRow> rows;
    rows.reserve(cells_.size());
    for (size_t r = 0; r < reference_names_.size(); ++r) {
        for (size_t m = 0; m < motif_pairs_.size(); ++m) {
            rows.push_back({reference_names_[r], motif_pairs_[m], cells_[r * motif_pairs_.size() + m]});
        }
    }
    return rows;
}

StateCounts AggregateReport::totals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    StateCounts total;
    for (const auto& cell : cells_) {
        total += cell;
    }
    return total;
}

}  // namespace Memopair
