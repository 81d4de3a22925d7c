#pragma once

#include <array>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "core/Types.hpp"

namespace Memopair {

/**
 * @brief Per-state occurrence counters for one (reference, motif pair) cell.
 */
struct StateCounts {
    std::array<uint64_t, kNumPairedStates> by_state{};
    uint64_t considered = 0;   ///< Occurrences not in NO_CALL
    uint64_t occurrences = 0;  ///< All occurrences scanned

    void add(PairedState state) {
        ++by_state[static_cast<size_t>(state)];
        ++occurrences;
        if (state != PairedState::NO_CALL) {
            ++considered;
        }
    }

    uint64_t count(PairedState state) const {
        return by_state[static_cast<size_t>(state)];
    }

    StateCounts& operator+=(const StateCounts& other) {
        for (size_t i = 0; i < by_state.size(); ++i) {
            by_state[i] += other.by_state[i];
        }
        considered += other.considered;
        occurrences += other.occurrences;
        return *this;
    }

    bool operator==(const StateCounts& other) const {
        return by_state == other.by_state && considered == other.considered && occurrences == other.occurrences;
    }
};

/**
 * @brief One finished report row.
 */
struct ReportRow {
    std::string reference;   ///< Reference record name
    std::string motif_pair;  ///< Canonical motif-pair string
    StateCounts counts;
};

/**
 * @brief Accumulates paired-state counts per (reference, motif pair).
 *
 * Every (reference, motif pair) cell exists from construction, so rows()
 * always returns references.size() * motif_pairs.size() rows, ordered by
 * reference input order and then motif-pair input order.
 *
 * Thread-safety: merge() is the only mutating call and is serialized by an
 * internal mutex; workers fold a whole reference at once.
 */
class AggregateReport {
public:
    AggregateReport(const std::vector<std::string>& reference_names, const std::vector<std::string>& motif_pairs);

    /**
     * @brief Folds the tallies of one reference into the report.
     *
     * @param ref_id Reference ID (row block).
     * @param per_pair One StateCounts per motif pair, in motif-pair order.
     * @throws std::out_of_range on a bad ref_id or tally size.
     */
    void merge(int ref_id, const std::vector<StateCounts>& per_pair);

    /**
     * @brief Snapshot of all rows in report order.
     */
    std::vector<ReportRow> rows() const;

    /**
     * @brief Sum over all cells.
     */
    StateCounts totals() const;

    size_t num_references() const { return reference_names_.size(); }
    size_t num_motif_pairs() const { return motif_pairs_.size(); }

private:
    std::vector<std::string> reference_names_;
    std::vector<std::string> motif_pairs_;
    std::vector<StateCounts> cells_;  ///< reference-major
    mutable std::mutex mutex_;
};

}  // namespace Memopair
