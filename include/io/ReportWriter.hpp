#pragma once

#include <string>
#include <utility>
#include <vector>

#include "core/AggregateReport.hpp"
#include "core/MotifPair.hpp"
#include "core/PairClassifier.hpp"
#include "core/ReferenceIndex.hpp"

namespace Memopair {

/**
 * @brief Writes the result tables with write-on-success semantics.
 *
 * Each table is first written to "<path>.tmp". commit() renames every staged
 * file onto its final path; a writer destroyed without commit() removes its
 * staged files, so a failed run leaves no partial output behind.
 *
 * Summary table columns:
 * ```
 * reference  motif_pair  n_both_modified  n_mod1_only  n_mod2_only
 * n_neither_modified  n_low_coverage  n_no_call  n_considered  n_occurrences
 * ```
 *
 * Occurrence table: one line per classified occurrence, missing sites as ".".
 */
class ReportWriter {
public:
    ReportWriter() = default;
    ~ReportWriter();

    ReportWriter(const ReportWriter&) = delete;
    ReportWriter& operator=(const ReportWriter&) = delete;

    /**
     * @brief Writes the summary rows to a staged file.
     * @throws std::runtime_error on any write failure.
     */
    void stage_summary(const std::string& path, const std::vector<ReportRow>& rows);

    /**
     * @brief Writes per-occurrence lines, references in ID order.
     * @throws std::runtime_error on any write failure.
     */
    void stage_occurrences(const std::string& path,
                           const std::vector<std::vector<ClassifiedOccurrence>>& occurrences,
                           const ReferenceIndex& references, const std::vector<MotifPairSpec>& specs);

    /**
     * @brief Moves every staged file onto its final path.
     *
     * All or nothing: if any rename fails, outputs already moved are removed
     * and the files they replaced are restored.
     *
     * @throws std::runtime_error if a rename fails.
     */
    void commit();

    static std::string summary_header();

private:
    void roll_back(size_t num_committed, const std::vector<std::string>& backups);

    /// (staged path, final path)
    std::vector<std::pair<std::string, std::string>> staged_;
};

}  // namespace Memopair
