#pragma once

#include <memory>
#include <string>
#include <vector>

#include "core/AggregateReport.hpp"
#include "core/Config.hpp"
#include "core/MotifPair.hpp"
#include "core/MotifScanner.hpp"
#include "core/PairClassifier.hpp"
#include "core/PileupIndex.hpp"
#include "core/ReferenceIndex.hpp"

namespace Memopair {

/**
 * @brief Runs the motif-pair methylation analysis for one configuration.
 *
 * Phases:
 * 1. prepare(): parse every motif pair, read the reference record names
 *    and build the pileup index. Any failure here aborts before a single
 *    occurrence is classified.
 * 2. run(): scan every reference record in parallel with OpenMP. Each
 *    thread opens its own FastaReader and tallies one record at a time;
 *    the finished tally is merged into the AggregateReport, whose merge()
 *    is the only shared write.
 *
 * The pileup index is built once and only read during run().
 */
class MotifPairEngine {
public:
    explicit MotifPairEngine(const Config& config);

    // The pileup index refers to references_, so the engine stays in place
    MotifPairEngine(const MotifPairEngine&) = delete;
    MotifPairEngine& operator=(const MotifPairEngine&) = delete;

    /**
     * @brief Parses motif pairs, loads reference names and the pileup.
     *
     * @throws InvalidSpecError, MalformedPileupLineError, std::runtime_error
     */
    void prepare();

    /**
     * @brief Scans and classifies all references. Calls prepare() if needed.
     *
     * @throws std::runtime_error if a reference record cannot be read.
     */
    void run();

    /**
     * @brief Scans one reference for every motif pair and tallies the states.
     *
     * @param details If non-null, every classified occurrence is appended.
     * @return One StateCounts per motif pair, in motif-pair order.
     */
    static std::vector<StateCounts> process_reference(const ReferenceSequence& reference,
                                                      const std::vector<MotifPairSpec>& specs,
                                                      const PairClassifier& classifier,
                                                      std::vector<ClassifiedOccurrence>* details = nullptr);

    const std::vector<MotifPairSpec>& specs() const { return specs_; }
    const ReferenceIndex& references() const { return references_; }
    const PileupIndex& pileup() const;
    const AggregateReport& report() const;

    /**
     * @brief Classified occurrences per reference ID; empty unless the
     *        configuration asks for the occurrence table.
     */
    const std::vector<std::vector<ClassifiedOccurrence>>& occurrences() const { return occurrences_; }

private:
    Config config_;
    bool prepared_;

    std::vector<MotifPairSpec> specs_;
    ReferenceIndex references_;
    std::unique_ptr<PileupIndex> pileup_;
    std::unique_ptr<AggregateReport> report_;
    std::vector<std::vector<ClassifiedOccurrence>> occurrences_;
};

}  // namespace Memopair
