#include "core/MotifPairEngine.hpp"

#include <omp.h>

#include <chrono>
#include <exception>
#include <sstream>
#include <stdexcept>

#include "utils/FastaReader.hpp"
#include "utils/Logger.hpp"

namespace Memopair {

MotifPairEngine::MotifPairEngine(const Config& config) : config_(config), prepared_(false) {
    omp_set_num_threads(config_.threads);

    std::stringstream ss;
    ss << "MotifPairEngine initialized:\n"
       << "  Threads: " << config_.threads << "\n"
       << "  Min coverage: " << config_.min_cov << "\n"
       << "  Min mod fraction: " << config_.min_mod_fraction << "\n"
       << "  Motif pairs: " << config_.motif_pairs.size();
    LOG_DEBUG(ss.str());
}

void MotifPairEngine::prepare() {
    // Every motif pair has to validate before any input is touched
    specs_ = parse_motif_pairs(config_.motif_pairs);
    for (const auto& spec : specs_) {
        LOG_DEBUG("Motif pair " + spec.to_string() + (spec.is_palindromic() ? " (palindromic)" : "") +
                  ", reverse complement " + spec.reverse_complement_motif());
    }

    {
        FastaReader fasta(config_.reference_fasta_path);
        references_ = ReferenceIndex();
        for (const auto& name : fasta.sequence_names()) {
            references_.get_or_create_id(name);
        }
    }
    LOG_INFO("Loaded " + std::to_string(references_.size()) + " reference records");

    pileup_ = std::make_unique<PileupIndex>(references_, config_.min_mod_fraction);
    pileup_->load(config_.pileup_path);

    prepared_ = true;
}

std::vector<StateCounts> MotifPairEngine::process_reference(const ReferenceSequence& reference,
                                                            const std::vector<MotifPairSpec>& specs,
                                                            const PairClassifier& classifier,
                                                            std::vector<ClassifiedOccurrence>* details) {
    std::vector<StateCounts> tally(specs.size());

    for (size_t i = 0; i < specs.size(); ++i) {
        MotifScanner scanner(reference, specs[i], i);
        MotifOccurrence occurrence;
        while (scanner.next(occurrence)) {
            ClassifiedOccurrence classified = classifier.classify(occurrence);
            tally[i].add(classified.state);
            if (details) {
                details->push_back(classified);
            }
        }
    }
    return tally;
}

void MotifPairEngine::run() {
    if (!prepared_) {
        prepare();
    }

    Utils::ScopedLogger scope("Scan " + std::to_string(references_.size()) + " references");

    std::vector<std::string> spec_names;
    spec_names.reserve(specs_.size());
    for (const auto& spec : specs_) {
        spec_names.push_back(spec.to_string());
    }
    report_ = std::make_unique<AggregateReport>(references_.names(), spec_names);

    occurrences_.clear();
    if (config_.write_occurrences()) {
        occurrences_.resize(references_.size());
    }

    const PairClassifier classifier(*pileup_, specs_, static_cast<uint32_t>(config_.min_cov));
    const int num_references = static_cast<int>(references_.size());
    const bool keep_details = config_.write_occurrences();

    // Exceptions cannot cross the OpenMP region; the first one is rethrown below
    std::exception_ptr first_error;
    bool failed = false;

#pragma omp parallel
    {
        // One faidx handle per thread
        std::unique_ptr<FastaReader> fasta;
        try {
            fasta = std::make_unique<FastaReader>(config_.reference_fasta_path);
        } catch (...) {
#pragma omp critical(memopair_error)
            {
                if (!first_error) first_error = std::current_exception();
            }
#pragma omp atomic write
            failed = true;
        }

#pragma omp for schedule(dynamic)
        for (int i = 0; i < num_references; i++) {
            bool stop;
#pragma omp atomic read
            stop = failed;
            if (stop || !fasta) continue;

            try {
                auto t_start = std::chrono::steady_clock::now();

                ReferenceSequence reference{i, references_.get_name(i), ""};
                reference.sequence = fasta->fetch_sequence(reference.name);

                std::vector<ClassifiedOccurrence>* details = keep_details ? &occurrences_[i] : nullptr;
                std::vector<StateCounts> tally = process_reference(reference, specs_, classifier, details);
                report_->merge(i, tally);

                uint64_t n_occurrences = 0;
                for (const auto& counts : tally) {
                    n_occurrences += counts.occurrences;
                }
                double elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() -
                                                                           t_start).count();
                std::stringstream ss;
                ss << "Reference " << reference.name << " (" << reference.sequence.size() << " bp): " << n_occurrences
                   << " occurrences, " << elapsed << " ms";
                LOG_DEBUG(ss.str());
            } catch (...) {
#pragma omp critical(memopair_error)
                {
                    if (!first_error) first_error = std::current_exception();
                }
#pragma omp atomic write
                failed = true;
            }
        }
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }

    StateCounts totals = report_->totals();
    LOG_INFO("Classified " + std::to_string(totals.occurrences) + " motif occurrences (" +
             std::to_string(totals.considered) + " with pileup calls at both sites)");
}

const PileupIndex& MotifPairEngine::pileup() const {
    if (!pileup_) {
        throw std::logic_error("MotifPairEngine::prepare() has not been called");
    }
    return *pileup_;
}

const AggregateReport& MotifPairEngine::report() const {
    if (!report_) {
        throw std::logic_error("MotifPairEngine::run() has not been called");
    }
    return *report_;
}

}  // namespace Memopair
