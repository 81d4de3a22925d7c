#pragma once

#include <string>
#include <vector>

#include "Types.hpp"

namespace Memopair {

/**
 * @brief Configuration structure holding all runtime parameters.
 *
 * Populated by Utils::ArgParser (CLI11 handles basic checks) and checked as a
 * whole by validate().
 */
struct Config {
    // Input/Output
    std::string reference_fasta_path;                  ///< Reference FASTA (Required)
    std::string pileup_path;                           ///< bedMethyl pileup, plain or bgzip (Required)
    std::vector<std::string> motif_pairs;              ///< MOTIF_TYPE1_POS1_TYPE2_POS2 tokens (Required)
    std::string output_path = "motif_methylation_state.tsv";  ///< Summary table
    std::string occurrences_path;                      ///< Per-occurrence table (Optional)
    bool force = false;                                ///< Overwrite existing outputs

    // Thresholds
    int min_cov = 5;                 ///< Minimum coverage at both sites to classify an occurrence
    double min_mod_fraction = 0.5;   ///< Read fraction needed to call a site modified/unmodified

    int threads = 1;  ///< Worker threads for per-reference processing

    // Logging
    LogLevel log_level = LogLevel::LOG_INFO;  ///< Logging verbosity level
    std::string log_file;                     ///< Mirror log to this file (Optional)

    /**
     * @brief Validates configuration logic and input files.
     *
     * Checks what CLI11 cannot: the reference opens with htslib faidx, the
     * pileup opens with hts_open, thresholds are in range and outputs do
     * not already exist unless force is set. Every problem is reported.
     *
     * @return true if configuration is valid, false otherwise.
     */
    bool validate() const;

    /**
     * @brief Prints the current configuration to stdout.
     */
    void print() const;

    bool write_occurrences() const { return !occurrences_path.empty(); }
};

}  // namespace Memopair
