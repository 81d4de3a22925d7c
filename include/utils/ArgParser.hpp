#pragma once

#include <CLI/CLI.hpp>

#include <algorithm>
#include <map>
#include <string>

#include "core/Config.hpp"

namespace Memopair {
namespace Utils {

/**
 * @brief Command-line argument parser wrapper around CLI11.
 */
class ArgParser {
public:
    /**
     * @brief Parses command line arguments and populates the Config object.
     *
     * Uses CLI11 to handle argument parsing, type conversion, and basic validation
     * (e.g., file existence, numeric ranges).
     *
     * @param argc Argument count.
     * @param argv Argument values.
     * @param config Reference to Config object to populate.
     * @return true if parsing was successful and execution should continue.
     * @return false if parsing failed or help was requested (execution should stop).
     */
    static bool parse(int argc, char** argv, Config& config) {
        CLI::App app{"memopair - paired methylation state of complementary motif sites"};
        app.set_version_flag("--version", "memopair 0.1.0");

        app.add_option("REFERENCE", config.reference_fasta_path, "Reference FASTA")
            ->required()
            ->check(CLI::ExistingFile);

        app.add_option("PILEUP", config.pileup_path, "bedMethyl pileup with modification calls (plain or bgzip)")
            ->required()
            ->check(CLI::ExistingFile);

        app.add_option("MOTIFS", config.motif_pairs,
                       "Complementary motif pairs as MOTIF_TYPE1_POS1_TYPE2_POS2, e.g. 'ACGT_a_0_m_3' or "
                       "'CCWGG_4mC_0_5mC_3'")
            ->required();

        app.add_option("-o,--out", config.output_path, "Summary table path (Default: motif_methylation_state.tsv)");

        app.add_option("--occurrences", config.occurrences_path, "Also write one line per motif occurrence to this path");

        app.add_flag("-f,--force", config.force, "Overwrite existing output files");

        app.add_option("--min-cov", config.min_cov, "Minimum coverage at both sites (Default: 5)")
            ->check(CLI::NonNegativeNumber);

        app.add_option("--min-mod-fraction", config.min_mod_fraction,
                       "Fraction of valid reads needed to call a site modified or unmodified (Default: 0.5)")
            ->check(CLI::Range(0.0, 1.0));

        app.add_option("-t,--threads", config.threads, "Number of threads (Default: 1)")
            ->check(CLI::PositiveNumber);

        std::string log_level_str = "info";
        app.add_option("--log-level", log_level_str, "Logging level: error, warn, info, debug (Default: info)")
            ->check(CLI::IsMember({"error", "warn", "info", "debug"}, CLI::ignore_case));

        app.add_option("--log-file", config.log_file, "Also write log lines to this file");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            // Help/version (ret=0) and errors (ret>0) both stop execution
            app.exit(e);
            return false;
        }

        static const std::map<std::string, LogLevel> log_level_map = {
            {"error", LogLevel::LOG_ERROR},
            {"warn", LogLevel::LOG_WARN},
            {"info", LogLevel::LOG_INFO},
            {"debug", LogLevel::LOG_DEBUG}
        };

        std::string log_lower = log_level_str;
        std::transform(log_lower.begin(), log_lower.end(), log_lower.begin(), ::tolower);
        auto it = log_level_map.find(log_lower);
        if (it != log_level_map.end()) {
            config.log_level = it->second;
        }

        return true;
    }
};

}  // namespace Utils
}  // namespace Memopair
