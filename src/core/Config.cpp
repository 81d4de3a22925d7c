#include "core/Config.hpp"

#include <htslib/faidx.h>
#include <htslib/hts.h>

#include <filesystem>
#include <iostream>

namespace Memopair {

bool Config::validate() const {
    bool valid = true;

    if (reference_fasta_path.empty()) {
        std::cerr << "Error: Reference FASTA path is required." << std::endl;
        valid = false;
    } else {
        faidx_t* fai = fai_load(reference_fasta_path.c_str());
        if (fai == NULL) {
            std::cerr << "Error: Cannot open or index Reference FASTA: " << reference_fasta_path << std::endl;
            valid = false;
        } else {
            if (faidx_nseq(fai) == 0) {
                std::cerr << "Warning: Reference FASTA contains no records." << std::endl;
            }
            fai_destroy(fai);
        }
    }

    if (pileup_path.empty()) {
        std::cerr << "Error: Pileup path is required." << std::endl;
        valid = false;
    } else {
        htsFile* fp = hts_open(pileup_path.c_str(), "r");
        if (fp == NULL) {
            std::cerr << "Error: Cannot open pileup file: " << pileup_path << std::endl;
            valid = false;
        } else {
            hts_close(fp);
        }
    }

    if (motif_pairs.empty()) {
        std::cerr << "Error: At least one motif pair is required." << std::endl;
        valid = false;
    }

    if (min_cov < 0) {
        std::cerr << "Error: min_cov must be non-negative." << std::endl;
        valid = false;
    }

    if (min_mod_fraction <= 0.0 || min_mod_fraction > 1.0) {
        std::cerr << "Error: min_mod_fraction must be in (0, 1]." << std::endl;
        valid = false;
    }

    if (threads <= 0) {
        std::cerr << "Error: threads must be positive." << std::endl;
        valid = false;
    }

    if (output_path.empty()) {
        std::cerr << "Error: Output path is required." << std::endl;
        valid = false;
    } else if (!force && std::filesystem::exists(output_path)) {
        std::cerr << "Error: Output file already exists (use --force to overwrite): " << output_path << std::endl;
        valid = false;
    }

    if (write_occurrences()) {
        if (occurrences_path == output_path) {
            std::cerr << "Error: Occurrence table and summary table must be different files." << std::endl;
            valid = false;
        } else if (!force && std::filesystem::exists(occurrences_path)) {
            std::cerr << "Error: Occurrence file already exists (use --force to overwrite): " << occurrences_path
                      << std::endl;
            valid = false;
        }
    }

    return valid;
}

void Config::print() const {
    std::cout << "--- Configuration ---" << std::endl;
    std::cout << "Reference: " << reference_fasta_path << std::endl;
    std::cout << "Pileup: " << pileup_path << std::endl;
    std::cout << "Motif pairs: ";
    for (size_t i = 0; i < motif_pairs.size(); ++i) {
        std::cout << (i > 0 ? ", " : "") << motif_pairs[i];
    }
    std::cout << std::endl;
    std::cout << "Output: " << output_path << std::endl;
    std::cout << "Occurrences: " << (occurrences_path.empty() ? "None" : occurrences_path) << std::endl;
    std::cout << "Min Coverage: " << min_cov << std::endl;
    std::cout << "Min Mod Fraction: " << min_mod_fraction << std::endl;
    std::cout << "Threads: " << threads << std::endl;
    std::cout << "---------------------" << std::endl;
}

}  // namespace Memopair
