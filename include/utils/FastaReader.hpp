#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <htslib/faidx.h>

namespace Memopair {

/**
 * @brief RAII wrapper for FASTA file reading with HTSlib.
 *
 * Records are fetched one at a time through faidx, so only the record
 * being scanned is held in memory. A missing .fai index is built on open.
 *
 * Thread-safety: a faidx handle must not be shared between threads; each
 * OpenMP worker opens its own FastaReader.
 *
 * Usage:
 *   FastaReader fasta("genome.fa");
 *   for (const auto& name : fasta.sequence_names()) {
 *       std::string seq = fasta.fetch_sequence(name);
 *   }
 */
class FastaReader {
public:
    /**
     * @brief Opens (and if needed indexes) a FASTA file.
     * @throws std::runtime_error if the file cannot be opened or indexed.
     */
    explicit FastaReader(const std::string& fasta_path);

    ~FastaReader();

    // Disable copy, allow move
    FastaReader(const FastaReader&) = delete;
    FastaReader& operator=(const FastaReader&) = delete;
    FastaReader(FastaReader&&) noexcept;
    FastaReader& operator=(FastaReader&&) noexcept;

    /**
     * @brief Fetches a whole record, upper-cased.
     * @throws std::runtime_error if the record is unknown or cannot be read.
     */
    std::string fetch_sequence(const std::string& name) const;

    /**
     * @brief Record names in file order.
     */
    std::vector<std::string> sequence_names() const;

private:
    std::string fasta_path_;
    faidx_t* fai_;
};

}  // namespace Memopair
