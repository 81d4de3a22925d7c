#include "utils/FastaReader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace Memopair {

FastaReader::FastaReader(const std::string& fasta_path)
    : fasta_path_(fasta_path), fai_(nullptr) {
    // fai_load builds the .fai next to the FASTA when it is missing
    fai_ = fai_load(fasta_path.c_str());
    if (!fai_) {
        throw std::runtime_error("Failed to open or index FASTA file: " + fasta_path);
    }
}

FastaReader::~FastaReader() {
    if (fai_) {
        fai_destroy(fai_);
    }
}

FastaReader::FastaReader(FastaReader&& other) noexcept
    : fasta_path_(std::move(other.fasta_path_)),
      fai_(other.fai_) {
    other.fai_ = nullptr;
}

FastaReader& FastaReader::operator=(FastaReader&& other) noexcept {
    if (this != &other) {
        if (fai_) {
            fai_destroy(fai_);
        }
        fasta_path_ = std::move(other.fasta_path_);
        fai_ = other.fai_;
        other.fai_ = nullptr;
    }
    return *this;
}

std::string FastaReader::fetch_sequence(const std::string& name) const {
    if (!fai_) {
        throw std::runtime_error("FASTA file not loaded: " + fasta_path_);
    }

    int length = faidx_seq_len(fai_, name.c_str());
    if (length < 0) {
        throw std::runtime_error("Reference record '" + name + "' not found in " + fasta_path_);
    }
    if (length == 0) {
        return "";
    }

    hts_pos_t fetched = 0;
    char* seq = faidx_fetch_seq64(fai_, name.c_str(), 0, length - 1, &fetched);
    if (!seq || fetched < 0) {
        free(seq);
        throw std::runtime_error("Failed to read reference record '" + name + "' from " + fasta_path_);
    }

    std::string result(seq, static_cast<size_t>(fetched));
    free(seq);

    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::vector<std::string> FastaReader::sequence_names() const {
    std::vector<std::string> names;
    if (!fai_) {
        return names;
    }
    int n = faidx_nseq(fai_);
    names.reserve(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        names.emplace_back(faidx_iseq(fai_, i));
    }
    return names;
}

}  // namespace Memopair
