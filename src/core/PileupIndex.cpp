#include "core/PileupIndex.hpp"

#include <htslib/hts.h>
#include <htslib/kstring.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <memory>
#include <stdexcept>

#include "core/Errors.hpp"
#include "utils/Logger.hpp"

namespace Memopair {

namespace {

constexpr size_t kMinFields = 18;
constexpr size_t kColReference = 0;
constexpr size_t kColStart = 1;
constexpr size_t kColModCode = 3;
constexpr size_t kColStrand = 5;
constexpr size_t kColValidCov = 9;
constexpr size_t kColNMod = 11;
constexpr size_t kColNCanonical = 12;
constexpr size_t kColNDiff = 16;

struct HtsFileCloser {
    void operator()(htsFile* fp) const {
        if (fp) hts_close(fp);
    }
};

// Owns the buffer hts_getline grows.
struct LineBuffer {
    kstring_t str = {0, 0, nullptr};
    ~LineBuffer() { free(str.s); }
};

std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (start < line.size()) {
        size_t end = line.find_first_of("\t ", start);
        if (end == std::string::npos) end = line.size();
        if (end > start) {
            fields.push_back(line.substr(start, end - start));
        }
        start = end + 1;
    }
    return fields;
}

bool parse_unsigned(const std::string& s, uint64_t& value) {
    if (s.empty() || s[0] == '-' || s[0] == '+') return false;
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    value = static_cast<uint64_t>(v);
    return true;
}

uint32_t parse_count(const std::vector<std::string>& fields, size_t col, const char* name, size_t line_number,
                     const std::string& line) {
    uint64_t value = 0;
    if (!parse_unsigned(fields[col], value) || value > UINT32_MAX) {
        throw MalformedPileupLineError(line_number, line, std::string("invalid ") + name + " '" + fields[col] + "'");
    }
    return static_cast<uint32_t>(value);
}

}  // namespace

PileupIndex::PileupIndex(const ReferenceIndex& references, double min_mod_fraction)
    : references_(references), min_mod_fraction_(min_mod_fraction), sites_(references.size()) {
}

void PileupIndex::load(const std::string& path) {
    Utils::ScopedLogger scope("Load pileup " + path);

    std::unique_ptr<htsFile, HtsFileCloser> fp(hts_open(path.c_str(), "r"));
    if (!fp) {
        throw std::runtime_error("Could not open pileup file: " + path);
    }

    LineBuffer buffer;
    size_t line_number = 0;
    int ret;
    while ((ret = hts_getline(fp.get(), KS_SEP_LINE, &buffer.str)) >= 0) {
        ++line_number;
        std::string line(buffer.str.s, buffer.str.l);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        add_line(line, line_number);
    }
    if (ret < -1) {
        throw std::runtime_error("Error reading pileup file " + path + " after line " + std::to_string(line_number));
    }

    if (!unknown_references_.empty()) {
        LOG_WARNING("Skipped " + std::to_string(stats_.unknown_reference_lines) + " pileup records on " +
                    std::to_string(unknown_references_.size()) + " reference(s) absent from the reference file");
    }
    if (stats_.duplicates > 0) {
        LOG_DEBUG(std::to_string(stats_.duplicates) + " pileup rows replaced an earlier row for the same code");
    }
    LOG_INFO("Indexed " + std::to_string(size()) + " pileup records from " + std::to_string(line_number) + " lines");
}

bool PileupIndex::add_line(const std::string& line, size_t line_number) {
    ++stats_.lines;
    if (line.empty() || line[0] == '#' || line.compare(0, 5, "track") == 0) {
        return false;
    }

    std::vector<std::string> fields = split_fields(line);
    if (fields.size() < kMinFields) {
        throw MalformedPileupLineError(line_number, line,
                                       "expected at least " + std::to_string(kMinFields) + " fields, got " +
                                           std::to_string(fields.size()));
    }

    const std::string& ref_name = fields[kColReference];
    int ref_id = references_.find_id(ref_name);

    uint64_t position = 0;
    if (!parse_unsigned(fields[kColStart], position) || position > static_cast<uint64_t>(INT64_MAX / 2)) {
        throw MalformedPileupLineError(line_number, line, "invalid position '" + fields[kColStart] + "'");
    }

    Strand strand;
    const std::string& strand_field = fields[kColStrand];
    if (strand_field == "+" || strand_field == ".") {
        strand = Strand::FORWARD;
    } else if (strand_field == "-") {
        strand = Strand::REVERSE;
    } else {
        throw MalformedPileupLineError(line_number, line, "invalid strand '" + strand_field + "'");
    }

    PileupRecord record;
    record.ref_id = ref_id;
    record.position = static_cast<int64_t>(position);
    record.strand = strand;
    record.coverage = parse_count(fields, kColValidCov, "valid coverage", line_number, line);
    record.n_mod = parse_count(fields, kColNMod, "modified count", line_number, line);
    record.n_canonical = parse_count(fields, kColNCanonical, "canonical count", line_number, line);
    record.n_diff = parse_count(fields, kColNDiff, "diff count", line_number, line);

    if (fields[kColModCode].empty()) {
        throw MalformedPileupLineError(line_number, line, "empty modification code");
    }

    if (ref_id < 0) {
        if (unknown_references_.insert(ref_name).second) {
            LOG_WARNING("Pileup reference '" + ref_name + "' is not in the reference file; its records are ignored");
        }
        ++stats_.unknown_reference_lines;
        return false;
    }

    record.mod_code = intern_mod_code(fields[kColModCode]);
    record.call = CallKind::NO_CALL;
    if (record.coverage > 0) {
        double mod_fraction = static_cast<double>(record.n_mod) / record.coverage;
        double canonical_fraction = static_cast<double>(record.n_canonical) / record.coverage;
        if (mod_fraction >= min_mod_fraction_) {
            record.call = CallKind::MODIFIED;
        } else if (canonical_fraction >= min_mod_fraction_) {
            record.call = CallKind::UNMODIFIED;
        }
    }

    if (static_cast<size_t>(ref_id) >= sites_.size()) {
        sites_.resize(references_.size());
    }
    std::vector<PileupRecord>& site = sites_[static_cast<size_t>(ref_id)][make_key(record.position, strand)];
    auto same_code = std::find_if(site.begin(), site.end(),
                                  [&record](const PileupRecord& r) { return r.mod_code == record.mod_code; });
    if (same_code != site.end()) {
        *same_code = record;
        ++stats_.duplicates;
    } else {
        site.push_back(record);
    }
    ++stats_.records;
    return true;
}

const std::vector<PileupRecord>* PileupIndex::find_site(int ref_id, int64_t position, Strand strand) const {
    if (ref_id < 0 || ref_id >= static_cast<int>(sites_.size()) || position < 0) {
        return nullptr;
    }
    const auto& reference_sites = sites_[static_cast<size_t>(ref_id)];
    auto it = reference_sites.find(make_key(position, strand));
    if (it == reference_sites.end()) {
        return nullptr;
    }
    return &it->second;
}

const PileupRecord* PileupIndex::find(int ref_id, int64_t position, Strand strand, int mod_code) const {
    if (mod_code < 0) {
        return nullptr;
    }
    const std::vector<PileupRecord>* site = find_site(ref_id, position, strand);
    if (!site) {
        return nullptr;
    }
    for (const auto& record : *site) {
        if (record.mod_code == mod_code) {
            return &record;
        }
    }
    return nullptr;
}

int PileupIndex::intern_mod_code(const std::string& label) {
    auto it = mod_code_ids_.find(label);
    if (it != mod_code_ids_.end()) {
        return it->second;
    }
    int id = static_cast<int>(mod_codes_.size());
    mod_codes_.push_back(label);
    mod_code_ids_.emplace(label, id);
    return id;
}

int PileupIndex::find_mod_code(const std::string& label) const {
    auto it = mod_code_ids_.find(label);
    return it == mod_code_ids_.end() ? -1 : it->second;
}

std::string PileupIndex::mod_code_name(int mod_code) const {
    if (mod_code >= 0 && mod_code < static_cast<int>(mod_codes_.size())) {
        return mod_codes_[mod_code];
    }
    return "";
}

size_t PileupIndex::size() const {
    size_t total = 0;
    for (const auto& reference_sites : sites_) {
        for (const auto& site : reference_sites) {
            total += site.second.size();
        }
    }
    return total;
}

}  // namespace Memopair
