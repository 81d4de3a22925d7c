#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/ReferenceIndex.hpp"
#include "core/Types.hpp"

namespace Memopair {

enum class CallKind : uint8_t {
    NO_CALL = 0,
    MODIFIED = 1,
    UNMODIFIED = 2
};

/**
 * @brief One pileup row at (reference, position, strand, modification code).
 *
 * mod_code is the interned code ID of the row's label (see
 * PileupIndex::find_mod_code).
 */
struct PileupRecord {
    int ref_id;            ///< Reference ID (ReferenceIndex)
    int64_t position;      ///< 0-based position
    Strand strand;         ///< Strand of the observation
    int mod_code;          ///< Interned modification code of this row
    CallKind call;         ///< Derived call for this code
    uint32_t coverage;     ///< Valid coverage (Nvalid_cov)
    uint32_t n_mod;        ///< Reads called modified
    uint32_t n_canonical;  ///< Reads called canonical
    uint32_t n_diff;       ///< Reads with a different base
};

/**
 * @brief Counters collected while loading a pileup.
 */
struct PileupLoadStats {
    size_t lines = 0;                    ///< Lines read, including skipped ones
    size_t records = 0;                  ///< Records stored (duplicates included)
    size_t duplicates = 0;               ///< Records that replaced an earlier one with the same code
    size_t unknown_reference_lines = 0;  ///< Records skipped for an unknown reference
};

/**
 * @brief Point-lookup index over a bedMethyl pileup.
 *
 * Reads modkit-style bedMethyl (plain or bgzip-compressed) as a stream and
 * keeps one record per (reference, position, strand, modification code);
 * modkit writes one row per code at a site, e.g. "m" and "h" at the same C.
 * Columns used
 * (0-based): 0 reference, 1 start, 3 mod code, 5 strand, 9 Nvalid_cov,
 * 11 Nmod, 12 Ncanonical, 16 Ndiff. Fields may be separated by tabs or
 * spaces.
 *
 * Call derivation: zero coverage is a no-call; Nmod/Nvalid_cov >= the
 * modified fraction threshold is MODIFIED;
 * Ncanonical/Nvalid_cov >= the threshold is UNMODIFIED; anything else is a
 * no-call.
 *
 * Duplicate keys (same site and code): the last line wins. Records on references absent from
 * the ReferenceIndex are skipped with one warning per reference name.
 *
 * Thread-safety: construction and loading are single-threaded; after that
 * the index is read-only and find() may be called from any thread.
 */
class PileupIndex {
public:
    PileupIndex(const ReferenceIndex& references, double min_mod_fraction = 0.5);

    /**
     * @brief Streams a pileup file into the index.
     *
     * @throws std::runtime_error if the file cannot be opened or read.
     * @throws MalformedPileupLineError on the first unparseable line.
     */
    void load(const std::string& path);

    /**
     * @brief Parses one pileup line and stores the record.
     *
     * @param line Line content without the trailing newline.
     * @param line_number 1-based line number, used in error reports.
     * @return true if a record was stored, false if the line was skipped.
     * @throws MalformedPileupLineError if the line cannot be parsed.
     */
    bool add_line(const std::string& line, size_t line_number);

    /**
     * @brief O(1) lookup of the row for one modification code.
     * @return The record, or nullptr if the pileup has none for this key.
     */
    const PileupRecord* find(int ref_id, int64_t position, Strand strand, int mod_code) const;

    /**
     * @brief All rows at a site, one per code, in first-seen order.
     * @return nullptr if the pileup has no row at this site.
     */
    const std::vector<PileupRecord>* find_site(int ref_id, int64_t position, Strand strand) const;

    /**
     * @brief Resolves a modification label to its interned code ID.
     * @return Code ID, or -1 if no pileup row carries the label.
     */
    int find_mod_code(const std::string& label) const;

    /**
     * @brief Label of an interned code ID, or "" for an unknown ID.
     */
    std::string mod_code_name(int mod_code) const;

    size_t size() const;

    const PileupLoadStats& stats() const { return stats_; }

    const std::set<std::string>& unknown_references() const { return unknown_references_; }

private:
    static int64_t make_key(int64_t position, Strand strand) {
        return position * 2 + static_cast<int64_t>(strand);
    }

    int intern_mod_code(const std::string& label);

    const ReferenceIndex& references_;
    double min_mod_fraction_;

    /// Per reference: site key -> rows at that site, one per code
    std::vector<std::unordered_map<int64_t, std::vector<PileupRecord>>> sites_;
    std::vector<std::string> mod_codes_;
    std::unordered_map<std::string, int> mod_code_ids_;
    std::set<std::string> unknown_references_;
    PileupLoadStats stats_;
};

}  // namespace Memopair
