#include "io/ReportWriter.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include "utils/Logger.hpp"

namespace Memopair {

namespace {

std::ofstream open_staged(const std::string& staged_path) {
    std::filesystem::path p(staged_path);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path());
    }
    std::ofstream ofs(staged_path, std::ios::out | std::ios::trunc);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + staged_path);
    }
    return ofs;
}

void finish(std::ofstream& ofs, const std::string& staged_path) {
    ofs.flush();
    if (!ofs) {
        throw std::runtime_error("Failed writing " + staged_path);
    }
    ofs.close();
}

void write_site(std::ofstream& ofs, const std::string& mod_type, int64_t position, const PileupRecord* site) {
    ofs << mod_type << "\t" << position << "\t";
    if (site) {
        ofs << site->coverage << "\t" << site->n_mod << "\t" << site->n_canonical << "\t" << site->n_diff;
    } else {
        ofs << ".\t.\t.\t.";
    }
}

}  // namespace

ReportWriter::~ReportWriter() {
    for (const auto& staged : staged_) {
        std::error_code ec;
        std::filesystem::remove(staged.first, ec);
    }
}

std::string ReportWriter::summary_header() {
    return "reference\tmotif_pair\tn_both_modified\tn_mod1_only\tn_mod2_only\tn_neither_modified\t"
           "n_low_coverage\tn_no_call\tn_considered\tn_occurrences";
}

void ReportWriter::stage_summary(const std::string& path, const std::vector<ReportRow>& rows) {
    std::string staged_path = path + ".tmp";
    std::ofstream ofs = open_staged(staged_path);
    staged_.emplace_back(staged_path, path);

    ofs << summary_header() << "\n";
    for (const auto& row : rows) {
        const StateCounts& c = row.counts;
        ofs << row.reference << "\t"
            << row.motif_pair << "\t"
            << c.count(PairedState::BOTH_MODIFIED) << "\t"
            << c.count(PairedState::MOD1_ONLY) << "\t"
            << c.count(PairedState::MOD2_ONLY) << "\t"
            << c.count(PairedState::NEITHER_MODIFIED) << "\t"
            << c.count(PairedState::LOW_COVERAGE) << "\t"
            << c.count(PairedState::NO_CALL) << "\t"
            << c.considered << "\t"
            << c.occurrences << "\n";
    }
    finish(ofs, staged_path);
}

void ReportWriter::stage_occurrences(const std::string& path,
                                     const std::vector<std::vector<ClassifiedOccurrence>>& occurrences,
                                     const ReferenceIndex& references, const std::vector<MotifPairSpec>& specs) {
    std::string staged_path = path + ".tmp";
    std::ofstream ofs = open_staged(staged_path);
    staged_.emplace_back(staged_path, path);

    // Rendered once; spec_index is the position in specs
    std::vector<std::string> spec_names;
    spec_names.reserve(specs.size());
    for (const auto& spec : specs) {
        spec_names.push_back(spec.to_string());
    }

    ofs << "reference\tstart\tstrand\tmotif_pair\t"
        << "mod_type_1\tposition_1\tcoverage_1\tn_mod_1\tn_canonical_1\tn_diff_1\t"
        << "mod_type_2\tposition_2\tcoverage_2\tn_mod_2\tn_canonical_2\tn_diff_2\tstate\n";

    size_t n_lines = 0;
    for (size_t ref_id = 0; ref_id < occurrences.size(); ++ref_id) {
        const std::string ref_name = references.get_name(static_cast<int>(ref_id));
        for (const auto& classified : occurrences[ref_id]) {
            const MotifOccurrence& occ = classified.occurrence;
            const MotifPairSpec& spec = specs.at(occ.spec_index);

            ofs << ref_name << "\t" << occ.start << "\t" << strand_to_string(occ.strand) << "\t"
                << spec_names[occ.spec_index] << "\t";
            write_site(ofs, spec.mod1.mod_type, occ.mod1_pos, classified.site1);
            ofs << "\t";
            write_site(ofs, spec.mod2.mod_type, occ.mod2_pos, classified.site2);
            ofs << "\t" << paired_state_to_string(classified.state) << "\n";
            ++n_lines;
        }
    }
    finish(ofs, staged_path);

    LOG_DEBUG("Staged " + std::to_string(n_lines) + " occurrence lines");
}

void ReportWriter::commit() {
    // Existing outputs are set aside first so a failed rename can put them back
    std::vector<std::string> backups(staged_.size());
    std::error_code ec;
    for (size_t i = 0; i < staged_.size(); ++i) {
        const std::string& final_path = staged_[i].second;
        if (std::filesystem::exists(final_path, ec)) {
            backups[i] = final_path + ".bak";
            std::filesystem::rename(final_path, backups[i], ec);
            if (ec) {
                std::string message = "Failed to set aside " + final_path + ": " + ec.message();
                roll_back(0, backups);
                throw std::runtime_error(message);
            }
        }
    }

    for (size_t i = 0; i < staged_.size(); ++i) {
        std::filesystem::rename(staged_[i].first, staged_[i].second, ec);
        if (ec) {
            std::string message =
                "Failed to move " + staged_[i].first + " to " + staged_[i].second + ": " + ec.message();
            roll_back(i, backups);
            throw std::runtime_error(message);
        }
    }

    for (size_t i = 0; i < staged_.size(); ++i) {
        if (!backups[i].empty()) {
            std::filesystem::remove(backups[i], ec);
            if (ec) {
                LOG_WARNING("Could not remove " + backups[i] + ": " + ec.message());
            }
        }
        LOG_INFO("Wrote " + staged_[i].second);
    }
    staged_.clear();
}

void ReportWriter::roll_back(size_t num_committed, const std::vector<std::string>& backups) {
    std::error_code ec;
    for (size_t i = 0; i < num_committed; ++i) {
        std::filesystem::remove(staged_[i].second, ec);
    }
    for (size_t i = 0; i < backups.size(); ++i) {
        if (!backups[i].empty() && std::filesystem::exists(backups[i], ec)) {
            std::filesystem::rename(backups[i], staged_[i].second, ec);
            if (ec) {
                LOG_ERROR("Could not restore " + staged_[i].second + " from " + backups[i] + ": " + ec.message());
            }
        }
    }
}

}  // namespace Memopair
