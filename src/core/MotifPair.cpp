#include "core/MotifPair.hpp"

#include <cctype>
#include <set>
#include <sstream>
#include <utility>

#include "core/Errors.hpp"
#include "core/Iupac.hpp"

namespace Memopair {

namespace {

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream iss(s);
    while (std::getline(iss, field, delim)) {
        fields.push_back(field);
    }
    // getline drops a trailing empty field
    if (!s.empty() && s.back() == delim) {
        fields.emplace_back();
    }
    return fields;
}

size_t parse_offset(const std::string& token, const std::string& field, const std::string& value,
                    size_t motif_length) {
    if (value.empty()) {
        throw InvalidSpecError(token, field, "empty position");
    }
    size_t offset = 0;
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw InvalidSpecError(token, field, "'" + value + "' is not a non-negative integer");
        }
        offset = offset * 10 + static_cast<size_t>(c - '0');
        if (offset >= motif_length) {
            throw InvalidSpecError(token, field,
                                   "position " + value + " outside motif of length " + std::to_string(motif_length));
        }
    }
    return offset;
}

}  // namespace

MotifPairSpec MotifPairSpec::parse(const std::string& token) {
    std::vector<std::string> fields = split(token, '_');
    if (fields.size() != 5) {
        throw InvalidSpecError(token, "field_count",
                               "expected MOTIF_TYPE1_POS1_TYPE2_POS2, got " + std::to_string(fields.size()) + " fields");
    }

    MotifPairSpec spec;
    spec.motif = fields[0];
    if (spec.motif.empty()) {
        throw InvalidSpecError(token, "motif", "empty motif");
    }
    for (char& c : spec.motif) {
        if (!Iupac::is_valid(c)) {
            throw InvalidSpecError(token, "motif", std::string("'") + c + "' is not an IUPAC nucleotide code");
        }
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    if (fields[1].empty()) {
        throw InvalidSpecError(token, "mod_type_1", "empty modification type");
    }
    if (fields[3].empty()) {
        throw InvalidSpecError(token, "mod_type_2", "empty modification type");
    }
    spec.mod1.mod_type = fields[1];
    spec.mod2.mod_type = fields[3];
    spec.mod1.offset = parse_offset(token, "mod_position_1", fields[2], spec.motif.size());
    spec.mod2.offset = parse_offset(token, "mod_position_2", fields[4], spec.motif.size());

    if (spec.mod1.offset == spec.mod2.offset) {
        throw InvalidSpecError(token, "mod_position_2", "both sites point at offset " + fields[4]);
    }
    return spec;
}

std::string MotifPairSpec::to_string() const {
    std::ostringstream oss;
    oss << motif << "_" << mod1.mod_type << "_" << mod1.offset << "_" << mod2.mod_type << "_" << mod2.offset;
    return oss.str();
}

std::string MotifPairSpec::reverse_complement_motif() const {
    return Iupac::reverse_complement(motif);
}

bool MotifPairSpec::is_palindromic() const {
    return motif == reverse_complement_motif();
}

std::vector<MotifPairSpec> parse_motif_pairs(const std::vector<std::string>& tokens) {
    std::vector<MotifPairSpec> specs;
    std::set<std::string> seen;
    specs.reserve(tokens.size());

    for (const auto& token : tokens) {
        MotifPairSpec spec = MotifPairSpec::parse(token);
        if (!seen.insert(spec.to_string()).second) {
            throw InvalidSpecError(token, "motif", "duplicate of an earlier motif pair");
        }
        specs.push_back(std::move(spec));
    }
    return specs;
}

}  // namespace Memopair
