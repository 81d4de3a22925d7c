#include "core/Iupac.hpp"

#include <array>

namespace Memopair {
namespace Iupac {

namespace {

constexpr uint8_t A = 1, C = 2, G = 4, T = 8;

struct Tables {
    std::array<uint8_t, 256> masks{};
    std::array<char, 256> complements{};

    Tables() {
        complements.fill('N');

        const struct {
            char code;
            uint8_t mask;
            char complement;
        } codes[] = {
            {'A', A, 'T'},         {'C', C, 'G'},         {'G', G, 'C'},         {'T', T, 'A'},
            {'R', A | G, 'Y'},     {'Y', C | T, 'R'},     {'S', C | G, 'S'},     {'W', A | T, 'W'},
            {'K', G | T, 'M'},     {'M', A | C, 'K'},     {'B', C | G | T, 'V'}, {'D', A | G | T, 'H'},
            {'H', A | C | T, 'D'}, {'V', A | C | G, 'B'}, {'N', A | C | G | T, 'N'},
        };

        for (const auto& entry : codes) {
            char lower = static_cast<char>(entry.code - 'A' + 'a');
            masks[static_cast<unsigned char>(entry.code)] = entry.mask;
            masks[static_cast<unsigned char>(lower)] = entry.mask;
            complements[static_cast<unsigned char>(entry.code)] = entry.complement;
            complements[static_cast<unsigned char>(lower)] = entry.complement;
        }
    }
};

const Tables& tables() {
    static const Tables instance;
    return instance;
}

}  // namespace

uint8_t mask(char c) {
    return tables().masks[static_cast<unsigned char>(c)];
}

char complement(char c) {
    return tables().complements[static_cast<unsigned char>(c)];
}

std::string reverse_complement(const std::string& seq) {
    std::string result(seq.size(), 'N');
    for (size_t i = 0; i < seq.size(); ++i) {
        result[seq.size() - 1 - i] = complement(seq[i]);
    }
    return result;
}

}  // namespace Iupac
}  // namespace Memopair
