#pragma once

#include <cstdint>
#include <string>

namespace Memopair {
namespace Iupac {

/**
 * @brief Nucleotide set of an IUPAC code as a 4-bit mask (A=1, C=2, G=4, T=8).
 *
 * Case-insensitive. Returns 0 for characters that are not IUPAC nucleotide codes.
 */
uint8_t mask(char c);

/**
 * @brief True if c is one of A C G T R Y S W K M B D H V N (any case).
 */
inline bool is_valid(char c) {
    return mask(c) != 0;
}

/**
 * @brief Complement code, upper-cased. Returns 'N' for invalid input.
 */
char complement(char c);

/**
 * @brief Reverse complement of an IUPAC string, upper-cased.
 */
std::string reverse_complement(const std::string& seq);

/**
 * @brief True if the reference symbol's nucleotide set is contained in the
 *        motif symbol's set.
 *
 * `W` in the motif matches A, T and W in the reference. A reference `N`
 * only matches a motif `N`.
 */
inline bool matches(char motif_symbol, char reference_symbol) {
    uint8_t ref = mask(reference_symbol);
    return ref != 0 && (ref & ~mask(motif_symbol)) == 0;
}

}  // namespace Iupac
}  // namespace Memopair
