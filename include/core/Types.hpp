#pragma once

#include <cstdint>
#include <string>

namespace Memopair {

/**
 * @brief Strand a motif occurrence or pileup observation sits on.
 *
 * - FORWARD: positive strand (+)
 * - REVERSE: negative strand (-)
 */
enum class Strand : uint8_t {
    FORWARD = 0,  ///< Forward strand (+)
    REVERSE = 1   ///< Reverse strand (-)
};

/**
 * @brief Log level for controlling output verbosity.
 */
enum class LogLevel {
    LOG_ERROR = 0,    ///< Only errors
    LOG_WARN = 1,     ///< Errors and warnings
    LOG_INFO = 2,     ///< Normal operational messages
    LOG_DEBUG = 3     ///< Detailed debug output
};

/**
 * @brief Joint modification status of the two sites of one motif occurrence.
 */
enum class PairedState : uint8_t {
    BOTH_MODIFIED = 0,
    MOD1_ONLY = 1,
    MOD2_ONLY = 2,
    NEITHER_MODIFIED = 3,
    LOW_COVERAGE = 4,  ///< At least one site below min_cov
    NO_CALL = 5        ///< At least one site absent from the pileup
};

constexpr int kNumPairedStates = 6;

inline std::string strand_to_string(Strand s) {
    return s == Strand::FORWARD ? "+" : "-";
}

inline std::string paired_state_to_string(PairedState state) {
    switch (state) {
        case PairedState::BOTH_MODIFIED: return "BOTH_MODIFIED";
        case PairedState::MOD1_ONLY: return "MOD1_ONLY";
        case PairedState::MOD2_ONLY: return "MOD2_ONLY";
        case PairedState::NEITHER_MODIFIED: return "NEITHER_MODIFIED";
        case PairedState::LOW_COVERAGE: return "LOW_COVERAGE";
        case PairedState::NO_CALL: return "NO_CALL";
    }
    return "UNKNOWN";
}

}  // namespace Memopair
