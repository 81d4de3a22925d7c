#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace Memopair {

/**
 * @brief Thrown when a motif-pair token fails grammar or range validation.
 */
class InvalidSpecError : public std::runtime_error {
public:
    InvalidSpecError(const std::string& token, const std::string& field, const std::string& reason)
        : std::runtime_error("Invalid motif pair '" + token + "' (" + field + "): " + reason),
          token_(token),
          field_(field) {
    }

    const std::string& token() const { return token_; }
    const std::string& field() const { return field_; }

private:
    std::string token_;
    std::string field_;
};

/**
 * @brief Thrown when a pileup line cannot be turned into a PileupRecord.
 *
 * Loading is fail-fast: the index is never used after this is raised.
 */
class MalformedPileupLineError : public std::runtime_error {
public:
    MalformedPileupLineError(size_t line_number, const std::string& content, const std::string& reason)
        : std::runtime_error("Malformed pileup line " + std::to_string(line_number) + " (" + reason +
                             "): " + content),
          line_number_(line_number),
          content_(content) {
    }

    size_t line_number() const { return line_number_; }
    const std::string& content() const { return content_; }

private:
    size_t line_number_;
    std::string content_;
};

}  // namespace Memopair
