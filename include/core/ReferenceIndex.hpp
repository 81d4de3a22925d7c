#pragma once

#include <map>
#include <string>
#include <vector>

namespace Memopair {

/**
 * @brief Maps reference record names to dense integer IDs in input order.
 *
 * The ID of a record is its position in the reference FASTA, which is also
 * the order report rows are emitted in.
 */
class ReferenceIndex {
public:
    /**
     * @brief Gets existing ID or creates a new one for the given reference name.
     */
    int get_or_create_id(const std::string& name);

    /**
     * @brief Finds the ID for a reference name.
     * @return ID if found, -1 if not found.
     */
    int find_id(const std::string& name) const;

    /**
     * @brief Gets the reference name for a given ID, or "" if out of range.
     */
    std::string get_name(int ref_id) const;

    size_t size() const { return id_to_name_.size(); }

    const std::vector<std::string>& names() const { return id_to_name_; }

private:
    std::map<std::string, int> name_to_id_;
    std::vector<std::string> id_to_name_;
};

}  // namespace Memopair
