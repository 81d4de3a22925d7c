#include "core/ReferenceIndex.hpp"

namespace Memopair {

int ReferenceIndex::get_or_create_id(const std::string& name) {
    auto it = name_to_id_.find(name);
    if (it != name_to_id_.end()) {
        return it->second;
    }

    int new_id = static_cast<int>(id_to_name_.size());
    name_to_id_[name] = new_id;
    id_to_name_.push_back(name);
    return new_id;
}

int ReferenceIndex::find_id(const std::string& name) const {
    auto it = name_to_id_.find(name);
    if (it != name_to_id_.end()) {
        return it->second;
    }
    return -1;
}

std::string ReferenceIndex::get_name(int ref_id) const {
    if (ref_id >= 0 && ref_id < static_cast<int>(id_to_name_.size())) {
        return id_to_name_[ref_id];
    }
    return "";
}

}  // namespace Memopair
