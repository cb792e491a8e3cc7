#include "ark/registry.h"

namespace ark {

const std::string* Registry::find(std::string_view fingerprint) const {
    auto it = index_.find(fingerprint);
    if (it == index_.end()) return nullptr;
    return &entries_[it->second].pseudonym;
}

bool Registry::insert(std::string fingerprint, std::string pseudonym) {
    if (index_.count(fingerprint) > 0) return false;

    size_t slot = entries_.size();
    entries_.push_back({std::move(fingerprint), std::move(pseudonym)});
    // string_view points into the deque element, which stays put as the deque grows
    index_[std::string_view(entries_.back().fingerprint)] = slot;
    return true;
}

} // namespace ark
