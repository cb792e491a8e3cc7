#include "ark/name_space.h"
#include "ark/error.h"
#include <unordered_set>

namespace ark {

NameSpace::NameSpace(std::vector<Category> categories) : categories_(std::move(categories)) {
    if (categories_.empty()) {
        throw EmptyCategoryError("<none>");
    }

    total_ = 1;
    sizes_.reserve(categories_.size());
    for (auto& category : categories_) {
        if (category.words.empty()) {
            throw EmptyCategoryError(category.name);
        }
        std::unordered_set<std::string> seen;
        for (auto& w : category.words) {
            if (!seen.insert(w).second) {
                throw DuplicateWordError(category.name, w);
            }
        }

        size_t n = category.words.size();
        // total_ <= kMaxNameSpaceSize here, so the check cannot overflow
        if (n > kMaxNameSpaceSize || total_ * n > kMaxNameSpaceSize) {
            throw NameSpaceTooLargeError();
        }
        total_ *= n;
        sizes_.push_back(n);
    }
}

const std::string& NameSpace::word(size_t category, size_t position) const {
    if (category >= categories_.size()) {
        throw IndexOutOfRangeError("NameSpace::word: invalid category " + std::to_string(category));
    }
    auto& words = categories_[category].words;
    if (position < 1 || position > words.size()) {
        throw IndexOutOfRangeError("NameSpace::word: position " + std::to_string(position) +
                                   " outside category '" + categories_[category].name + "'");
    }
    return words[position - 1];
}

std::vector<std::string> NameSpace::words(const Subscript& subscript) const {
    if (subscript.size() != categories_.size()) {
        throw IndexOutOfRangeError("NameSpace::words: subscript has " +
                                   std::to_string(subscript.size()) + " components, expected " +
                                   std::to_string(categories_.size()));
    }
    std::vector<std::string> result;
    result.reserve(subscript.size());
    for (size_t i = 0; i < subscript.size(); i++) {
        result.push_back(word(i, subscript[i]));
    }
    return result;
}

} // namespace ark
