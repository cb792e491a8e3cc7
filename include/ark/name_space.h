#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ark {

/// Identifies one pseudonym in the cartesian product of all categories, 1-based.
using LinearIndex = uint64_t;

/// Largest supported number of combinations. Every index is held in memory by
/// the allocation pools, so a name space must stay within this bound.
constexpr LinearIndex kMaxNameSpaceSize = LinearIndex{1} << 26;

/// One 1-based word position per category.
using Subscript = std::vector<size_t>;

/// A named list of words that contributes one word to every pseudonym.
struct Category {
    std::string name;
    std::vector<std::string> words;
};

/// Ordered, immutable set of name-part categories.
///
/// Throws EmptyCategoryError for a category without words, DuplicateWordError
/// for a repeated word, and NameSpaceTooLargeError when the number of
/// combinations exceeds kMaxNameSpaceSize.
class NameSpace {
public:
    explicit NameSpace(std::vector<Category> categories);

    const std::vector<Category>& categories() const { return categories_; }
    const std::vector<size_t>& sizes() const { return sizes_; }
    size_t categoryCount() const { return categories_.size(); }

    /// Number of distinct pseudonyms (product of the category sizes).
    LinearIndex total() const { return total_; }

    /// Word at a 1-based position of a category.
    const std::string& word(size_t category, size_t position) const;

    /// Words selected by a subscript, in category order.
    std::vector<std::string> words(const Subscript& subscript) const;

private:
    std::vector<Category> categories_;
    std::vector<size_t> sizes_;
    LinearIndex total_ = 0;
};

} // namespace ark
