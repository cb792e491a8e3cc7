#include "ark/permutation_pool.h"
#include "ark/error.h"
#include <algorithm>
#include <numeric>
#include <unordered_set>

namespace ark {

PermutationPool::PermutationPool(std::vector<LinearIndex> indices, std::mt19937& rng)
    : sequence_(std::move(indices)) {
    std::shuffle(sequence_.begin(), sequence_.end(), rng);
    capacity_ = sequence_.size();
}

PermutationPool PermutationPool::range(LinearIndex total, std::mt19937& rng) {
    if (total > kMaxNameSpaceSize) {
        throw NameSpaceTooLargeError();
    }
    std::vector<LinearIndex> indices(static_cast<size_t>(total));
    std::iota(indices.begin(), indices.end(), LinearIndex{1});
    return PermutationPool(std::move(indices), rng);
}

std::vector<LinearIndex> PermutationPool::draw(size_t k) {
    if (k > remaining()) {
        throw InsufficientCapacityError(k, remaining());
    }
    auto first = sequence_.begin() + static_cast<std::ptrdiff_t>(cursor_);
    std::vector<LinearIndex> drawn(first, first + static_cast<std::ptrdiff_t>(k));
    cursor_ += k;
    return drawn;
}

void PermutationPool::remove(const std::vector<LinearIndex>& indices) {
    if (indices.empty() || remaining() == 0) return;

    std::unordered_set<LinearIndex> doomed(indices.begin(), indices.end());
    auto first = sequence_.begin() + static_cast<std::ptrdiff_t>(cursor_);
    // std::remove_if is stable, so the survivors keep their draw order
    auto last = std::remove_if(first, sequence_.end(),
                               [&](LinearIndex i) { return doomed.count(i) > 0; });
    sequence_.erase(last, sequence_.end());
}

std::vector<LinearIndex> PermutationPool::undrawn() const {
    return std::vector<LinearIndex>(sequence_.begin() + static_cast<std::ptrdiff_t>(cursor_),
                                    sequence_.end());
}

} // namespace ark
