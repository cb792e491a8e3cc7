#pragma once

#include "name_space.h"
#include <cstddef>
#include <random>
#include <vector>

namespace ark {

/// A shuffled, consumable sequence of linear indices.
///
/// Indices are handed out from the front in stored order; a cursor marks how
/// many have been drawn. draw() and remove() are the only mutators.
class PermutationPool {
public:
    /// Shuffle an explicit index set.
    PermutationPool(std::vector<LinearIndex> indices, std::mt19937& rng);

    /// Shuffle the full range 1..total.
    static PermutationPool range(LinearIndex total, std::mt19937& rng);

    /// Next k undrawn indices. Throws InsufficientCapacityError, leaving the
    /// pool untouched, when k exceeds remaining().
    std::vector<LinearIndex> draw(size_t k);

    /// Drop the given indices from the undrawn part, keeping the order of the
    /// rest. Indices already drawn or never in the pool are ignored.
    void remove(const std::vector<LinearIndex>& indices);

    size_t remaining() const { return sequence_.size() - cursor_; }

    /// Size of the index set the pool was built from.
    size_t capacity() const { return capacity_; }

    /// Undrawn indices in draw order.
    std::vector<LinearIndex> undrawn() const;

private:
    std::vector<LinearIndex> sequence_;
    size_t cursor_ = 0;
    size_t capacity_ = 0;
};

} // namespace ark
