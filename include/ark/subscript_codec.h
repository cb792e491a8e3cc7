#pragma once

#include "name_space.h"
#include <cstddef>
#include <vector>

namespace ark {

/// Mixed-radix conversion between a LinearIndex and a Subscript.
///
/// Radix order: the LAST category varies fastest. Index 1 is (1, 1, ..., 1),
/// index 2 is (1, ..., 1, 2), and so on. encode and decode both rely on it.
///
///   index = 1 + sum_i (pos_i - 1) * weight_i
///   weight_i = product of the sizes of the categories after i
///
/// Throws IndexOutOfRangeError for any input outside the name space.
class SubscriptCodec {
public:
    explicit SubscriptCodec(std::vector<size_t> sizes);

    LinearIndex encode(const Subscript& subscript) const;
    Subscript decode(LinearIndex index) const;

    // Batch forms, order preserving.
    std::vector<LinearIndex> encodeAll(const std::vector<Subscript>& subscripts) const;
    std::vector<Subscript> decodeAll(const std::vector<LinearIndex>& indices) const;

    const std::vector<size_t>& sizes() const { return sizes_; }
    LinearIndex total() const { return total_; }

private:
    std::vector<size_t> sizes_;
    std::vector<LinearIndex> weights_;
    LinearIndex total_ = 0;
};

} // namespace ark
