#include "ark/subscript_codec.h"
#include "ark/error.h"
#include <limits>

namespace ark {

SubscriptCodec::SubscriptCodec(std::vector<size_t> sizes) : sizes_(std::move(sizes)) {
    // weights_[i] = product of sizes_[i+1..]; last category has weight 1
    weights_.assign(sizes_.size(), 1);
    total_ = 1;
    for (size_t i = sizes_.size(); i-- > 0;) {
        if (sizes_[i] == 0) {
            throw IndexOutOfRangeError("SubscriptCodec: category " + std::to_string(i) + " is empty");
        }
        weights_[i] = total_;
        if (total_ > std::numeric_limits<LinearIndex>::max() / sizes_[i]) {
            throw NameSpaceTooLargeError();
        }
        total_ *= sizes_[i];
    }
}

LinearIndex SubscriptCodec::encode(const Subscript& subscript) const {
    if (subscript.size() != sizes_.size()) {
        throw IndexOutOfRangeError("SubscriptCodec::encode: subscript has " +
                                   std::to_string(subscript.size()) + " components, expected " +
                                   std::to_string(sizes_.size()));
    }
    LinearIndex index = 1;
    for (size_t i = 0; i < sizes_.size(); i++) {
        size_t pos = subscript[i];
        if (pos < 1 || pos > sizes_[i]) {
            throw IndexOutOfRangeError("SubscriptCodec::encode: position " + std::to_string(pos) +
                                       " outside [1, " + std::to_string(sizes_[i]) +
                                       "] for category " + std::to_string(i));
        }
        index += static_cast<LinearIndex>(pos - 1) * weights_[i];
    }
    return index;
}

Subscript SubscriptCodec::decode(LinearIndex index) const {
    if (index < 1 || index > total_) {
        throw IndexOutOfRangeError("SubscriptCodec::decode: index " + std::to_string(index) +
                                   " outside [1, " + std::to_string(total_) + "]");
    }
    Subscript subscript(sizes_.size());
    LinearIndex rest = index - 1;
    for (size_t i = sizes_.size(); i-- > 0;) {
        subscript[i] = static_cast<size_t>(rest % sizes_[i]) + 1;
        rest /= sizes_[i];
    }
    return subscript;
}

std::vector<LinearIndex> SubscriptCodec::encodeAll(const std::vector<Subscript>& subscripts) const {
    std::vector<LinearIndex> result;
    result.reserve(subscripts.size());
    for (auto& s : subscripts) result.push_back(encode(s));
    return result;
}

std::vector<Subscript> SubscriptCodec::decodeAll(const std::vector<LinearIndex>& indices) const {
    std::vector<Subscript> result;
    result.reserve(indices.size());
    for (auto i : indices) result.push_back(decode(i));
    return result;
}

} // namespace ark
