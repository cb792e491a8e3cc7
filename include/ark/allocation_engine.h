#pragma once

#include "name_space.h"
#include "subscript_codec.h"
#include "permutation_pool.h"
#include "registry.h"
#include "fingerprint.h"
#include <cstddef>
#include <random>
#include <string>
#include <vector>

namespace ark {

/// Hands out unique pseudonyms for fingerprints.
///
/// Two pools are kept in step: one over every linear index, one over the
/// alliterating subset. An index drawn from either pool is removed from the
/// other in the same call, so no index is ever issued twice. Registered
/// fingerprints always get their stored pseudonym back.
///
/// Not thread-safe. A caller sharing an engine must hold one lock around each
/// whole pseudonymize() call.
class AllocationEngine {
public:
    AllocationEngine(NameSpace nameSpace, std::mt19937& rng, std::string separator = " ");

    /// One pseudonym per key, in key order. New keys (deduplicated) draw from
    /// the alliteration pool when alliterate is set, otherwise from the full
    /// pool. Throws CapacityExhaustedError, changing nothing, when the pool
    /// cannot cover the new keys.
    std::vector<std::string> pseudonymize(const std::vector<Fingerprint>& keys, bool alliterate);

    /// Pseudonym text for a linear index.
    std::string pseudonymAt(LinearIndex index) const;

    /// Number of registered keys.
    size_t size() const { return registry_.size(); }

    /// Number of registered pseudonyms that are alliterations.
    size_t alliterationCount() const { return alliterationPool_.capacity() - alliterationPool_.remaining(); }

    LinearIndex total() const { return nameSpace_.total(); }
    size_t alliterationTotal() const { return alliterationPool_.capacity(); }
    size_t remaining() const { return fullPool_.remaining(); }
    size_t alliterationRemaining() const { return alliterationPool_.remaining(); }

    const NameSpace& nameSpace() const { return nameSpace_; }
    const SubscriptCodec& codec() const { return codec_; }
    const Registry& registry() const { return registry_; }
    const PermutationPool& fullPool() const { return fullPool_; }
    const PermutationPool& alliterationPool() const { return alliterationPool_; }
    const std::string& separator() const { return separator_; }

private:
    NameSpace nameSpace_;
    SubscriptCodec codec_;
    PermutationPool fullPool_;
    PermutationPool alliterationPool_;
    Registry registry_;
    std::string separator_;
};

} // namespace ark
