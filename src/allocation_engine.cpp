#include "ark/allocation_engine.h"
#include "ark/alliteration.h"
#include "ark/error.h"
#include "ark/log.h"
#include <unordered_map>

namespace ark {

AllocationEngine::AllocationEngine(NameSpace nameSpace, std::mt19937& rng, std::string separator)
    : nameSpace_(std::move(nameSpace)),
      codec_(nameSpace_.sizes()),
      fullPool_(PermutationPool::range(nameSpace_.total(), rng)),
      alliterationPool_(findAlliterations(nameSpace_, codec_), rng),
      separator_(std::move(separator)) {
    logger()->debug("engine ready: {} pseudonyms, {} alliterations",
                    nameSpace_.total(), alliterationPool_.capacity());
}

std::string AllocationEngine::pseudonymAt(LinearIndex index) const {
    auto words = nameSpace_.words(codec_.decode(index));
    std::string result;
    for (size_t i = 0; i < words.size(); i++) {
        if (i > 0) result += separator_;
        result += words[i];
    }
    return result;
}

std::vector<std::string> AllocationEngine::pseudonymize(const std::vector<Fingerprint>& keys,
                                                        bool alliterate) {
    // Distinct unregistered keys, in order of first appearance.
    std::vector<const Fingerprint*> fresh;
    std::unordered_map<std::string_view, size_t> freshSlot;
    for (auto& key : keys) {
        if (registry_.contains(key)) continue;
        if (freshSlot.emplace(key, fresh.size()).second) {
            fresh.push_back(&key);
        }
    }

    std::vector<std::string> freshNames;
    if (!fresh.empty()) {
        PermutationPool& source = alliterate ? alliterationPool_ : fullPool_;
        PermutationPool& sibling = alliterate ? fullPool_ : alliterationPool_;

        std::vector<LinearIndex> drawn;
        try {
            drawn = source.draw(fresh.size());
        } catch (const InsufficientCapacityError&) {
            CapacityExhaustedError error(fresh.size(), fullPool_.remaining(),
                                         alliterationPool_.remaining(), alliterate);
            logger()->warn("{}", error.what());
            throw error;
        }

        freshNames.reserve(drawn.size());
        for (auto index : drawn) {
            freshNames.push_back(pseudonymAt(index));
        }
        sibling.remove(drawn);

        for (size_t i = 0; i < fresh.size(); i++) {
            registry_.insert(*fresh[i], freshNames[i]);
        }
        logger()->debug("issued {} {}pseudonyms, {} left ({} alliterations)",
                        fresh.size(), alliterate ? "alliterating " : "",
                        fullPool_.remaining(), alliterationPool_.remaining());
    }

    std::vector<std::string> result;
    result.reserve(keys.size());
    for (auto& key : keys) {
        auto slot = freshSlot.find(key);
        if (slot != freshSlot.end()) {
            result.push_back(freshNames[slot->second]);
        } else {
            result.push_back(*registry_.find(key));
        }
    }
    return result;
}

} // namespace ark
