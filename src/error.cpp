#include "ark/error.h"

namespace ark {

static std::string capacityMessage(size_t requested, size_t remainingTotal,
                                   size_t remainingAlliterations, bool alliterate) {
    std::string msg = "Not enough unused pseudonyms left in the Ark. Requested: " +
                      std::to_string(requested) + ", available: " +
                      std::to_string(remainingTotal) + " (" +
                      std::to_string(remainingAlliterations) +
                      " alliterations). Try using custom name parts.";
    if (alliterate && requested <= remainingTotal) {
        msg += " Note: more alliterations were requested than available, but there "
               "are enough pseudonyms left that are not alliterations.";
    }
    return msg;
}

CapacityExhaustedError::CapacityExhaustedError(size_t requested, size_t remainingTotal,
                                               size_t remainingAlliterations, bool alliterate)
    : ArkError(capacityMessage(requested, remainingTotal, remainingAlliterations, alliterate)),
      requested_(requested), remainingTotal_(remainingTotal),
      remainingAlliterations_(remainingAlliterations), alliterate_(alliterate) {}

} // namespace ark
