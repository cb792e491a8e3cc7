#pragma once

#include "name_space.h"
#include <string>
#include <vector>

namespace ark {

class SubscriptCodec;

/// Every linear index whose words all start with the same letter A-Z,
/// compared case-insensitively. Sorted ascending, no duplicates. May be empty.
std::vector<LinearIndex> findAlliterations(const NameSpace& nameSpace, const SubscriptCodec& codec);

/// Convenience overload building the codec from the name space.
std::vector<LinearIndex> findAlliterations(const NameSpace& nameSpace);

/// True if every word starts with the same letter A-Z (case-insensitive).
bool isAlliteration(const std::vector<std::string>& words);

} // namespace ark
