#pragma once

#include "name_space.h"
#include <string>
#include <vector>

namespace ark {

/// Built-in word lists used when no name parts are configured.
const std::vector<std::string>& defaultAdjectives();
const std::vector<std::string>& defaultAnimals();

/// The "adjectives" and "animals" categories, in that order.
std::vector<Category> defaultNameParts();

/// Collapse runs of whitespace to one space and trim both ends.
std::string squish(const std::string& word);

/// Squish every word, drop words that end up empty, and drop repeats within a
/// category (first occurrence wins). Category order and names are kept.
std::vector<Category> cleanNameParts(std::vector<Category> parts);

} // namespace ark
