#include "ark/alliteration.h"
#include "ark/subscript_codec.h"
#include <algorithm>
#include <cctype>

namespace ark {

static char firstLetter(const std::string& word) {
    if (word.empty()) return '\0';
    return static_cast<char>(std::toupper(static_cast<unsigned char>(word[0])));
}

// Odometer step over per-category choices. Returns false after the last combination.
static bool advance(std::vector<size_t>& cursor, const std::vector<std::vector<size_t>>& choices) {
    for (size_t c = cursor.size(); c-- > 0;) {
        if (++cursor[c] < choices[c].size()) return true;
        cursor[c] = 0;
    }
    return false;
}

std::vector<LinearIndex> findAlliterations(const NameSpace& nameSpace, const SubscriptCodec& codec) {
    auto& categories = nameSpace.categories();
    std::vector<LinearIndex> result;

    for (char letter = 'A'; letter <= 'Z'; letter++) {
        // 1-based positions per category whose word starts with letter
        std::vector<std::vector<size_t>> matches(categories.size());
        bool everyCategory = true;
        for (size_t c = 0; c < categories.size() && everyCategory; c++) {
            auto& words = categories[c].words;
            for (size_t p = 0; p < words.size(); p++) {
                if (firstLetter(words[p]) == letter) matches[c].push_back(p + 1);
            }
            everyCategory = !matches[c].empty();
        }
        if (!everyCategory || categories.empty()) continue;

        // Walk the cartesian product of the matches, last category fastest.
        std::vector<size_t> cursor(categories.size(), 0);
        Subscript subscript(categories.size());
        do {
            for (size_t c = 0; c < categories.size(); c++) {
                subscript[c] = matches[c][cursor[c]];
            }
            result.push_back(codec.encode(subscript));
        } while (advance(cursor, matches));
    }

    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

std::vector<LinearIndex> findAlliterations(const NameSpace& nameSpace) {
    SubscriptCodec codec(nameSpace.sizes());
    return findAlliterations(nameSpace, codec);
}

bool isAlliteration(const std::vector<std::string>& words) {
    if (words.empty()) return false;
    char letter = firstLetter(words[0]);
    if (letter < 'A' || letter > 'Z') return false;
    for (auto& w : words) {
        if (firstLetter(w) != letter) return false;
    }
    return true;
}

} // namespace ark
