#include "ark/name_parts.h"
#include <cctype>
#include <unordered_set>

namespace ark {

const std::vector<std::string>& defaultAdjectives() {
    static const std::vector<std::string> v = {
        "Able", "Agile", "Airy", "Amber", "Ancient", "Arctic", "Artful", "Azure",
        "Bold", "Brave", "Breezy", "Bright", "Brisk", "Bubbly", "Busy",
        "Calm", "Candid", "Cheerful", "Clever", "Cosmic", "Cozy", "Crimson", "Curious",
        "Dainty", "Dapper", "Daring", "Dashing", "Dazzling", "Deft", "Dreamy", "Dusky",
        "Eager", "Earnest", "Easy", "Elegant", "Emerald", "Epic", "Exotic",
        "Fabulous", "Fair", "Fancy", "Fearless", "Feisty", "Fluffy", "Frosty", "Fuzzy",
        "Gallant", "Gentle", "Giant", "Gifted", "Glad", "Golden", "Graceful", "Grand",
        "Handsome", "Happy", "Hardy", "Hasty", "Hearty", "Honest", "Humble",
        "Icy", "Ideal", "Idle", "Improbable", "Indigo", "Inky", "Ivory",
        "Jade", "Jaunty", "Jazzy", "Jolly", "Jovial", "Joyful", "Jumpy",
        "Keen", "Kind", "Kindly", "Knightly", "Knowing",
        "Lanky", "Lively", "Lofty", "Loyal", "Lucky", "Lunar", "Lush",
        "Magic", "Majestic", "Mellow", "Merry", "Mighty", "Misty", "Modest", "Mossy",
        "Neat", "Nimble", "Noble", "Nocturnal", "Nifty", "Novel",
        "Oaken", "Odd", "Olive", "Opal", "Orange", "Ornate",
        "Patient", "Peppy", "Plucky", "Polite", "Proud", "Purple",
        "Quaint", "Queenly", "Quick", "Quiet", "Quirky",
        "Radiant", "Rapid", "Regal", "Rosy", "Royal", "Rustic",
        "Sandy", "Scarlet", "Serene", "Shiny", "Silent", "Silver", "Sleepy", "Snowy", "Sunny", "Swift",
        "Tame", "Tawny", "Tender", "Tidy", "Tiny", "Tranquil", "Trusty",
        "Ultimate", "Umber", "Unique", "Upbeat", "Urban",
        "Valiant", "Velvet", "Vibrant", "Vivid", "Vocal",
        "Wandering", "Warm", "Whimsical", "Wild", "Wise", "Witty", "Woolly",
        "Xenial", "Yellow", "Young", "Youthful", "Zany", "Zealous", "Zesty"};
    return v;
}

const std::vector<std::string>& defaultAnimals() {
    static const std::vector<std::string> v = {
        "Aardvark", "Albatross", "Alligator", "Alpaca", "Antelope", "Armadillo",
        "Badger", "Bat", "Bear", "Beaver", "Bison", "Bobcat", "Buffalo", "Butterfly",
        "Camel", "Capybara", "Caribou", "Cheetah", "Chipmunk", "Cougar", "Coyote", "Crane",
        "Deer", "Dingo", "Dolphin", "Donkey", "Dove", "Dragonfly", "Duck",
        "Eagle", "Echidna", "Eel", "Egret", "Elephant", "Elk", "Emu",
        "Falcon", "Ferret", "Finch", "Flamingo", "Fox", "Frog",
        "Gazelle", "Gecko", "Gibbon", "Giraffe", "Goose", "Gorilla", "Grouse",
        "Hamster", "Hare", "Hawk", "Hedgehog", "Heron", "Hippo", "Hummingbird",
        "Ibex", "Ibis", "Iguana", "Impala",
        "Jackal", "Jaguar", "Jay", "Jellyfish",
        "Kangaroo", "Kestrel", "Kingfisher", "Kiwi", "Koala", "Kudu",
        "Ladybug", "Lemur", "Leopard", "Lion", "Llama", "Lobster", "Lynx",
        "Macaw", "Magpie", "Manatee", "Meerkat", "Mink", "Mole", "Moose", "Mouse",
        "Narwhal", "Newt", "Nightingale", "Numbat",
        "Ocelot", "Octopus", "Okapi", "Opossum", "Orca", "Ostrich", "Otter", "Owl",
        "Panda", "Panther", "Parrot", "Pelican", "Penguin", "Platypus", "Puffin", "Puma",
        "Quail", "Quetzal", "Quokka",
        "Rabbit", "Raccoon", "Raven", "Reindeer", "Rhino", "Robin",
        "Salamander", "Seal", "Shark", "Sloth", "Sparrow", "Squirrel", "Starling", "Swan",
        "Tapir", "Tiger", "Toad", "Toucan", "Turtle",
        "Urchin", "Unicorn",
        "Vicuna", "Viper", "Vole", "Vulture",
        "Wallaby", "Walrus", "Weasel", "Whale", "Wolf", "Wombat", "Woodpecker",
        "Yak", "Zebra"};
    return v;
}

std::vector<Category> defaultNameParts() {
    return {{"adjectives", defaultAdjectives()}, {"animals", defaultAnimals()}};
}

std::string squish(const std::string& word) {
    std::string out;
    out.reserve(word.size());
    bool pendingSpace = false;
    for (unsigned char c : word) {
        if (std::isspace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out += ' ';
            pendingSpace = false;
        }
        out += static_cast<char>(c);
    }
    return out;
}

std::vector<Category> cleanNameParts(std::vector<Category> parts) {
    for (auto& category : parts) {
        std::vector<std::string> cleaned;
        std::unordered_set<std::string> seen;
        for (auto& w : category.words) {
            std::string s = squish(w);
            if (s.empty()) continue;
            if (seen.insert(s).second) cleaned.push_back(std::move(s));
        }
        category.words = std::move(cleaned);
    }
    return parts;
}

} // namespace ark
