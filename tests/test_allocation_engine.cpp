#include <catch2/catch_test_macros.hpp>
#include "ark/allocation_engine.h"
#include "ark/alliteration.h"
#include "ark/error.h"
#include "ark/name_parts.h"
#include <set>
#include <string>

using namespace ark;

static AllocationEngine makeEngine(std::vector<Category> parts, uint32_t seed = 42,
                                   std::string separator = " ") {
    std::mt19937 rng(seed);
    return AllocationEngine(NameSpace(std::move(parts)), rng, std::move(separator));
}

static std::vector<Fingerprint> keys(std::initializer_list<const char*> names) {
    return std::vector<Fingerprint>(names.begin(), names.end());
}

// Linear indices currently registered, recovered through the pseudonym text.
static std::set<LinearIndex> issuedIndices(const AllocationEngine& engine) {
    std::set<std::string> names;
    for (auto& e : engine.registry().entries()) names.insert(e.pseudonym);
    std::set<LinearIndex> issued;
    for (LinearIndex i = 1; i <= engine.total(); i++) {
        if (names.count(engine.pseudonymAt(i))) issued.insert(i);
    }
    return issued;
}

TEST_CASE("Engine: alliterating then plain request", "[engine]") {
    auto engine = makeEngine({{"adjectives", {"Big", "Calm"}}, {"animals", {"Bear", "Cat"}}});
    REQUIRE(engine.total() == 4);
    REQUIRE(engine.alliterationTotal() == 2);

    auto x = engine.pseudonymize(keys({"X"}), true);
    REQUIRE(x.size() == 1);
    CHECK((x[0] == "Big Bear" || x[0] == "Calm Cat"));
    CHECK(engine.alliterationCount() == 1);
    CHECK(engine.remaining() == 3);

    auto y = engine.pseudonymize(keys({"Y"}), false);
    std::set<std::string> allNames{"Big Bear", "Big Cat", "Calm Bear", "Calm Cat"};
    CHECK(allNames.count(y[0]) == 1);
    CHECK(y[0] != x[0]);
}

TEST_CASE("Engine: every combination alliterates when all words share a letter", "[engine]") {
    auto engine = makeEngine({{"adjectives", {"Big", "Blue"}}, {"animals", {"Bear", "Bat"}}});
    CHECK(engine.alliterationTotal() == 4);

    // plain draws consume alliterations too
    engine.pseudonymize(keys({"A", "B"}), false);
    CHECK(engine.alliterationCount() == 2);
    CHECK(engine.alliterationRemaining() == 2);
}

TEST_CASE("Engine: same key gets the same pseudonym", "[engine]") {
    auto engine = makeEngine(defaultNameParts());
    auto first = engine.pseudonymize(keys({"alice", "bob"}), false);
    auto again = engine.pseudonymize(keys({"bob", "alice"}), true);
    CHECK(again[0] == first[1]);
    CHECK(again[1] == first[0]);
    CHECK(engine.size() == 2);
}

TEST_CASE("Engine: batch with duplicates", "[engine]") {
    auto engine = makeEngine(defaultNameParts());
    auto out = engine.pseudonymize(keys({"A", "B", "A", "C"}), false);
    REQUIRE(out.size() == 4);
    CHECK(out[0] == out[2]);
    CHECK(std::set<std::string>(out.begin(), out.end()).size() == 3);
    CHECK(engine.size() == 3);
}

TEST_CASE("Engine: registry order follows draw order", "[engine]") {
    auto engine = makeEngine(defaultNameParts());
    auto out = engine.pseudonymize(keys({"c", "a", "c", "b"}), false);
    auto& entries = engine.registry().entries();
    REQUIRE(entries.size() == 3);
    CHECK(entries[0].fingerprint == "c");
    CHECK(entries[1].fingerprint == "a");
    CHECK(entries[2].fingerprint == "b");
    CHECK(entries[2].pseudonym == out[3]);
}

TEST_CASE("Engine: no pseudonym is issued twice", "[engine]") {
    auto engine = makeEngine(defaultNameParts(), 2024);
    std::set<std::string> seen;
    for (int batch = 0; batch < 40; batch++) {
        std::vector<Fingerprint> ks;
        for (int i = 0; i < 25; i++) ks.push_back("k" + std::to_string(batch * 25 + i));
        auto out = engine.pseudonymize(ks, batch % 3 == 0);
        for (auto& name : out) {
            CHECK(seen.insert(name).second);
        }
    }
    CHECK(engine.size() == 1000);
    CHECK(engine.remaining() == engine.total() - 1000);
}

TEST_CASE("Engine: issued indices are gone from both pools", "[engine]") {
    auto engine = makeEngine(defaultNameParts(), 99);
    auto allits = findAlliterations(engine.nameSpace(), engine.codec());
    std::set<LinearIndex> allitSet(allits.begin(), allits.end());

    for (int round = 0; round < 6; round++) {
        std::vector<Fingerprint> ks;
        for (int i = 0; i < 15; i++) ks.push_back(std::to_string(round) + "/" + std::to_string(i));
        engine.pseudonymize(ks, round % 2 == 0);
    }

    auto issued = issuedIndices(engine);
    REQUIRE(issued.size() == engine.size());

    auto full = engine.fullPool().undrawn();
    auto allit = engine.alliterationPool().undrawn();
    for (auto i : full) CHECK(issued.count(i) == 0);
    for (auto i : allit) {
        CHECK(issued.count(i) == 0);
        CHECK(allitSet.count(i) == 1);
    }
    CHECK(full.size() == engine.total() - issued.size());

    size_t issuedAllit = 0;
    for (auto i : issued) issuedAllit += allitSet.count(i);
    CHECK(engine.alliterationCount() == issuedAllit);
    CHECK(allit.size() == allitSet.size() - issuedAllit);
}

TEST_CASE("Engine: capacity exhaustion", "[engine]") {
    auto engine = makeEngine({{"adjectives", {"Big", "Calm"}}, {"animals", {"Bear", "Cat"}}});

    CHECK_THROWS_AS(engine.pseudonymize(keys({"1", "2", "3", "4", "5"}), false), CapacityExhaustedError);
    CHECK(engine.size() == 0);
    CHECK(engine.remaining() == 4);
    CHECK(engine.alliterationRemaining() == 2);

    auto four = engine.pseudonymize(keys({"1", "2", "3", "4"}), false);
    CHECK(std::set<std::string>(four.begin(), four.end()).size() == 4);
    CHECK(engine.remaining() == 0);
    CHECK(engine.alliterationRemaining() == 0);

    CHECK_THROWS_AS(engine.pseudonymize(keys({"5"}), false), CapacityExhaustedError);

    // known keys still resolve once the ark is full
    auto again = engine.pseudonymize(keys({"3", "1"}), true);
    CHECK(again[0] == four[2]);
    CHECK(again[1] == four[0]);
}

TEST_CASE("Engine: alliteration scarcity is reported separately", "[engine]") {
    auto engine = makeEngine({{"adjectives", {"Big", "Calm"}}, {"animals", {"Bear", "Cat"}}});
    try {
        engine.pseudonymize(keys({"a", "b", "c"}), true);
        FAIL("expected CapacityExhaustedError");
    } catch (const CapacityExhaustedError& e) {
        CHECK(e.requested() == 3);
        CHECK(e.remainingTotal() == 4);
        CHECK(e.remainingAlliterations() == 2);
        CHECK(e.alliterationsOnly());
        CHECK(std::string(e.what()).find("not alliterations") != std::string::npos);
    }
    CHECK(engine.size() == 0);

    try {
        engine.pseudonymize(keys({"a", "b", "c", "d", "e"}), true);
        FAIL("expected CapacityExhaustedError");
    } catch (const CapacityExhaustedError& e) {
        CHECK_FALSE(e.alliterationsOnly());
        CHECK(std::string(e.what()).find("not alliterations") == std::string::npos);
    }

    try {
        engine.pseudonymize(keys({"a", "b", "c", "d", "e"}), false);
        FAIL("expected CapacityExhaustedError");
    } catch (const CapacityExhaustedError& e) {
        CHECK_FALSE(e.alliterate());
        CHECK_FALSE(e.alliterationsOnly());
    }
}

TEST_CASE("Engine: no fallback to plain pseudonyms", "[engine]") {
    auto engine = makeEngine({{"adjectives", {"Big", "Calm"}}, {"animals", {"Bear", "Cat"}}});
    engine.pseudonymize(keys({"a", "b"}), true);
    CHECK(engine.alliterationRemaining() == 0);
    CHECK(engine.remaining() == 2);
    CHECK_THROWS_AS(engine.pseudonymize(keys({"c"}), true), CapacityExhaustedError);
    CHECK(engine.pseudonymize(keys({"c"}), false).size() == 1);
}

TEST_CASE("Engine: empty and all-known batches draw nothing", "[engine]") {
    auto engine = makeEngine(defaultNameParts());
    CHECK(engine.pseudonymize({}, false).empty());
    engine.pseudonymize(keys({"a"}), false);
    auto left = engine.remaining();
    engine.pseudonymize(keys({"a", "a"}), false);
    CHECK(engine.remaining() == left);
}

TEST_CASE("Engine: separator and pseudonym text", "[engine]") {
    auto engine = makeEngine({{"adjectives", {"Big"}}, {"colors", {"Red"}}, {"animals", {"Bear"}}},
                             1, "-");
    CHECK(engine.separator() == "-");
    CHECK(engine.pseudonymAt(1) == "Big-Red-Bear");
    CHECK(engine.pseudonymize(keys({"only"}), true)[0] == "Big-Red-Bear");
    CHECK_THROWS_AS(engine.pseudonymAt(2), IndexOutOfRangeError);
}

TEST_CASE("Engine: same seed replays the same pseudonyms", "[engine]") {
    auto a = makeEngine(defaultNameParts(), 7);
    auto b = makeEngine(defaultNameParts(), 7);
    CHECK(a.pseudonymize(keys({"x", "y", "z"}), false) == b.pseudonymize(keys({"x", "y", "z"}), false));
    CHECK(a.pseudonymize(keys({"w"}), true) == b.pseudonymize(keys({"w"}), true));
}
