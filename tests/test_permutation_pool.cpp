#include <catch2/catch_test_macros.hpp>
#include "ark/permutation_pool.h"
#include "ark/error.h"
#include <algorithm>
#include <numeric>
#include <set>

using namespace ark;

TEST_CASE("PermutationPool range is a permutation", "[pool]") {
    std::mt19937 rng(7);
    auto pool = PermutationPool::range(100, rng);
    CHECK(pool.capacity() == 100);
    CHECK(pool.remaining() == 100);

    auto all = pool.draw(100);
    std::sort(all.begin(), all.end());
    std::vector<LinearIndex> expected(100);
    std::iota(expected.begin(), expected.end(), LinearIndex{1});
    CHECK(all == expected);
    CHECK(pool.remaining() == 0);
}

TEST_CASE("PermutationPool draws in stored order without repeats", "[pool]") {
    std::mt19937 rng(11);
    auto pool = PermutationPool::range(20, rng);
    auto order = pool.undrawn();

    auto a = pool.draw(5);
    auto b = pool.draw(7);
    CHECK(a == std::vector<LinearIndex>(order.begin(), order.begin() + 5));
    CHECK(b == std::vector<LinearIndex>(order.begin() + 5, order.begin() + 12));
    CHECK(pool.remaining() == 8);
    CHECK(pool.draw(0).empty());
}

TEST_CASE("PermutationPool overdraw throws and leaves state alone", "[pool]") {
    std::mt19937 rng(3);
    PermutationPool pool({10, 20, 30}, rng);
    auto before = pool.undrawn();
    CHECK_THROWS_AS(pool.draw(4), InsufficientCapacityError);
    CHECK(pool.remaining() == 3);
    CHECK(pool.undrawn() == before);

    try {
        pool.draw(5);
        FAIL("expected InsufficientCapacityError");
    } catch (const InsufficientCapacityError& e) {
        CHECK(e.requested() == 5);
        CHECK(e.remaining() == 3);
    }
}

TEST_CASE("PermutationPool remove keeps the order of the rest", "[pool]") {
    std::mt19937 rng(5);
    auto pool = PermutationPool::range(10, rng);
    pool.draw(2);
    auto before = pool.undrawn();

    std::vector<LinearIndex> doomed{before[1], before[4]};
    pool.remove(doomed);

    std::vector<LinearIndex> expected;
    for (auto i : before) {
        if (i != doomed[0] && i != doomed[1]) expected.push_back(i);
    }
    CHECK(pool.undrawn() == expected);
    CHECK(pool.remaining() == 6);
    CHECK(pool.capacity() == 10);
}

TEST_CASE("PermutationPool remove ignores absent and drawn indices", "[pool]") {
    std::mt19937 rng(9);
    PermutationPool pool({1, 2, 3, 4}, rng);
    auto drawn = pool.draw(1);
    auto before = pool.undrawn();

    pool.remove({drawn[0], 99});
    CHECK(pool.undrawn() == before);
    CHECK(pool.remaining() == 3);
}

TEST_CASE("PermutationPool empty set", "[pool]") {
    std::mt19937 rng(1);
    PermutationPool pool({}, rng);
    CHECK(pool.capacity() == 0);
    CHECK(pool.remaining() == 0);
    CHECK(pool.draw(0).empty());
    CHECK_THROWS_AS(pool.draw(1), InsufficientCapacityError);
    pool.remove({1});
    CHECK(pool.remaining() == 0);
}

TEST_CASE("PermutationPool range refuses oversized totals", "[pool]") {
    std::mt19937 rng(2);
    CHECK_THROWS_AS(PermutationPool::range(kMaxNameSpaceSize + 1, rng), NameSpaceTooLargeError);
}

TEST_CASE("PermutationPool same seed gives same order", "[pool]") {
    std::mt19937 a(1234);
    std::mt19937 b(1234);
    CHECK(PermutationPool::range(50, a).undrawn() == PermutationPool::range(50, b).undrawn());
}
