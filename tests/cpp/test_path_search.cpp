#include <catch2/catch_test_macros.hpp>
#include "Encoding.h"
#include "LruCache.h"
#include "PathSearch.h"
#include "Validator.h"
#include "WeekEnumerator.h"
#include "globals.h"
#include <atomic>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::vector<WeekSchedule> optimalSeeds(const Encoding &e) {
    WeekEnumerator enumerator(e);
    std::vector<WeekSchedule> seeds;
    for (const WeekSchedule &w :
         enumerator.enumerateAll(MatchupSet(), MatchupSet(), 0)) {
        if (e.score(w) == e.optimalWeekScore()) {
            seeds.push_back(w);
        }
    }
    return seeds;
}

} // namespace

// ============================================================================
// LruCache
// ============================================================================

TEST_CASE("LruCache evicts the least recently used entry", "[lru_cache]") {
    LruCache<int, std::string> cache(2);
    cache.put(1, "one");
    cache.put(2, "two");
    REQUIRE(cache.get(1) != nullptr); // 1 is now most recent
    cache.put(3, "three");

    REQUIRE(cache.size() == 2);
    REQUIRE(cache.get(2) == nullptr);
    REQUIRE(*cache.get(1) == "one");
    REQUIRE(*cache.get(3) == "three");
    REQUIRE(cache.getHits() == 3);
    REQUIRE(cache.getMisses() == 1);
}

TEST_CASE("LruCache with zero capacity stores nothing", "[lru_cache]") {
    LruCache<int, int> cache(0);
    cache.put(1, 1);
    REQUIRE(cache.size() == 0);
    REQUIRE(cache.get(1) == nullptr);
}

// ============================================================================
// PathSearch
// ============================================================================

TEST_CASE("PathSearch finds every optimal continuation", "[path_search]") {
    Encoding e(6);
    std::vector<WeekSchedule> seeds = optimalSeeds(e);
    REQUIRE(seeds.size() == 48);

    PathSearch search(e, 2, e.optimalWeekScore());
    Validator validator(e);
    std::atomic<bool> stop{false};

    uint64_t total = 0;
    for (const WeekSchedule &seed : seeds) {
        std::vector<Path> found;
        UnitResult r = search.explore(
            Path{seed}, 0, 0,
            [&found](const Path &p) { found.push_back(p); }, stop);
        REQUIRE(r.exhausted);
        REQUIRE_FALSE(r.interrupted);
        REQUIRE(r.totalFound == 36);
        REQUIRE(r.newResults == 36);
        REQUIRE(found.size() == 36);
        for (const Path &p : found) {
            REQUIRE(p.size() == 2);
            REQUIRE(p[0] == seed);
            REQUIRE(validator.checkPath(p, e.optimalWeekScore()).valid());
        }
        total += found.size();
    }
    REQUIRE(total == 1728);
}

TEST_CASE("PathSearch bounded units", "[path_search]") {
    Encoding e(6);
    std::vector<WeekSchedule> seeds = optimalSeeds(e);
    PathSearch search(e, 2, e.optimalWeekScore());
    std::atomic<bool> stop{false};
    const Path start{seeds[0]};

    std::vector<Path> all;
    search.explore(start, 0, 0, [&all](const Path &p) { all.push_back(p); },
                   stop);
    REQUIRE(all.size() == 36);

    SECTION("breadth limit cuts the unit off") {
        std::vector<Path> found;
        UnitResult r = search.explore(
            start, 0, 10, [&found](const Path &p) { found.push_back(p); },
            stop);
        REQUIRE_FALSE(r.exhausted);
        REQUIRE(r.newResults == 10);
        REQUIRE(found == std::vector<Path>(all.begin(), all.begin() + 10));
        // the week-1 candidates come from the cache the second time
        REQUIRE(search.getCacheHits() > 0);
    }

    SECTION("skip offset resumes where the last unit stopped") {
        std::vector<Path> found;
        UnitResult r = search.explore(
            start, 10, 10, [&found](const Path &p) { found.push_back(p); },
            stop);
        REQUIRE_FALSE(r.exhausted);
        REQUIRE(r.totalFound == 20);
        REQUIRE(found ==
                std::vector<Path>(all.begin() + 10, all.begin() + 20));
    }

    SECTION("the last unit exhausts the subtree") {
        std::vector<Path> found;
        UnitResult r = search.explore(
            start, 30, 10, [&found](const Path &p) { found.push_back(p); },
            stop);
        REQUIRE(r.exhausted);
        REQUIRE(r.newResults == 6);
        REQUIRE(found == std::vector<Path>(all.begin() + 30, all.end()));
    }

    SECTION("a skip past the end finds nothing new") {
        UnitResult r = search.explore(start, 36, 10, [](const Path &) {},
                                      stop);
        REQUIRE(r.exhausted);
        REQUIRE(r.newResults == 0);
    }
}

TEST_CASE("PathSearch diversify changes order, not results",
          "[path_search]") {
    Encoding e(4);
    std::vector<WeekSchedule> seeds = optimalSeeds(e);
    PathSearch search(e, 3, e.optimalWeekScore());
    std::atomic<bool> stop{false};
    const Path start{seeds[1]};

    std::vector<Path> plain;
    std::vector<Path> rotated;
    std::vector<Path> rotatedAgain;
    search.explore(start, 0, 0,
                   [&plain](const Path &p) { plain.push_back(p); }, stop);
    search.explore(
        start, 0, 0, [&rotated](const Path &p) { rotated.push_back(p); },
        stop, true);
    search.explore(
        start, 0, 0,
        [&rotatedAgain](const Path &p) { rotatedAgain.push_back(p); }, stop,
        true);

    REQUIRE(plain.size() == 2304);
    REQUIRE(std::set<Path>(plain.begin(), plain.end()) ==
            std::set<Path>(rotated.begin(), rotated.end()));
    // deterministic for the same start
    REQUIRE(rotated == rotatedAgain);
}

TEST_CASE("PathSearch honours the stop flag", "[path_search]") {
    Encoding e(6);
    std::vector<WeekSchedule> seeds = optimalSeeds(e);
    PathSearch search(e, 2, e.optimalWeekScore());

    SECTION("stop set before the unit starts") {
        std::atomic<bool> stop{true};
        UnitResult r =
            search.explore(Path{seeds[0]}, 0, 0, [](const Path &) {}, stop);
        REQUIRE(r.interrupted);
        REQUIRE_FALSE(r.exhausted);
        REQUIRE(r.totalFound == 0);
    }

    SECTION("stop set by the visitor") {
        std::atomic<bool> stop{false};
        int seen = 0;
        UnitResult r = search.explore(
            Path{seeds[0]}, 0, 0,
            [&stop, &seen](const Path &) {
                if (++seen == 5) {
                    stop.store(true);
                }
            },
            stop);
        REQUIRE(r.interrupted);
        REQUIRE_FALSE(r.exhausted);
        REQUIRE(r.newResults == 5);
    }
}

TEST_CASE("PathSearch with a complete starting path", "[path_search]") {
    Encoding e(6);
    std::vector<WeekSchedule> seeds = optimalSeeds(e);
    std::atomic<bool> stop{false};

    PathSearch oneWeek(e, 1, e.optimalWeekScore());
    int reported = 0;
    UnitResult r = oneWeek.explore(Path{seeds[0]}, 0, 0,
                                   [&reported](const Path &) { reported++; },
                                   stop);
    REQUIRE(r.exhausted);
    REQUIRE(reported == 1);

    Path tooLong{seeds[0], seeds[0]};
    REQUIRE_THROWS_AS(oneWeek.explore(tooLong, 0, 0, [](const Path &) {},
                                      stop),
                      std::invalid_argument);
}
