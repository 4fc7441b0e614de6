#include <catch2/catch_test_macros.hpp>
#include "Encoding.h"
#include "RoundTracker.h"
#include "Validator.h"
#include "WeekEnumerator.h"
#include "globals.h"
#include <set>
#include <vector>

namespace {

MatchupSet toSet(const WeekSchedule &week) {
    MatchupSet s;
    for (int m : week) {
        s.set(m);
    }
    return s;
}

} // namespace

// ============================================================================
// Unconstrained enumeration
// ============================================================================

TEST_CASE("WeekEnumerator produces only valid weeks", "[week_enumerator]") {
    Encoding e(6);
    WeekEnumerator enumerator(e);
    Validator validator(e);

    std::vector<WeekSchedule> weeks =
        enumerator.enumerateAll(MatchupSet(), MatchupSet(), 0);
    REQUIRE(!weeks.empty());
    for (const WeekSchedule &week : weeks) {
        REQUIRE(week[0] == 0);
        REQUIRE(validator.checkWeek(week).empty());
    }

    // no duplicates
    std::set<WeekSchedule> distinct(weeks.begin(), weeks.end());
    REQUIRE(distinct.size() == weeks.size());
}

TEST_CASE("WeekEnumerator counts for 6 teams with AvB first",
          "[week_enumerator]") {
    Encoding e(6);
    WeekEnumerator enumerator(e);
    std::vector<WeekSchedule> weeks =
        enumerator.enumerateAll(MatchupSet(), MatchupSet(), 0);
    REQUIRE(weeks.size() == 192);

    Score best = e.score(weeks[0]);
    size_t atOptimum = 0;
    for (const WeekSchedule &week : weeks) {
        Score s = e.score(week);
        if (s < best) {
            best = s;
        }
    }
    for (const WeekSchedule &week : weeks) {
        if (e.score(week) == Score(2, 4)) {
            atOptimum++;
        }
    }
    REQUIRE(best == Score(2, 4));
    REQUIRE(atOptimum == 48);
}

TEST_CASE("WeekEnumerator minimum score for 4 teams", "[week_enumerator]") {
    Encoding e(4);
    WeekEnumerator enumerator(e);
    std::vector<WeekSchedule> weeks =
        enumerator.enumerateAll(MatchupSet(), MatchupSet(), 0);
    REQUIRE(weeks.size() == 8);
    for (const WeekSchedule &week : weeks) {
        // a 4-team week plays every matchup once
        REQUIRE(toSet(week) == e.allMatchups());
        REQUIRE(e.score(week) == Score(1, 2));
    }
}

TEST_CASE("WeekEnumerator without a fixed first slot", "[week_enumerator]") {
    Encoding e(4);
    WeekEnumerator enumerator(e);
    std::vector<WeekSchedule> weeks =
        enumerator.enumerateAll(MatchupSet(), MatchupSet());
    std::vector<WeekSchedule> pinned =
        enumerator.enumerateAll(MatchupSet(), MatchupSet(), 0);

    size_t startingWithAvB = 0;
    for (const WeekSchedule &week : weeks) {
        if (week[0] == 0) {
            startingWithAvB++;
        }
    }
    REQUIRE(weeks.size() > pinned.size());
    REQUIRE(startingWithAvB == pinned.size());
}

// ============================================================================
// Constraints
// ============================================================================

TEST_CASE("WeekEnumerator honours exclude", "[week_enumerator]") {
    Encoding e(6);
    WeekEnumerator enumerator(e);

    SECTION("single excluded matchup") {
        MatchupSet exclude;
        exclude.set(e.encode(2, 3));
        std::vector<WeekSchedule> weeks =
            enumerator.enumerateAll(exclude, MatchupSet(), 0);
        REQUIRE(!weeks.empty());
        for (const WeekSchedule &week : weeks) {
            REQUIRE((toSet(week) & exclude).none());
        }
    }

    SECTION("too few matchups left is an empty result") {
        // 15 - 9 = 6 matchups cannot fill 9 slots
        std::vector<WeekSchedule> first =
            enumerator.enumerateAll(MatchupSet(), MatchupSet(), 0);
        MatchupSet exclude = toSet(first[0]);
        size_t n = enumerator.enumerate(
            exclude, MatchupSet(), [](const WeekSchedule &) { return true; });
        REQUIRE(n == 0);
    }

    SECTION("fixed first slot that is excluded") {
        MatchupSet exclude;
        exclude.set(0);
        REQUIRE(enumerator.enumerateAll(exclude, MatchupSet(), 0).empty());
    }
}

TEST_CASE("WeekEnumerator honours required", "[week_enumerator]") {
    Encoding e(6);
    WeekEnumerator enumerator(e);
    std::vector<WeekSchedule> first =
        enumerator.enumerateAll(MatchupSet(), MatchupSet(), 0);

    SECTION("every unplayed matchup of the round") {
        MatchupSet required = e.allMatchups() & ~toSet(first[0]);
        REQUIRE(required.count() == 6);
        std::vector<WeekSchedule> weeks =
            enumerator.enumerateAll(MatchupSet(), required);
        REQUIRE(!weeks.empty());
        for (const WeekSchedule &week : weeks) {
            REQUIRE((required & ~toSet(week)).none());
        }
    }

    SECTION("required and excluded together is infeasible") {
        MatchupSet both;
        both.set(3);
        REQUIRE(enumerator.enumerateAll(both, both).empty());
    }
}

TEST_CASE("WeekEnumerator stops when the visitor says so",
          "[week_enumerator]") {
    Encoding e(6);
    WeekEnumerator enumerator(e);
    int seen = 0;
    size_t n = enumerator.enumerate(MatchupSet(), MatchupSet(),
                                    [&seen](const WeekSchedule &) {
                                        return ++seen < 5;
                                    });
    REQUIRE(n == 5);
    REQUIRE(seen == 5);
    REQUIRE(enumerator.wasStopped());

    enumerator.enumerate(MatchupSet(), MatchupSet(),
                         [](const WeekSchedule &) { return true; }, 0);
    REQUIRE_FALSE(enumerator.wasStopped());
}

TEST_CASE("WeekEnumerator with 8-team round constraints",
          "[week_enumerator][round_tracker]") {
    Encoding e(8);
    WeekEnumerator enumerator(e);
    RoundTracker tracker(e);
    const size_t LIMIT = 40;

    // collect a handful of weeks without enumerating everything
    auto firstWeeks = [&](const Constraint &c, int fixed) {
        std::vector<WeekSchedule> weeks;
        enumerator.enumerate(
            c.exclude, c.required,
            [&weeks, LIMIT](const WeekSchedule &w) {
                weeks.push_back(w);
                return weeks.size() < LIMIT;
            },
            fixed);
        return weeks;
    };

    RoundState state;
    Constraint c0 = tracker.constraintFor(0, state);
    std::vector<WeekSchedule> week0 = firstWeeks(c0, 0);
    REQUIRE(!week0.empty());
    state = tracker.advance(0, week0[0], state, c0.required);

    // 28 - 12 = 16 remaining: the week lies inside the round
    Constraint c1 = tracker.constraintFor(1, state);
    REQUIRE(c1.remaining == 16);
    REQUIRE(c1.exclude == toSet(week0[0]));
    REQUIRE(c1.required.none());
    std::vector<WeekSchedule> week1 = firstWeeks(c1, -1);
    REQUIRE(!week1.empty());
    for (const WeekSchedule &week : week1) {
        REQUIRE((toSet(week) & c1.exclude).none());
    }
    state = tracker.advance(1, week1[0], state, c1.required);

    // 4 remaining: the round completes this week
    Constraint c2 = tracker.constraintFor(2, state);
    REQUIRE(c2.remaining == 4);
    REQUIRE(c2.required.count() == 4);
    REQUIRE(c2.exclude.none());
    std::vector<WeekSchedule> week2 = firstWeeks(c2, -1);
    REQUIRE(!week2.empty());
    for (const WeekSchedule &week : week2) {
        REQUIRE((c2.required & ~toSet(week)).none());
    }
}
