#include <catch2/catch_test_macros.hpp>
#include "Encoding.h"
#include "globals.h"
#include <set>
#include <stdexcept>
#include <utility>

// ============================================================================
// Matchup ids
// ============================================================================

TEST_CASE("Encoding rejects unsupported team counts", "[encoding]") {
    REQUIRE_THROWS_AS(Encoding(5), ConfigurationException);
    REQUIRE_THROWS_AS(Encoding(2), ConfigurationException);
    REQUIRE_THROWS_AS(Encoding(18), ConfigurationException);
    REQUIRE_NOTHROW(Encoding(4));
    REQUIRE_NOTHROW(Encoding(16));
}

TEST_CASE("Encoding sizes", "[encoding]") {
    Encoding e6(6);
    REQUIRE(e6.numTeams() == 6);
    REQUIRE(e6.numSlots() == 9);
    REQUIRE(e6.numMatchups() == 15);

    Encoding e16(16);
    REQUIRE(e16.numSlots() == 24);
    REQUIRE(e16.numMatchups() == 120);
    REQUIRE(e16.allMatchups().count() == 120);
}

TEST_CASE("Encoding uses lexicographic pair order", "[encoding]") {
    Encoding e(6);
    REQUIRE(e.encode(0, 1) == 0);
    REQUIRE(e.encode(0, 5) == 4);
    REQUIRE(e.encode(1, 2) == 5);
    REQUIRE(e.encode(4, 5) == 14);
    REQUIRE(e.encode(2, 1) == e.encode(1, 2));
    REQUIRE(e.matchupToString(0) == "AvB");
    REQUIRE(e.matchupToString(14) == "EvF");
}

TEST_CASE("Encoding encode and decode are inverse", "[encoding]") {
    for (int n = MIN_TEAMS; n <= MAX_TEAMS; n += 2) {
        Encoding e(n);
        std::set<int> ids;
        for (int a = 0; a < n; a++) {
            for (int b = a + 1; b < n; b++) {
                int m = e.encode(a, b);
                ids.insert(m);
                REQUIRE(e.decode(m) == std::make_pair(a, b));
            }
        }
        // dense and contiguous
        REQUIRE(static_cast<int>(ids.size()) == e.numMatchups());
        REQUIRE(*ids.begin() == 0);
        REQUIRE(*ids.rbegin() == e.numMatchups() - 1);
    }
}

TEST_CASE("Encoding rejects invalid pairs and ids", "[encoding]") {
    Encoding e(4);
    REQUIRE_THROWS_AS(e.encode(1, 1), std::out_of_range);
    REQUIRE_THROWS_AS(e.encode(0, 4), std::out_of_range);
    REQUIRE_THROWS_AS(e.decode(6), std::out_of_range);
    REQUIRE_THROWS_AS(e.decode(-1), std::out_of_range);
}

// ============================================================================
// Patterns
// ============================================================================

TEST_CASE("Encoding builds shifted patterns", "[encoding][patterns]") {
    SECTION("6 slots") {
        Encoding e(4);
        // 2 span-4 shapes x 3 offsets + 3 span-5 shapes x 2 offsets
        REQUIRE(e.numPatterns() == 12);
    }

    SECTION("24 slots") {
        Encoding e(16);
        REQUIRE(e.numPatterns() == 2 * 21 + 3 * 20);
    }

    SECTION("every pattern fits the week and spans at most 5") {
        Encoding e(8);
        for (const auto &p : e.getPatterns()) {
            REQUIRE(p[0] < p[1]);
            REQUIRE(p[1] < p[2]);
            REQUIRE(p[2] < e.numSlots());
            REQUIRE(p[2] - p[0] + 1 <= MAX_SPAN);
        }
    }

    SECTION("slot masks select the patterns using that slot") {
        Encoding e(6);
        const auto &patterns = e.getPatterns();
        for (int slot = 0; slot < e.numSlots(); slot++) {
            for (int p = 0; p < e.numPatterns(); p++) {
                bool uses = patterns[p][0] == slot || patterns[p][1] == slot ||
                            patterns[p][2] == slot;
                REQUIRE(e.slotMask(slot).test(p) == uses);
            }
        }
    }
}

// ============================================================================
// Score
// ============================================================================

TEST_CASE("Encoding scores a week", "[encoding][score]") {
    Encoding e(4);
    // AvB CvD AvC BvD AvD BvC: A at 0,2,4 B at 0,3,5 C at 1,2,5 D at 1,3,4
    WeekSchedule week = {e.encode(0, 1), e.encode(2, 3), e.encode(0, 2),
                         e.encode(1, 3), e.encode(0, 3), e.encode(1, 2)};
    Score s = e.score(week);
    // gaps of 3: B 0->3, C 2->5
    REQUIRE(s.doubleByes == 2);
    // span 5: A and C (B spans 6, D spans 4)
    REQUIRE(s.fiveSlotSpanTeams == 2);
}

TEST_CASE("Score ordering is lexicographic", "[encoding][score]") {
    REQUIRE(Score(1, 9) < Score(2, 0));
    REQUIRE(Score(2, 3) < Score(2, 4));
    REQUIRE_FALSE(Score(2, 4) < Score(2, 4));
    REQUIRE(Score(2, 4) == Score(2, 4));
    REQUIRE(Score(2, 4) != Score(1, 2));
}

TEST_CASE("Declared optimal week score", "[encoding][score]") {
    REQUIRE(Encoding(4).optimalWeekScore() == Score(1, 2));
    REQUIRE(Encoding(6).optimalWeekScore() == Score(2, 4));
    REQUIRE(Encoding(12).optimalWeekScore() == Score(2, 4));
}
