#ifndef ENCODING_H
#define ENCODING_H

#include "globals.h"
#include <array>
#include <string>
#include <utility>
#include <vector>

// Immutable tables for one team count: matchup ids, slot patterns and the
// per-slot pattern masks. Built once per run and shared by const reference.
class Encoding {
  public:
    explicit Encoding(int teams);

    int numTeams() const { return teams; }
    int numSlots() const { return slots; }
    int numMatchups() const { return matchups; }
    int numPatterns() const { return static_cast<int>(patterns.size()); }

    // lexicographic pair order: 0v1 = 0, 0v2 = 1, ..., 1v2 = N-1, ...
    int encode(int team1, int team2) const;
    std::pair<int, int> decode(int matchup) const;
    std::string matchupToString(int matchup) const; // e.g. "AvB"

    const std::vector<std::array<int, 3>> &getPatterns() const {
        return patterns;
    }
    const PatternSet &slotMask(int slot) const { return slotMasks[slot]; }
    const PatternSet &allPatterns() const { return allPatternsMask; }
    const MatchupSet &allMatchups() const { return allMatchupsMask; }

    Score score(const WeekSchedule &week) const;

    // Declared minimum per-week score used for pruning. Empirical: (1,2) for
    // 4 teams, (2,4) for every larger supported count.
    Score optimalWeekScore() const;

  private:
    void buildPatterns();

    int teams;
    int slots;
    int matchups;
    std::vector<std::pair<int, int>> teamsByMatchup;
    std::vector<int> matchupByTeams; // team1 * teams + team2 -> matchup
    std::vector<std::array<int, 3>> patterns;
    std::vector<PatternSet> slotMasks; // slot -> patterns using that slot
    PatternSet allPatternsMask;
    MatchupSet allMatchupsMask;
};

#endif // ENCODING_H
