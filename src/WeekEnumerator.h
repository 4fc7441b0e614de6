#ifndef WEEK_ENUMERATOR_H
#define WEEK_ENUMERATOR_H

#include "Encoding.h"
#include "globals.h"
#include <cstddef>
#include <functional>
#include <vector>

// current week state, mutated in place by the backtracking search
struct WeekContext {
    WeekSchedule games;                  // slot -> matchup
    std::vector<int> gamesByTeam;        // team -> # games placed
    std::vector<PatternSet> validMasks;  // team -> patterns still possible
    std::vector<TeamSet> requiredOpps;   // team -> opponents still required
    MatchupSet used;                     // matchups placed this week
    int gamesNeeded = 0;                 // sum of games still owed by teams
};

// what a placement overwrote, so it can be reverted exactly
struct Placement {
    int slot;
    int team1;
    int team2;
    int matchup;
    PatternSet oldMask1;
    PatternSet oldMask2;
    bool wasRequired;
};

// Enumerates every legal single-week schedule: each team plays 3 games whose
// slots span at most 5, no matchup repeats, nothing from `exclude` is used
// and everything in `required` appears somewhere in the week.
class WeekEnumerator {
  public:
    // return false to end the search early
    using Visitor = std::function<bool(const WeekSchedule &)>;

    explicit WeekEnumerator(const Encoding &e);

    // Returns the number of schedules visited. `fixedFirstSlot` >= 0 pins
    // that matchup to slot 0.
    size_t enumerate(const MatchupSet &exclude, const MatchupSet &required,
                     const Visitor &onSchedule, int fixedFirstSlot = -1);
    std::vector<WeekSchedule> enumerateAll(const MatchupSet &exclude,
                                           const MatchupSet &required,
                                           int fixedFirstSlot = -1);

    // true if the last enumerate() call was ended early by its visitor
    bool wasStopped() const { return stopped; }

  private:
    void resetContext(const MatchupSet &required);
    bool backtrack(int slot);
    void updateWeekState(Placement &p, bool revert = false);
    bool feasible(int slot) const;

    const Encoding &encoding;
    WeekContext context;
    MatchupSet excluded;
    const Visitor *visitor = nullptr;
    size_t visited = 0;
    bool stopped = false;
};

#endif // WEEK_ENUMERATOR_H
