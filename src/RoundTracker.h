#ifndef ROUND_TRACKER_H
#define ROUND_TRACKER_H

#include "Encoding.h"
#include "globals.h"

// Matchups used so far in the lowest incomplete round. Earlier rounds are
// complete by definition. A week straddling a boundary completes
// `currentRound` and opens the next, so at most two rounds are ever open
// during a single advance().
struct RoundState {
    int currentRound = 0;
    MatchupSet used;
};

// which round each of a week's matchups counts toward
struct WeekAssignment {
    MatchupSet current; // completes or continues the current round
    MatchupSet next;    // opens the following round
};

class RoundTracker {
  public:
    explicit RoundTracker(const Encoding &e);

    // Throws std::logic_error if `state` cannot belong to week `weekIndex`.
    Constraint constraintFor(int weekIndex, const RoundState &state) const;

    // Record a chosen week. `required` is the set constraintFor() returned
    // for the same week; a week that leaves it unplayed throws
    // std::logic_error.
    RoundState advance(int weekIndex, const WeekSchedule &week,
                       const RoundState &state,
                       const MatchupSet &required) const;

    // Assignment is by membership in `required`, never by slot position:
    // next-round games may precede round-completing ones within the week.
    WeekAssignment assign(const WeekSchedule &week,
                          const Constraint &constraint) const;

    // replay advance() from round 0 over every week of `path`
    RoundState rebuild(const Path &path) const;

  private:
    void checkWeekIndex(int weekIndex, const RoundState &state) const;

    const Encoding &encoding;
};

#endif // ROUND_TRACKER_H
