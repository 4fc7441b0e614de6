#ifndef VALIDATOR_H
#define VALIDATOR_H

#include "Encoding.h"
#include "RoundTracker.h"
#include "globals.h"
#include <string>

// result of checking one full path; an empty string means the check passed
struct PathReport {
    std::string structureError;
    std::string scoreError;
    std::string roundRobinError;
    bool valid() const {
        return structureError.empty() && scoreError.empty() &&
               roundRobinError.empty();
    }
};

// Independent checks on schedules read back from disk or produced by the
// search.
class Validator {
  public:
    explicit Validator(const Encoding &e);

    // length, id range, no repeats, 3 games per team, span <= 5
    std::string checkWeek(const WeekSchedule &week) const;

    // every week of the path scores exactly `target`
    std::string checkScore(const Path &path, const Score &target) const;

    // Replays the round tracker from week 0: no excluded matchup reused,
    // every required matchup present, and each completed round covers the
    // full matchup universe exactly once.
    std::string checkRoundRobin(const Path &path) const;

    PathReport checkPath(const Path &path, const Score &target) const;

  private:
    const Encoding &encoding;
    RoundTracker tracker;
};

#endif // VALIDATOR_H
