#include "RoundTracker.h"
#include "Encoding.h"
#include "globals.h"
#include <stdexcept>
#include <string>

RoundTracker::RoundTracker(const Encoding &e) : encoding(e) {}

void RoundTracker::checkWeekIndex(int weekIndex,
                                  const RoundState &state) const {
    // every week consumes exactly numSlots() matchups across the rounds
    long long consumed = static_cast<long long>(weekIndex) *
                         encoding.numSlots();
    long long recorded =
        static_cast<long long>(state.currentRound) * encoding.numMatchups() +
        static_cast<long long>(state.used.count());
    if (consumed != recorded) {
        throw std::logic_error(
            "round state holds " + std::to_string(recorded) +
            " matchups but week " + std::to_string(weekIndex) + " expects " +
            std::to_string(consumed));
    }
}

Constraint RoundTracker::constraintFor(int weekIndex,
                                       const RoundState &state) const {
    checkWeekIndex(weekIndex, state);

    Constraint c;
    c.remaining = encoding.numMatchups() - static_cast<int>(state.used.count());

    // the round completes this week: every unplayed matchup must appear
    if (c.remaining <= encoding.numSlots()) {
        c.required = encoding.allMatchups() & ~state.used;
    }

    // the whole week lies inside the current round: no repeats allowed.
    // A straddling week may reuse anything, as next-round games.
    if (c.remaining >= encoding.numSlots()) {
        c.exclude = state.used;
    }
    return c;
}

WeekAssignment RoundTracker::assign(const WeekSchedule &week,
                                    const Constraint &constraint) const {
    WeekAssignment a;
    bool fitsInRound = constraint.remaining >= encoding.numSlots();
    for (int m : week) {
        if (fitsInRound || constraint.required.test(m)) {
            a.current.set(m);
        } else {
            a.next.set(m);
        }
    }
    return a;
}

RoundState RoundTracker::advance(int weekIndex, const WeekSchedule &week,
                                 const RoundState &state,
                                 const MatchupSet &required) const {
    checkWeekIndex(weekIndex, state);

    Constraint c;
    c.remaining = encoding.numMatchups() - static_cast<int>(state.used.count());
    c.required = required;
    WeekAssignment a = assign(week, c);

    if ((a.current & state.used).any()) {
        throw std::logic_error("week " + std::to_string(weekIndex) +
                               " repeats a matchup within its round");
    }

    RoundState next;
    next.currentRound = state.currentRound;
    next.used = state.used | a.current;

    if (c.remaining < encoding.numSlots() &&
        next.used != encoding.allMatchups()) {
        throw std::logic_error("week " + std::to_string(weekIndex) +
                               " leaves round " +
                               std::to_string(state.currentRound) +
                               " incomplete");
    }

    if (next.used == encoding.allMatchups()) {
        next.currentRound++;
        next.used = a.next;
    }
    return next;
}

RoundState RoundTracker::rebuild(const Path &path) const {
    RoundState state;
    for (size_t w = 0; w < path.size(); w++) {
        int weekIndex = static_cast<int>(w);
        Constraint c = constraintFor(weekIndex, state);
        state = advance(weekIndex, path[w], state, c.required);
    }
    return state;
}
