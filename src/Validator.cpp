#include "Validator.h"
#include "Encoding.h"
#include "RoundTracker.h"
#include "globals.h"
#include <stdexcept>
#include <string>
#include <vector>

Validator::Validator(const Encoding &e) : encoding(e), tracker(e) {}

std::string Validator::checkWeek(const WeekSchedule &week) const {
    if (static_cast<int>(week.size()) != encoding.numSlots()) {
        return "expected " + std::to_string(encoding.numSlots()) +
               " slots, got " + std::to_string(week.size());
    }

    MatchupSet seen;
    std::vector<std::vector<int>> slotsByTeam(encoding.numTeams());
    for (size_t s = 0; s < week.size(); s++) {
        int m = week[s];
        if (m < 0 || m >= encoding.numMatchups()) {
            return "matchup id " + std::to_string(m) + " out of range";
        }
        if (seen.test(m)) {
            return encoding.matchupToString(m) + " repeats within the week";
        }
        seen.set(m);
        std::pair<int, int> p = encoding.decode(m);
        slotsByTeam[p.first].push_back(static_cast<int>(s));
        slotsByTeam[p.second].push_back(static_cast<int>(s));
    }

    for (int t = 0; t < encoding.numTeams(); t++) {
        const std::vector<int> &ts = slotsByTeam[t];
        if (ts.size() != GAMES_PER_TEAM) {
            return "team " + std::to_string(t) + " plays " +
                   std::to_string(ts.size()) + " games";
        }
        if (ts.back() - ts.front() + 1 > MAX_SPAN) {
            return "team " + std::to_string(t) + " spans " +
                   std::to_string(ts.back() - ts.front() + 1) + " slots";
        }
    }
    return "";
}

std::string Validator::checkScore(const Path &path, const Score &target) const {
    for (size_t w = 0; w < path.size(); w++) {
        Score s = encoding.score(path[w]);
        if (s != target) {
            return "week " + std::to_string(w) + " scores (" +
                   std::to_string(s.doubleByes) + "," +
                   std::to_string(s.fiveSlotSpanTeams) + "), expected (" +
                   std::to_string(target.doubleByes) + "," +
                   std::to_string(target.fiveSlotSpanTeams) + ")";
        }
    }
    return "";
}

std::string Validator::checkRoundRobin(const Path &path) const {
    // own bookkeeping of the two open rounds, cross-checked with the tracker
    MatchupSet current;
    MatchupSet next;
    int completedRounds = 0;
    RoundState state;

    for (size_t w = 0; w < path.size(); w++) {
        const WeekSchedule &week = path[w];
        int weekIndex = static_cast<int>(w);
        Constraint c;
        try {
            c = tracker.constraintFor(weekIndex, state);
        } catch (const std::logic_error &e) {
            return e.what();
        }

        MatchupSet weekSet;
        for (int m : week) {
            if (c.exclude.test(m)) {
                return "week " + std::to_string(w) + " reuses " +
                       encoding.matchupToString(m) + " within round " +
                       std::to_string(completedRounds);
            }
            weekSet.set(m);
            if (!current.test(m)) {
                current.set(m);
            } else if (!next.test(m)) {
                next.set(m);
            } else {
                return "week " + std::to_string(w) + " plays " +
                       encoding.matchupToString(m) +
                       " a third time across two open rounds";
            }
        }
        if ((c.required & ~weekSet).any()) {
            return "week " + std::to_string(w) + " leaves round " +
                   std::to_string(completedRounds) + " incomplete";
        }

        if (current == encoding.allMatchups()) {
            completedRounds++;
            current = next;
            next.reset();
        } else if (next.any()) {
            return "week " + std::to_string(w) + " opens round " +
                   std::to_string(completedRounds + 1) + " before round " +
                   std::to_string(completedRounds) + " is complete";
        }

        try {
            state = tracker.advance(weekIndex, week, state, c.required);
        } catch (const std::logic_error &e) {
            return e.what();
        }
        if (state.currentRound != completedRounds || state.used != current) {
            return "round state diverges at week " + std::to_string(w);
        }
    }
    return "";
}

PathReport Validator::checkPath(const Path &path, const Score &target) const {
    PathReport report;
    for (size_t w = 0; w < path.size(); w++) {
        std::string error = checkWeek(path[w]);
        if (!error.empty()) {
            report.structureError = "week " + std::to_string(w) + ": " + error;
            // score and rounds are meaningless on a malformed week
            return report;
        }
    }
    report.scoreError = checkScore(path, target);
    report.roundRobinError = checkRoundRobin(path);
    return report;
}
