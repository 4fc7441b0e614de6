#include "WeekEnumerator.h"
#include "Encoding.h"
#include "globals.h"
#include <vector>

WeekEnumerator::WeekEnumerator(const Encoding &e) : encoding(e) {}

void WeekEnumerator::resetContext(const MatchupSet &required) {
    const int teams = encoding.numTeams();
    context.games.assign(encoding.numSlots(), -1);
    context.gamesByTeam.assign(teams, 0);
    context.validMasks.assign(teams, encoding.allPatterns());
    context.requiredOpps.assign(teams, TeamSet());
    context.used.reset();
    context.gamesNeeded = teams * GAMES_PER_TEAM;
    for (int m = 0; m < encoding.numMatchups(); m++) {
        if (required.test(m)) {
            std::pair<int, int> p = encoding.decode(m);
            context.requiredOpps[p.first].set(p.second);
            context.requiredOpps[p.second].set(p.first);
        }
    }
}

size_t WeekEnumerator::enumerate(const MatchupSet &exclude,
                                 const MatchupSet &required,
                                 const Visitor &onSchedule,
                                 int fixedFirstSlot) {
    excluded = exclude;
    visitor = &onSchedule;
    visited = 0;
    stopped = false;
    resetContext(required);

    // a matchup that is both required and excluded can never be placed
    if ((required & exclude).any()) {
        visitor = nullptr;
        return 0;
    }

    if (fixedFirstSlot >= 0) {
        if (!excluded.test(fixedFirstSlot)) {
            std::pair<int, int> teams = encoding.decode(fixedFirstSlot);
            Placement p{0, teams.first, teams.second, fixedFirstSlot,
                        PatternSet(), PatternSet(), false};
            updateWeekState(p);
            if (feasible(0)) {
                backtrack(1);
            }
            updateWeekState(p, true);
        }
    } else {
        backtrack(0);
    }

    visitor = nullptr;
    return visited;
}

std::vector<WeekSchedule>
WeekEnumerator::enumerateAll(const MatchupSet &exclude,
                             const MatchupSet &required, int fixedFirstSlot) {
    std::vector<WeekSchedule> schedules;
    enumerate(
        exclude, required,
        [&schedules](const WeekSchedule &week) {
            schedules.push_back(week);
            return true;
        },
        fixedFirstSlot);
    return schedules;
}

bool WeekEnumerator::backtrack(int slot) {
    // returns false once the visitor has asked to stop
    if (slot == encoding.numSlots()) {
        for (const TeamSet &opps : context.requiredOpps) {
            if (opps.any()) {
                return true; // a required matchup was never placed
            }
        }
        visited++;
        if (!(*visitor)(context.games)) {
            stopped = true;
            return false;
        }
        return true;
    }

    // teams that still owe games and have a pattern covering this slot
    const PatternSet &slotMask = encoding.slotMask(slot);
    int candidates[MAX_TEAMS];
    int numCandidates = 0;
    for (int t = 0; t < encoding.numTeams(); t++) {
        if (context.gamesByTeam[t] < GAMES_PER_TEAM &&
            (context.validMasks[t] & slotMask).any()) {
            candidates[numCandidates++] = t;
        }
    }

    for (int i = 0; i < numCandidates - 1; i++) {
        for (int j = i + 1; j < numCandidates; j++) {
            int matchup = encoding.encode(candidates[i], candidates[j]);
            if (context.used.test(matchup) || excluded.test(matchup)) {
                continue;
            }

            Placement p{slot,          candidates[i], candidates[j],
                        matchup,       PatternSet(),  PatternSet(),
                        false};
            updateWeekState(p);
            bool keepGoing = true;
            if (feasible(slot)) {
                keepGoing = backtrack(slot + 1);
            }
            updateWeekState(p, true);
            if (!keepGoing) {
                return false;
            }
        }
    }
    return true;
}

void WeekEnumerator::updateWeekState(Placement &p, bool revert) {
    if (!revert) {
        const PatternSet &slotMask = encoding.slotMask(p.slot);
        context.games[p.slot] = p.matchup;
        context.used.set(p.matchup);
        context.gamesByTeam[p.team1]++;
        context.gamesByTeam[p.team2]++;
        context.gamesNeeded -= 2;
        p.oldMask1 = context.validMasks[p.team1];
        p.oldMask2 = context.validMasks[p.team2];
        context.validMasks[p.team1] &= slotMask;
        context.validMasks[p.team2] &= slotMask;
        p.wasRequired = context.requiredOpps[p.team1].test(p.team2);
        if (p.wasRequired) {
            context.requiredOpps[p.team1].reset(p.team2);
            context.requiredOpps[p.team2].reset(p.team1);
        }
    } else {
        if (p.wasRequired) {
            context.requiredOpps[p.team1].set(p.team2);
            context.requiredOpps[p.team2].set(p.team1);
        }
        context.validMasks[p.team1] = p.oldMask1;
        context.validMasks[p.team2] = p.oldMask2;
        context.gamesNeeded += 2;
        context.gamesByTeam[p.team1]--;
        context.gamesByTeam[p.team2]--;
        context.used.reset(p.matchup);
        context.games[p.slot] = -1;
    }
}

bool WeekEnumerator::feasible(int slot) const {
    // checked after placing a matchup in `slot`
    for (int t = 0; t < encoding.numTeams(); t++) {
        int gamesLeft = GAMES_PER_TEAM - context.gamesByTeam[t];
        if (gamesLeft > 0 && context.validMasks[t].none()) {
            return false;
        }
        if (static_cast<int>(context.requiredOpps[t].count()) > gamesLeft) {
            return false;
        }
    }
    int slotsLeft = encoding.numSlots() - slot - 1;
    return context.gamesNeeded <= 2 * slotsLeft;
}
