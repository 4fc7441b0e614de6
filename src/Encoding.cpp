#include "Encoding.h"
#include "globals.h"
#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

const std::string TEAM_LETTERS = "ABCDEFGHIJKLMNOP";

// slot offsets of a team's 3 games, relative to its first game
const std::array<int, 3> SHAPES[] = {
    {0, 1, 3}, {0, 2, 3},            // span 4
    {0, 1, 4}, {0, 2, 4}, {0, 3, 4}, // span 5
};

} // namespace

Encoding::Encoding(int t)
    : teams(t), slots(t * GAMES_PER_TEAM / 2), matchups(t * (t - 1) / 2) {
    if (teams % 2 != 0) {
        throw ConfigurationException("team count must be even, got " +
                                     std::to_string(teams));
    }
    if (teams < MIN_TEAMS || teams > MAX_TEAMS) {
        throw ConfigurationException(
            "team count must be between " + std::to_string(MIN_TEAMS) +
            " and " + std::to_string(MAX_TEAMS) + ", got " +
            std::to_string(teams));
    }

    matchupByTeams.assign(teams * teams, -1);
    for (int i = 0; i < teams - 1; i++) {
        for (int j = i + 1; j < teams; j++) {
            int id = static_cast<int>(teamsByMatchup.size());
            teamsByMatchup.emplace_back(i, j);
            matchupByTeams[i * teams + j] = id;
            matchupByTeams[j * teams + i] = id;
            allMatchupsMask.set(id);
        }
    }

    buildPatterns();
}

void Encoding::buildPatterns() {
    // shift each shape across every start offset that keeps it in the week
    for (const std::array<int, 3> &shape : SHAPES) {
        int span = shape[2] + 1;
        for (int start = 0; start + span <= slots; start++) {
            patterns.push_back(
                {shape[0] + start, shape[1] + start, shape[2] + start});
        }
    }
    if (static_cast<int>(patterns.size()) > MAX_BITS) {
        throw std::logic_error("pattern count exceeds bitset width");
    }

    slotMasks.assign(slots, PatternSet());
    for (size_t p = 0; p < patterns.size(); p++) {
        for (int slot : patterns[p]) {
            slotMasks[slot].set(p);
        }
        allPatternsMask.set(p);
    }
}

int Encoding::encode(int team1, int team2) const {
    if (team1 == team2 || team1 < 0 || team2 < 0 || team1 >= teams ||
        team2 >= teams) {
        throw std::out_of_range("invalid team pair " + std::to_string(team1) +
                                "," + std::to_string(team2));
    }
    return matchupByTeams[team1 * teams + team2];
}

std::pair<int, int> Encoding::decode(int matchup) const {
    if (matchup < 0 || matchup >= matchups) {
        throw std::out_of_range("invalid matchup id " +
                                std::to_string(matchup));
    }
    return teamsByMatchup[matchup];
}

std::string Encoding::matchupToString(int matchup) const {
    std::pair<int, int> p = decode(matchup);
    return std::string(1, TEAM_LETTERS[p.first]) + "v" +
           TEAM_LETTERS[p.second];
}

Score Encoding::score(const WeekSchedule &week) const {
    std::vector<std::vector<int>> slotsByTeam(teams);
    for (size_t s = 0; s < week.size(); s++) {
        std::pair<int, int> p = decode(week[s]);
        slotsByTeam[p.first].push_back(static_cast<int>(s));
        slotsByTeam[p.second].push_back(static_cast<int>(s));
    }

    Score result;
    for (const std::vector<int> &ts : slotsByTeam) {
        if (ts.size() != GAMES_PER_TEAM) {
            continue;
        }
        if (ts[2] - ts[0] + 1 == MAX_SPAN) {
            result.fiveSlotSpanTeams++;
        }
        for (int i = 0; i < 2; i++) {
            if (ts[i + 1] - ts[i] == 3) {
                result.doubleByes++;
            }
        }
    }
    return result;
}

Score Encoding::optimalWeekScore() const {
    if (teams == 4) {
        return Score(1, 2);
    }
    return Score(2, 4);
}
