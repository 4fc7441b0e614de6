#ifndef GLOBALS_H
#define GLOBALS_H

#include <bitset>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// Terminal colors
#define RESET "\033[0m"
#define GRAY "\033[90m"
#define RED "\033[91m"
#define GREEN "\033[92m"
#define YELLOW "\033[93m"

constexpr int MIN_TEAMS = 4;
constexpr int MAX_TEAMS = 16;
constexpr int GAMES_PER_TEAM = 3;
constexpr int MAX_SPAN = 5; // max slots between a team's first and last game

// wide enough for 120 matchups (16 teams) and 102 patterns (24 slots)
constexpr int MAX_BITS = 128;

using MatchupSet = std::bitset<MAX_BITS>; // bit i set -> matchup i
using PatternSet = std::bitset<MAX_BITS>; // bit i set -> pattern i
using TeamSet = std::bitset<MAX_TEAMS>;   // bit i set -> team i

// one matchup id per slot
using WeekSchedule = std::vector<int>;

// one WeekSchedule per week, week 0 first
using Path = std::vector<WeekSchedule>;

struct Score {
    int doubleByes = 0;        // consecutive games exactly 3 slots apart
    int fiveSlotSpanTeams = 0; // teams whose 3 games span exactly 5 slots
    Score() {}
    Score(int d, int f) : doubleByes(d), fiveSlotSpanTeams(f) {}
    bool operator==(const Score &rhs) const {
        return (doubleByes == rhs.doubleByes &&
                fiveSlotSpanTeams == rhs.fiveSlotSpanTeams);
    }
    bool operator!=(const Score &rhs) const { return !(*this == rhs); }
    // lexicographic: double-byes first
    bool operator<(const Score &rhs) const {
        if (doubleByes != rhs.doubleByes)
            return doubleByes < rhs.doubleByes;
        return fiveSlotSpanTeams < rhs.fiveSlotSpanTeams;
    }
};

// derived fresh for every week from the current round's state
struct Constraint {
    MatchupSet exclude;  // may not appear this week
    MatchupSet required; // must appear somewhere this week
    int remaining = 0;   // matchups still unplayed in the current round
};

class ConfigurationException : public std::runtime_error {
  public:
    explicit ConfigurationException(const std::string &msg)
        : std::runtime_error(msg) {}
};

class TreeFormatException : public std::runtime_error {
  public:
    explicit TreeFormatException(const std::string &msg)
        : std::runtime_error(msg) {}
};

class WorkerException : public std::runtime_error {
  public:
    explicit WorkerException(const std::string &msg)
        : std::runtime_error(msg) {}
};

#endif // GLOBALS_H
