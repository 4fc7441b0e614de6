#ifndef PATH_SEARCH_H
#define PATH_SEARCH_H

#include "Encoding.h"
#include "LruCache.h"
#include "RoundTracker.h"
#include "WeekEnumerator.h"
#include "globals.h"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

struct ConstraintKey {
    MatchupSet exclude;
    MatchupSet required;
    bool operator==(const ConstraintKey &rhs) const {
        return exclude == rhs.exclude && required == rhs.required;
    }
};

struct ConstraintKeyHash {
    size_t operator()(const ConstraintKey &k) const {
        size_t h = std::hash<MatchupSet>()(k.exclude);
        return h ^ (std::hash<MatchupSet>()(k.required) + 0x9e3779b97f4a7c15ULL +
                    (h << 6) + (h >> 2));
    }
};

using WeekList = std::shared_ptr<const std::vector<WeekSchedule>>;

// outcome of one bounded unit of work on one starting path
struct UnitResult {
    uint64_t totalFound = 0; // accepted continuations, skipped ones included
    uint64_t newResults = 0; // reported through onPath
    bool exhausted = false;  // the whole subtree was explored
    bool interrupted = false;
};

// Extends a starting path week by week, keeping only continuations in which
// every week scores exactly the target week score.
class PathSearch {
  public:
    using PathVisitor = std::function<void(const Path &)>;

    PathSearch(const Encoding &e, int targetWeeks, const Score &weekScore,
               size_t cacheEntries = 256);

    // Skips the first `skipOffset` accepted paths, reports at most
    // `breadthLimit` new ones (0 = no limit). With `diversify` the
    // candidate order at each depth is rotated by an offset derived from
    // the starting path, which changes the order but not the result set.
    UnitResult explore(const Path &start, uint64_t skipOffset,
                       uint64_t breadthLimit, const PathVisitor &onPath,
                       const std::atomic<bool> &stop, bool diversify = false);

    // optimal-scoring weeks satisfying `c`; nullptr if stopped mid-search
    WeekList candidates(const Constraint &c, const std::atomic<bool> &stop);

    size_t getCacheHits() const { return cache.getHits(); }

  private:
    // returns false once the unit should stop (breadth reached or stop set)
    bool extend(Path &path, const RoundState &state, int week);

    const Encoding &encoding;
    RoundTracker tracker;
    WeekEnumerator enumerator;
    int numWeeks;
    Score targetScore;
    LruCache<ConstraintKey, WeekList, ConstraintKeyHash> cache;

    // per-unit state
    const PathVisitor *visitor = nullptr;
    const std::atomic<bool> *stopFlag = nullptr;
    uint64_t skip = 0;
    uint64_t breadth = 0;
    uint64_t found = 0;
    bool breadthReached = false;
    bool interrupted = false;
    bool rotate = false;
    uint64_t rotationSeed = 0;
};

#endif // PATH_SEARCH_H
