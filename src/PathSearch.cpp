#include "PathSearch.h"
#include "Encoding.h"
#include "RoundTracker.h"
#include "globals.h"
#include "utils.h"
#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

PathSearch::PathSearch(const Encoding &e, int targetWeeks,
                       const Score &weekScore, size_t cacheEntries)
    : encoding(e), tracker(e), enumerator(e), numWeeks(targetWeeks),
      targetScore(weekScore), cache(cacheEntries) {}

UnitResult PathSearch::explore(const Path &start, uint64_t skipOffset,
                               uint64_t breadthLimit,
                               const PathVisitor &onPath,
                               const std::atomic<bool> &stop,
                               bool diversify) {
    if (static_cast<int>(start.size()) > numWeeks) {
        throw std::invalid_argument("starting path has " +
                                    std::to_string(start.size()) +
                                    " weeks, target is " +
                                    std::to_string(numWeeks));
    }

    visitor = &onPath;
    stopFlag = &stop;
    skip = skipOffset;
    breadth = breadthLimit;
    found = 0;
    breadthReached = false;
    interrupted = false;
    rotate = diversify;
    rotationSeed = diversify ? hashPath(start) : 0;

    Path path(start);
    RoundState state = tracker.rebuild(start);
    extend(path, state, static_cast<int>(start.size()));

    UnitResult result;
    result.totalFound = found;
    result.newResults = found > skip ? found - skip : 0;
    result.interrupted = interrupted;
    result.exhausted = !breadthReached && !interrupted;

    visitor = nullptr;
    stopFlag = nullptr;
    return result;
}

WeekList PathSearch::candidates(const Constraint &c,
                                const std::atomic<bool> &stop) {
    ConstraintKey key{c.exclude, c.required};
    if (const WeekList *hit = cache.get(key)) {
        return *hit;
    }

    std::shared_ptr<std::vector<WeekSchedule>> weeks =
        std::make_shared<std::vector<WeekSchedule>>();
    enumerator.enumerate(c.exclude, c.required,
                         [this, &weeks, &stop](const WeekSchedule &week) {
                             if (stop.load(std::memory_order_relaxed)) {
                                 return false;
                             }
                             // prune non-optimal weeks before recursing
                             if (encoding.score(week) == targetScore) {
                                 weeks->push_back(week);
                             }
                             return true;
                         });
    if (enumerator.wasStopped()) {
        return nullptr; // partial list, not cacheable
    }

    WeekList list = weeks;
    cache.put(key, list);
    return list;
}

bool PathSearch::extend(Path &path, const RoundState &state, int week) {
    if (stopFlag->load(std::memory_order_relaxed)) {
        interrupted = true;
        return false;
    }

    if (week == numWeeks) {
        found++;
        if (found <= skip) {
            return true; // reported by an earlier unit
        }
        (*visitor)(path);
        if (breadth > 0 && found - skip >= breadth) {
            breadthReached = true;
            return false;
        }
        return true;
    }

    Constraint c = tracker.constraintFor(week, state);
    WeekList weeks = candidates(c, *stopFlag);
    if (!weeks) {
        interrupted = true;
        return false;
    }

    const size_t n = weeks->size();
    size_t offset = 0;
    if (rotate && n > 0) {
        offset = mix64(rotationSeed + static_cast<uint64_t>(week)) % n;
    }

    for (size_t i = 0; i < n; i++) {
        const WeekSchedule &candidate = (*weeks)[(i + offset) % n];
        RoundState next = tracker.advance(week, candidate, state, c.required);
        path.push_back(candidate);
        bool keepGoing = extend(path, next, week + 1);
        path.pop_back();
        if (!keepGoing) {
            return false;
        }
    }
    return true;
}
