#ifndef COORDINATOR_H
#define COORDINATOR_H

#include "Encoding.h"
#include "PathSearch.h"
#include "TreeStore.h"
#include "globals.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

int defaultWorkerCount();

struct RunOptions {
    int teams = 8;
    int weeks = 2;
    int workers = defaultWorkerCount();
    uint64_t breadth = 32; // new paths per input per fairness round, 0 = all
    size_t cacheEntries = 256;
    bool validate = false; // search only, no file I/O
    bool verbose = false;
    bool suppress = false;
    bool diversify = false;
    std::filesystem::path resultsDir = "results";
};

struct RunSummary {
    std::filesystem::path outputPath;
    std::filesystem::path sourcePath; // empty when seeded in memory
    Score weekScore;
    uint64_t inputPaths = 0;      // input paths read or generated
    uint64_t skippedInputs = 0;   // already complete on a previous run
    uint64_t exhaustedInputs = 0; // completed during this run
    uint64_t copiedPaths = 0;     // carried forward from a partial output
    uint64_t newPaths = 0;
    uint64_t duplicates = 0;
    uint64_t totalPaths = 0;      // paths in the output when done
    int fairnessRounds = 0;
    uint64_t minPerInput = 0;
    uint64_t maxPerInput = 0;
    double avgPerInput = 0;
    double seconds = 0;
    bool alreadyComplete = false;
    bool resumed = false;
    bool partial = false;
    bool interrupted = false;
};

// message from a worker task to the coordinator
struct WorkerMessage {
    enum class Kind { Paths, Done, Failed };
    Kind kind = Kind::Paths;
    size_t input = 0; // index of the input path the unit extends
    std::vector<Path> paths;
    UnitResult result;
    std::string error;
};

// unbounded multi-producer, single-consumer queue
class MessageQueue {
  public:
    void push(WorkerMessage message);
    // false if nothing arrived within `timeout`
    bool pop(WorkerMessage &out, std::chrono::milliseconds timeout);

  private:
    std::mutex mutex;
    std::condition_variable ready;
    std::deque<WorkerMessage> messages;
};

// Drives PathSearch units across a worker pool in fairness rounds, owns the
// dedup index and the output TreeWriter, and checkpoints on interruption.
class Coordinator {
  public:
    explicit Coordinator(const RunOptions &o);

    // Throws ConfigurationException before any search starts, and
    // WorkerException (after checkpointing) if a worker task fails. Setting
    // `stop` checkpoints the output as partial and returns.
    RunSummary run(std::atomic<bool> &stop);

    // called on the coordinator thread after every finished unit
    void setUnitCallback(std::function<void(uint64_t unitsDone)> callback) {
        onUnitDone = std::move(callback);
    }

    // Week-0 schedules with slot 0 fixed to matchup 0 at the minimum score.
    // Sets `best` to that score; warns if it differs from the declared one.
    std::vector<WeekSchedule> generateSeeds(Score &best) const;

    std::string resumeCommand() const;

  private:
    struct InputState {
        Path path;
        uint64_t found = 0; // children already written, the next skip offset
        bool attempted = false;
        bool exhausted = false;
    };

    void checkOptions() const;
    std::filesystem::path findSource() const;
    void writeSeedFile(const std::filesystem::path &path,
                       const std::vector<WeekSchedule> &seeds) const;
    void loadInputs(const std::filesystem::path &source,
                    const ParentStatusMap &parents, RunSummary &summary);
    void copyForward(const std::filesystem::path &previous, int prefixLength,
                     RunSummary &summary);
    // returns the first worker error, empty if none failed
    std::string search(std::atomic<bool> &stop, RunSummary &summary);
    void acceptPaths(const std::vector<Path> &paths, RunSummary &summary);
    void checkpoint(RunSummary &summary);
    void computeStats(RunSummary &summary) const;
    void report(const RunSummary &summary) const;

    RunOptions opts;
    Encoding encoding;
    Score weekScore;
    std::vector<InputState> inputs;
    std::unordered_set<uint64_t> seen;
    std::unique_ptr<TreeWriter> writer;
    std::function<void(uint64_t)> onUnitDone;
};

#endif // COORDINATOR_H
