#include "Coordinator.h"
#include "Encoding.h"
#include "PathSearch.h"
#include "TreeStore.h"
#include "WeekEnumerator.h"
#include "globals.h"
#include "utils.h"
#include <BS_thread_pool/BS_thread_pool.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <indicators/indicators.hpp>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace {

// paths per worker message
const size_t BATCH_SIZE = 100;
const std::chrono::milliseconds POLL_INTERVAL(100);

std::string scoreToString(const Score &s) {
    return "(" + std::to_string(s.doubleByes) + "," +
           std::to_string(s.fiveSlotSpanTeams) + ")";
}

double secondsSince(const std::chrono::steady_clock::time_point &t0) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - t0)
               .count() /
           1000.0;
}

} // namespace

int defaultWorkerCount() {
    int hw = static_cast<int>(std::thread::hardware_concurrency());
    return std::max(1, hw - 2);
}

void MessageQueue::push(WorkerMessage message) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        messages.push_back(std::move(message));
    }
    ready.notify_one();
}

bool MessageQueue::pop(WorkerMessage &out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex);
    if (!ready.wait_for(lock, timeout, [this] { return !messages.empty(); })) {
        return false;
    }
    out = std::move(messages.front());
    messages.pop_front();
    return true;
}

Coordinator::Coordinator(const RunOptions &o)
    : opts(o), encoding(o.teams), weekScore(encoding.optimalWeekScore()) {
    checkOptions();
}

void Coordinator::checkOptions() const {
    if (opts.weeks < 1) {
        throw ConfigurationException("week count must be at least 1, got " +
                                     std::to_string(opts.weeks));
    }
    if (opts.workers < 1) {
        throw ConfigurationException("worker count must be at least 1, got " +
                                     std::to_string(opts.workers));
    }
}

std::vector<WeekSchedule> Coordinator::generateSeeds(Score &best) const {
    // pinning 0v1 to slot 0 removes the team-relabelling symmetry
    WeekEnumerator enumerator(encoding);
    std::vector<WeekSchedule> all = enumerator.enumerateAll(
        MatchupSet(), MatchupSet(), encoding.encode(0, 1));
    if (all.empty()) {
        throw std::logic_error("no legal week for " +
                               std::to_string(encoding.numTeams()) + " teams");
    }

    best = encoding.score(all[0]);
    for (const WeekSchedule &week : all) {
        Score s = encoding.score(week);
        if (s < best) {
            best = s;
        }
    }
    Score declared = encoding.optimalWeekScore();
    if (best != declared && !opts.suppress) {
        std::cerr << YELLOW << "Warning: minimum week score for "
                  << encoding.numTeams() << " teams is " << scoreToString(best)
                  << ", declared " << scoreToString(declared)
                  << "; using the measured minimum" << RESET << std::endl;
    }

    std::vector<WeekSchedule> seeds;
    for (const WeekSchedule &week : all) {
        if (encoding.score(week) == best) {
            seeds.push_back(week);
        }
    }
    if (opts.verbose && !opts.suppress) {
        std::cout << GRAY << all.size() << " legal weeks with 0v1 first, "
                  << seeds.size() << " at " << scoreToString(best) << RESET
                  << std::endl;
    }
    return seeds;
}

std::string Coordinator::resumeCommand() const {
    std::string cmd = "rrsched --teams=" + std::to_string(opts.teams) +
                      " --weeks=" + std::to_string(opts.weeks) +
                      " --workers=" + std::to_string(opts.workers) +
                      " --breadth=" + std::to_string(opts.breadth);
    if (opts.cacheEntries != RunOptions().cacheEntries) {
        cmd += " --cache=" + std::to_string(opts.cacheEntries);
    }
    if (opts.resultsDir != RunOptions().resultsDir) {
        cmd += " --dir=" + opts.resultsDir.string();
    }
    if (opts.diversify) {
        cmd += " --diversify";
    }
    return cmd;
}

std::filesystem::path Coordinator::findSource() const {
    for (int w = opts.weeks - 1; w >= 1; w--) {
        std::filesystem::path p =
            resultsPath(opts.resultsDir, opts.teams, w);
        if (!std::filesystem::exists(p)) {
            continue;
        }
        TreeHeader h;
        try {
            h = readHeaderFromFile(p);
        } catch (const TreeFormatException &e) {
            if (!opts.suppress) {
                std::cerr << YELLOW << "Warning: ignoring " << p.string()
                          << ": " << e.what() << RESET << std::endl;
            }
            continue;
        }
        if (h.teams == opts.teams && h.weeks == w && !h.partial) {
            return p;
        }
    }
    return std::filesystem::path();
}

void Coordinator::writeSeedFile(const std::filesystem::path &path,
                                const std::vector<WeekSchedule> &seeds) const {
    TreeWriter seedWriter(path);
    seedWriter.writeHeader(opts.teams, 1);
    for (const WeekSchedule &week : seeds) {
        seedWriter.writePath(Path{week});
    }
    seedWriter.finalize(false);
    if (!opts.suppress) {
        std::cout << "Wrote " << seeds.size() << " week-0 schedules to "
                  << path.string() << "." << std::endl;
    }
}

void Coordinator::loadInputs(const std::filesystem::path &source,
                             const ParentStatusMap &parents,
                             RunSummary &summary) {
    TreeReader reader(source, opts.suppress);
    if (reader.getHeader().teams != opts.teams) {
        throw ConfigurationException(source.string() + " is for " +
                                     std::to_string(reader.getHeader().teams) +
                                     " teams");
    }

    reader.forEachPath([this, &parents, &summary](const Path &p) {
        if (summary.inputPaths++ == 0) {
            weekScore = encoding.score(p[0]);
        }
        ParentStatus status = get_or(parents, hashPath(p), ParentStatus());
        if (status.completeSeen) {
            summary.skippedInputs++;
            return true;
        }
        InputState in;
        in.path = p;
        // the children on disk are the first ones in enumeration order
        in.found = status.childCount;
        in.attempted =
            status.childCount > 0 || status.lastMarker != MarkerKind::None;
        inputs.push_back(std::move(in));
        return true;
    });

    if (reader.getMalformedLines() > 0 && !opts.suppress) {
        std::cerr << YELLOW << "Skipped " << reader.getMalformedLines()
                  << " malformed lines in " << source.string() << RESET
                  << std::endl;
    }
}

void Coordinator::copyForward(const std::filesystem::path &previous,
                              int prefixLength, RunSummary &summary) {
    TreeReader reader(previous, opts.suppress);
    const size_t len = static_cast<size_t>(prefixLength);
    reader.forEachEntry(
        [this, &summary](const Path &p) {
            if (seen.insert(hashPath(p)).second) {
                writer->writePath(p);
                summary.copiedPaths++;
            } else {
                summary.duplicates++;
            }
            return true;
        },
        [this, len](const Path &prefix, MarkerKind kind) {
            // incomplete markers are re-derived at the next checkpoint
            if (kind == MarkerKind::Complete && prefix.size() == len) {
                writer->writeCompleteMarker(prefix);
            }
            return true;
        });
    writer->flush();

    if (reader.getMalformedLines() > 0 && !opts.suppress) {
        std::cerr << YELLOW << "Dropped " << reader.getMalformedLines()
                  << " malformed lines from " << previous.string() << RESET
                  << std::endl;
    }
}

void Coordinator::acceptPaths(const std::vector<Path> &paths,
                              RunSummary &summary) {
    for (const Path &p : paths) {
        if (!seen.insert(hashPath(p)).second) {
            summary.duplicates++;
            continue;
        }
        if (writer) {
            writer->writePath(p);
        }
        summary.newPaths++;
    }
}

std::string Coordinator::search(std::atomic<bool> &stop, RunSummary &summary) {
    std::vector<size_t> active;
    for (size_t i = 0; i < inputs.size(); i++) {
        active.push_back(i);
    }
    const size_t total = inputs.size();
    uint64_t exhausted = 0;

    // set up progress bar
    const bool showBar = !opts.verbose && !opts.suppress && !opts.validate;
    indicators::BlockProgressBar bar{
        indicators::option::BarWidth{64},
        indicators::option::ForegroundColor{indicators::Color::white},
        indicators::option::FontStyles{
            std::vector<indicators::FontStyle>{indicators::FontStyle::bold}},
        indicators::option::MaxProgress{total},
        indicators::option::ShowElapsedTime{true},
        indicators::option::ShowRemainingTime{false},
    };
    if (showBar) {
        indicators::show_console_cursor(false);
    }

    auto tStart = std::chrono::steady_clock::now();
    auto updateBar = [&]() {
        if (!showBar) {
            return;
        }
        bar.set_option(indicators::option::PostfixText{
            std::to_string(summary.newPaths) + " paths, " +
            std::to_string(exhausted) + "/" + std::to_string(total) +
            " inputs, round " + std::to_string(summary.fairnessRounds) + ", " +
            formatDuration(secondsSince(tStart))});
        bar.set_progress(static_cast<float>(exhausted));
    };

    MessageQueue queue;
    std::atomic<bool> halt{false};
    std::string failure;
    uint64_t unitsDone = 0;

    // each pool thread keeps its own search state and week cache
    std::vector<std::unique_ptr<PathSearch>> searches;
    for (int i = 0; i < opts.workers; i++) {
        searches.push_back(std::make_unique<PathSearch>(
            encoding, opts.weeks, weekScore, opts.cacheEntries));
    }
    std::unordered_map<std::thread::id, size_t> indexByThreadId;

    // declared last: joins its threads before anything they reference dies
    BS::thread_pool pool(opts.workers);
    std::vector<std::thread::id> threadIds = pool.get_thread_ids();
    for (size_t i = 0; i < threadIds.size(); i++) {
        indexByThreadId[threadIds[i]] = i;
    }

    try {
        while (!active.empty()) {
            if (stop.load() || halt.load()) {
                break;
            }
            summary.fairnessRounds++;

            // one unit per incomplete input path
            size_t outstanding = 0;
            for (size_t i : active) {
                InputState &in = inputs[i];
                in.attempted = true;
                Path start = in.path;
                uint64_t skip = in.found;
                pool.detach_task([this, &queue, &searches, &indexByThreadId,
                                  &halt, i, start, skip] {
                    WorkerMessage done;
                    done.input = i;
                    try {
                        PathSearch &search = *searches[indexByThreadId.at(
                            std::this_thread::get_id())];
                        std::vector<Path> batch;
                        done.result = search.explore(
                            start, skip, opts.breadth,
                            [&queue, &batch, i](const Path &p) {
                                batch.push_back(p);
                                if (batch.size() >= BATCH_SIZE) {
                                    WorkerMessage m;
                                    m.input = i;
                                    m.paths.swap(batch);
                                    queue.push(std::move(m));
                                }
                            },
                            halt, opts.diversify);
                        if (!batch.empty()) {
                            WorkerMessage m;
                            m.input = i;
                            m.paths.swap(batch);
                            queue.push(std::move(m));
                        }
                        done.kind = WorkerMessage::Kind::Done;
                    } catch (const std::exception &e) {
                        done.kind = WorkerMessage::Kind::Failed;
                        done.error = e.what();
                    }
                    queue.push(std::move(done));
                });
                outstanding++;
            }

            // barrier: the next round starts once every unit has reported
            while (outstanding > 0) {
                if (!halt.load() && stop.load()) {
                    halt.store(true);
                }
                WorkerMessage msg;
                if (!queue.pop(msg, POLL_INTERVAL)) {
                    updateBar();
                    continue;
                }
                InputState &in = inputs[msg.input];

                if (msg.kind == WorkerMessage::Kind::Paths) {
                    acceptPaths(msg.paths, summary);
                    in.found += msg.paths.size();
                    continue;
                }

                outstanding--;
                if (msg.kind == WorkerMessage::Kind::Failed) {
                    if (failure.empty()) {
                        failure = msg.error;
                    }
                    halt.store(true);
                    continue;
                }

                unitsDone++;
                const UnitResult &r = msg.result;
                if (r.exhausted) {
                    in.exhausted = true;
                    exhausted++;
                    summary.exhaustedInputs++;
                    if (writer) {
                        writer->writeCompleteMarker(in.path);
                    }
                }
                if (writer) {
                    writer->flush();
                }
                if (opts.verbose && !opts.suppress) {
                    std::cout << GRAY << "round " << summary.fairnessRounds
                              << " input " << msg.input << ": +"
                              << r.newResults << " (" << in.found << " total)"
                              << (r.exhausted     ? " exhausted"
                                  : r.interrupted ? " interrupted"
                                                  : " breadth reached")
                              << RESET << std::endl;
                }
                updateBar();
                if (onUnitDone) {
                    onUnitDone(unitsDone);
                }
            }

            active.erase(std::remove_if(active.begin(), active.end(),
                                        [this](size_t i) {
                                            return inputs[i].exhausted;
                                        }),
                         active.end());
        }
    } catch (const std::exception &) {
        // let queued units drain quickly before the pool joins
        halt.store(true);
        pool.wait();
        if (showBar) {
            indicators::show_console_cursor(true);
        }
        throw;
    }

    pool.wait();

    // progress bar complete
    if (showBar) {
        updateBar();
        if (active.empty()) {
            bar.mark_as_completed();
        }
        indicators::show_console_cursor(true);
        std::cout << std::endl;
    }

    summary.interrupted = !active.empty() && failure.empty();
    return failure;
}

void Coordinator::checkpoint(RunSummary &summary) {
    uint64_t marked = 0;
    for (const InputState &in : inputs) {
        // never-attempted inputs carry no marker and are explored fresh
        if (in.attempted && !in.exhausted) {
            writer->writeIncompleteMarker(in.path);
            marked++;
        }
    }
    if (opts.verbose && !opts.suppress) {
        std::cout << GRAY << "Marked " << marked << " of "
                  << summary.inputPaths << " input paths incomplete" << RESET
                  << std::endl;
    }
}

void Coordinator::computeStats(RunSummary &summary) const {
    if (inputs.empty()) {
        return;
    }
    uint64_t sum = 0;
    summary.minPerInput = inputs[0].found;
    summary.maxPerInput = inputs[0].found;
    for (const InputState &in : inputs) {
        summary.minPerInput = std::min(summary.minPerInput, in.found);
        summary.maxPerInput = std::max(summary.maxPerInput, in.found);
        sum += in.found;
    }
    summary.avgPerInput = static_cast<double>(sum) / inputs.size();
}

void Coordinator::report(const RunSummary &summary) const {
    if (opts.suppress) {
        return;
    }
    if (summary.alreadyComplete) {
        std::cout << GREEN << summary.outputPath.string()
                  << " is already complete with " << summary.totalPaths
                  << " paths." << RESET << std::endl;
        return;
    }
    std::cout << "Week score: " << scoreToString(summary.weekScore)
              << std::endl;
    std::cout << "Input paths: " << summary.inputPaths;
    if (summary.skippedInputs > 0) {
        std::cout << " (" << summary.skippedInputs << " already complete)";
    }
    std::cout << std::endl;
    if (summary.copiedPaths > 0) {
        std::cout << "Carried forward: " << summary.copiedPaths << std::endl;
    }
    std::cout << "New paths: " << summary.newPaths << std::endl;
    if (summary.duplicates > 0) {
        std::cout << "Duplicates dropped: " << summary.duplicates << std::endl;
    }
    std::cout << "Fairness rounds: " << summary.fairnessRounds << std::endl;
    if (!inputs.empty()) {
        std::cout << "Paths per input: min " << summary.minPerInput << ", max "
                  << summary.maxPerInput << ", avg " << summary.avgPerInput
                  << std::endl;
    }
    std::cout << "Elapsed time: " << formatDuration(summary.seconds);
    if (summary.seconds > 0) {
        std::cout << " (" << static_cast<uint64_t>(summary.newPaths /
                                                   summary.seconds)
                  << " paths/s)";
    }
    std::cout << std::endl;

    if (opts.validate) {
        std::cout << "Validate mode: " << summary.totalPaths
                  << " paths found, nothing written." << std::endl;
    } else if (summary.partial) {
        std::cout << YELLOW << "Saved " << summary.totalPaths
                  << " paths to " << summary.outputPath.string()
                  << " (partial)." << RESET << std::endl;
    } else {
        std::cout << GREEN << "Wrote " << summary.totalPaths << " paths to "
                  << summary.outputPath.string() << "." << RESET << std::endl;
    }
}

RunSummary Coordinator::run(std::atomic<bool> &stop) {
    auto tStart = std::chrono::steady_clock::now();
    RunSummary summary;
    inputs.clear();
    seen.clear();
    writer.reset();

    if (opts.validate) {
        Score best;
        std::vector<WeekSchedule> seeds = generateSeeds(best);
        weekScore = best;
        if (opts.weeks == 1) {
            std::vector<Path> paths;
            for (const WeekSchedule &week : seeds) {
                paths.push_back(Path{week});
            }
            acceptPaths(paths, summary);
        } else {
            for (const WeekSchedule &week : seeds) {
                InputState in;
                in.path.push_back(week);
                inputs.push_back(std::move(in));
            }
            summary.inputPaths = inputs.size();
            std::string failure = search(stop, summary);
            if (!failure.empty()) {
                throw WorkerException(failure);
            }
        }
        summary.weekScore = weekScore;
        summary.totalPaths = summary.newPaths;
        summary.partial = summary.interrupted;
        summary.seconds = secondsSince(tStart);
        computeStats(summary);
        report(summary);
        return summary;
    }

    summary.outputPath = resultsPath(opts.resultsDir, opts.teams, opts.weeks);
    std::filesystem::path previous = summary.outputPath;
    previous += ".prev";

    // A resume killed while copying forward leaves the old file in .prev and
    // a half-written output, or no output at all. Only a finalized complete
    // output supersedes .prev.
    if (std::filesystem::exists(previous)) {
        bool outputComplete = false;
        if (std::filesystem::exists(summary.outputPath)) {
            try {
                TreeHeader h = readHeaderFromFile(summary.outputPath);
                outputComplete = !h.partial;
            } catch (const TreeFormatException &) {
                outputComplete = false;
            }
        }
        if (outputComplete) {
            std::filesystem::remove(previous);
        } else {
            std::filesystem::rename(previous, summary.outputPath);
            if (!opts.suppress) {
                std::cerr << YELLOW << "Restored "
                          << summary.outputPath.string() << " from "
                          << previous.string() << RESET << std::endl;
            }
        }
    }

    bool resuming = false;
    if (std::filesystem::exists(summary.outputPath)) {
        TreeHeader h = readHeaderFromFile(summary.outputPath);
        if (h.teams != opts.teams || h.weeks != opts.weeks) {
            throw ConfigurationException(
                summary.outputPath.string() + " holds teams=" +
                std::to_string(h.teams) + " weeks=" + std::to_string(h.weeks));
        }
        if (!h.partial) {
            summary.alreadyComplete = true;
            summary.totalPaths = h.count;
            summary.seconds = secondsSince(tStart);
            report(summary);
            return summary;
        }
        if (h.diversify != opts.diversify) {
            throw ConfigurationException(
                "cannot resume " + summary.outputPath.string() + ": it was " +
                "written " + (h.diversify ? "with" : "without") +
                " --diversify, rerun " + (h.diversify ? "with" : "without") +
                " it");
        }
        resuming = true;
    }

    if (opts.weeks == 1) {
        Score best;
        std::vector<WeekSchedule> seeds = generateSeeds(best);
        writeSeedFile(summary.outputPath, seeds);
        summary.weekScore = best;
        summary.newPaths = seeds.size();
        summary.totalPaths = seeds.size();
        summary.seconds = secondsSince(tStart);
        return summary;
    }

    std::filesystem::path source = findSource();
    if (source.empty()) {
        if (resuming) {
            throw ConfigurationException(
                "cannot resume " + summary.outputPath.string() +
                ": no complete result file with fewer than " +
                std::to_string(opts.weeks) + " weeks in " +
                opts.resultsDir.string());
        }
        Score best;
        std::vector<WeekSchedule> seeds = generateSeeds(best);
        source = resultsPath(opts.resultsDir, opts.teams, 1);
        writeSeedFile(source, seeds);
    }
    summary.sourcePath = source;
    const int prefixLength = readHeaderFromFile(source).weeks;

    ParentStatusMap parents;
    if (resuming) {
        TreeReader reader(summary.outputPath, opts.suppress);
        parents = reader.collectParents(prefixLength);
        std::filesystem::rename(summary.outputPath, previous);
        summary.resumed = true;
    }

    if (!opts.suppress) {
        std::cout << GRAY << "Started "
                  << formatSystemTimePoint(std::chrono::system_clock::now(),
                                           "%Y-%m-%d %H:%M:%S")
                  << RESET << std::endl;
        std::cout << (resuming ? "Resuming " : "Extending ")
                  << source.string() << " to " << opts.weeks << " weeks with "
                  << opts.workers << " workers..." << std::endl;
    }
    loadInputs(source, parents, summary);
    summary.weekScore = weekScore;

    writer = std::make_unique<TreeWriter>(summary.outputPath);
    writer->writeHeader(opts.teams, opts.weeks, opts.diversify);
    if (resuming) {
        copyForward(previous, prefixLength, summary);
    }

    std::string failure = search(stop, summary);

    summary.partial = std::any_of(
        inputs.begin(), inputs.end(),
        [](const InputState &in) { return !in.exhausted; });
    if (summary.partial) {
        checkpoint(summary);
    }
    writer->finalize(summary.partial);
    summary.totalPaths = writer->getCount();
    writer.reset();
    if (resuming) {
        std::filesystem::remove(previous);
    }

    summary.seconds = secondsSince(tStart);
    computeStats(summary);
    report(summary);

    if (!failure.empty()) {
        throw WorkerException(failure);
    }
    return summary;
}
