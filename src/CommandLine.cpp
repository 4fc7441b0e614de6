#include "CommandLine.h"
#include "Coordinator.h"
#include "globals.h"
#include <atomic>
#include <exception>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

void printUsage() {
    std::cout
        << "Usage: rrsched [options]\n"
        << "  --teams=N      number of teams, even, 4-16 (default 8)\n"
        << "  --weeks=N      target week count (default 2)\n"
        << "  --workers=N    worker threads (default cpus - 2)\n"
        << "  --breadth=N    new paths per input per round, 0 = all "
           "(default 32)\n"
        << "  --cache=N      cached constraint results per worker "
           "(default 256)\n"
        << "  --dir=PATH     results directory (default results)\n"
        << "  --validate     search without reading or writing files\n"
        << "  --diversify    rotate candidate order per input path\n"
        << "  --debug        per-unit diagnostics (alias --verbose)\n"
        << "  --help, -h     show this message" << std::endl;
}

int parseNumber(const std::string &flag, const std::string &value) {
    size_t end = 0;
    long long n = 0;
    try {
        n = std::stoll(value, &end);
    } catch (const std::exception &) {
        end = 0;
    }
    if (value.empty() || end != value.size() || n < 0 ||
        n > std::numeric_limits<int>::max()) {
        throw ConfigurationException("invalid value for " + flag + ": '" +
                                     value + "'");
    }
    return static_cast<int>(n);
}

RunOptions parseArgs(const std::vector<std::string> &args, bool &help) {
    RunOptions opts;
    for (const std::string &arg : args) {
        if (arg == "--help" || arg == "-h") {
            help = true;
            continue;
        }
        if (arg == "--validate") {
            opts.validate = true;
            continue;
        }
        if (arg == "--diversify") {
            opts.diversify = true;
            continue;
        }
        if (arg == "--debug" || arg == "--verbose") {
            opts.verbose = true;
            continue;
        }

        size_t eq = arg.find('=');
        if (arg.rfind("--", 0) != 0 || eq == std::string::npos) {
            throw ConfigurationException("unknown argument: " + arg);
        }
        std::string flag = arg.substr(0, eq);
        std::string value = arg.substr(eq + 1);
        if (flag == "--teams") {
            opts.teams = parseNumber(flag, value);
        } else if (flag == "--weeks") {
            opts.weeks = parseNumber(flag, value);
        } else if (flag == "--workers") {
            opts.workers = parseNumber(flag, value);
        } else if (flag == "--breadth") {
            opts.breadth = static_cast<uint64_t>(parseNumber(flag, value));
        } else if (flag == "--cache") {
            opts.cacheEntries = static_cast<size_t>(parseNumber(flag, value));
        } else if (flag == "--dir") {
            if (value.empty()) {
                throw ConfigurationException("--dir needs a path");
            }
            opts.resultsDir = value;
        } else {
            throw ConfigurationException("unknown argument: " + arg);
        }
    }
    return opts;
}

int runCommand(const RunOptions &opts, std::atomic<bool> &stop) {
    try {
        Coordinator c(opts);
        RunSummary summary = c.run(stop);
        if (summary.interrupted && !opts.suppress) {
            std::cout << std::endl
                      << YELLOW << "Interrupted: " << summary.totalPaths
                      << " paths saved." << RESET << std::endl;
            if (!opts.validate) {
                std::cout << "Resume with: " << c.resumeCommand() << std::endl;
            }
        }
    } catch (const ConfigurationException &e) {
        std::cerr << RED << e.what() << RESET << std::endl;
        return 1;
    } catch (const TreeFormatException &e) {
        std::cerr << RED << e.what() << RESET << std::endl;
        return 1;
    } catch (const WorkerException &e) {
        std::cerr << RED << "Worker failed: " << e.what() << RESET << std::endl;
        return 2;
    } catch (const std::exception &e) {
        // filesystem errors on the results directory land here
        std::cerr << RED << "Error: " << e.what() << RESET << std::endl;
        return 1;
    }
    return 0;
}
