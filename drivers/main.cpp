// Search optimal round-robin schedules

#include "CommandLine.h"
#include "Coordinator.h"
#include "globals.h"
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

// usage:
// $ ./rrsched --teams=8 --weeks=2 [--workers=N] [--breadth=N] [--cache=N]
//   [--dir=results] [--validate] [--diversify] [--debug]

std::atomic<bool> g_stop{false};

void interruptHandler(int) {
    if (g_stop.load()) {
        // second Ctrl+C: give up on the checkpoint
        std::_Exit(1);
    }
    g_stop.store(true);
}

int main(int argc, char **argv) {
    bool help = false;
    RunOptions opts;
    try {
        opts = parseArgs(std::vector<std::string>(argv + 1, argv + argc), help);
    } catch (const ConfigurationException &e) {
        std::cerr << RED << e.what() << RESET << std::endl;
        printUsage();
        exit(1);
    }
    if (help) {
        printUsage();
        return 0;
    }

    std::signal(SIGINT, interruptHandler);
    std::signal(SIGTERM, interruptHandler);

    return runCommand(opts, g_stop);
}
