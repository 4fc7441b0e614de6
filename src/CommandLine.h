#ifndef COMMAND_LINE_H
#define COMMAND_LINE_H

#include "Coordinator.h"
#include <atomic>
#include <string>
#include <vector>

void printUsage();

// non-negative and small enough for an int, else ConfigurationException
int parseNumber(const std::string &flag, const std::string &value);

// `args` excludes the program name
RunOptions parseArgs(const std::vector<std::string> &args, bool &help);

// Runs the coordinator and reports failures on stderr. Returns the process
// exit code: 0 on success or interruption, 2 if a worker failed, 1 for any
// other error.
int runCommand(const RunOptions &opts, std::atomic<bool> &stop);

#endif // COMMAND_LINE_H
