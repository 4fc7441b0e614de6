// Check every path of a result file

#include "Encoding.h"
#include "TreeStore.h"
#include "Validator.h"
#include "globals.h"
#include "utils.h"
#include <cstdint>
#include <iostream>
#include <string>
#include <unordered_set>

// usage:
// $ ./rrsched_verify <result txt path> [--quiet]

const uint64_t MAX_REPORTED = 10;

int main(int argc, char **argv) {
    if (argc < 2 || argc > 3) {
        std::cerr << "Usage: ./rrsched_verify <result txt path> [--quiet]"
                  << std::endl;
        exit(1);
    }
    const std::string path = argv[1];
    bool quiet = false;
    if (argc == 3) {
        if (std::string(argv[2]) != "--quiet") {
            std::cerr << "Unknown argument: " << argv[2] << std::endl;
            exit(1);
        }
        quiet = true;
    }

    uint64_t paths = 0;
    uint64_t valid = 0;
    uint64_t structureErrors = 0;
    uint64_t scoreErrors = 0;
    uint64_t roundRobinErrors = 0;
    uint64_t duplicates = 0;
    uint64_t reported = 0;
    TreeHeader header;

    try {
        TreeReader reader(path, quiet);
        header = reader.getHeader();
        Encoding encoding(header.teams);
        Validator validator(encoding);
        const Score target = encoding.optimalWeekScore();
        std::unordered_set<uint64_t> seen;

        reader.forEachPath([&](const Path &p) {
            paths++;
            if (!seen.insert(hashPath(p)).second) {
                duplicates++;
                return true;
            }
            PathReport r = validator.checkPath(p, target);
            if (r.valid()) {
                valid++;
                return true;
            }
            std::string error;
            if (!r.structureError.empty()) {
                structureErrors++;
                error = r.structureError;
            } else {
                if (!r.scoreError.empty()) {
                    scoreErrors++;
                    error = r.scoreError;
                }
                if (!r.roundRobinError.empty()) {
                    roundRobinErrors++;
                    error = r.roundRobinError;
                }
            }
            if (!quiet && reported++ < MAX_REPORTED) {
                std::cout << RED << "path " << paths << ": " << error << RESET
                          << std::endl;
            }
            return true;
        });

        if (reader.getMalformedLines() > 0) {
            structureErrors += reader.getMalformedLines();
        }
    } catch (const TreeFormatException &e) {
        std::cerr << RED << e.what() << RESET << std::endl;
        exit(1);
    } catch (const ConfigurationException &e) {
        std::cerr << RED << e.what() << RESET << std::endl;
        exit(1);
    }

    const bool countMatches = header.count == paths;
    std::cout << "File: " << path << std::endl;
    std::cout << "Header: teams=" << header.teams << " weeks=" << header.weeks
              << " count=" << header.count
              << (header.partial ? " (partial)" : "") << std::endl;
    std::cout << "Paths: " << paths
              << (countMatches ? "" : " (header count differs)") << std::endl;
    std::cout << "Valid: " << valid << std::endl;
    std::cout << "Structure errors: " << structureErrors << std::endl;
    std::cout << "Score errors: " << scoreErrors << std::endl;
    std::cout << "Round-robin errors: " << roundRobinErrors << std::endl;
    std::cout << "Duplicates: " << duplicates << std::endl;

    bool ok = structureErrors == 0 && scoreErrors == 0 &&
              roundRobinErrors == 0 && duplicates == 0 && countMatches;
    std::cout << (ok ? GREEN "OK" : RED "PROBLEMS FOUND") << RESET
              << std::endl;
    return ok ? 0 : 1;
}
