#include "TreeStore.h"
#include "globals.h"
#include "utils.h"
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <regex>
#include <string>
#include <utility>
#include <vector>

const std::string INCOMPLETE_MARKER = "\xE2\x80\xA6"; // U+2026 …
const std::string COMPLETE_MARKER = "\xE2\x9C\x85";   // U+2705 ✅

namespace {

// fixed-width count field so finalize() can rewrite it in place
const int COUNT_WIDTH = 13;
const int PARTIAL_RESERVE = 10; // room for " (partial)"
const std::string PARTIAL_SUFFIX = " (partial)";
const uint64_t MAX_WARNINGS = 10;

std::string countField(uint64_t count, bool partial) {
    std::string field = std::to_string(count) + (partial ? PARTIAL_SUFFIX : "");
    field.resize(COUNT_WIDTH + PARTIAL_RESERVE, ' ');
    return field;
}

// lexicographic pair order, same ids as Encoding
std::vector<std::pair<int, int>> matchupTeams(int teams) {
    std::vector<std::pair<int, int>> pairs;
    for (int a = 0; a < teams; a++) {
        for (int b = a + 1; b < teams; b++) {
            pairs.emplace_back(a, b);
        }
    }
    return pairs;
}

// False unless `content` is exactly `slots` distinct matchup ids in range
// giving every team GAMES_PER_TEAM games. A line cut short inside a
// multi-digit id still has `slots` tokens; the per-team tally rejects it.
bool parseSchedule(const std::string &content, int teams,
                   const std::vector<std::pair<int, int>> &pairs,
                   WeekSchedule &out) {
    const int slots = teams * GAMES_PER_TEAM / 2;
    const int matchups = static_cast<int>(pairs.size());
    std::vector<std::string> tokens = split(content, ',');
    if (static_cast<int>(tokens.size()) != slots) {
        return false;
    }
    out.clear();
    out.reserve(tokens.size());
    MatchupSet used;
    std::vector<int> games(teams, 0);
    for (const std::string &raw : tokens) {
        std::string token = trim(raw);
        if (token.empty() || token.size() > 4) {
            return false;
        }
        for (char c : token) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return false;
            }
        }
        int value = std::stoi(token);
        if (value >= matchups || used.test(value)) {
            return false;
        }
        used.set(value);
        games[pairs[value].first]++;
        games[pairs[value].second]++;
        out.push_back(value);
    }
    for (int g : games) {
        if (g != GAMES_PER_TEAM) {
            return false;
        }
    }
    return true;
}

} // namespace

TreeHeader parseHeader(const std::string &line) {
    TreeHeader h;
    std::smatch m;
    if (std::regex_search(line, m, std::regex("teams=(\\d+)"))) {
        h.teams = std::stoi(m[1]);
    }
    if (std::regex_search(line, m, std::regex("weeks=(\\d+)"))) {
        h.weeks = std::stoi(m[1]);
    }
    if (std::regex_search(line, m, std::regex("count=(\\d+)"))) {
        h.count = std::stoull(m[1]);
    }
    h.diversify = line.find(" diversify=1") != std::string::npos;
    h.partial = line.find("(partial)") != std::string::npos;
    return h;
}

TreeHeader readHeaderFromFile(const std::filesystem::path &path) {
    std::ifstream in(path);
    if (!in) {
        throw TreeFormatException("cannot open " + path.string());
    }
    std::string line;
    if (!std::getline(in, line) || line.empty() || line[0] != '#') {
        throw TreeFormatException(path.string() + " has no header line");
    }
    TreeHeader h = parseHeader(line);
    if (h.teams < MIN_TEAMS || h.teams > MAX_TEAMS || h.weeks <= 0) {
        throw TreeFormatException("unparsable header in " + path.string() +
                                  ": " + line);
    }
    return h;
}

std::string formatSchedule(const WeekSchedule &schedule) {
    std::string s;
    for (size_t i = 0; i < schedule.size(); i++) {
        if (i > 0) {
            s += ',';
        }
        s += std::to_string(schedule[i]);
    }
    return s;
}

std::filesystem::path resultsPath(const std::filesystem::path &dir, int teams,
                                  int weeks) {
    std::string name = std::to_string(teams) + "teams-" +
                       std::to_string(weeks) + (weeks == 1 ? "week" : "weeks") +
                       ".txt";
    return dir / name;
}

// ---------------------------------------------------------------------------
// TreeWriter
// ---------------------------------------------------------------------------

TreeWriter::TreeWriter(const std::filesystem::path &p) : filePath(p) {
    if (filePath.has_parent_path()) {
        std::filesystem::create_directories(filePath.parent_path());
    }
    out.open(filePath, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!out) {
        throw TreeFormatException("cannot open " + filePath.string() +
                                  " for writing");
    }
}

TreeWriter::~TreeWriter() {
    // an unfinalized file keeps its "(partial)" header
    if (!closed) {
        out.close();
    }
}

void TreeWriter::writeHeader(int teams, int weeks, bool diversify) {
    std::string prefix = "# teams=" + std::to_string(teams) +
                         " weeks=" + std::to_string(weeks) +
                         (diversify ? " diversify=1" : "") + " count=";
    countOffset = static_cast<std::streamoff>(prefix.size());
    out << prefix + countField(0, true) + "\n";
    headerWritten = true;
}

void TreeWriter::writeNodes(const Path &path) {
    // skip the weeks shared with the previous path
    size_t common = 0;
    while (common < previousPath.size() && common < path.size() &&
           previousPath[common] == path[common]) {
        common++;
    }
    for (size_t depth = common; depth < path.size(); depth++) {
        // whole line in one write
        out << std::string(depth, '\t') + formatSchedule(path[depth]) + "\n";
    }
}

void TreeWriter::writePath(const Path &path) {
    writeNodes(path);
    previousPath = path;
    count++;
}

void TreeWriter::writeMarker(const Path &prefix, const std::string &marker) {
    writeNodes(prefix);
    out << std::string(prefix.size(), '\t') + marker + "\n";
    previousPath = prefix;
}

void TreeWriter::writeIncompleteMarker(const Path &prefix) {
    writeMarker(prefix, INCOMPLETE_MARKER);
}

void TreeWriter::writeCompleteMarker(const Path &prefix) {
    writeMarker(prefix, COMPLETE_MARKER);
}

void TreeWriter::flush() { out.flush(); }

void TreeWriter::finalize(bool partial) {
    if (closed) {
        return;
    }
    out.close();
    closed = true;
    if (!out) {
        throw TreeFormatException("write to " + filePath.string() + " failed");
    }
    if (!headerWritten) {
        return;
    }

    std::fstream f(filePath, std::ios::in | std::ios::out | std::ios::binary);
    if (!f) {
        throw TreeFormatException("cannot reopen " + filePath.string());
    }
    f.seekp(countOffset);
    f << countField(count, partial);
    if (!f) {
        throw TreeFormatException("cannot update header of " +
                                  filePath.string());
    }
}

// ---------------------------------------------------------------------------
// TreeReader
// ---------------------------------------------------------------------------

TreeReader::TreeReader(const std::filesystem::path &p, bool s)
    : filePath(p), suppress(s) {}

const TreeHeader &TreeReader::getHeader() {
    if (!headerRead) {
        header = readHeaderFromFile(filePath);
        headerRead = true;
    }
    return header;
}

void TreeReader::warnMalformed(uint64_t lineNumber, const std::string &line) {
    malformedLines++;
    if (suppress) {
        return;
    }
    if (malformedLines <= MAX_WARNINGS) {
        std::cerr << YELLOW << "Warning: skipping malformed line " << lineNumber
                  << " in " << filePath.string() << ": "
                  << line.substr(0, 60) << RESET << std::endl;
    } else if (malformedLines == MAX_WARNINGS + 1) {
        std::cerr << YELLOW << "Warning: further malformed lines in "
                  << filePath.string() << " will be skipped silently" << RESET
                  << std::endl;
    }
}

uint64_t TreeReader::forEachEntry(const PathVisitor &onPath,
                                  const MarkerVisitor &onMarker) {
    getHeader();
    const std::vector<std::pair<int, int>> pairs = matchupTeams(header.teams);
    const size_t weeks = static_cast<size_t>(header.weeks);

    std::ifstream in(filePath);
    if (!in) {
        throw TreeFormatException("cannot open " + filePath.string());
    }

    Path stack; // schedule at each depth of the current branch
    WeekSchedule schedule;
    std::string line;
    uint64_t lineNumber = 0;
    uint64_t visited = 0;
    // after a bad line at depth d, its subtree is absent: skip deeper lines
    size_t skipBelow = SIZE_MAX;

    while (std::getline(in, line)) {
        lineNumber++;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }
        // getline hit end of file before a newline: the write was cut off
        const bool unterminated = in.eof();

        size_t depth = 0;
        while (depth < line.size() && line[depth] == '\t') {
            depth++;
        }
        std::string content = trim(line.substr(depth));
        if (content.empty()) {
            continue;
        }
        if (skipBelow != SIZE_MAX) {
            if (depth > skipBelow) {
                continue;
            }
            skipBelow = SIZE_MAX;
        }

        bool incomplete = content == INCOMPLETE_MARKER;
        bool complete = content == COMPLETE_MARKER;

        if (unterminated || depth > stack.size() ||
            depth >= weeks + (incomplete || complete)) {
            // no parent at depth - 1, or deeper than the tree
            warnMalformed(lineNumber, line);
            skipBelow = depth;
            continue;
        }
        stack.resize(depth);

        if (incomplete || complete) {
            if (onMarker &&
                !onMarker(stack, complete ? MarkerKind::Complete
                                          : MarkerKind::Incomplete)) {
                return visited;
            }
            continue;
        }

        if (!parseSchedule(content, header.teams, pairs, schedule)) {
            warnMalformed(lineNumber, line);
            skipBelow = depth;
            continue;
        }
        stack.push_back(schedule);

        if (stack.size() == weeks) {
            visited++;
            if (onPath && !onPath(stack)) {
                return visited;
            }
        }
    }
    return visited;
}

uint64_t TreeReader::forEachPath(const PathVisitor &onPath) {
    return forEachEntry(onPath, nullptr);
}

std::vector<Path> TreeReader::readAll() {
    std::vector<Path> paths;
    forEachPath([&paths](const Path &path) {
        paths.push_back(path);
        return true;
    });
    return paths;
}

ParentStatusMap TreeReader::collectParents(int prefixLength) {
    ParentStatusMap parents;
    const size_t len = static_cast<size_t>(prefixLength);
    forEachEntry(
        [&parents, len](const Path &path) {
            parents[hashPath(path, len)].childCount++;
            return true;
        },
        [&parents, len](const Path &prefix, MarkerKind kind) {
            if (prefix.size() == len) {
                ParentStatus &status = parents[hashPath(prefix)];
                status.lastMarker = kind;
                if (kind == MarkerKind::Complete) {
                    status.completeSeen = true;
                }
            }
            return true;
        });
    return parents;
}
