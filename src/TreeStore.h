#ifndef TREE_STORE_H
#define TREE_STORE_H

#include "globals.h"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

// Streaming tree format, one schedule per line, tabs give the week index:
//
//   # teams=6 weeks=2 count=1728
//   0,5,1,9,13,2,10,12,14
//   \t3,4,1,9,13,...
//   \t3,4,1,9,14,...
//   \t✅
//
// A path's leading weeks are omitted when they repeat the previously
// written path. Marker lines close a parent's children: "…" means the
// exploration below it was cut off, "✅" means it finished. A run with
// rotated candidate order writes " diversify=1" before the count, and a
// resume must use the same order.

extern const std::string INCOMPLETE_MARKER;
extern const std::string COMPLETE_MARKER;

struct TreeHeader {
    int teams = 0;
    int weeks = 0;
    uint64_t count = 0;
    bool diversify = false; // written with rotated candidate order
    bool partial = false;
};

TreeHeader parseHeader(const std::string &line);
TreeHeader readHeaderFromFile(const std::filesystem::path &path);
std::string formatSchedule(const WeekSchedule &schedule);

// "{N}teams-1week.txt" or "{N}teams-{W}weeks.txt"
std::filesystem::path resultsPath(const std::filesystem::path &dir, int teams,
                                  int weeks);

class TreeWriter {
  public:
    explicit TreeWriter(const std::filesystem::path &p);
    ~TreeWriter();
    TreeWriter(const TreeWriter &) = delete;
    TreeWriter &operator=(const TreeWriter &) = delete;

    // starts out marked partial; finalize() settles it
    void writeHeader(int teams, int weeks, bool diversify = false);
    void writePath(const Path &path);
    // writes `prefix` (compressed), then a marker line at depth prefix.size()
    void writeIncompleteMarker(const Path &prefix);
    void writeCompleteMarker(const Path &prefix);
    void flush();
    // closes the stream and rewrites the header count in place
    void finalize(bool partial);

    uint64_t getCount() const { return count; }

  private:
    void writeNodes(const Path &path);
    void writeMarker(const Path &prefix, const std::string &marker);

    std::filesystem::path filePath;
    std::ofstream out;
    Path previousPath;
    uint64_t count = 0;
    std::streamoff countOffset = 0;
    bool headerWritten = false;
    bool closed = false;
};

enum class MarkerKind { None, Incomplete, Complete };

// children and markers recorded under one parent node
struct ParentStatus {
    uint64_t childCount = 0;
    MarkerKind lastMarker = MarkerKind::None;
    bool completeSeen = false;
};

// parent key is hashPath() of the parent's prefix
using ParentStatusMap = std::unordered_map<uint64_t, ParentStatus>;

class TreeReader {
  public:
    // return false to stop reading
    using PathVisitor = std::function<bool(const Path &)>;
    using MarkerVisitor =
        std::function<bool(const Path &prefix, MarkerKind kind)>;

    explicit TreeReader(const std::filesystem::path &p, bool suppress = false);

    const TreeHeader &getHeader();

    // streams every full path; returns the number visited
    uint64_t forEachPath(const PathVisitor &onPath);
    // streams full paths and marker lines in file order
    uint64_t forEachEntry(const PathVisitor &onPath,
                          const MarkerVisitor &onMarker);
    std::vector<Path> readAll();

    // Per parent at depth prefixLength - 1 (prefixLength weeks), how many
    // children follow it and which markers close it.
    ParentStatusMap collectParents(int prefixLength);

    uint64_t getMalformedLines() const { return malformedLines; }

  private:
    void warnMalformed(uint64_t lineNumber, const std::string &line);

    std::filesystem::path filePath;
    bool suppress;
    bool headerRead = false;
    TreeHeader header;
    uint64_t malformedLines = 0;
};

#endif // TREE_STORE_H
