#include "utils.h"
#include "globals.h"
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

std::string trim(const std::string &s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    size_t end = s.find_last_not_of(" \t\r\n");

    if (start == std::string::npos) {
        // string is all whitespace
        return "";
    }
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string &s, char delim) {
    std::vector<std::string> parts;
    std::stringstream ss(s);
    std::string field;
    while (std::getline(ss, field, delim)) {
        parts.push_back(field);
    }
    // getline drops a trailing empty field
    if (!s.empty() && s.back() == delim) {
        parts.push_back("");
    }
    return parts;
}

std::string
formatSystemTimePoint(const std::chrono::system_clock::time_point &tp,
                      std::string format) {
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm *tm = std::localtime(&tt);
    std::ostringstream oss;
    oss << std::put_time(tm, format.c_str());
    return oss.str();
}

std::string formatDuration(double seconds) {
    long long total = static_cast<long long>(seconds + 0.5);
    std::ostringstream oss;
    if (total < 60) {
        oss << total << "s";
    } else if (total < 3600) {
        oss << total / 60 << ":" << std::setw(2) << std::setfill('0')
            << total % 60 << " minutes";
    } else if (total < 86400) {
        oss << total / 3600 << ":" << std::setw(2) << std::setfill('0')
            << (total % 3600) / 60 << " hours";
    } else {
        oss << total / 86400 << "d " << (total % 86400) / 3600 << ":"
            << std::setw(2) << std::setfill('0') << (total % 3600) / 60;
    }
    return oss.str();
}

uint64_t hashPath(const Path &path) { return hashPath(path, path.size()); }

uint64_t hashPath(const Path &path, size_t weeks) {
    uint64_t h = 1469598103934665603ull;
    for (size_t w = 0; w < weeks && w < path.size(); w++) {
        for (int m : path[w]) {
            h ^= static_cast<uint64_t>(m) + 1;
            h *= 1099511628211ull;
        }
        h ^= 0xffull; // week separator
        h *= 1099511628211ull;
    }
    return h;
}

uint64_t mix64(uint64_t x) {
    // splitmix64 finalizer
    x += 0x9e3779b97f4a7c15ull;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
    return x ^ (x >> 31);
}
