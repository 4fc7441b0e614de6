#ifndef UTILS_H
#define UTILS_H

#include "globals.h"
#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

std::string trim(const std::string &s);
std::vector<std::string> split(const std::string &s, char delim);
std::string
formatSystemTimePoint(const std::chrono::system_clock::time_point &tp,
                      std::string format);
std::string formatDuration(double seconds);

// 64-bit FNV-1a over every matchup id, with a separator between weeks
uint64_t hashPath(const Path &path);
// hash of the first `weeks` weeks only
uint64_t hashPath(const Path &path, size_t weeks);
uint64_t mix64(uint64_t x);

// Get `key`'s value from map; return `default_value` if `key` not found
template <typename Map, typename Key,
          typename Value = typename Map::mapped_type>
Value get_or(const Map &m, const Key &key, const Value &default_value) {
    auto it = m.find(key);
    if (it != m.end()) {
        return it->second;
    }
    return default_value;
}

#endif // UTILS_H
