#ifndef LRU_CACHE_H
#define LRU_CACHE_H

#include <cstddef>
#include <functional>
#include <list>
#include <unordered_map>
#include <utility>

// Bounded least-recently-used map. Not thread safe; each worker owns one.
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class LruCache {
  public:
    explicit LruCache(size_t c) : capacity(c) {}

    // returns nullptr on miss; the pointer is valid until the next put()
    const Value *get(const Key &k) {
        auto it = entries.find(k);
        if (it == entries.end()) {
            misses++;
            return nullptr;
        }
        // move to front (most recently used)
        order.splice(order.begin(), order, it->second.first);
        hits++;
        return &it->second.second;
    }

    void put(const Key &k, Value v) {
        if (capacity == 0) {
            return;
        }
        auto it = entries.find(k);
        if (it != entries.end()) {
            it->second.second = std::move(v);
            order.splice(order.begin(), order, it->second.first);
            return;
        }
        // evict least recently used if full
        if (entries.size() >= capacity && !order.empty()) {
            entries.erase(order.back());
            order.pop_back();
        }
        order.push_front(k);
        entries.emplace(k, std::make_pair(order.begin(), std::move(v)));
    }

    size_t size() const { return entries.size(); }
    size_t getHits() const { return hits; }
    size_t getMisses() const { return misses; }

  private:
    using ListIt = typename std::list<Key>::iterator;

    size_t capacity;
    size_t hits = 0;
    size_t misses = 0;
    std::list<Key> order; // front = most recently used
    std::unordered_map<Key, std::pair<ListIt, Value>, Hash> entries;
};

#endif // LRU_CACHE_H
