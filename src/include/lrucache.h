/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef LRUCACHE_H
#define LRUCACHE_H

#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace phorg{

// Fixed capacity map that evicts the least recently used entry.
// Safe to use from multiple threads.
template <typename K, typename V>
class LruCache {
    using Entry = std::pair<K, V>;
    using ListIterator = typename std::list<Entry>::iterator;

    size_t capacity;
    std::list<Entry> entries; // Most recent first
    std::unordered_map<K, ListIterator> index;
    mutable std::mutex mtx;

public:
    explicit LruCache(size_t capacity) : capacity(capacity) {}

    std::optional<V> get(const K &key){
        std::lock_guard<std::mutex> lock(mtx);

        auto it = index.find(key);
        if (it == index.end()) return std::nullopt;

        entries.splice(entries.begin(), entries, it->second);
        return it->second->second;
    }

    void put(const K &key, const V &value){
        if (capacity == 0) return;

        std::lock_guard<std::mutex> lock(mtx);

        auto it = index.find(key);
        if (it != index.end()){
            it->second->second = value;
            entries.splice(entries.begin(), entries, it->second);
            return;
        }

        if (entries.size() >= capacity){
            index.erase(entries.back().first);
            entries.pop_back();
        }

        entries.emplace_front(key, value);
        index[key] = entries.begin();
    }

    size_t size() const{
        std::lock_guard<std::mutex> lock(mtx);
        return entries.size();
    }

    void clear(){
        std::lock_guard<std::mutex> lock(mtx);
        entries.clear();
        index.clear();
    }
};

}

#endif // LRUCACHE_H
