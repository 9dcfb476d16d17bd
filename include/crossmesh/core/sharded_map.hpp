/**
 * @file sharded_map.hpp
 * @brief Concurrent hash map split into independently locked shards.
 *
 * Each shard owns a shared_mutex; no lock ever spans the whole table.
 * Values are held by shared_ptr so callers can keep using an entry after
 * the shard lock is released; entries that need mutation carry their own
 * mutex.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#pragma once

#include <array>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace crossmesh {
namespace core {

template<typename K, typename V, size_t ShardCount = 16, typename Hash = std::hash<K>>
class ShardedMap {
public:
    using ValuePtr = std::shared_ptr<V>;

    ShardedMap() = default;

    ShardedMap(const ShardedMap&) = delete;
    ShardedMap& operator=(const ShardedMap&) = delete;

    /**
     * @brief Return the entry for key, or nullptr.
     */
    ValuePtr find(const K& key) const {
        const Shard& shard = shardFor(key);
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        auto it = shard.entries.find(key);
        return it == shard.entries.end() ? nullptr : it->second;
    }

    /**
     * @brief Return the entry for key, creating it with factory() if absent.
     * The factory runs under the shard's write lock.
     */
    template<typename Factory>
    ValuePtr getOrCreate(const K& key, Factory&& factory) {
        Shard& shard = shardFor(key);
        {
            std::shared_lock<std::shared_mutex> lock(shard.mutex);
            auto it = shard.entries.find(key);
            if (it != shard.entries.end()) {
                return it->second;
            }
        }

        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        auto it = shard.entries.find(key);
        if (it != shard.entries.end()) {
            return it->second;
        }
        ValuePtr value = factory();
        shard.entries.emplace(key, value);
        return value;
    }

    /**
     * @brief Insert or replace.
     */
    void put(const K& key, ValuePtr value) {
        Shard& shard = shardFor(key);
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        shard.entries[key] = std::move(value);
    }

    bool erase(const K& key) {
        Shard& shard = shardFor(key);
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        return shard.entries.erase(key) > 0;
    }

    /**
     * @brief Erase key only while it still maps to expected.
     */
    bool eraseIf(const K& key, const ValuePtr& expected) {
        Shard& shard = shardFor(key);
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        auto it = shard.entries.find(key);
        if (it == shard.entries.end() || it->second != expected) {
            return false;
        }
        shard.entries.erase(it);
        return true;
    }

    /**
     * @brief Remove every entry for which pred(key, value) is true.
     * @return The removed entries.
     */
    template<typename Pred>
    std::vector<std::pair<K, ValuePtr>> removeWhere(Pred&& pred) {
        std::vector<std::pair<K, ValuePtr>> removed;
        for (auto& shard : shards_) {
            std::unique_lock<std::shared_mutex> lock(shard.mutex);
            for (auto it = shard.entries.begin(); it != shard.entries.end();) {
                if (pred(it->first, it->second)) {
                    removed.emplace_back(it->first, it->second);
                    it = shard.entries.erase(it);
                } else {
                    ++it;
                }
            }
        }
        return removed;
    }

    /**
     * @brief Copy of all (key, value) pairs, one shard at a time.
     */
    std::vector<std::pair<K, ValuePtr>> snapshot() const {
        std::vector<std::pair<K, ValuePtr>> out;
        for (const auto& shard : shards_) {
            std::shared_lock<std::shared_mutex> lock(shard.mutex);
            for (const auto& entry : shard.entries) {
                out.emplace_back(entry.first, entry.second);
            }
        }
        return out;
    }

    size_t size() const {
        size_t total = 0;
        for (const auto& shard : shards_) {
            std::shared_lock<std::shared_mutex> lock(shard.mutex);
            total += shard.entries.size();
        }
        return total;
    }

    void clear() {
        for (auto& shard : shards_) {
            std::unique_lock<std::shared_mutex> lock(shard.mutex);
            shard.entries.clear();
        }
    }

private:
    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<K, ValuePtr, Hash> entries;
    };

    std::array<Shard, ShardCount> shards_;

    Shard& shardFor(const K& key) {
        return shards_[Hash()(key) % ShardCount];
    }

    const Shard& shardFor(const K& key) const {
        return shards_[Hash()(key) % ShardCount];
    }
};

}  // namespace core
}  // namespace crossmesh
