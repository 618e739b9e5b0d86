// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>

namespace csms {

/// \brief Map split into independently locked shards so unrelated keys never contend on one mutex.
///
/// Callbacks receive the shard's std::map while its lock is held; they must not call back into the same
/// ShardedMap. A key always lives in the same shard, so every access to one key is serialized.
template <typename Key, typename Value, std::size_t ShardCount = 16>
class ShardedMap {
public:
    using Entries = std::map<Key, Value>;

    template <typename Fn>
    decltype(auto) with_shard(const Key& key, Fn&& fn) {
        auto& shard = shard_for(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        return fn(shard.entries);
    }

    template <typename Fn>
    decltype(auto) with_shard(const Key& key, Fn&& fn) const {
        const auto& shard = shard_for(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        return fn(static_cast<const Entries&>(shard.entries));
    }

    /// \brief Visit every shard in turn; only one shard lock is held at a time.
    template <typename Fn>
    void for_each_shard(Fn&& fn) {
        for (auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard.mutex);
            fn(shard.entries);
        }
    }

    template <typename Fn>
    void for_each_shard(Fn&& fn) const {
        for (const auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard.mutex);
            fn(static_cast<const Entries&>(shard.entries));
        }
    }

private:
    struct Shard {
        mutable std::mutex mutex;
        Entries entries;
    };

    Shard& shard_for(const Key& key) {
        return shards_[std::hash<Key>{}(key) % ShardCount];
    }

    const Shard& shard_for(const Key& key) const {
        return shards_[std::hash<Key>{}(key) % ShardCount];
    }

    std::array<Shard, ShardCount> shards_;
};

} // namespace csms
