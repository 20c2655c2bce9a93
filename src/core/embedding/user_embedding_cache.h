#pragma once

#include "core/embedding/embedding_vector.h"

#include <QString>

#include <array>
#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace hr {

// Keyed store for computed user embeddings. Injected into the embedding
// computer so the in-process cache can be replaced by a shared one.
class UserEmbeddingCache {
public:
    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t evictions = 0;
        int currentSize = 0;
    };

    virtual ~UserEmbeddingCache() = default;

    virtual std::optional<EmbeddingVector> get(const QString& userId) = 0;
    virtual void put(const QString& userId, const EmbeddingVector& embedding) = 0;
    virtual void invalidate(const QString& userId) = 0;
    virtual void clear() = 0;
    virtual Stats stats() const = 0;
};

struct UserEmbeddingCacheConfig {
    int ttlSeconds = 300;
    int maxEntriesPerShard = 2048;
};

// TTL + LRU cache split into independently locked shards, so a writer for
// one user only blocks readers that hash to the same shard. Expired entries
// are evicted lazily on read.
class InMemoryUserEmbeddingCache : public UserEmbeddingCache {
public:
    static constexpr int kShardCount = 16;

    explicit InMemoryUserEmbeddingCache(UserEmbeddingCacheConfig config = {});

    std::optional<EmbeddingVector> get(const QString& userId) override;
    void put(const QString& userId, const EmbeddingVector& embedding) override;
    void invalidate(const QString& userId) override;
    void clear() override;
    Stats stats() const override;

private:
    struct Entry {
        QString key;
        EmbeddingVector value;
        std::chrono::steady_clock::time_point insertedAt;
    };

    struct QStringHash {
        size_t operator()(const QString& s) const { return qHash(s); }
    };

    struct Shard {
        mutable std::mutex mutex;
        std::list<Entry> list;  // front = most recently used
        std::unordered_map<QString, std::list<Entry>::iterator, QStringHash> index;
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t evictions = 0;
    };

    Shard& shardFor(const QString& userId);

    UserEmbeddingCacheConfig m_config;
    std::array<Shard, kShardCount> m_shards;
};

} // namespace hr
