#include "core/embedding/user_embedding_cache.h"

namespace hr {

InMemoryUserEmbeddingCache::InMemoryUserEmbeddingCache(UserEmbeddingCacheConfig config)
    : m_config(config)
{
}

InMemoryUserEmbeddingCache::Shard& InMemoryUserEmbeddingCache::shardFor(const QString& userId)
{
    return m_shards[qHash(userId) % kShardCount];
}

std::optional<EmbeddingVector> InMemoryUserEmbeddingCache::get(const QString& userId)
{
    Shard& shard = shardFor(userId);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.index.find(userId);
    if (it == shard.index.end()) {
        ++shard.misses;
        return std::nullopt;
    }

    const auto now = std::chrono::steady_clock::now();
    const auto age = std::chrono::duration_cast<std::chrono::milliseconds>(
        now - it->second->insertedAt);
    if (age.count() >= static_cast<long long>(m_config.ttlSeconds) * 1000) {
        // Expired, remove lazily
        shard.list.erase(it->second);
        shard.index.erase(it);
        ++shard.evictions;
        ++shard.misses;
        return std::nullopt;
    }

    if (it->second != shard.list.begin()) {
        shard.list.splice(shard.list.begin(), shard.list, it->second);
    }

    ++shard.hits;
    return it->second->value;
}

void InMemoryUserEmbeddingCache::put(const QString& userId, const EmbeddingVector& embedding)
{
    Shard& shard = shardFor(userId);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto existing = shard.index.find(userId);
    if (existing != shard.index.end()) {
        shard.list.erase(existing->second);
        shard.index.erase(existing);
    }

    while (static_cast<int>(shard.list.size()) >= m_config.maxEntriesPerShard && !shard.list.empty()) {
        shard.index.erase(shard.list.back().key);
        shard.list.pop_back();
        ++shard.evictions;
    }

    shard.list.push_front({userId, embedding, std::chrono::steady_clock::now()});
    shard.index[userId] = shard.list.begin();
}

void InMemoryUserEmbeddingCache::invalidate(const QString& userId)
{
    Shard& shard = shardFor(userId);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.index.find(userId);
    if (it != shard.index.end()) {
        shard.list.erase(it->second);
        shard.index.erase(it);
    }
}

void InMemoryUserEmbeddingCache::clear()
{
    for (Shard& shard : m_shards) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        shard.list.clear();
        shard.index.clear();
    }
}

UserEmbeddingCache::Stats InMemoryUserEmbeddingCache::stats() const
{
    Stats total;
    for (const Shard& shard : m_shards) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        total.hits += shard.hits;
        total.misses += shard.misses;
        total.evictions += shard.evictions;
        total.currentSize += static_cast<int>(shard.list.size());
    }
    return total;
}

} // namespace hr
