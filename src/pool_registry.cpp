#include "h1_client/pool_registry.hpp"

#include <spdlog/spdlog.h>

#include <mutex>
#include <stdexcept>

namespace h1_client {

    PoolRegistry::PoolRegistry(factory_fn make_pool)
        : m_make_pool(std::move(make_pool)) {
        if (!m_make_pool) {
            throw std::invalid_argument("PoolRegistry needs a pool factory");
        }
    }

    PoolRegistry::Shard& PoolRegistry::shard_for(
        const PoolKey& key) const noexcept {
        return m_shards[std::hash<PoolKey>{}(key) % kShardCount];
    }

    PoolRegistry::pool_ptr PoolRegistry::get_or_create(const PoolKey& key) {
        auto& shard = shard_for(key);

        {
            std::shared_lock lock(shard.mutex);
            auto it = shard.pools.find(key);
            if (it != shard.pools.end()) return it->second;
        }

        std::unique_lock lock(shard.mutex);
        auto [it, inserted] = shard.pools.try_emplace(key);
        if (inserted) {
            try {
                it->second = m_make_pool(key);
            } catch (...) {
                shard.pools.erase(it);
                throw;
            }
            SPDLOG_DEBUG("registry: new pool for {}", key.to_string());
        }
        return it->second;
    }

    PoolRegistry::pool_ptr PoolRegistry::find(const PoolKey& key) const {
        auto& shard = shard_for(key);
        std::shared_lock lock(shard.mutex);
        auto it = shard.pools.find(key);
        return it == shard.pools.end() ? nullptr : it->second;
    }

    std::size_t PoolRegistry::size() const {
        std::size_t n = 0;
        for (auto& shard : m_shards) {
            std::shared_lock lock(shard.mutex);
            n += shard.pools.size();
        }
        return n;
    }

    std::vector<PoolRegistry::pool_ptr> PoolRegistry::snapshot() const {
        std::vector<pool_ptr> out;
        for (auto& shard : m_shards) {
            std::shared_lock lock(shard.mutex);
            for (const auto& entry : shard.pools) {
                out.push_back(entry.second);
            }
        }
        return out;
    }

}  // namespace h1_client
