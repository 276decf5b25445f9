#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "h1_client/connection_pool.hpp"
#include "h1_client/remote_address.hpp"

namespace h1_client {

    /**
     * @brief Concurrent map from PoolKey to the one ConnectionPool serving
     * it.
     *
     * The map is split into shards so lookups for different addresses never
     * contend. Pools are created on first use and live as long as the
     * registry. No lock is held once a call returns.
     */
    class PoolRegistry {
       public:
        using pool_ptr = std::shared_ptr<ConnectionPool>;
        using factory_fn = std::function<pool_ptr(const PoolKey&)>;

        static constexpr std::size_t kShardCount = 16;

        /// @param make_pool Builds the pool for a key on first use. Called
        /// under the shard's exclusive lock, at most once per key.
        explicit PoolRegistry(factory_fn make_pool);

        PoolRegistry(const PoolRegistry&) = delete;
        PoolRegistry& operator=(const PoolRegistry&) = delete;

        /// @brief The pool for @p key, creating it if absent. Concurrent
        /// callers with the same key get the same pool.
        pool_ptr get_or_create(const PoolKey& key);

        /// @brief The pool for @p key, or nullptr.
        pool_ptr find(const PoolKey& key) const;

        std::size_t size() const;

        /// @brief Every pool currently registered, in no particular order.
        std::vector<pool_ptr> snapshot() const;

       private:
        struct Shard {
            mutable std::shared_mutex mutex;
            std::unordered_map<PoolKey, pool_ptr> pools;
        };

        Shard& shard_for(const PoolKey& key) const noexcept;

        factory_fn m_make_pool;
        mutable std::array<Shard, kShardCount> m_shards;
    };

}  // namespace h1_client
