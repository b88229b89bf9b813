#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

#include <absl/container/node_hash_map.h>

#include "allocator.h"
#include "partition_registry.h"

namespace IdPool {

/**
 * Pooled allocator that treats each raw source value as the LOW end of a block
 * of increment_size identifiers: a fetch returning v reserves [v, v + increment_size).
 *
 * Tenant-scoped calls are served straight from the tenant's partition under the
 * allocator mutex. Calls without a tenant are served from a per-thread sub-pool of
 * at most sub_pool_size identifiers carved out of the no-tenant partition, so the
 * common case touches no shared state at all.
 *
 * The source is expected to advance by increment_size per fetch; see
 * ApplyIncrementSizeToSourceValues().
 */
class PooledLoAllocator : public IIdAllocator {
public:
    static constexpr int64_t kDefaultSubPoolSize = 5000;

    // Throws ConfigurationError if increment_size or sub_pool_size is below 1.
    PooledLoAllocator(IntegralType type, int64_t increment_size,
                      int64_t sub_pool_size = kDefaultSubPoolSize);
    ~PooledLoAllocator() override;

    PooledLoAllocator(const PooledLoAllocator&) = delete;
    PooledLoAllocator& operator=(const PooledLoAllocator&) = delete;

    Identifier Generate(AccessCallback& callback) override;

    // Throws StateNotInitializedError if nothing was fetched for the partition yet.
    std::unique_ptr<IntegralHolder> GetLastSourceValue(const TenantKey& tenant = std::nullopt) const override;

    bool ApplyIncrementSizeToSourceValues() const override { return true; }

    int64_t GetIncrementSize() const override { return increment_size_; }
    int64_t GetSubPoolSize() const { return sub_pool_size_; }
    IntegralType GetIdentifierType() const override { return type_; }

    // Number of successful round trips to the source so far.
    uint64_t GetSourceFetchCount() const { return source_fetches_.load(std::memory_order_relaxed); }

    // Sub-pools currently held by the calling thread, across all allocators.
    static size_t ThreadSubPoolCount();

private:
    struct SubPool {
        std::unique_ptr<IntegralHolder> cursor;
        std::unique_ptr<IntegralHolder> upper_limit;

        bool HasRemaining() const { return cursor && cursor->Lt(*upper_limit); }
    };

    // Sub-pools of one thread, keyed by allocator instance id. Entries of
    // destroyed allocators are dropped on the thread's next slow path.
    struct ThreadSubPools {
        ThreadSubPools();
        ~ThreadSubPools();

        absl::node_hash_map<uint64_t, SubPool> pools;
        // Value of the process-wide retirement counter at the last sweep
        uint64_t retirements_seen = 0;
    };

    // nullptr once the calling thread's table has been destroyed, or if
    // create is false and the thread never used one.
    static ThreadSubPools* CurrentThreadSubPools(bool create);
    static void DropRetiredSubPools(ThreadSubPools& table);

    // Caller must hold mutex_.
    void RefillIfNeeded(PartitionState& state, AccessCallback& callback);
    Identifier CarveSubPool(PartitionState& state, SubPool& local);

    std::unique_ptr<IntegralHolder> FetchFromSource(AccessCallback& callback);

    const IntegralType type_;
    const int64_t increment_size_;
    const int64_t sub_pool_size_;
    const uint64_t instance_id_;

    mutable std::mutex mutex_;
    PartitionRegistry registry_;
    std::atomic<uint64_t> source_fetches_{0};
};

} // namespace IdPool
