#pragma once

#include <memory>
#include <string>

#include <absl/container/flat_hash_map.h>
#include <absl/synchronization/mutex.h>

#include "access_callback.h"
#include "numeric/integral_holder.h"

namespace IdPool {

/**
 * Allocation window of one tenant (or of the no-tenant scope).
 * All three holders stay null until the first block is fetched.
 */
struct PartitionState {
    // last value read from the source
    std::unique_ptr<IntegralHolder> last_source_value;
    // next value to hand out
    std::unique_ptr<IntegralHolder> cursor;
    // the value at which the source is hit again
    std::unique_ptr<IntegralHolder> upper_limit;

    bool initialized() const { return last_source_value != nullptr; }

    // True when the window is uninitialized or exhausted.
    bool NeedsRefill() const {
        return last_source_value == nullptr || !cursor->Lt(*upper_limit);
    }
};

/**
 * Maps a tenant to its PartitionState. Entries are created lazily and never
 * evicted; references returned by Locate stay valid for the registry's lifetime.
 */
class PartitionRegistry {
public:
    PartitionRegistry() = default;
    PartitionRegistry(const PartitionRegistry&) = delete;
    PartitionRegistry& operator=(const PartitionRegistry&) = delete;

    // Returns the partition for tenant, creating an empty one on first use.
    PartitionState& Locate(const TenantKey& tenant);

    // Lookup without creation. nullptr if the partition was never located.
    PartitionState* Find(const TenantKey& tenant);
    const PartitionState* Find(const TenantKey& tenant) const;

    // Number of tenant-specific partitions (the no-tenant one is not counted).
    size_t TenantCount() const;

private:
    PartitionState* FindLocked(const TenantKey& tenant) const ABSL_SHARED_LOCKS_REQUIRED(mutex_);

    mutable absl::Mutex mutex_;
    std::unique_ptr<PartitionState> no_tenant_state_ ABSL_GUARDED_BY(mutex_);
    absl::flat_hash_map<std::string, std::unique_ptr<PartitionState>> tenant_states_ ABSL_GUARDED_BY(mutex_);
};

} // namespace IdPool
