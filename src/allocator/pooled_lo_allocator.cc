#include "pooled_lo_allocator.h"

#include <absl/base/attributes.h>
#include <absl/container/flat_hash_set.h>
#include <absl/synchronization/mutex.h>
#include <glog/logging.h>

#include "common/errors.h"

namespace IdPool {

namespace {

// Instance ids are never reused, so a sub-pool left behind in some thread by a
// destroyed allocator can never be picked up by a newer one.
std::atomic<uint64_t> next_instance_id{1};

// Bumped after every allocator destruction; threads sweep their table when it moves.
std::atomic<uint64_t> retired_allocators{0};

ABSL_CONST_INIT absl::Mutex live_instances_mutex(absl::kConstInit);

// Never destroyed: allocators with static storage duration may outlive any
// other static.
absl::flat_hash_set<uint64_t>& LiveInstances() {
    static auto* live = new absl::flat_hash_set<uint64_t>();
    return *live;
}

enum class TableState : uint8_t { kUnused, kAlive, kDestroyed };
thread_local TableState thread_table_state = TableState::kUnused;

std::string DescribeTenant(const TenantKey& tenant) {
    return tenant.has_value() ? "tenant '" + *tenant + "'" : "no-tenant";
}

} // namespace

PooledLoAllocator::ThreadSubPools::ThreadSubPools() {
    thread_table_state = TableState::kAlive;
}

PooledLoAllocator::ThreadSubPools::~ThreadSubPools() {
    thread_table_state = TableState::kDestroyed;
}

PooledLoAllocator::PooledLoAllocator(IntegralType type, int64_t increment_size, int64_t sub_pool_size)
    : type_(type),
      increment_size_(increment_size),
      sub_pool_size_(sub_pool_size),
      instance_id_(next_instance_id.fetch_add(1, std::memory_order_relaxed)) {
    if (increment_size < 1) {
        throw ConfigurationError("increment size cannot be less than 1 (got " +
                                 std::to_string(increment_size) + ")");
    }
    if (sub_pool_size < 1) {
        throw ConfigurationError("sub-pool size cannot be less than 1 (got " +
                                 std::to_string(sub_pool_size) + ")");
    }
    {
        absl::MutexLock lock(&live_instances_mutex);
        LiveInstances().insert(instance_id_);
    }
    LOG(INFO) << "Creating pooled-lo allocator [incrementSize=" << increment_size_
              << ", subPoolSize=" << sub_pool_size_
              << ", identifierType=" << IntegralTypeName(type_) << "]";
}

PooledLoAllocator::~PooledLoAllocator() {
    {
        absl::MutexLock lock(&live_instances_mutex);
        LiveInstances().erase(instance_id_);
    }
    retired_allocators.fetch_add(1, std::memory_order_release);

    // Other threads drop their entries on their next slow path or at exit.
    if (ThreadSubPools* table = CurrentThreadSubPools(false)) {
        table->pools.erase(instance_id_);
    }
}

PooledLoAllocator::ThreadSubPools* PooledLoAllocator::CurrentThreadSubPools(bool create) {
    if (thread_table_state == TableState::kDestroyed) {
        return nullptr;
    }
    if (!create && thread_table_state == TableState::kUnused) {
        return nullptr;
    }
    thread_local ThreadSubPools table;
    return &table;
}

void PooledLoAllocator::DropRetiredSubPools(ThreadSubPools& table) {
    const uint64_t retired = retired_allocators.load(std::memory_order_acquire);
    if (retired == table.retirements_seen) {
        return;
    }
    absl::MutexLock lock(&live_instances_mutex);
    const auto& live = LiveInstances();
    for (auto it = table.pools.begin(); it != table.pools.end();) {
        if (live.contains(it->first)) {
            ++it;
        } else {
            table.pools.erase(it++);
        }
    }
    table.retirements_seen = retired;
}

size_t PooledLoAllocator::ThreadSubPoolCount() {
    ThreadSubPools* table = CurrentThreadSubPools(false);
    return table == nullptr ? 0 : table->pools.size();
}

Identifier PooledLoAllocator::Generate(AccessCallback& callback) {
    const TenantKey tenant = callback.GetTenantIdentifier();
    ThreadSubPools* table = tenant.has_value() ? nullptr : CurrentThreadSubPools(true);

    // Fast path: the calling thread's own sub-pool, no locking.
    if (table != nullptr) {
        auto it = table->pools.find(instance_id_);
        if (it != table->pools.end() && it->second.HasRemaining()) {
            return it->second.cursor->MakeValueThenIncrement();
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    PartitionState& state = registry_.Locate(tenant);
    RefillIfNeeded(state, callback);

    // Tenant calls, and calls from a thread already past its thread_local
    // teardown, are served straight from the partition.
    if (table == nullptr) {
        return state.cursor->MakeValueThenIncrement();
    }
    DropRetiredSubPools(*table);
    return CarveSubPool(state, table->pools[instance_id_]);
}

std::unique_ptr<IntegralHolder> PooledLoAllocator::FetchFromSource(AccessCallback& callback) {
    std::unique_ptr<IntegralHolder> value = callback.GetNextValue();
    if (!value) {
        throw SourceFetchError("Source returned no value for " +
                               DescribeTenant(callback.GetTenantIdentifier()));
    }
    if (value->type() != type_) {
        throw HolderError(std::string("Source returned a ") + IntegralTypeName(value->type()) +
                          " value but the allocator issues " + IntegralTypeName(type_));
    }
    if (!value->initialized()) {
        throw HolderError("Source returned an uninitialized value");
    }
    source_fetches_.fetch_add(1, std::memory_order_relaxed);
    return value;
}

void PooledLoAllocator::RefillIfNeeded(PartitionState& state, AccessCallback& callback) {
    if (!state.NeedsRefill()) {
        return;
    }
    // A block lying entirely at or below zero is empty; fetch again. Nothing is
    // committed to the partition until a usable block arrives.
    std::unique_ptr<IntegralHolder> previous;
    while (true) {
        std::unique_ptr<IntegralHolder> fetched = FetchFromSource(callback);
        if (previous && !fetched->Gt(*previous)) {
            throw SourceFetchError("Source did not advance past " + previous->ToString() +
                                   " for " + DescribeTenant(callback.GetTenantIdentifier()));
        }

        auto upper_limit = fetched->Copy();
        upper_limit->Add(increment_size_);
        auto cursor = fetched->Copy();
        // Sources whose initial value is below one (hsqldb style sequences)
        // lose the non-positive part of the block.
        if (cursor->Lt(1)) {
            cursor->Initialize(1);
        }

        VLOG(1) << "Fetched block for " << DescribeTenant(callback.GetTenantIdentifier())
                << ": source=" << *fetched << " usable=[" << *cursor << ", " << *upper_limit << ")";

        if (cursor->Lt(*upper_limit)) {
            state.last_source_value = std::move(fetched);
            state.upper_limit = std::move(upper_limit);
            state.cursor = std::move(cursor);
            return;
        }
        previous = std::move(fetched);
    }
}

Identifier PooledLoAllocator::CarveSubPool(PartitionState& state, SubPool& local) {
    // Advance the partition by sub_pool_size; if that would overshoot the
    // window, clip the excess so the partition lands exactly on upper_limit.
    const int64_t remaining = state.upper_limit->Difference(*state.cursor);
    auto end = state.cursor->Copy();
    end->Add(sub_pool_size_ < remaining ? sub_pool_size_ : remaining);

    VLOG(2) << "Carved sub-pool [" << *state.cursor << ", " << *end << ") for thread";

    local.cursor = state.cursor->Copy();
    local.upper_limit = end->Copy();
    state.cursor = std::move(end);
    return local.cursor->MakeValueThenIncrement();
}

std::unique_ptr<IntegralHolder> PooledLoAllocator::GetLastSourceValue(const TenantKey& tenant) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const PartitionState* state = registry_.Find(tenant);
    if (state == nullptr || !state->initialized()) {
        throw StateNotInitializedError("Could not locate previous generation state for " +
                                       DescribeTenant(tenant));
    }
    return state->last_source_value->Copy();
}

} // namespace IdPool
