#include "partition_registry.h"

namespace IdPool {

PartitionState& PartitionRegistry::Locate(const TenantKey& tenant) {
    {
        absl::ReaderMutexLock lock(&mutex_);
        if (PartitionState* state = FindLocked(tenant)) {
            return *state;
        }
    }

    absl::WriterMutexLock lock(&mutex_);
    if (!tenant.has_value()) {
        if (!no_tenant_state_) {
            no_tenant_state_ = std::make_unique<PartitionState>();
        }
        return *no_tenant_state_;
    }

    auto [it, inserted] = tenant_states_.try_emplace(*tenant);
    if (inserted) {
        it->second = std::make_unique<PartitionState>();
    }
    return *it->second;
}

PartitionState* PartitionRegistry::FindLocked(const TenantKey& tenant) const {
    if (!tenant.has_value()) {
        return no_tenant_state_.get();
    }
    auto it = tenant_states_.find(*tenant);
    return it == tenant_states_.end() ? nullptr : it->second.get();
}

PartitionState* PartitionRegistry::Find(const TenantKey& tenant) {
    absl::ReaderMutexLock lock(&mutex_);
    return FindLocked(tenant);
}

const PartitionState* PartitionRegistry::Find(const TenantKey& tenant) const {
    absl::ReaderMutexLock lock(&mutex_);
    return FindLocked(tenant);
}

size_t PartitionRegistry::TenantCount() const {
    absl::ReaderMutexLock lock(&mutex_);
    return tenant_states_.size();
}

} // namespace IdPool
