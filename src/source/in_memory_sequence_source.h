#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <absl/container/flat_hash_map.h>

#include "sequence_source.h"

namespace IdPool {

/**
 * Process-local counter table with one row per tenant (plus the no-tenant row).
 * Each NextValue returns the row's current value and advances it by
 * increment_size, the same way a sequence with INCREMENT BY increment_size would.
 */
class InMemorySequenceSource : public ISequenceSource {
public:
    // Throws ConfigurationError if increment_size is below 1.
    InMemorySequenceSource(IntegralType type, int64_t initial_value, int64_t increment_size);

    std::unique_ptr<IntegralHolder> NextValue(const TenantKey& tenant) override;
    IntegralType identifier_type() const override { return type_; }

    int64_t increment_size() const { return increment_size_; }

    // Number of NextValue calls served, across all rows.
    uint64_t fetch_count() const;

private:
    IntegralHolder& Row(const TenantKey& tenant);

    const IntegralType type_;
    const int64_t initial_value_;
    const int64_t increment_size_;

    mutable std::mutex mutex_;
    std::unique_ptr<IntegralHolder> no_tenant_row_;
    absl::flat_hash_map<std::string, std::unique_ptr<IntegralHolder>> tenant_rows_;
    uint64_t fetch_count_ = 0;
};

} // namespace IdPool
