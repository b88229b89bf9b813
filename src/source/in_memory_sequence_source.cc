#include "in_memory_sequence_source.h"

#include <glog/logging.h>

#include "common/errors.h"

namespace IdPool {

InMemorySequenceSource::InMemorySequenceSource(IntegralType type, int64_t initial_value,
                                               int64_t increment_size)
    : type_(type), initial_value_(initial_value), increment_size_(increment_size) {
    if (increment_size < 1) {
        throw ConfigurationError("sequence increment size cannot be less than 1 (got " +
                                 std::to_string(increment_size) + ")");
    }
    // Fail on an out of range initial value now rather than on first fetch.
    MakeHolder(type_, initial_value_);
}

IntegralHolder& InMemorySequenceSource::Row(const TenantKey& tenant) {
    if (!tenant.has_value()) {
        if (!no_tenant_row_) {
            no_tenant_row_ = MakeHolder(type_, initial_value_);
        }
        return *no_tenant_row_;
    }
    auto& row = tenant_rows_[*tenant];
    if (!row) {
        VLOG(1) << "Creating sequence row for tenant '" << *tenant << "' at " << initial_value_;
        row = MakeHolder(type_, initial_value_);
    }
    return *row;
}

std::unique_ptr<IntegralHolder> InMemorySequenceSource::NextValue(const TenantKey& tenant) {
    std::lock_guard<std::mutex> lock(mutex_);
    IntegralHolder& row = Row(tenant);
    auto value = row.Copy();
    try {
        row.Add(increment_size_);
    } catch (const HolderError& e) {
        throw SourceFetchError(std::string("Sequence exhausted: ") + e.what());
    }
    ++fetch_count_;
    return value;
}

uint64_t InMemorySequenceSource::fetch_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fetch_count_;
}

} // namespace IdPool
