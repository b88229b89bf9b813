#pragma once

#include <memory>
#include <string>
#include <utility>

#include "allocator/access_callback.h"
#include "numeric/integral_holder.h"

namespace IdPool {

/**
 * Authoritative counter an allocator refills its blocks from
 */
class ISequenceSource {
public:
    virtual ~ISequenceSource() = default;

    // Returns the current raw value for tenant and advances the counter.
    // Throws SourceFetchError when the value cannot be obtained.
    virtual std::unique_ptr<IntegralHolder> NextValue(const TenantKey& tenant) = 0;

    virtual IntegralType identifier_type() const = 0;
};

/**
 * Binds a source to the tenant of one Generate() call
 */
class SourceAccessCallback : public AccessCallback {
public:
    SourceAccessCallback(ISequenceSource& source, TenantKey tenant = std::nullopt)
        : source_(source), tenant_(std::move(tenant)) {}

    std::unique_ptr<IntegralHolder> GetNextValue() override {
        return source_.NextValue(tenant_);
    }

    TenantKey GetTenantIdentifier() const override { return tenant_; }

private:
    ISequenceSource& source_;
    TenantKey tenant_;
};

} // namespace IdPool
