#pragma once

#include <cstdint>
#include <memory>

#include "access_callback.h"
#include "numeric/integral_holder.h"

namespace IdPool {

/**
 * Interface for identifier allocators sitting in front of an authoritative source
 */
class IIdAllocator {
public:
    virtual ~IIdAllocator() = default;

    virtual Identifier Generate(AccessCallback& callback) = 0;

    // Raw value most recently fetched from the source for the given partition.
    virtual std::unique_ptr<IntegralHolder> GetLastSourceValue(const TenantKey& tenant = std::nullopt) const = 0;

    // True when the source must advance by GetIncrementSize() on every fetch.
    virtual bool ApplyIncrementSizeToSourceValues() const = 0;

    virtual int64_t GetIncrementSize() const = 0;
    virtual IntegralType GetIdentifierType() const = 0;
};

} // namespace IdPool
