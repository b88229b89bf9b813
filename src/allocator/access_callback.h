#pragma once

#include <memory>
#include <optional>
#include <string>

#include "numeric/integral_holder.h"

namespace IdPool {

// std::nullopt selects the no-tenant partition.
using TenantKey = std::optional<std::string>;

/**
 * Per-call view of the authoritative source handed to an allocator.
 */
class AccessCallback {
public:
    virtual ~AccessCallback() = default;

    // Next raw block-start value. May block on I/O; failures surface as exceptions.
    virtual std::unique_ptr<IntegralHolder> GetNextValue() = 0;

    virtual TenantKey GetTenantIdentifier() const = 0;
};

} // namespace IdPool
