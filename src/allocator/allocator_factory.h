#pragma once

#include <memory>

#include "common/configuration.h"
#include "pooled_lo_allocator.h"

namespace IdPool {

// Builds an allocator from the allocator section of config. Logs a warning when
// the configured sequencer advances by a different increment.
// Throws ConfigurationError on invalid values.
std::unique_ptr<PooledLoAllocator> MakeAllocator(const IdPoolConfig& config);

// True when allocator.increment_size and sequencer.increment_size are equal.
bool IncrementSizesAgree(const IdPoolConfig& config);

} // namespace IdPool
