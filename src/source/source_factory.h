#pragma once

#include <memory>

#include "common/configuration.h"
#include "sequence_source.h"

namespace IdPool {

// Builds the source named by config.source.kind. The source always advances by
// the allocator's increment size (in-process) or is checked against it (remote).
// Throws ConfigurationError on an unknown kind or invalid values.
std::unique_ptr<ISequenceSource> MakeSequenceSource(const IdPoolConfig& config);

} // namespace IdPool
