#include "allocator_factory.h"

#include <glog/logging.h>

namespace IdPool {

bool IncrementSizesAgree(const IdPoolConfig& config) {
    return config.allocator.increment_size.get() == config.sequencer.increment_size.get();
}

std::unique_ptr<PooledLoAllocator> MakeAllocator(const IdPoolConfig& config) {
    const IntegralType type = ParseIntegralType(config.allocator.identifier_type.get());
    if (!IncrementSizesAgree(config)) {
        LOG(WARNING) << "Allocator increment size " << config.allocator.increment_size.get()
                     << " differs from sequencer increment size " << config.sequencer.increment_size.get()
                     << "; identifiers may collide";
    }
    return std::make_unique<PooledLoAllocator>(type,
                                               config.allocator.increment_size.get(),
                                               config.allocator.sub_pool_size.get());
}

} // namespace IdPool
