#include "source_factory.h"

#include <chrono>

#include <glog/logging.h>
#include <grpcpp/grpcpp.h>

#include "common/errors.h"
#include "grpc_sequence_source.h"
#include "in_memory_sequence_source.h"

namespace IdPool {

std::unique_ptr<ISequenceSource> MakeSequenceSource(const IdPoolConfig& config) {
    const IntegralType type = ParseIntegralType(config.allocator.identifier_type.get());
    const int64_t increment_size = config.allocator.increment_size.get();
    const std::string kind = config.source.kind.get();

    if (kind == "memory") {
        return std::make_unique<InMemorySequenceSource>(type, config.source.initial_value.get(),
                                                        increment_size);
    }
    if (kind == "grpc") {
        const std::string address = config.source.sequencer_address.get();
        LOG(INFO) << "Using sequencer at " << address << " for sequence '"
                  << config.source.sequence_name.get() << "'";
        return std::make_unique<GrpcSequenceSource>(
            grpc::CreateChannel(address, grpc::InsecureChannelCredentials()),
            config.source.sequence_name.get(), type,
            std::chrono::milliseconds(config.source.rpc_deadline_ms.get()), increment_size);
    }
    throw ConfigurationError("Unknown source kind '" + kind + "' (expected memory or grpc)");
}

} // namespace IdPool
