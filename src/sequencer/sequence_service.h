#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <absl/container/flat_hash_map.h>
#include <grpcpp/grpcpp.h>

#include "sequence_service.grpc.pb.h"
#include "numeric/integral_holder.h"
#include "source/in_memory_sequence_source.h"

namespace IdPool {

/**
 * gRPC front of a set of named counters. Sequences are created on first use,
 * all starting at initial_value and advancing by increment_size per call.
 */
class SequenceServiceImpl final : public idpool::sequencer::SequenceService::Service {
public:
    SequenceServiceImpl(IntegralType type, int64_t initial_value, int64_t increment_size);

    grpc::Status NextValue(grpc::ServerContext* context,
                           const idpool::sequencer::NextValueRequest* request,
                           idpool::sequencer::NextValueResponse* response) override;

    size_t sequence_count() const;

private:
    InMemorySequenceSource& Sequence(const std::string& name);

    const IntegralType type_;
    const int64_t initial_value_;
    const int64_t increment_size_;

    mutable std::mutex mutex_;
    absl::flat_hash_map<std::string, std::unique_ptr<InMemorySequenceSource>> sequences_;
};

} // namespace IdPool
