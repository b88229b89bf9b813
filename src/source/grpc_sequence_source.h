#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "sequence_service.grpc.pb.h"
#include "sequence_source.h"

namespace IdPool {

/**
 * Source backed by a remote idpool_sequencer.
 *
 *   GrpcSequenceSource source(grpc::CreateChannel("localhost:50061",
 *                                                 grpc::InsecureChannelCredentials()),
 *                             "orders", IntegralType::kInt64, std::chrono::milliseconds(2000));
 *
 * Every NextValue is one blocking RPC bounded by the deadline. A failed RPC is
 * logged and rethrown as SourceFetchError; nothing is retried here.
 */
class GrpcSequenceSource : public ISequenceSource {
public:
    // expected_increment_size > 0 enables a one-time warning when the server
    // advances its sequences by a different amount.
    GrpcSequenceSource(std::shared_ptr<grpc::Channel> channel,
                       std::string sequence_name,
                       IntegralType type,
                       std::chrono::milliseconds deadline,
                       int64_t expected_increment_size = 0);

    std::unique_ptr<IntegralHolder> NextValue(const TenantKey& tenant) override;
    IntegralType identifier_type() const override { return type_; }

    const std::string& sequence_name() const { return sequence_name_; }

private:
    std::unique_ptr<idpool::sequencer::SequenceService::Stub> stub_;
    const std::string sequence_name_;
    const IntegralType type_;
    const std::chrono::milliseconds deadline_;
    const int64_t expected_increment_size_;
    std::atomic<bool> increment_mismatch_logged_{false};
};

} // namespace IdPool
