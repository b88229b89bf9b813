#include "grpc_sequence_source.h"

#include <glog/logging.h>

#include "common/errors.h"

using grpc::ClientContext;
using grpc::Status;
using idpool::sequencer::NextValueRequest;
using idpool::sequencer::NextValueResponse;
using idpool::sequencer::SequenceService;

namespace IdPool {

GrpcSequenceSource::GrpcSequenceSource(std::shared_ptr<grpc::Channel> channel,
                                       std::string sequence_name,
                                       IntegralType type,
                                       std::chrono::milliseconds deadline,
                                       int64_t expected_increment_size)
    : stub_(SequenceService::NewStub(std::move(channel))),
      sequence_name_(std::move(sequence_name)),
      type_(type),
      deadline_(deadline),
      expected_increment_size_(expected_increment_size) {
    if (sequence_name_.empty()) {
        throw ConfigurationError("sequence name cannot be empty");
    }
}

std::unique_ptr<IntegralHolder> GrpcSequenceSource::NextValue(const TenantKey& tenant) {
    NextValueRequest request;
    request.set_sequence_name(sequence_name_);
    if (tenant.has_value()) {
        request.set_has_tenant(true);
        request.set_tenant_id(*tenant);
    }

    NextValueResponse response;
    ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + deadline_);

    Status status = stub_->NextValue(&context, request, &response);
    if (!status.ok()) {
        LOG(ERROR) << "NextValue(" << sequence_name_ << ") failed: [" << status.error_code() << "] "
                   << status.error_message();
        throw SourceFetchError("NextValue for sequence '" + sequence_name_ + "' failed: " +
                               status.error_message());
    }

    if (expected_increment_size_ > 0 && response.increment_size() != expected_increment_size_ &&
        !increment_mismatch_logged_.exchange(true)) {
        LOG(WARNING) << "Sequencer advances '" << sequence_name_ << "' by " << response.increment_size()
                     << " but the allocator expects " << expected_increment_size_
                     << "; identifiers may collide";
    }

    auto value = MakeHolder(type_);
    try {
        value->Initialize(response.value());
    } catch (const HolderError& e) {
        throw SourceFetchError("Sequencer returned unusable value '" + response.value() + "': " + e.what());
    }
    return value;
}

} // namespace IdPool
