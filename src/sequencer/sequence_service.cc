#include "sequence_service.h"

#include <glog/logging.h>

#include "common/errors.h"

using grpc::ServerContext;
using grpc::Status;
using idpool::sequencer::NextValueRequest;
using idpool::sequencer::NextValueResponse;

namespace IdPool {

SequenceServiceImpl::SequenceServiceImpl(IntegralType type, int64_t initial_value, int64_t increment_size)
    : type_(type), initial_value_(initial_value), increment_size_(increment_size) {
    if (increment_size < 1) {
        throw ConfigurationError("sequencer increment size cannot be less than 1");
    }
    try {
        MakeHolder(type_, initial_value_);
    } catch (const HolderError& e) {
        throw ConfigurationError(std::string("Invalid sequencer initial value: ") + e.what());
    }
}

InMemorySequenceSource& SequenceServiceImpl::Sequence(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& sequence = sequences_[name];
    if (!sequence) {
        LOG(INFO) << "Creating sequence '" << name << "' [initialValue=" << initial_value_
                  << ", incrementSize=" << increment_size_ << "]";
        sequence = std::make_unique<InMemorySequenceSource>(type_, initial_value_, increment_size_);
    }
    return *sequence;
}

Status SequenceServiceImpl::NextValue(ServerContext* context, const NextValueRequest* request,
                                      NextValueResponse* response) {
    if (request->sequence_name().empty()) {
        return Status(grpc::StatusCode::INVALID_ARGUMENT, "Sequence name cannot be empty");
    }

    TenantKey tenant;
    if (request->has_tenant()) {
        tenant = request->tenant_id();
    }

    try {
        auto value = Sequence(request->sequence_name()).NextValue(tenant);
        response->set_value(value->ToString());
        response->set_increment_size(increment_size_);
    } catch (const SourceFetchError& e) {
        LOG(ERROR) << "NextValue failed for sequence '" << request->sequence_name() << "': " << e.what();
        return Status(grpc::StatusCode::RESOURCE_EXHAUSTED, e.what());
    }

    VLOG(1) << "NextValue " << request->sequence_name()
            << (request->has_tenant() ? " tenant=" + request->tenant_id() : std::string())
            << " -> " << response->value() << " (peer " << context->peer() << ")";
    return Status::OK;
}

size_t SequenceServiceImpl::sequence_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sequences_.size();
}

} // namespace IdPool
