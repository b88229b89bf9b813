#include "sequence_service.h"
#include "common/configuration.h"
#include "common/errors.h"

#include <grpcpp/grpcpp.h>
#include <glog/logging.h>

#include <csignal>
#include <memory>
#include <string>

using grpc::Server;
using namespace IdPool;

namespace {

int RunServer(const IdPoolConfig& config) {
	const std::string server_address = "0.0.0.0:" + std::to_string(config.sequencer.port.get());

	std::unique_ptr<SequenceServiceImpl> service;
	try {
		service = std::make_unique<SequenceServiceImpl>(
				ParseIntegralType(config.allocator.identifier_type.get()),
				config.sequencer.initial_value.get(),
				config.sequencer.increment_size.get());
	} catch (const ConfigurationError& e) {
		LOG(ERROR) << "Invalid sequencer configuration: " << e.what();
		return 1;
	}

	grpc::ServerBuilder builder;
	builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
	builder.RegisterService(service.get());

	std::unique_ptr<Server> server(builder.BuildAndStart());
	if (!server) {
		LOG(ERROR) << "Failed to start the sequencer on " << server_address;
		return 1;
	}

	LOG(INFO) << "Sequencer listening on " << server_address
		<< " [initialValue=" << config.sequencer.initial_value.get()
		<< ", incrementSize=" << config.sequencer.increment_size.get()
		<< ", identifierType=" << config.allocator.identifier_type.get() << "]";

	std::signal(SIGINT, [](int signal) {
			LOG(INFO) << "Received shutdown signal";
			exit(0);
			});

	server->Wait();
	return 0;
}

} // namespace

int main(int argc, char** argv) {
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();
	FLAGS_logtostderr = 1;

	Configuration& configuration = Configuration::getInstance();
	configuration.overrideFromCommandLine(argc, argv);
	if (!configuration.validate()) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Config validation error: " << error;
		}
		return 1;
	}
	FLAGS_v = configuration.config().logging.verbosity.get();

	return RunServer(configuration.config());
}
