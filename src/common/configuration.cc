#include "configuration.h"
#include <cstdlib>
#include <getopt.h>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace IdPool {

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return static_cast<int64_t>(std::stoll(env_val));
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["idpool"]) {
        LOG(WARNING) << "Configuration has no 'idpool' root; keeping defaults";
        return;
    }
    auto root = yaml["idpool"];

    // Allocator
    if (root["allocator"]) {
        auto allocator = root["allocator"];
        if (allocator["increment_size"]) config_.allocator.increment_size.set(allocator["increment_size"].as<int64_t>());
        if (allocator["sub_pool_size"]) config_.allocator.sub_pool_size.set(allocator["sub_pool_size"].as<int64_t>());
        if (allocator["identifier_type"]) config_.allocator.identifier_type.set(allocator["identifier_type"].as<std::string>());
    }

    // Source
    if (root["source"]) {
        auto source = root["source"];
        if (source["kind"]) config_.source.kind.set(source["kind"].as<std::string>());
        if (source["sequence_name"]) config_.source.sequence_name.set(source["sequence_name"].as<std::string>());
        if (source["initial_value"]) config_.source.initial_value.set(source["initial_value"].as<int64_t>());
        if (source["sequencer_address"]) config_.source.sequencer_address.set(source["sequencer_address"].as<std::string>());
        if (source["rpc_deadline_ms"]) config_.source.rpc_deadline_ms.set(source["rpc_deadline_ms"].as<int>());
    }

    // Sequencer
    if (root["sequencer"]) {
        auto sequencer = root["sequencer"];
        if (sequencer["port"]) config_.sequencer.port.set(sequencer["port"].as<int>());
        if (sequencer["initial_value"]) config_.sequencer.initial_value.set(sequencer["initial_value"].as<int64_t>());
        if (sequencer["increment_size"]) config_.sequencer.increment_size.set(sequencer["increment_size"].as<int64_t>());
    }

    // Logging
    if (root["logging"]) {
        auto logging = root["logging"];
        if (logging["verbosity"]) config_.logging.verbosity.set(logging["verbosity"].as<int>());
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        applyYAML(YAML::LoadFile(filename));
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
    return validate();
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        applyYAML(YAML::Load(yaml_content));
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
    return validate();
}

void Configuration::overrideFromCommandLine(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"config", required_argument, 0, 'f'},
        {"increment-size", required_argument, 0, 'i'},
        {"sub-pool-size", required_argument, 0, 's'},
        {"identifier-type", required_argument, 0, 't'},
        {"source", required_argument, 0, 'k'},
        {"sequencer-address", required_argument, 0, 'a'},
        {"port", required_argument, 0, 'p'},
        {"initial-value", required_argument, 0, 'n'},
        {"verbosity", required_argument, 0, 'v'},
        {0, 0, 0, 0}
    };

    int option_index = 0;
    int c;
    // Unknown flags belong to other parsers
    opterr = 0;
    optind = 1;

    while ((c = getopt_long(argc, argv, "f:i:s:t:k:a:p:n:v:", long_options, &option_index)) != -1) {
        try {
            switch (c) {
                case 'f':
                    loadFromFile(optarg);
                    break;
                case 'i':
                    config_.allocator.increment_size.set(std::stoll(optarg));
                    config_.sequencer.increment_size.set(std::stoll(optarg));
                    break;
                case 's':
                    config_.allocator.sub_pool_size.set(std::stoll(optarg));
                    break;
                case 't':
                    config_.allocator.identifier_type.set(optarg);
                    break;
                case 'k':
                    config_.source.kind.set(optarg);
                    break;
                case 'a':
                    config_.source.sequencer_address.set(optarg);
                    break;
                case 'p':
                    config_.sequencer.port.set(std::stoi(optarg));
                    break;
                case 'n':
                    config_.source.initial_value.set(std::stoll(optarg));
                    config_.sequencer.initial_value.set(std::stoll(optarg));
                    break;
                case 'v':
                    config_.logging.verbosity.set(std::stoi(optarg));
                    break;
                default:
                    break;
            }
        } catch (const std::exception& e) {
            LOG(ERROR) << "Invalid value '" << (optarg ? optarg : "") << "' for option "
                       << (argv[optind - 1] ? argv[optind - 1] : "?") << ": " << e.what();
        }
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    // Allocator
    if (config_.allocator.increment_size.get() < 1) {
        validation_errors_.push_back("Increment size must be at least 1");
    }
    if (config_.allocator.sub_pool_size.get() < 1) {
        validation_errors_.push_back("Sub-pool size must be at least 1");
    }
    const std::string type = config_.allocator.identifier_type.get();
    if (type != "int32" && type != "int64" && type != "big_integer") {
        validation_errors_.push_back("Identifier type must be one of int32, int64, big_integer");
    }

    // Source
    const std::string kind = config_.source.kind.get();
    if (kind != "memory" && kind != "grpc") {
        validation_errors_.push_back("Source kind must be memory or grpc");
    }
    if (config_.source.sequence_name.get().empty()) {
        validation_errors_.push_back("Sequence name cannot be empty");
    }
    if (config_.source.rpc_deadline_ms.get() < 1) {
        validation_errors_.push_back("RPC deadline must be at least 1ms");
    }

    // Sequencer
    if (config_.sequencer.port.get() < 1024 || config_.sequencer.port.get() > 65535) {
        validation_errors_.push_back("Sequencer port must be between 1024 and 65535");
    }
    if (config_.sequencer.increment_size.get() < 1) {
        validation_errors_.push_back("Sequencer increment size must be at least 1");
    }

    if (config_.logging.verbosity.get() < 0) {
        validation_errors_.push_back("Log verbosity cannot be negative");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace IdPool
