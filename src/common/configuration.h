#ifndef IDPOOL_CONFIGURATION_H_
#define IDPOOL_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace YAML {
class Node;
}

namespace IdPool {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct IdPoolConfig {
    // Allocator sitting in front of the source
    struct Allocator {
        ConfigValue<int64_t> increment_size{50, "IDPOOL_INCREMENT_SIZE"};
        // Identifiers carved out per thread for calls without a tenant
        ConfigValue<int64_t> sub_pool_size{5000, "IDPOOL_SUB_POOL_SIZE"};
        // int32 | int64 | big_integer
        ConfigValue<std::string> identifier_type{"int64", "IDPOOL_IDENTIFIER_TYPE"};
    } allocator;

    // Authoritative source used by clients of the allocator
    struct Source {
        // memory | grpc
        ConfigValue<std::string> kind{"memory", "IDPOOL_SOURCE_KIND"};
        ConfigValue<std::string> sequence_name{"default", "IDPOOL_SEQUENCE_NAME"};
        // Only used by the in-process source
        ConfigValue<int64_t> initial_value{1, "IDPOOL_SOURCE_INITIAL_VALUE"};
        ConfigValue<std::string> sequencer_address{"localhost:50061", "IDPOOL_SEQUENCER_ADDRESS"};
        ConfigValue<int> rpc_deadline_ms{2000, "IDPOOL_RPC_DEADLINE_MS"};
    } source;

    // Sequencer service (idpool_sequencer)
    struct Sequencer {
        ConfigValue<int> port{50061, "IDPOOL_SEQUENCER_PORT"};
        ConfigValue<int64_t> initial_value{1, "IDPOOL_SEQUENCER_INITIAL_VALUE"};
        // Must match allocator.increment_size of every client
        ConfigValue<int64_t> increment_size{50, "IDPOOL_SEQUENCER_INCREMENT_SIZE"};
    } sequencer;

    struct Logging {
        // glog verbosity (FLAGS_v)
        ConfigValue<int> verbosity{0, "IDPOOL_LOG_VERBOSITY"};
    } logging;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Override with command line arguments
    void overrideFromCommandLine(int argc, char* argv[]);

    // Get the configuration
    const IdPoolConfig& config() const { return config_; }
    IdPoolConfig& config() { return config_; }

    // Restore every value to its built-in default
    void reset() { config_ = IdPoolConfig{}; validation_errors_.clear(); }

    // Helper methods for common access patterns
    int64_t getIncrementSize() const { return config_.allocator.increment_size.get(); }
    int64_t getSubPoolSize() const { return config_.allocator.sub_pool_size.get(); }
    std::string getSequencerAddress() const { return config_.source.sequencer_address.get(); }
    int getSequencerPort() const { return config_.sequencer.port.get(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    IdPoolConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void applyYAML(const YAML::Node& yaml);
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

} // namespace IdPool

#endif // IDPOOL_CONFIGURATION_H_
