#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "glog/logging.h"
#include "cxxopts.hpp"
#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"

#include "allocator/allocator_factory.h"
#include "common/configuration.h"
#include "common/errors.h"
#include "source/source_factory.h"

using namespace IdPool;

namespace {

struct ThreadResult {
    uint64_t issued = 0;
    uint64_t failures = 0;
    // partition ("" for no tenant) -> identifiers, only filled with --verify
    absl::flat_hash_map<std::string, std::vector<std::string>> ids;
};

} // namespace

int main(int argc, char** argv) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = 1;
    std::ios::sync_with_stdio(false);

    cxxopts::Options options("idpool_bench", "Pooled identifier allocator throughput and uniqueness check");
    options.add_options()
        ("c,config", "YAML configuration file", cxxopts::value<std::string>())
        ("t,threads", "Number of allocating threads", cxxopts::value<int>()->default_value("4"))
        ("n,ids_per_thread", "Identifiers requested by each thread", cxxopts::value<uint64_t>()->default_value("1000000"))
        ("tenants", "Number of tenants for tenant-scoped calls", cxxopts::value<int>()->default_value("0"))
        ("tenant_pct", "0..100 percentage of calls that are tenant-scoped", cxxopts::value<int>()->default_value("0"))
        ("increment_size", "Block size fetched per source round trip", cxxopts::value<int64_t>())
        ("sub_pool_size", "Identifiers carved per thread", cxxopts::value<int64_t>())
        ("identifier_type", "int32|int64|big_integer", cxxopts::value<std::string>())
        ("source", "memory|grpc", cxxopts::value<std::string>())
        ("sequencer_address", "host:port of idpool_sequencer", cxxopts::value<std::string>())
        ("verify", "Check that no identifier is issued twice (0/1)", cxxopts::value<int>()->default_value("1"))
        ("v,verbosity", "glog verbosity", cxxopts::value<int>())
        ("h,help", "Print usage");

    auto result = options.parse(argc, argv);
    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    Configuration& configuration = Configuration::getInstance();
    if (result.count("config") && !configuration.loadFromFile(result["config"].as<std::string>())) {
        for (const auto& error : configuration.getValidationErrors()) {
            LOG(ERROR) << "Config validation error: " << error;
        }
        return 1;
    }
    IdPoolConfig& config = configuration.config();
    if (result.count("increment_size")) config.allocator.increment_size.set(result["increment_size"].as<int64_t>());
    if (result.count("sub_pool_size")) config.allocator.sub_pool_size.set(result["sub_pool_size"].as<int64_t>());
    if (result.count("identifier_type")) config.allocator.identifier_type.set(result["identifier_type"].as<std::string>());
    if (result.count("source")) config.source.kind.set(result["source"].as<std::string>());
    if (result.count("sequencer_address")) config.source.sequencer_address.set(result["sequencer_address"].as<std::string>());
    if (result.count("verbosity")) config.logging.verbosity.set(result["verbosity"].as<int>());
    FLAGS_v = config.logging.verbosity.get();

    const int threads = result["threads"].as<int>();
    const uint64_t ids_per_thread = result["ids_per_thread"].as<uint64_t>();
    const int tenants = result["tenants"].as<int>();
    const int tenant_pct = tenants > 0 ? result["tenant_pct"].as<int>() : 0;
    const bool verify = result["verify"].as<int>() != 0;

    if (threads < 1 || tenant_pct < 0 || tenant_pct > 100) {
        LOG(ERROR) << "threads must be >= 1 and tenant_pct within 0..100";
        return 1;
    }

    std::unique_ptr<PooledLoAllocator> allocator;
    std::unique_ptr<ISequenceSource> source;
    try {
        allocator = MakeAllocator(config);
        source = MakeSequenceSource(config);
    } catch (const ConfigurationError& e) {
        LOG(ERROR) << "Invalid configuration: " << e.what();
        return 1;
    }

    std::vector<ThreadResult> results(threads);
    std::atomic<bool> start{false};
    std::vector<std::thread> workers;
    workers.reserve(threads);

    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&, t]() {
            ThreadResult& mine = results[t];
            while (!start.load(std::memory_order_acquire)) {
                std::this_thread::yield();
            }
            for (uint64_t i = 0; i < ids_per_thread; ++i) {
                TenantKey tenant;
                if (static_cast<int>(i % 100) < tenant_pct) {
                    tenant = "tenant-" + std::to_string((t + i) % tenants);
                }
                SourceAccessCallback callback(*source, tenant);
                try {
                    Identifier id = allocator->Generate(callback);
                    ++mine.issued;
                    if (verify) {
                        mine.ids[tenant.value_or("")].push_back(IdentifierToString(id));
                    }
                } catch (const IdPoolError& e) {
                    ++mine.failures;
                    LOG_EVERY_N(ERROR, 1000) << "Generate failed: " << e.what();
                }
            }
        });
    }

    auto begin = std::chrono::steady_clock::now();
    start.store(true, std::memory_order_release);
    for (auto& worker : workers) {
        worker.join();
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - begin);

    uint64_t issued = 0;
    uint64_t failures = 0;
    for (const auto& r : results) {
        issued += r.issued;
        failures += r.failures;
    }
    const double seconds = std::max<int64_t>(elapsed.count(), 1) / 1e6;

    std::cout << "threads=" << threads
              << " increment_size=" << allocator->GetIncrementSize()
              << " sub_pool_size=" << allocator->GetSubPoolSize()
              << " type=" << IntegralTypeName(allocator->GetIdentifierType()) << "\n"
              << "issued=" << issued << " failures=" << failures
              << " source_fetches=" << allocator->GetSourceFetchCount()
              << " elapsed_s=" << seconds
              << " ids_per_s=" << static_cast<uint64_t>(issued / seconds) << std::endl;

    if (verify) {
        absl::flat_hash_map<std::string, absl::flat_hash_set<std::string>> seen;
        uint64_t duplicates = 0;
        for (const auto& r : results) {
            for (const auto& [partition, ids] : r.ids) {
                auto& bucket = seen[partition];
                for (const auto& id : ids) {
                    if (!bucket.insert(id).second) {
                        if (duplicates++ < 10) {
                            LOG(ERROR) << "Duplicate identifier " << id << " in partition '"
                                       << (partition.empty() ? "<no tenant>" : partition) << "'";
                        }
                    }
                }
            }
        }
        if (duplicates > 0) {
            std::cout << "VERIFY FAILED: " << duplicates << " duplicate identifiers" << std::endl;
            return 2;
        }
        std::cout << "verify: all " << issued << " identifiers unique across " << seen.size()
                  << " partition(s)" << std::endl;
    }
    return failures > 0 ? 3 : 0;
}
