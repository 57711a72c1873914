#pragma once

#include "kgraph/evaluator.hpp"
#include "kgraph/graph_cache.hpp"
#include "kgraph/types.hpp"

#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

namespace kgraph {

/// Source of configuration records, owned outside the library.
class ConfigurationProvider {
public:
    virtual ~ConfigurationProvider() = default;

    virtual std::optional<ConfigurationRecord> fetch(const ConfigurationIdentity& identity) const = 0;
};

/// Thread-safe provider backed by a map; records are replaced wholesale.
class InMemoryConfigurationProvider : public ConfigurationProvider {
public:
    void put(ConfigurationRecord record);
    bool remove(const ConfigurationIdentity& identity);

    std::optional<ConfigurationRecord> fetch(const ConfigurationIdentity& identity) const override;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<ConfigurationIdentity, ConfigurationRecord, ConfigurationIdentityHash> records_;
};

/**
 * EligibilityService
 *
 * The query surface: evaluate(identity, candidate, explain).
 *
 * Fetches the identity's configuration, obtains its graph from the cache
 * (compiling on a miss or a fingerprint change) and evaluates the candidate
 * against that graph. Compile failures propagate as CompileError; an identity
 * the provider does not know raises CompileError(UnknownConfiguration).
 */
class EligibilityService {
public:
    EligibilityService(GraphCache& cache, const ConfigurationProvider& provider,
                       Evaluator evaluator = Evaluator());

    EligibilityResult evaluate(const ConfigurationIdentity& identity,
                               const CandidateAssignment& candidate,
                               bool explain = false) const;

private:
    GraphCache&                  cache_;
    const ConfigurationProvider& provider_;
    Evaluator                    evaluator_;
};

} // namespace kgraph
