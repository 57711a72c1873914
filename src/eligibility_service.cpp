#include "kgraph/eligibility_service.hpp"

#include "kgraph/errors.hpp"

#include <spdlog/spdlog.h>

namespace kgraph {

// ── InMemoryConfigurationProvider ────────────────────────────────────────────

void InMemoryConfigurationProvider::put(ConfigurationRecord record) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto identity = record.identity;
    records_[identity] = std::move(record);
}

bool InMemoryConfigurationProvider::remove(const ConfigurationIdentity& identity) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return records_.erase(identity) > 0;
}

std::optional<ConfigurationRecord> InMemoryConfigurationProvider::fetch(const ConfigurationIdentity& identity) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = records_.find(identity);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

// ── EligibilityService ───────────────────────────────────────────────────────

EligibilityService::EligibilityService(GraphCache& cache, const ConfigurationProvider& provider,
                                       Evaluator evaluator)
    : cache_(cache), provider_(provider), evaluator_(std::move(evaluator)) {}

EligibilityResult EligibilityService::evaluate(const ConfigurationIdentity& identity,
                                               const CandidateAssignment& candidate,
                                               bool explain) const {
    auto record = provider_.fetch(identity);
    if (!record) {
        spdlog::warn("eligibility_service: no configuration for {}", identity.to_string());
        throw CompileError(CompileErrorKind::UnknownConfiguration,
                           "no configuration for " + identity.to_string());
    }

    // The shared_ptr pins this graph for the whole evaluation, even if the
    // identity is recompiled or evicted meanwhile.
    auto graph = cache_.get_or_compile(identity, *record);
    return evaluator_.evaluate(*graph, candidate, explain);
}

} // namespace kgraph
