#include "kgraph/graph_cache.hpp"

#include "kgraph/errors.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace kgraph {

GraphCache::GraphCache(std::shared_ptr<const RuleCompiler> compiler, CacheOptions options)
    : compiler_(std::move(compiler)), options_(options) {
    if (!compiler_) throw std::invalid_argument("GraphCache requires a rule compiler");
}

// ── Lookup ───────────────────────────────────────────────────────────────────

std::shared_ptr<GraphCache::Entry> GraphCache::find_entry(const ConfigurationIdentity& identity) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(identity);
    return it == entries_.end() ? nullptr : it->second;
}

std::shared_ptr<GraphCache::Entry> GraphCache::find_or_create_entry(const ConfigurationIdentity& identity) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& slot = entries_[identity];
    if (!slot) slot = std::make_shared<Entry>();
    return slot;
}

std::shared_ptr<const CompiledGraph> GraphCache::get_or_compile(const ConfigurationIdentity& identity,
                                                                const ConfigurationRecord& configuration) {
    if (!(configuration.identity == identity)) {
        throw std::invalid_argument("configuration for " + configuration.identity.to_string() +
                                    " submitted under " + identity.to_string());
    }
    const auto wanted = fingerprint(configuration);

    if (auto entry = find_entry(identity)) {
        auto graph = std::atomic_load(&entry->graph);
        if (graph && graph->matches(configuration, wanted)) {
            entry->last_used.store(tick(), std::memory_order_relaxed);
            hits_.fetch_add(1, std::memory_order_relaxed);
            return graph;
        }
    }
    misses_.fetch_add(1, std::memory_order_relaxed);

    std::shared_ptr<const CompiledGraph> fresh;
    {
        auto entry = find_or_create_entry(identity);
        std::lock_guard<std::mutex> compile_lock(entry->compile_mutex);

        // Another caller may have compiled this fingerprint while we waited.
        auto current = std::atomic_load(&entry->graph);
        if (current && current->matches(configuration, wanted)) {
            entry->last_used.store(tick(), std::memory_order_relaxed);
            return current;
        }

        try {
            fresh = std::make_shared<const CompiledGraph>(compiler_->compile(configuration));
        } catch (const CompileError& e) {
            spdlog::warn("graph_cache: compiling {} failed: {}", identity.to_string(), e.what());
            if (!current) {
                std::unique_lock<std::shared_mutex> lock(mutex_);
                auto it = entries_.find(identity);
                if (it != entries_.end() && it->second == entry) entries_.erase(it);
            }
            throw;
        }

        std::atomic_store(&entry->graph, fresh);
        entry->last_used.store(tick(), std::memory_order_relaxed);
        compilations_.fetch_add(1, std::memory_order_relaxed);
        spdlog::info("graph_cache: {} {} (version '{}', fingerprint {:016x}, {} values, {} relations)",
                     current ? "recompiled" : "compiled", identity.to_string(),
                     fresh->version(), fresh->fingerprint(),
                     fresh->value_count(), fresh->constraint_count());
    }

    evict_if_needed(identity);
    return fresh;
}

std::shared_ptr<const CompiledGraph> GraphCache::peek(const ConfigurationIdentity& identity) const {
    auto entry = find_entry(identity);
    return entry ? std::atomic_load(&entry->graph) : nullptr;
}

// ── Invalidation and eviction ────────────────────────────────────────────────

bool GraphCache::invalidate(const ConfigurationIdentity& identity) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(identity);
    if (it == entries_.end()) return false;
    entries_.erase(it);
    invalidations_.fetch_add(1, std::memory_order_relaxed);
    spdlog::info("graph_cache: invalidated {}", identity.to_string());
    return true;
}

void GraphCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    invalidations_.fetch_add(entries_.size(), std::memory_order_relaxed);
    entries_.clear();
}

void GraphCache::evict_if_needed(const ConfigurationIdentity& keep) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    while (entries_.size() > options_.max_identities) {
        auto victim = entries_.end();
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            if (it->first == keep) continue;
            if (victim == entries_.end() ||
                it->second->last_used.load(std::memory_order_relaxed) <
                    victim->second->last_used.load(std::memory_order_relaxed)) {
                victim = it;
            }
        }
        if (victim == entries_.end()) break;

        spdlog::info("graph_cache: evicted {}", victim->first.to_string());
        entries_.erase(victim);
        evictions_.fetch_add(1, std::memory_order_relaxed);
    }
}

// ── Introspection ────────────────────────────────────────────────────────────

std::size_t GraphCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

CacheStats GraphCache::stats() const {
    CacheStats s;
    s.hits          = hits_.load(std::memory_order_relaxed);
    s.misses        = misses_.load(std::memory_order_relaxed);
    s.compilations  = compilations_.load(std::memory_order_relaxed);
    s.evictions     = evictions_.load(std::memory_order_relaxed);
    s.invalidations = invalidations_.load(std::memory_order_relaxed);
    return s;
}

} // namespace kgraph
