#pragma once

#include "kgraph/compiled_graph.hpp"
#include "kgraph/rule_compiler.hpp"
#include "kgraph/types.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace kgraph {

struct CacheOptions {
    std::size_t max_identities = 1024;
};

struct CacheStats {
    std::uint64_t hits          = 0;
    std::uint64_t misses        = 0;
    std::uint64_t compilations  = 0;
    std::uint64_t evictions     = 0;
    std::uint64_t invalidations = 0;
};

/**
 * GraphCache
 *
 * Holds one compiled graph per configuration identity.
 *
 * A cached graph is served as long as its version marker and fingerprint
 * equal those of the configuration submitted with the request; otherwise
 * the identity is recompiled and the new graph replaces the old one in a
 * single pointer swap.
 * Callers keep the shared_ptr they were handed, so a replacement or eviction
 * never changes the graph an in-flight evaluation is reading.
 *
 * Locking:
 *   - the identity map sits behind a shared_mutex; hits only take it shared;
 *   - every identity has its own compile mutex, so two requests for the same
 *     stale identity compile once while other identities proceed untouched.
 *
 * When more than max_identities are cached the least recently used identity
 * is dropped.
 */
class GraphCache {
public:
    explicit GraphCache(std::shared_ptr<const RuleCompiler> compiler,
                        CacheOptions options = CacheOptions());

    GraphCache(const GraphCache&) = delete;
    GraphCache& operator=(const GraphCache&) = delete;

    /// Throws CompileError when the configuration does not compile; the
    /// previously cached graph for the identity, if any, stays in place.
    /// Throws std::invalid_argument when `configuration` belongs to another
    /// identity.
    std::shared_ptr<const CompiledGraph> get_or_compile(const ConfigurationIdentity& identity,
                                                        const ConfigurationRecord& configuration);

    /// Currently cached graph, without compiling.
    std::shared_ptr<const CompiledGraph> peek(const ConfigurationIdentity& identity) const;

    /// Returns false when nothing was cached for the identity.
    bool invalidate(const ConfigurationIdentity& identity);
    void clear();

    std::size_t size() const;
    CacheStats stats() const;

private:
    struct Entry {
        std::mutex                           compile_mutex;
        std::shared_ptr<const CompiledGraph> graph;        // std::atomic_load / atomic_store only
        std::atomic<std::uint64_t>           last_used{0};
    };

    std::shared_ptr<Entry> find_entry(const ConfigurationIdentity& identity) const;
    std::shared_ptr<Entry> find_or_create_entry(const ConfigurationIdentity& identity);
    void evict_if_needed(const ConfigurationIdentity& keep);
    std::uint64_t tick() { return clock_.fetch_add(1, std::memory_order_relaxed) + 1; }

    std::shared_ptr<const RuleCompiler> compiler_;
    CacheOptions                        options_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<ConfigurationIdentity, std::shared_ptr<Entry>, ConfigurationIdentityHash> entries_;

    std::atomic<std::uint64_t> clock_{0};
    std::atomic<std::uint64_t> hits_{0};
    std::atomic<std::uint64_t> misses_{0};
    std::atomic<std::uint64_t> compilations_{0};
    std::atomic<std::uint64_t> evictions_{0};
    std::atomic<std::uint64_t> invalidations_{0};
};

} // namespace kgraph
