#pragma once

#include "kgraph/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace kgraph {

using NodeId = std::size_t;
using EdgeId = std::size_t;

enum class NodeKind { Value, All, Any, Not, Always };

// Requires and Excludes come from rules; the remaining kinds link an
// aggregation node to its children.
enum class RelationKind { Requires, Excludes, ImpliedByAll, ImpliedByAny, Negates };

inline bool is_constraint(RelationKind k) {
    return k == RelationKind::Requires || k == RelationKind::Excludes;
}

inline std::ostream& operator<<(std::ostream& os, NodeKind k) {
    switch (k) {
        case NodeKind::Value:  return os << "Value";
        case NodeKind::All:    return os << "All";
        case NodeKind::Any:    return os << "Any";
        case NodeKind::Not:    return os << "Not";
        case NodeKind::Always: return os << "Always";
        default:               return os << "Unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, RelationKind k) {
    switch (k) {
        case RelationKind::Requires:     return os << "Requires";
        case RelationKind::Excludes:     return os << "Excludes";
        case RelationKind::ImpliedByAll: return os << "ImpliedByAll";
        case RelationKind::ImpliedByAny: return os << "ImpliedByAny";
        case RelationKind::Negates:      return os << "Negates";
        default:                         return os << "Unknown";
    }
}

struct GraphNode {
    NodeKind            kind = NodeKind::Value;
    DomainValue         value;                  // Value nodes only
    ValueOrigin         origin = ValueOrigin::Catalog;
    bool                sensitive = false;
    std::vector<NodeId> children;               // aggregation nodes only, sorted
};

struct RelationEdge {
    RelationKind kind = RelationKind::Requires;
    NodeId       source = 0;
    NodeId       target = 0;
    Strength     strength = Strength::Strong;
    std::string  rule;                          // empty for aggregation membership
    std::size_t  rule_index = 0;
};

/**
 * CompiledGraph
 *
 * The node and relation set compiled from one configuration record. Never
 * modified after construction; the cache hands it out as
 * std::shared_ptr<const CompiledGraph> so concurrent evaluations can share it.
 *
 * Besides the raw structure the graph keeps two lookup tables built once at
 * construction:
 *   - a value index from DomainValue to its node;
 *   - a trigger index listing, for every value node, the constraint edges
 *     that node can activate (edges whose source it feeds through All/Any
 *     aggregations, and exclusions on either side).
 */
class CompiledGraph {
public:
    CompiledGraph(ConfigurationIdentity identity, std::string version,
                  std::uint64_t fingerprint, std::vector<GraphNode> nodes,
                  std::vector<RelationEdge> edges,
                  std::vector<DomainValue> sensitive_values = {});

    const ConfigurationIdentity& identity() const { return identity_; }
    const std::string& version() const { return version_; }
    std::uint64_t fingerprint() const { return fingerprint_; }

    /// True when this graph was compiled from `record`: same identity,
    /// version marker and fingerprint.
    bool matches(const ConfigurationRecord& record, std::uint64_t record_fingerprint) const;

    const std::vector<GraphNode>& nodes() const { return nodes_; }
    const std::vector<RelationEdge>& edges() const { return edges_; }
    const GraphNode& node(NodeId id) const { return nodes_.at(id); }
    const RelationEdge& edge(EdgeId id) const { return edges_.at(id); }

    std::optional<NodeId> find(const DomainValue& value) const;

    const std::vector<EdgeId>& triggers(NodeId value_node) const { return triggers_.at(value_node); }

    /// Sorted categories of every value node at or below `id`.
    const std::vector<std::string>& categories_under(NodeId id) const { return categories_.at(id); }

    std::size_t value_count() const { return index_.size(); }
    std::size_t aggregation_count() const;
    std::size_t constraint_count() const;

    /// Human-readable node label; sensitive values print as `mask_token`.
    std::string label(NodeId id, const std::string& mask_token) const;

    /// Rule name with every occurrence of a sensitive value replaced by
    /// `mask_token`. An occurrence glued to a neighbouring letter, digit or
    /// '_' is part of a longer word and stays as is.
    std::string rule_label(const std::string& rule, const std::string& mask_token) const;

private:
    void collect_activators(NodeId id, std::vector<NodeId>& out) const;

    ConfigurationIdentity                                    identity_;
    std::string                                              version_;
    std::uint64_t                                            fingerprint_;
    std::vector<GraphNode>                                   nodes_;
    std::vector<RelationEdge>                                edges_;
    std::unordered_map<DomainValue, NodeId, DomainValueHash> index_;
    std::vector<std::vector<EdgeId>>                         triggers_;
    std::vector<std::vector<std::string>>                    categories_;
    std::vector<std::string>                                 sensitive_words_;   // longest first
};

} // namespace kgraph
