#include "kgraph/rule_compiler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace kgraph {

namespace {

using ValueSet = std::unordered_set<DomainValue, DomainValueHash>;

constexpr std::size_t none = static_cast<std::size_t>(-1);

// ── Validation ───────────────────────────────────────────────────────────────

void validate_values(const std::vector<DomainValue>& values, const Rule& rule,
                     std::size_t index, const DomainCatalog& catalog,
                     const ValueSet& custom) {
    for (const auto& v : values) {
        if (v.category.empty() || v.value.empty()) {
            throw CompileError(CompileErrorKind::MalformedRule,
                "rule '" + rule.name + "' references a value with an empty category or value",
                index, rule.name, v);
        }
        if (!catalog.contains(v) && custom.count(v) == 0) {
            throw CompileError(CompileErrorKind::UnknownDomainValue,
                "rule '" + rule.name + "' references unknown value " + to_string(v),
                index, rule.name, v);
        }
    }
}

void validate_rule(const Rule& rule, std::size_t index, const DomainCatalog& catalog,
                   const ValueSet& custom) {
    if (rule.unconditional) {
        if (!rule.when.empty() || !rule.unless.empty()) {
            throw CompileError(CompileErrorKind::MalformedRule,
                "rule '" + rule.name + "' is unconditional but also carries a precondition",
                index, rule.name);
        }
    } else if (rule.when.empty()) {
        throw CompileError(CompileErrorKind::MalformedRule,
            "rule '" + rule.name + "' has no precondition", index, rule.name);
    }
    if (rule.then.empty()) {
        throw CompileError(CompileErrorKind::MalformedRule,
            "rule '" + rule.name + "' has no consequence", index, rule.name);
    }
    validate_values(rule.when, rule, index, catalog, custom);
    validate_values(rule.unless, rule, index, catalog, custom);
    validate_values(rule.then, rule, index, catalog, custom);
}

// ── GraphBuilder ─────────────────────────────────────────────────────────────

class GraphBuilder {
public:
    GraphBuilder(const DomainCatalog& catalog, const ConfigurationRecord& record)
        : catalog_(catalog),
          sensitive_(record.sensitive_values.begin(), record.sensitive_values.end()) {}

    NodeId value_node(const DomainValue& v) {
        auto it = values_.find(v);
        if (it != values_.end()) return it->second;

        GraphNode n;
        n.kind      = NodeKind::Value;
        n.value     = v;
        n.origin    = catalog_.contains(v) ? ValueOrigin::Catalog : ValueOrigin::Configuration;
        n.sensitive = sensitive_.count(v) > 0;
        nodes_.push_back(std::move(n));
        values_.emplace(v, nodes_.size() - 1);
        return nodes_.size() - 1;
    }

    std::vector<NodeId> value_nodes(const std::vector<DomainValue>& values) {
        std::vector<NodeId> ids;
        ids.reserve(values.size());
        for (const auto& v : values) ids.push_back(value_node(v));
        std::sort(ids.begin(), ids.end());
        ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
        return ids;
    }

    // Aggregations are keyed by kind and sorted child set, so the same
    // combination always maps to one node regardless of rule order.
    NodeId aggregate(NodeKind kind, std::vector<NodeId> children) {
        std::sort(children.begin(), children.end());
        children.erase(std::unique(children.begin(), children.end()), children.end());

        auto key = std::make_pair(kind, children);
        auto it = aggregations_.find(key);
        if (it != aggregations_.end()) return it->second;

        GraphNode n;
        n.kind     = kind;
        n.children = children;
        nodes_.push_back(std::move(n));
        NodeId id = nodes_.size() - 1;
        aggregations_.emplace(std::move(key), id);

        RelationKind membership = kind == NodeKind::All ? RelationKind::ImpliedByAll
                                : kind == NodeKind::Any ? RelationKind::ImpliedByAny
                                                        : RelationKind::Negates;
        for (NodeId child : children) {
            RelationEdge e;
            e.kind   = membership;
            e.source = child;
            e.target = id;
            memberships_.push_back(e);
        }
        return id;
    }

    NodeId always() {
        if (!always_) {
            GraphNode n;
            n.kind = NodeKind::Always;
            nodes_.push_back(std::move(n));
            always_ = nodes_.size() - 1;
        }
        return *always_;
    }

    NodeId precondition(const Rule& rule) {
        if (rule.unconditional) return always();

        auto when = value_nodes(rule.when);
        if (rule.unless.empty()) {
            return when.size() == 1 ? when.front() : aggregate(NodeKind::All, when);
        }

        auto unless = value_nodes(rule.unless);
        NodeId any_unless = unless.size() == 1 ? unless.front() : aggregate(NodeKind::Any, unless);
        when.push_back(aggregate(NodeKind::Not, { any_unless }));
        return aggregate(NodeKind::All, when);
    }

    // A rule overrides an earlier relation only when both hang off the same
    // precondition and disagree on the kind. Contradictions between
    // unconditional rules are left in place for the consistency pass.
    void require(NodeId source, NodeId target, Strength strength,
                 const Rule& rule, std::size_t index) {
        auto clash = excludes_.find({ source, target });
        if (clash != excludes_.end() && !anchored(source)) {
            drop(clash->second, rule);
            excludes_.erase(clash);
        }
        place(requires_, RelationKind::Requires, source, target, strength, rule, index);
    }

    void exclude(NodeId source, NodeId target, const Rule& rule, std::size_t index) {
        auto clash = requires_.find({ source, target });
        if (clash != requires_.end() && !anchored(source)) {
            drop(clash->second, rule);
            requires_.erase(clash);
        }
        place(excludes_, RelationKind::Excludes, source, target, Strength::Strong, rule, index);
    }

    std::vector<GraphNode>& nodes() { return nodes_; }

    // Constraint relations in the order their pair was first related,
    // followed by aggregation memberships. "A excludes B" and "B excludes A"
    // are one symmetric relation; the one placed first is kept.
    std::vector<RelationEdge> edges() const {
        std::vector<RelationEdge> out;
        out.reserve(relations_.size() + memberships_.size());
        for (std::size_t slot = 0; slot < relations_.size(); ++slot) {
            const auto& r = relations_[slot];
            if (!r) continue;
            if (r->kind == RelationKind::Excludes) {
                auto mirror = excludes_.find({ r->target, r->source });
                if (mirror != excludes_.end() && mirror->second < slot) continue;
            }
            out.push_back(*r);
        }
        out.insert(out.end(), memberships_.begin(), memberships_.end());
        return out;
    }

private:
    using SlotMap = std::map<std::pair<NodeId, NodeId>, std::size_t>;

    bool anchored(NodeId source) const { return always_ && *always_ == source; }

    void place(SlotMap& slots, RelationKind kind, NodeId source, NodeId target,
               Strength strength, const Rule& rule, std::size_t index) {
        RelationEdge e;
        e.kind       = kind;
        e.source     = source;
        e.target     = target;
        e.strength   = strength;
        e.rule       = rule.name;
        e.rule_index = index;

        auto it = slots.find({ source, target });
        if (it != slots.end()) {
            // Same relation restated: a strong requirement implies the weak
            // one, so strength never decreases.
            auto& existing = relations_[it->second];
            if (existing->strength == Strength::Strong && strength == Strength::Weak) return;
            existing = std::move(e);
            return;
        }
        relations_.push_back(std::move(e));
        slots.emplace(std::make_pair(source, target), relations_.size() - 1);
    }

    void drop(std::size_t slot, const Rule& rule) {
        spdlog::debug("rule_compiler: rule '{}' overrides contradictory relation from rule '{}'",
                      rule.name, relations_[slot]->rule);
        relations_[slot].reset();
    }

    const DomainCatalog&                                     catalog_;
    ValueSet                                                 sensitive_;
    std::vector<GraphNode>                                   nodes_;
    std::unordered_map<DomainValue, NodeId, DomainValueHash> values_;
    std::map<std::pair<NodeKind, std::vector<NodeId>>, NodeId> aggregations_;
    std::optional<NodeId>                                    always_;
    std::vector<std::optional<RelationEdge>>                 relations_;
    SlotMap                                                  requires_;
    SlotMap                                                  excludes_;
    std::vector<RelationEdge>                                memberships_;
};

// ── Consistency pass ─────────────────────────────────────────────────────────

/**
 * Propagates what unconditional rules force. A node is forced true when an
 * Always-anchored strong requirement (or a chain of them) reaches it, and
 * forced false when an exclusion pairs it with a forced-true node. Marks only
 * ever get added, so the loop reaches a fixpoint.
 */
class ConsistencyCheck {
public:
    ConsistencyCheck(const std::vector<GraphNode>& nodes, const std::vector<RelationEdge>& edges)
        : nodes_(nodes), edges_(edges),
          true_by_(nodes.size(), none), false_by_(nodes.size(), none) {}

    void run() {
        bool changed = true;
        while (changed) {
            changed = false;
            for (EdgeId e = 0; e < edges_.size(); ++e) {
                const auto& edge = edges_[e];
                if (edge.kind == RelationKind::Requires) {
                    if (edge.strength == Strength::Strong && forced_true(edge.source)) {
                        changed |= mark_true(edge.target, e);
                    }
                } else if (edge.kind == RelationKind::Excludes) {
                    if (forced_true(edge.source)) changed |= mark_false(edge.target, e);
                    if (forced_true(edge.target)) changed |= mark_false(edge.source, e);
                }
            }
        }

        for (NodeId id = 0; id < nodes_.size(); ++id) {
            if (forced_true(id) && forced_false(id)) {
                fail(id, blame_true(id), blame_false(id));
            }
        }
    }

private:
    bool forced_true(NodeId id) const {
        const auto& n = nodes_[id];
        switch (n.kind) {
            case NodeKind::Always: return true;
            case NodeKind::Value:  return true_by_[id] != none;
            case NodeKind::All:
                return true_by_[id] != none ||
                       std::all_of(n.children.begin(), n.children.end(),
                                   [this](NodeId c) { return forced_true(c); });
            case NodeKind::Any:
                return true_by_[id] != none ||
                       std::any_of(n.children.begin(), n.children.end(),
                                   [this](NodeId c) { return forced_true(c); });
            case NodeKind::Not:
                return true_by_[id] != none || forced_false(n.children.front());
        }
        return false;
    }

    bool forced_false(NodeId id) const {
        const auto& n = nodes_[id];
        switch (n.kind) {
            case NodeKind::Always: return false;
            case NodeKind::Value:  return false_by_[id] != none;
            case NodeKind::All:
                return false_by_[id] != none ||
                       std::any_of(n.children.begin(), n.children.end(),
                                   [this](NodeId c) { return forced_false(c); });
            case NodeKind::Any:
                return false_by_[id] != none ||
                       std::all_of(n.children.begin(), n.children.end(),
                                   [this](NodeId c) { return forced_false(c); });
            case NodeKind::Not:
                return false_by_[id] != none || forced_true(n.children.front());
        }
        return false;
    }

    bool mark_true(NodeId id, EdgeId by) {
        if (true_by_[id] != none) return false;
        true_by_[id] = by;
        const auto& n = nodes_[id];
        if (n.kind == NodeKind::All) {
            for (NodeId c : n.children) mark_true(c, by);
        } else if (n.kind == NodeKind::Not) {
            mark_false(n.children.front(), by);
        }
        return true;
    }

    bool mark_false(NodeId id, EdgeId by) {
        if (false_by_[id] != none) return false;
        false_by_[id] = by;
        const auto& n = nodes_[id];
        if (n.kind == NodeKind::Any) {
            for (NodeId c : n.children) mark_false(c, by);
        } else if (n.kind == NodeKind::Not) {
            mark_true(n.children.front(), by);
        }
        return true;
    }

    // Edge responsible for a derived mark: the node's own, else the first
    // child that carries one.
    EdgeId blame_true(NodeId id) const { return blame(id, true_by_, false_by_); }
    EdgeId blame_false(NodeId id) const { return blame(id, false_by_, true_by_); }

    EdgeId blame(NodeId id, const std::vector<std::size_t>& same,
                 const std::vector<std::size_t>& opposite) const {
        if (same[id] != none) return same[id];
        const auto& n = nodes_[id];
        for (NodeId c : n.children) {
            auto by = n.kind == NodeKind::Not ? blame(c, opposite, same) : blame(c, same, opposite);
            if (by != none) return by;
        }
        return none;
    }

    [[noreturn]] void fail(NodeId id, EdgeId required_by, EdgeId excluded_by) const {
        auto rule_of = [this](EdgeId e) -> const RelationEdge* {
            return e < edges_.size() ? &edges_[e] : nullptr;
        };
        const RelationEdge* req = rule_of(required_by);
        const RelationEdge* exc = rule_of(excluded_by);

        const auto& n = nodes_[id];
        std::string what = n.kind == NodeKind::Value ? to_string(n.value)
                                                     : "aggregation node " + std::to_string(id);
        std::string message = what + " is forced true";
        if (req) message += " by rule '" + req->rule + "'";
        message += " and forced false";
        if (exc) message += " by rule '" + exc->rule + "'";

        const RelationEdge* latest = req;
        if (!latest || (exc && exc->rule_index > latest->rule_index)) latest = exc;

        std::optional<DomainValue> value;
        if (n.kind == NodeKind::Value) value = n.value;
        throw CompileError(CompileErrorKind::UnsatisfiableConstraint, message,
                           latest ? latest->rule_index : CompileError::no_rule,
                           latest ? latest->rule : std::string(), value);
    }

    const std::vector<GraphNode>&    nodes_;
    const std::vector<RelationEdge>& edges_;
    std::vector<std::size_t>         true_by_;
    std::vector<std::size_t>         false_by_;
};

} // namespace

// ── RuleCompiler ─────────────────────────────────────────────────────────────

RuleCompiler::RuleCompiler(DomainCatalog catalog) : catalog_(std::move(catalog)) {}

CompiledGraph RuleCompiler::compile(const ConfigurationRecord& record) const {
    ValueSet custom(record.custom_values.begin(), record.custom_values.end());
    for (std::size_t i = 0; i < record.rules.size(); ++i) {
        validate_rule(record.rules[i], i, catalog_, custom);
    }

    GraphBuilder builder(catalog_, record);
    for (std::size_t i = 0; i < record.rules.size(); ++i) {
        const auto& rule = record.rules[i];
        NodeId source = builder.precondition(rule);
        auto targets  = builder.value_nodes(rule.then);

        switch (rule.kind) {
            case ConsequenceKind::Require:
                for (NodeId t : targets) builder.require(source, t, rule.strength, rule, i);
                break;
            case ConsequenceKind::Exclude:
                for (NodeId t : targets) builder.exclude(source, t, rule, i);
                break;
            case ConsequenceKind::OneOf: {
                NodeId target = targets.size() == 1 ? targets.front()
                                                    : builder.aggregate(NodeKind::Any, targets);
                builder.require(source, target, rule.strength, rule, i);
                break;
            }
        }
    }

    auto edges = builder.edges();
    ConsistencyCheck(builder.nodes(), edges).run();

    CompiledGraph graph(record.identity, record.version, fingerprint(record),
                        std::move(builder.nodes()), std::move(edges), record.sensitive_values);
    spdlog::debug("rule_compiler: compiled {} version '{}' ({} values, {} aggregations, {} relations)",
                  record.identity.to_string(), record.version, graph.value_count(),
                  graph.aggregation_count(), graph.constraint_count());
    return graph;
}

} // namespace kgraph
