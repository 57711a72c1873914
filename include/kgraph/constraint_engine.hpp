#pragma once

#include "kgraph/compiled_graph.hpp"
#include "kgraph/types.hpp"

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <unordered_set>
#include <vector>

namespace kgraph {

enum class RelationOutcome { Inactive, Satisfied, Violated };

inline std::ostream& operator<<(std::ostream& os, RelationOutcome o) {
    switch (o) {
        case RelationOutcome::Inactive:  return os << "Inactive";
        case RelationOutcome::Satisfied: return os << "Satisfied";
        case RelationOutcome::Violated:  return os << "Violated";
        default:                         return os << "Unknown";
    }
}

/**
 * QueryContext
 *
 * Per-query state: which value nodes the candidate touches, which categories
 * it names, and the memo of node satisfaction. One context serves every
 * relation query of a single evaluation and is then discarded.
 */
class QueryContext {
public:
    QueryContext(const CompiledGraph& graph, const CandidateAssignment& candidate);

    const CompiledGraph& graph() const { return graph_; }

    bool present(NodeId value_node) const { return present_[value_node] != 0; }
    bool has_category(const std::string& category) const { return categories_.count(category) > 0; }

    /// Value nodes named by the candidate, ascending. Unknown values are skipped.
    const std::vector<NodeId>& touched() const { return touched_; }

    bool known(NodeId id) const { return memo_[id] >= 0; }
    bool recalled(NodeId id) const { return memo_[id] == 1; }
    void remember(NodeId id, bool satisfied) { memo_[id] = satisfied ? 1 : 0; }

private:
    const CompiledGraph&            graph_;
    std::vector<char>               present_;
    std::unordered_set<std::string> categories_;
    std::vector<NodeId>             touched_;
    std::vector<std::int8_t>        memo_;
};

/**
 * ConstraintEngine
 *
 * The satisfiability backend the evaluator queries. Implementations decide
 * whether a node holds for a query and whether a single relation is
 * inactive, satisfied or violated.
 */
class ConstraintEngine {
public:
    virtual ~ConstraintEngine() = default;

    virtual bool satisfied(NodeId node, QueryContext& ctx) const = 0;
    virtual RelationOutcome check(const RelationEdge& edge, QueryContext& ctx) const = 0;
};

/**
 * MemoizedEngine
 *
 * Default backend. Value nodes hold when the candidate names them; All, Any
 * and Not are plain boolean combinators whose result is independent of child
 * order. Every node is computed at most once per QueryContext.
 *
 * Requires(source, target) is inactive while the source does not hold.
 * A weak requirement also passes when the candidate names none of the
 * categories found under the target.
 */
class MemoizedEngine : public ConstraintEngine {
public:
    bool satisfied(NodeId node, QueryContext& ctx) const override;
    RelationOutcome check(const RelationEdge& edge, QueryContext& ctx) const override;
};

std::shared_ptr<const ConstraintEngine> default_engine();

} // namespace kgraph
