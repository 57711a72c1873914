#include "kgraph/evaluator.hpp"

#include <algorithm>
#include <stdexcept>

namespace kgraph {

namespace {

void collect_values(const CompiledGraph& graph, NodeId id, std::vector<NodeId>& out) {
    const auto& n = graph.node(id);
    if (n.kind == NodeKind::Value) {
        out.push_back(id);
        return;
    }
    for (NodeId child : n.children) collect_values(graph, child, out);
}

} // namespace

// ── Evaluator ────────────────────────────────────────────────────────────────

Evaluator::Evaluator(std::shared_ptr<const ConstraintEngine> engine, EvaluatorOptions options)
    : engine_(std::move(engine)), options_(std::move(options)) {
    if (!engine_) throw std::invalid_argument("Evaluator requires a constraint engine");
}

EligibilityResult Evaluator::evaluate(const CompiledGraph& graph, const CandidateAssignment& candidate,
                                      bool explain) const {
    EligibilityResult result;
    result.identity = graph.identity().to_string();
    result.version  = graph.version();

    QueryContext ctx(graph, candidate);

    std::vector<EdgeId> relations;
    for (NodeId v : ctx.touched()) {
        const auto& t = graph.triggers(v);
        relations.insert(relations.end(), t.begin(), t.end());
    }
    std::sort(relations.begin(), relations.end());
    relations.erase(std::unique(relations.begin(), relations.end()), relations.end());

    for (EdgeId e : relations) {
        ++result.relations_checked;
        const auto& edge = graph.edge(e);
        if (engine_->check(edge, ctx) != RelationOutcome::Violated) continue;

        result.decision = Decision::Ineligible;
        if (!explain) break;
        result.reasons.push_back(describe(graph, edge));
    }
    std::stable_sort(result.reasons.begin(), result.reasons.end(),
                     [](const Violation& a, const Violation& b) { return a.rule_index < b.rule_index; });
    return result;
}

Violation Evaluator::describe(const CompiledGraph& graph, const RelationEdge& edge) const {
    const auto& mask = options_.mask_token;
    bool anchored = graph.node(edge.source).kind == NodeKind::Always;

    Violation v;
    v.relation   = edge.kind;
    v.rule       = graph.rule_label(edge.rule, mask);
    v.rule_index = edge.rule_index;
    v.source     = graph.label(edge.source, mask);
    v.target     = graph.label(edge.target, mask);

    std::vector<NodeId> values;
    collect_values(graph, edge.source, values);
    collect_values(graph, edge.target, values);
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
    for (NodeId id : values) v.involved.push_back(graph.label(id, mask));

    if (edge.kind == RelationKind::Excludes) {
        v.reason = anchored ? v.target + " is not permitted"
                            : v.source + " excludes " + v.target;
    } else {
        v.reason = v.source + " requires " + v.target;
    }
    v.reason += " (rule '" + v.rule + "')";
    return v;
}

} // namespace kgraph
