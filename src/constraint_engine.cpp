#include "kgraph/constraint_engine.hpp"

#include <algorithm>

namespace kgraph {

// ── QueryContext ─────────────────────────────────────────────────────────────

QueryContext::QueryContext(const CompiledGraph& graph, const CandidateAssignment& candidate)
    : graph_(graph),
      present_(graph.nodes().size(), 0),
      memo_(graph.nodes().size(), -1) {
    for (const auto& v : candidate) {
        categories_.insert(v.category);
        auto id = graph.find(v);
        if (!id || present_[*id]) continue;
        present_[*id] = 1;
        touched_.push_back(*id);
    }
    std::sort(touched_.begin(), touched_.end());
}

// ── MemoizedEngine ───────────────────────────────────────────────────────────

bool MemoizedEngine::satisfied(NodeId node, QueryContext& ctx) const {
    if (ctx.known(node)) return ctx.recalled(node);

    const auto& n = ctx.graph().node(node);
    bool result = false;
    switch (n.kind) {
        case NodeKind::Value:
            result = ctx.present(node);
            break;
        case NodeKind::All:
            result = std::all_of(n.children.begin(), n.children.end(),
                                 [&](NodeId c) { return satisfied(c, ctx); });
            break;
        case NodeKind::Any:
            result = std::any_of(n.children.begin(), n.children.end(),
                                 [&](NodeId c) { return satisfied(c, ctx); });
            break;
        case NodeKind::Not:
            result = !n.children.empty() && !satisfied(n.children.front(), ctx);
            break;
        case NodeKind::Always:
            result = true;
            break;
    }
    ctx.remember(node, result);
    return result;
}

RelationOutcome MemoizedEngine::check(const RelationEdge& edge, QueryContext& ctx) const {
    switch (edge.kind) {
        case RelationKind::Requires: {
            if (!satisfied(edge.source, ctx)) return RelationOutcome::Inactive;
            if (satisfied(edge.target, ctx)) return RelationOutcome::Satisfied;
            if (edge.strength == Strength::Weak) {
                const auto& cats = ctx.graph().categories_under(edge.target);
                bool named = std::any_of(cats.begin(), cats.end(),
                                         [&](const std::string& c) { return ctx.has_category(c); });
                if (!named) return RelationOutcome::Satisfied;
            }
            return RelationOutcome::Violated;
        }
        case RelationKind::Excludes: {
            bool source = satisfied(edge.source, ctx);
            bool target = satisfied(edge.target, ctx);
            if (source && target) return RelationOutcome::Violated;
            return source || target ? RelationOutcome::Satisfied : RelationOutcome::Inactive;
        }
        default:
            return RelationOutcome::Inactive;
    }
}

std::shared_ptr<const ConstraintEngine> default_engine() {
    static const auto engine = std::make_shared<const MemoizedEngine>();
    return engine;
}

} // namespace kgraph
