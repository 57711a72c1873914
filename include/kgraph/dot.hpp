#pragma once

#include "kgraph/compiled_graph.hpp"
#include "kgraph/json.hpp"

#include <sstream>
#include <string>

namespace kgraph {

/// Graphviz rendering of a compiled graph. Sensitive values print as
/// `mask_token` in node labels and rule names; aggregation nodes are
/// labelled by their combinator.
inline std::string to_dot(const CompiledGraph& graph, const std::string& mask_token = "<redacted>") {
    std::ostringstream os;
    os << "digraph " << json_detail::quoted(graph.identity().to_string()) << " {\n";

    for (NodeId id = 0; id < graph.nodes().size(); ++id) {
        const auto& n = graph.node(id);
        os << "  n" << id << " [";
        switch (n.kind) {
            case NodeKind::Value:
                os << "shape=box, label=" << json_detail::quoted(graph.label(id, mask_token));
                break;
            case NodeKind::All:    os << "shape=circle, label=\"ALL\"";    break;
            case NodeKind::Any:    os << "shape=circle, label=\"ANY\"";    break;
            case NodeKind::Not:    os << "shape=circle, label=\"NOT\"";    break;
            case NodeKind::Always: os << "shape=diamond, label=\"ALWAYS\""; break;
        }
        os << "];\n";
    }

    for (const auto& e : graph.edges()) {
        os << "  n" << e.source << " -> n" << e.target << " [";
        switch (e.kind) {
            case RelationKind::Requires:
                os << "label=" << json_detail::quoted(graph.rule_label(e.rule, mask_token))
                   << (e.strength == Strength::Weak ? ", style=dashed" : "");
                break;
            case RelationKind::Excludes:
                os << "label=" << json_detail::quoted(graph.rule_label(e.rule, mask_token)) << ", color=red, dir=both, arrowhead=tee, arrowtail=tee";
                break;
            case RelationKind::ImpliedByAll:
            case RelationKind::ImpliedByAny:
                os << "color=gray";
                break;
            case RelationKind::Negates:
                os << "color=gray, arrowhead=odot";
                break;
        }
        os << "];\n";
    }

    os << "}\n";
    return os.str();
}

} // namespace kgraph
