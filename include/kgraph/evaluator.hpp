#pragma once

#include "kgraph/compiled_graph.hpp"
#include "kgraph/constraint_engine.hpp"
#include "kgraph/types.hpp"

#include <cstddef>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace kgraph {

enum class Decision { Eligible, Ineligible };

inline std::ostream& operator<<(std::ostream& os, Decision d) {
    return os << (d == Decision::Eligible ? "Eligible" : "Ineligible");
}

struct Violation {
    RelationKind             relation = RelationKind::Requires;
    std::string              rule;
    std::size_t              rule_index = 0;
    std::string              source;       // node labels, masked
    std::string              target;
    std::vector<std::string> involved;     // value nodes on either side
    std::string              reason;
};

struct EligibilityResult {
    Decision               decision = Decision::Eligible;
    std::vector<Violation> reasons;        // empty unless explained
    std::string            identity;
    std::string            version;
    std::size_t            relations_checked = 0;

    bool eligible() const { return decision == Decision::Eligible; }
};

struct EvaluatorOptions {
    std::string mask_token = "<redacted>";
};

/**
 * Evaluator
 *
 * Answers whether a candidate assignment is permitted by a compiled graph.
 *
 * Only relations reachable from value nodes the candidate names are
 * examined; values the graph does not know impose no constraint. Each
 * relation is handed to the ConstraintEngine, which memoizes node results for
 * the duration of the query.
 *
 * With explain == false evaluation stops at the first violation and the
 * result carries the decision only. With explain == true every violated
 * relation is reported, ordered by the position of the rule that created it.
 */
class Evaluator {
public:
    explicit Evaluator(std::shared_ptr<const ConstraintEngine> engine = default_engine(),
                       EvaluatorOptions options = EvaluatorOptions());

    EligibilityResult evaluate(const CompiledGraph& graph, const CandidateAssignment& candidate,
                               bool explain = true) const;

    const EvaluatorOptions& options() const { return options_; }

private:
    Violation describe(const CompiledGraph& graph, const RelationEdge& edge) const;

    std::shared_ptr<const ConstraintEngine> engine_;
    EvaluatorOptions                        options_;
};

} // namespace kgraph
