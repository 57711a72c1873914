#pragma once

#include "kgraph/catalog.hpp"
#include "kgraph/compiled_graph.hpp"
#include "kgraph/errors.hpp"
#include "kgraph/types.hpp"

namespace kgraph {

/**
 * RuleCompiler
 *
 * Translates a configuration record into a CompiledGraph.
 *
 * Construction:
 *   1. Every rule is validated: a precondition (or the unconditional flag)
 *      and a non-empty consequence are required, and every referenced value
 *      must be in the catalog or among the record's custom values.
 *   2. Each distinct (category, value) pair becomes exactly one value node.
 *   3. Each rule becomes Requires/Excludes relations hanging off its
 *      precondition node (the value itself, an All aggregation when several
 *      values or an `unless` clause are involved, or the Always node).
 *      OneOf targets are gathered under an Any aggregation.
 *   4. A relation is unique per (source, target). A later rule replaces an
 *      earlier relation of the opposite kind on the same pair; a restated
 *      requirement keeps the stronger strength. Excludes is symmetric, so
 *      "A excludes B" and "B excludes A" yield one relation.
 *   5. A consistency pass rejects graphs that unconditional rules make
 *      unsatisfiable.
 *
 * Failures are reported by throwing CompileError. compile() is const and
 * touches no shared state, so one compiler may serve concurrent callers.
 */
class RuleCompiler {
public:
    explicit RuleCompiler(DomainCatalog catalog);

    CompiledGraph compile(const ConfigurationRecord& record) const;

    const DomainCatalog& catalog() const { return catalog_; }

private:
    DomainCatalog catalog_;
};

} // namespace kgraph
