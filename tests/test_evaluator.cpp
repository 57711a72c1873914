#include "kgraph/catalog.hpp"
#include "kgraph/dot.hpp"
#include "kgraph/evaluator.hpp"
#include "kgraph/json.hpp"
#include "kgraph/rule_compiler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace kgraph;

// ── Helpers ──────────────────────────────────────────────────────────────────

static const DomainValue card     { "payment_method", "card" };
static const DomainValue wallet   { "payment_method", "wallet" };
static const DomainValue crypto   { "payment_method", "crypto" };
static const DomainValue us       { "country", "US" };
static const DomainValue ca       { "country", "CA" };
static const DomainValue de       { "country", "DE" };
static const DomainValue kp       { "country", "KP" };
static const DomainValue usd      { "currency", "USD" };
static const DomainValue eur      { "currency", "EUR" };
static const DomainValue gbp      { "currency", "GBP" };
static const DomainValue three_ds { "authentication_type", "three_ds" };

static CompiledGraph compile(std::vector<Rule> rules, std::vector<DomainValue> sensitive = {}) {
    static const RuleCompiler compiler(default_payment_catalog());
    ConfigurationRecord record;
    record.identity         = { "merchant_1", "stripe" };
    record.version          = "v1";
    record.rules            = std::move(rules);
    record.sensitive_values = std::move(sensitive);
    return compiler.compile(record);
}

static std::vector<std::string> rule_names(const EligibilityResult& r) {
    std::vector<std::string> names;
    for (const auto& v : r.reasons) names.push_back(v.rule);
    std::sort(names.begin(), names.end());
    return names;
}

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

static int passed = 0;
static int failed = 0;

#define ASSERT_EQ(label, expected, actual)                                  \
    do {                                                                    \
        if ((expected) == (actual)) {                                       \
            std::cout << "  [PASS] " << label << "\n";                     \
            ++passed;                                                       \
        } else {                                                            \
            std::cout << "  [FAIL] " << label                              \
                      << "  (expected=" << (expected)                      \
                      << " got=" << (actual) << ")\n";                     \
            ++failed;                                                       \
        }                                                                   \
    } while (0)

#define ASSERT_TRUE(label, expr)                                            \
    do {                                                                    \
        if ((expr)) {                                                       \
            std::cout << "  [PASS] " << label << "\n";                     \
            ++passed;                                                       \
        } else {                                                            \
            std::cout << "  [FAIL] " << label << "\n";                     \
            ++failed;                                                       \
        }                                                                   \
    } while (0)

/// Wraps the default engine and counts relation queries.
class CountingEngine : public ConstraintEngine {
public:
    bool satisfied(NodeId node, QueryContext& ctx) const override {
        return inner_.satisfied(node, ctx);
    }
    RelationOutcome check(const RelationEdge& edge, QueryContext& ctx) const override {
        ++checks;
        return inner_.check(edge, ctx);
    }

    mutable std::size_t checks = 0;

private:
    MemoizedEngine inner_;
};

// ── Test suites ──────────────────────────────────────────────────────────────

void test_wallet_requires_us() {
    std::cout << "\n[WalletRequiresUS]\n";
    auto graph = compile({ require_rule("wallet-us", { wallet }, { us }) });
    Evaluator evaluator;

    auto denied = evaluator.evaluate(graph, { wallet, de });
    ASSERT_EQ("wallet in DE -> Ineligible", Decision::Ineligible, denied.decision);
    ASSERT_EQ("one reason", static_cast<std::size_t>(1), denied.reasons.size());
    if (!denied.reasons.empty()) {
        const auto& v = denied.reasons.front();
        ASSERT_EQ("reason cites the requires relation", RelationKind::Requires, v.relation);
        ASSERT_EQ("reason names the rule", std::string("wallet-us"), v.rule);
        ASSERT_EQ("reason text",
                  std::string("payment_method=wallet requires country=US (rule 'wallet-us')"), v.reason);
        ASSERT_EQ("both nodes involved", static_cast<std::size_t>(2), v.involved.size());
    }

    ASSERT_EQ("wallet in US -> Eligible", Decision::Eligible,
              evaluator.evaluate(graph, { wallet, us }).decision);
    ASSERT_EQ("card -> Eligible (no applicable rule)", Decision::Eligible,
              evaluator.evaluate(graph, { card }).decision);
}

void test_symmetric_exclusion() {
    std::cout << "\n[SymmetricExclusion]\n";
    auto graph = compile({
        exclude_rule("crypto-not-us", { crypto }, { us }),
        exclude_rule("us-not-crypto", { us }, { crypto }),
    });
    Evaluator evaluator;

    auto r = evaluator.evaluate(graph, { crypto, us });
    ASSERT_EQ("{A, B} -> Ineligible", Decision::Ineligible, r.decision);
    ASSERT_EQ("reported once", static_cast<std::size_t>(1), r.reasons.size());
    ASSERT_EQ("A alone -> Eligible", Decision::Eligible, evaluator.evaluate(graph, { crypto }).decision);
    ASSERT_EQ("B alone -> Eligible", Decision::Eligible, evaluator.evaluate(graph, { us }).decision);
}

void test_permissive_on_omission() {
    std::cout << "\n[PermissiveOnOmission]\n";
    auto graph = compile({
        require_rule("wallet-us", { wallet }, { us }),
        one_of_rule("card-currency", { card }, { usd, eur }),
        unconditional_rule("always-us", ConsequenceKind::Require, { us }),
    });
    Evaluator evaluator;

    auto r = evaluator.evaluate(graph, { crypto, de, gbp });
    ASSERT_EQ("unmentioned values -> Eligible", Decision::Eligible, r.decision);
    ASSERT_EQ("no relation examined", static_cast<std::size_t>(0), r.relations_checked);

    ASSERT_EQ("empty candidate -> Eligible", Decision::Eligible,
              evaluator.evaluate(graph, {}).decision);
}

void test_violation_completeness() {
    std::cout << "\n[ViolationCompleteness]\n";
    auto graph = compile({
        require_rule("wallet-us", { wallet }, { us }),
        exclude_rule("wallet-not-de", { wallet }, { de }),
        one_of_rule("wallet-currency", { wallet }, { usd, eur }),
    });
    Evaluator evaluator;

    auto full = evaluator.evaluate(graph, { wallet, de, gbp }, true);
    ASSERT_EQ("every violation reported", static_cast<std::size_t>(3), full.reasons.size());
    if (full.reasons.size() == 3) {
        ASSERT_EQ("ordered by rule (0)", static_cast<std::size_t>(0), full.reasons[0].rule_index);
        ASSERT_EQ("ordered by rule (1)", static_cast<std::size_t>(1), full.reasons[1].rule_index);
        ASSERT_EQ("ordered by rule (2)", static_cast<std::size_t>(2), full.reasons[2].rule_index);
        ASSERT_EQ("exclusion reported", RelationKind::Excludes, full.reasons[1].relation);
        ASSERT_TRUE("one-of lists its options",
                    contains(full.reasons[2].reason, "any of [currency=USD, currency=EUR]") ||
                    contains(full.reasons[2].reason, "any of [currency=EUR, currency=USD]"));
    }

    auto fast = evaluator.evaluate(graph, { wallet, de, gbp }, false);
    ASSERT_EQ("decision-only agrees", full.decision, fast.decision);
    ASSERT_TRUE("decision-only carries no reasons", fast.reasons.empty());
    ASSERT_EQ("decision-only stops at the first violation",
              static_cast<std::size_t>(1), fast.relations_checked);

    const std::vector<CandidateAssignment> candidates {
        { wallet }, { wallet, us }, { wallet, us, usd }, { wallet, us, de, eur }, { card, de }, {},
    };
    bool agree = true;
    for (const auto& c : candidates) {
        auto explained = evaluator.evaluate(graph, c, true);
        auto decided   = evaluator.evaluate(graph, c, false);
        if (decided.eligible() != explained.reasons.empty()) agree = false;
        if (decided.decision != explained.decision) agree = false;
    }
    ASSERT_TRUE("decision matches reasons.empty() for every candidate", agree);
}

void test_aggregation_semantics() {
    std::cout << "\n[AggregationSemantics]\n";
    Rule card_3ds = require_rule("card-3ds", { card }, { three_ds });
    card_3ds.unless = { us };

    auto graph = compile({
        require_rule("card-us-usd", { card, us }, { usd }),
        one_of_rule("wallet-currency", { wallet }, { usd, eur }),
        card_3ds,
    });
    Evaluator evaluator;

    ASSERT_EQ("ALL precondition met, target missing -> Ineligible", Decision::Ineligible,
              evaluator.evaluate(graph, { card, us, eur }).decision);
    ASSERT_EQ("ALL precondition met, target present -> Eligible", Decision::Eligible,
              evaluator.evaluate(graph, { card, us, usd }).decision);
    ASSERT_EQ("ANY satisfied by either option", Decision::Eligible,
              evaluator.evaluate(graph, { wallet, eur }).decision);
    ASSERT_EQ("ANY with no option -> Ineligible", Decision::Ineligible,
              evaluator.evaluate(graph, { wallet, gbp }).decision);
    ASSERT_EQ("NOT: card outside US without 3DS -> Ineligible", Decision::Ineligible,
              evaluator.evaluate(graph, { card, de }).decision);
    ASSERT_EQ("NOT: card outside US with 3DS -> Eligible", Decision::Eligible,
              evaluator.evaluate(graph, { card, de, three_ds }).decision);

    auto r = evaluator.evaluate(graph, { card, de }, true);
    ASSERT_TRUE("unless rule reported", rule_names(r) == std::vector<std::string>{ "card-3ds" });
    if (!r.reasons.empty()) {
        ASSERT_TRUE("source label shows the negation",
                    contains(r.reasons.front().source, "not country=US"));
    }
}

void test_weak_requirements() {
    std::cout << "\n[WeakRequirements]\n";
    auto graph = compile({ one_of_rule("wallet-na", { wallet }, { us, ca }, Strength::Weak) });
    Evaluator evaluator;

    ASSERT_EQ("country not given -> Eligible", Decision::Eligible,
              evaluator.evaluate(graph, { wallet }).decision);
    ASSERT_EQ("accepted country -> Eligible", Decision::Eligible,
              evaluator.evaluate(graph, { wallet, ca }).decision);
    ASSERT_EQ("other country -> Ineligible", Decision::Ineligible,
              evaluator.evaluate(graph, { wallet, de }).decision);
}

void test_unconditional_rules() {
    std::cout << "\n[UnconditionalRules]\n";
    auto graph = compile({
        unconditional_rule("embargo", ConsequenceKind::Exclude, { kp }),
        unconditional_rule("usd-only", ConsequenceKind::Require, { usd }),
    });
    Evaluator evaluator;

    auto r = evaluator.evaluate(graph, { card, kp }, true);
    ASSERT_EQ("excluded value -> Ineligible", Decision::Ineligible, r.decision);
    if (!r.reasons.empty()) {
        ASSERT_EQ("reason text", std::string("country=KP is not permitted (rule 'embargo')"),
                  r.reasons.front().reason);
    }
    ASSERT_EQ("unconditional requirement is not held against candidates", Decision::Eligible,
              evaluator.evaluate(graph, { card, eur }).decision);
}

void test_order_independence() {
    std::cout << "\n[OrderIndependence]\n";
    Rule card_3ds = require_rule("card-3ds", { card }, { three_ds });
    card_3ds.unless = { us };

    std::vector<Rule> rules {
        require_rule("wallet-us", { wallet }, { us }),
        exclude_rule("crypto-not-us", { crypto }, { us }),
        one_of_rule("card-currency", { card }, { usd, eur }),
        require_rule("card-us-usd", { card, us }, { usd }),
        card_3ds,
    };
    auto reversed = rules;
    std::reverse(reversed.begin(), reversed.end());
    auto rotated = rules;
    std::rotate(rotated.begin(), rotated.begin() + 2, rotated.end());

    auto a = compile(rules);
    auto b = compile(reversed);
    auto c = compile(rotated);
    Evaluator evaluator;

    const std::vector<CandidateAssignment> candidates {
        { wallet }, { wallet, us }, { crypto, us }, { card, us, eur }, { card, de },
        { card, de, usd, three_ds }, { card, us, usd }, { crypto, wallet, de }, { usd },
    };

    bool same = true;
    for (const auto& cand : candidates) {
        auto ra = evaluator.evaluate(a, cand);
        auto rb = evaluator.evaluate(b, cand);
        auto rc = evaluator.evaluate(c, cand);
        if (ra.decision != rb.decision || ra.decision != rc.decision) same = false;
        if (rule_names(ra) != rule_names(rb) || rule_names(ra) != rule_names(rc)) same = false;
    }
    ASSERT_TRUE("permuted rules give identical decisions and violations", same);

    auto again = compile(rules);
    bool deterministic = true;
    for (const auto& cand : candidates) {
        auto r1 = evaluator.evaluate(a, cand);
        auto r2 = evaluator.evaluate(again, cand);
        if (r1.decision != r2.decision || rule_names(r1) != rule_names(r2)) deterministic = false;
    }
    ASSERT_TRUE("compiling twice gives identical results", deterministic);
}

void test_masking() {
    std::cout << "\n[Masking]\n";
    auto graph = compile({ require_rule("wallet-us", { wallet }, { us }) }, { us });

    auto r = Evaluator().evaluate(graph, { wallet, de });
    ASSERT_EQ("still Ineligible", Decision::Ineligible, r.decision);
    if (!r.reasons.empty()) {
        const auto& v = r.reasons.front();
        ASSERT_TRUE("sensitive value replaced", contains(v.reason, "country=<redacted>"));
        ASSERT_TRUE("sensitive value absent from text", !contains(v.reason, "US"));
        bool leaked = false;
        for (const auto& i : v.involved)
            if (contains(i, "US")) leaked = true;
        ASSERT_TRUE("sensitive value absent from involved nodes", !leaked);
    }

    EvaluatorOptions options;
    options.mask_token = "***";
    auto custom = Evaluator(default_engine(), options).evaluate(graph, { wallet });
    ASSERT_TRUE("custom mask token used",
                !custom.reasons.empty() && contains(custom.reasons.front().target, "country=***"));

    auto dot = to_dot(graph);
    ASSERT_TRUE("dot output masked", contains(dot, "country=<redacted>") && !contains(dot, "\"country=US\""));

    auto named = compile({
        require_rule("wallet-US",  { wallet }, { us }),
        require_rule("wallet-USD", { wallet }, { usd }),
    }, { us });
    auto both = Evaluator().evaluate(named, { wallet });
    ASSERT_EQ("both requirements violated", static_cast<std::size_t>(2), both.reasons.size());
    if (both.reasons.size() == 2) {
        ASSERT_EQ("sensitive value masked in rule name", std::string("wallet-<redacted>"),
                  both.reasons[0].rule);
        ASSERT_TRUE("reason cites the masked rule name",
                    contains(both.reasons[0].reason, "(rule 'wallet-<redacted>')"));
        ASSERT_EQ("longer word left intact", std::string("wallet-USD"), both.reasons[1].rule);
    }
    ASSERT_TRUE("dot rule names masked", contains(to_dot(named), "\"wallet-<redacted>\""));
}

void test_engine_seam_and_memo() {
    std::cout << "\n[EngineSeam]\n";
    auto graph = compile({
        require_rule("wallet-us", { wallet }, { us }),
        require_rule("card-us-usd", { card, us }, { usd }),
        exclude_rule("card-not-de", { card }, { de }),
    });

    auto engine = std::make_shared<CountingEngine>();
    Evaluator evaluator(engine);
    auto r = evaluator.evaluate(graph, { card, us, de });
    ASSERT_EQ("engine queried once per examined relation", r.relations_checked, engine->checks);
    ASSERT_EQ("only relations reachable from the candidate examined",
              static_cast<std::size_t>(2), r.relations_checked);

    CandidateAssignment candidate { card, us };
    QueryContext ctx(graph, candidate);
    MemoizedEngine memo;
    NodeId all = 0;
    for (NodeId id = 0; id < graph.nodes().size(); ++id)
        if (graph.node(id).kind == NodeKind::All) all = id;
    ASSERT_TRUE("All node satisfied", memo.satisfied(all, ctx));
    ASSERT_TRUE("children memoized", ctx.known(*graph.find(card)) && ctx.known(*graph.find(us)));
    ASSERT_EQ("touched nodes", static_cast<std::size_t>(2), ctx.touched().size());
}

void test_json_output() {
    std::cout << "\n[JsonOutput]\n";
    auto graph = compile({ require_rule("wallet-us", { wallet }, { us }) });
    auto json = to_json(Evaluator().evaluate(graph, { wallet, de }));

    ASSERT_TRUE("json contains decision", contains(json, "\"Ineligible\""));
    ASSERT_TRUE("json contains rule",     contains(json, "\"wallet-us\""));
    ASSERT_TRUE("json contains identity", contains(json, "\"merchant_1/stripe\""));

    auto eligible = to_json(Evaluator().evaluate(graph, { wallet, us }));
    ASSERT_TRUE("eligible json has empty reasons", contains(eligible, "\"reasons\": []"));
}

// ── Main ─────────────────────────────────────────────────────────────────────

int main() {
    spdlog::set_level(spdlog::level::warn);
    std::cout << "=== Eligibility Evaluator Tests ===\n";

    test_wallet_requires_us();
    test_symmetric_exclusion();
    test_permissive_on_omission();
    test_violation_completeness();
    test_aggregation_semantics();
    test_weak_requirements();
    test_unconditional_rules();
    test_order_independence();
    test_masking();
    test_engine_seam_and_memo();
    test_json_output();

    std::cout << "\n--- Results: "
              << passed << " passed, " << failed << " failed ---\n";
    return failed == 0 ? 0 : 1;
}
