#include "kgraph/catalog.hpp"
#include "kgraph/connector_config.hpp"
#include "kgraph/dot.hpp"
#include "kgraph/eligibility_service.hpp"
#include "kgraph/json.hpp"
#include "kgraph/rule_compiler.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace kgraph;

static std::string decision_str(Decision d) {
    return d == Decision::Eligible ? "[ELIGIBLE]  " : "[INELIGIBLE]";
}

static std::string candidate_str(const CandidateAssignment& candidate) {
    std::string out;
    for (const auto& v : candidate) {
        if (!out.empty()) out += ", ";
        out += to_string(v);
    }
    return "{" + out + "}";
}

static void print_result(const ConfigurationIdentity& id, const CandidateAssignment& candidate,
                         const EligibilityResult& r) {
    std::cout << "\n  Identity  : " << id.to_string() << " (version " << r.version << ")\n"
              << "  Candidate : " << candidate_str(candidate) << "\n"
              << "  Decision  : " << decision_str(r.decision)
              << " after " << r.relations_checked << " relation(s)\n";
    for (const auto& v : r.reasons) {
        std::cout << "             -> " << v.reason << "\n";
    }
}

static void separator(const std::string& title) {
    std::cout << "\n" << std::string(55, '-') << "\n"
              << "  " << title << "\n"
              << std::string(55, '-') << "\n";
}

static ConnectorAccount stripe_account(const std::string& version, bool allow_gb) {
    PaymentMethodTypeConfig credit;
    credit.payment_method_type = "credit";
    credit.card_networks       = { "Visa", "Mastercard", "AmericanExpress" };
    credit.accepted_countries  = AcceptedValues::enable_only(
        allow_gb ? std::vector<std::string>{ "US", "CA", "GB" } : std::vector<std::string>{ "US", "CA" });
    credit.accepted_currencies = AcceptedValues::enable_only({ "USD", "CAD", "GBP" });
    credit.capture_methods     = { "automatic", "manual" };

    PaymentMethodTypeConfig debit;
    debit.payment_method_type  = "debit";
    debit.card_networks        = { "Visa", "Mastercard" };
    debit.accepted_countries   = AcceptedValues::disable_only({ "KP", "IR" });

    PaymentMethodTypeConfig apple_pay;
    apple_pay.payment_method_type = "apple_pay";
    apple_pay.accepted_countries  = AcceptedValues::enable_only({ "US" });

    ConnectorAccount account;
    account.merchant_id     = "merchant_1001";
    account.connector       = "stripe";
    account.version         = version;
    account.payment_methods = {
        { "card",   { credit, debit } },
        { "wallet", { apple_pay } },
    };
    return account;
}

int main() {
    spdlog::cfg::load_env_levels();

    // ── Build the engine ─────────────────────────────────────────────────────
    auto compiler = std::make_shared<const RuleCompiler>(default_payment_catalog());
    GraphCache cache(compiler);
    InMemoryConfigurationProvider provider;
    EligibilityService service(cache, provider);

    const ConfigurationIdentity stripe { "merchant_1001", "stripe" };
    provider.put(make_configuration(stripe_account("v1", false)));

    // ── Eligibility queries ──────────────────────────────────────────────────
    separator("ELIGIBILITY EVALUATION");

    std::vector<CandidateAssignment> scenarios = {
        { {"connector", "stripe"}, {"payment_method", "card"}, {"payment_method_type", "credit"},
          {"card_network", "Visa"}, {"country", "US"}, {"currency", "USD"} },
        { {"connector", "stripe"}, {"payment_method", "card"}, {"payment_method_type", "credit"},
          {"card_network", "Discover"}, {"country", "DE"}, {"currency", "EUR"} },
        { {"payment_method", "card"}, {"payment_method_type", "debit"}, {"country", "KP"} },
        { {"payment_method", "wallet"}, {"payment_method_type", "apple_pay"}, {"country", "US"} },
        { {"payment_method", "wallet"}, {"payment_method_type", "google_pay"} },
        { {"country", "GB"}, {"currency", "GBP"} },
    };

    for (const auto& candidate : scenarios) {
        print_result(stripe, candidate, service.evaluate(stripe, candidate, true));
    }

    // ── Configuration change ─────────────────────────────────────────────────
    separator("CONFIGURATION CHANGE");

    CandidateAssignment uk_credit {
        {"payment_method", "card"}, {"payment_method_type", "credit"}, {"country", "GB"},
    };
    print_result(stripe, uk_credit, service.evaluate(stripe, uk_credit, true));

    provider.put(make_configuration(stripe_account("v2", true)));
    print_result(stripe, uk_credit, service.evaluate(stripe, uk_credit, true));

    // ── Compile errors ───────────────────────────────────────────────────────
    separator("COMPILE ERRORS");

    ConfigurationRecord broken;
    broken.identity = { "merchant_1001", "adyen" };
    broken.version  = "v1";
    broken.rules    = {
        unconditional_rule("always-wallet", ConsequenceKind::Require, { {"payment_method", "wallet"} }),
        unconditional_rule("never-wallet",  ConsequenceKind::Exclude, { {"payment_method", "wallet"} }),
    };
    provider.put(broken);

    try {
        service.evaluate(broken.identity, { {"payment_method", "wallet"} });
    } catch (const CompileError& e) {
        std::cout << "\n  CompileError:\n" << to_json(e) << "\n";
    }

    // ── JSON and DOT output ──────────────────────────────────────────────────
    separator("JSON OUTPUT");

    {
        auto result = service.evaluate(stripe, scenarios[1], true);
        std::cout << "\n  EligibilityResult:\n" << to_json(result) << "\n";
        std::cout << "\n  CacheStats:\n  " << to_json(cache.stats()) << "\n";
    }

    separator("GRAPHVIZ");
    if (auto graph = cache.peek(stripe)) {
        std::cout << "\n" << to_dot(*graph);
    }

    std::cout << "\n" << std::string(55, '-') << "\n"
              << "  Eligibility evaluation complete.\n"
              << std::string(55, '-') << "\n\n";
    return 0;
}
