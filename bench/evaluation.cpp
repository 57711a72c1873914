#include "kgraph/catalog.hpp"
#include "kgraph/connector_config.hpp"
#include "kgraph/eligibility_service.hpp"
#include "kgraph/rule_compiler.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace kgraph;

static const std::vector<std::string> countries {
    "US", "CA", "MX", "BR", "GB", "IE", "DE", "FR", "NL", "BE", "AT", "CH",
    "ES", "PT", "IT", "DK", "SE", "NO", "FI", "PL", "AU", "NZ", "JP", "SG",
};
static const std::vector<std::string> currencies {
    "USD", "CAD", "MXN", "BRL", "GBP", "EUR", "CHF", "DKK", "SEK", "NOK", "PLN", "AUD", "JPY", "SGD",
};

static ConnectorAccount build_account() {
    ConnectorAccount account;
    account.merchant_id = "bench_merchant";
    account.connector   = "adyen";
    account.version     = "bench";

    auto type = [](const std::string& name) {
        PaymentMethodTypeConfig t;
        t.payment_method_type = name;
        t.accepted_countries  = AcceptedValues::enable_only(countries);
        t.accepted_currencies = AcceptedValues::enable_only(currencies);
        t.capture_methods     = { "automatic", "manual" };
        return t;
    };

    PaymentMethodConfig card { "card", { type("credit"), type("debit") } };
    for (auto& t : card.types) {
        t.card_networks = { "Visa", "Mastercard", "AmericanExpress", "Discover", "JCB" };
    }
    account.payment_methods = {
        card,
        { "wallet",        { type("apple_pay"), type("google_pay"), type("paypal") } },
        { "pay_later",     { type("klarna"), type("affirm"), type("afterpay_clearpay") } },
        { "bank_redirect", { type("ideal"), type("sofort"), type("giropay"), type("eps") } },
    };
    return account;
}

template <typename Fn>
static void measure(const std::string& name, std::size_t iterations, Fn&& fn) {
    std::size_t sink = 0;
    auto start = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < iterations; ++i) sink += fn(i);
    auto elapsed = std::chrono::steady_clock::now() - start;
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count();

    std::cout << "  " << std::left << std::setw(34) << name
              << std::right << std::setw(10) << (ns / static_cast<long long>(iterations)) << " ns/op"
              << "   (" << sink << ")\n";
}

int main() {
    spdlog::set_level(spdlog::level::warn);
    spdlog::cfg::load_env_levels();

    auto compiler = std::make_shared<const RuleCompiler>(default_payment_catalog());
    auto record   = make_configuration(build_account());

    GraphCache cache(compiler);
    InMemoryConfigurationProvider provider;
    provider.put(record);
    EligibilityService service(cache, provider);
    Evaluator evaluator;

    auto graph = cache.get_or_compile(record.identity, record);
    std::cout << "\n  graph: " << graph->value_count() << " values, "
              << graph->aggregation_count() << " aggregations, "
              << graph->constraint_count() << " relations\n\n";

    const std::vector<CandidateAssignment> candidates {
        { {"connector", "adyen"}, {"payment_method", "card"}, {"payment_method_type", "credit"},
          {"card_network", "Visa"}, {"country", "US"}, {"currency", "USD"}, {"capture_method", "manual"} },
        { {"connector", "adyen"}, {"payment_method", "wallet"}, {"payment_method_type", "apple_pay"},
          {"country", "KE"}, {"currency", "KES"} },
        { {"payment_method", "bank_redirect"}, {"payment_method_type", "ideal"}, {"country", "NL"} },
    };

    measure("compile", 2000, [&](std::size_t) {
        return compiler->compile(record).constraint_count();
    });
    measure("evaluate (decision only)", 200000, [&](std::size_t i) {
        return static_cast<std::size_t>(evaluator.evaluate(*graph, candidates[i % candidates.size()], false).eligible());
    });
    measure("evaluate (explain)", 200000, [&](std::size_t i) {
        return evaluator.evaluate(*graph, candidates[i % candidates.size()], true).reasons.size();
    });
    measure("service evaluate (cache hit)", 50000, [&](std::size_t i) {
        return static_cast<std::size_t>(
            service.evaluate(record.identity, candidates[i % candidates.size()], false).eligible());
    });

    std::cout << "\n";
    return 0;
}
