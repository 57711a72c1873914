#include "kgraph/connector_config.hpp"

#include "kgraph/catalog.hpp"

#include <map>

namespace kgraph {

namespace {

std::vector<DomainValue> values_of(const std::string& cat, const std::vector<std::string>& values) {
    std::vector<DomainValue> out;
    out.reserve(values.size());
    for (const auto& v : values) out.push_back({ cat, v });
    return out;
}

void restrict(std::vector<Rule>& rules, const std::string& name,
              const std::vector<DomainValue>& when, const std::string& cat,
              const AcceptedValues& accepted) {
    if (accepted.values.empty()) return;
    switch (accepted.mode) {
        case AcceptedValues::Mode::AllAccepted:
            break;
        case AcceptedValues::Mode::EnableOnly:
            rules.push_back(one_of_rule(name, when, values_of(cat, accepted.values), Strength::Weak));
            break;
        case AcceptedValues::Mode::DisableOnly:
            rules.push_back(exclude_rule(name, when, values_of(cat, accepted.values)));
            break;
    }
}

} // namespace

ConfigurationRecord make_configuration(const ConnectorAccount& account) {
    ConfigurationRecord record;
    record.identity         = { account.merchant_id, account.connector };
    record.version          = account.version;
    record.sensitive_values = account.sensitive_values;

    const DomainValue connector { category::connector, account.connector };
    const std::string prefix = account.connector + ":";
    auto& rules = record.rules;

    std::vector<DomainValue> methods;
    for (const auto& pm : account.payment_methods) {
        methods.push_back({ category::payment_method, pm.payment_method });
    }
    if (!methods.empty()) {
        rules.push_back(one_of_rule(prefix + "payment_methods", { connector }, methods, Strength::Weak));
    }

    // Types listed under several methods may accompany any of them.
    std::map<std::string, std::vector<DomainValue>> owners;
    for (const auto& pm : account.payment_methods) {
        std::vector<DomainValue> types;
        for (const auto& t : pm.types) {
            types.push_back({ category::payment_method_type, t.payment_method_type });
            owners[t.payment_method_type].push_back({ category::payment_method, pm.payment_method });
        }
        if (!types.empty()) {
            rules.push_back(one_of_rule(prefix + pm.payment_method + ":types",
                                        { { category::payment_method, pm.payment_method } },
                                        types, Strength::Weak));
        }
    }
    for (const auto& entry : owners) {
        rules.push_back(one_of_rule(prefix + entry.first + ":method",
                                    { { category::payment_method_type, entry.first } },
                                    entry.second, Strength::Weak));
    }

    for (const auto& pm : account.payment_methods) {
        for (const auto& t : pm.types) {
            const std::string name = prefix + pm.payment_method + ":" + t.payment_method_type;
            const std::vector<DomainValue> when {
                { category::payment_method, pm.payment_method },
                { category::payment_method_type, t.payment_method_type },
            };

            if (!t.card_networks.empty()) {
                rules.push_back(one_of_rule(name + ":card_networks", when,
                                            values_of(category::card_network, t.card_networks),
                                            Strength::Weak));
            }
            restrict(rules, name + ":countries", when, category::country, t.accepted_countries);
            restrict(rules, name + ":currencies", when, category::currency, t.accepted_currencies);
            if (!t.capture_methods.empty()) {
                rules.push_back(one_of_rule(name + ":capture_methods", when,
                                            values_of(category::capture_method, t.capture_methods),
                                            Strength::Weak));
            }
        }
    }

    if (account.disabled) {
        rules.push_back(unconditional_rule(prefix + "disabled", ConsequenceKind::Exclude, { connector }));
    }
    return record;
}

} // namespace kgraph
