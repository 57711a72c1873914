#pragma once

#include "kgraph/types.hpp"

#include <string>
#include <vector>

namespace kgraph {

struct AcceptedValues {
    enum class Mode { AllAccepted, EnableOnly, DisableOnly };

    Mode                     mode = Mode::AllAccepted;
    std::vector<std::string> values;

    static AcceptedValues all() { return {}; }
    static AcceptedValues enable_only(std::vector<std::string> v) { return { Mode::EnableOnly, std::move(v) }; }
    static AcceptedValues disable_only(std::vector<std::string> v) { return { Mode::DisableOnly, std::move(v) }; }
};

struct PaymentMethodTypeConfig {
    std::string              payment_method_type;   // "credit", "apple_pay", ...
    std::vector<std::string> card_networks;         // empty: no restriction
    AcceptedValues           accepted_countries;
    AcceptedValues           accepted_currencies;
    std::vector<std::string> capture_methods;       // empty: no restriction
};

struct PaymentMethodConfig {
    std::string                          payment_method;   // "card", "wallet", ...
    std::vector<PaymentMethodTypeConfig> types;
};

/**
 * ConnectorAccount
 *
 * What one merchant has enabled on one connector. make_configuration()
 * lowers it to an ordered rule list, general rules first:
 *   1. connector         -> one of its enabled payment methods
 *   2. payment method    -> one of its enabled types
 *   3. method type       -> its payment method
 *   4. method + type     -> card networks, countries, currencies, capture
 *                           methods (one-of for enable-only lists,
 *                           exclusions for disable-only lists)
 *   5. disabled account  -> the connector value is never permitted
 *
 * Requirements are weak: an attribute the candidate does not carry is not
 * held against it.
 */
struct ConnectorAccount {
    std::string                      merchant_id;
    std::string                      connector;
    std::string                      version;
    bool                             disabled = false;
    std::vector<PaymentMethodConfig> payment_methods;
    std::vector<DomainValue>         sensitive_values;
};

ConfigurationRecord make_configuration(const ConnectorAccount& account);

} // namespace kgraph
