#include "kgraph/catalog.hpp"

#include <algorithm>

namespace kgraph {

// ── DomainCatalog ────────────────────────────────────────────────────────────

void DomainCatalog::add(const std::string& category, const std::vector<std::string>& values) {
    auto& known = values_[category];
    for (const auto& v : values) {
        if (known.insert(v).second) ++size_;
    }
}

bool DomainCatalog::contains(const DomainValue& value) const {
    auto it = values_.find(value.category);
    return it != values_.end() && it->second.count(value.value) > 0;
}

bool DomainCatalog::has_category(const std::string& category) const {
    return values_.count(category) > 0;
}

std::vector<std::string> DomainCatalog::categories() const {
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (const auto& entry : values_) result.push_back(entry.first);
    std::sort(result.begin(), result.end());
    return result;
}

// ── Default catalog ──────────────────────────────────────────────────────────

DomainCatalog default_payment_catalog() {
    DomainCatalog catalog;

    catalog.add(category::payment_method, {
        "card", "wallet", "bank_redirect", "bank_transfer", "bank_debit",
        "pay_later", "crypto", "upi", "voucher", "gift_card",
    });

    catalog.add(category::payment_method_type, {
        "credit", "debit",
        "apple_pay", "google_pay", "paypal", "samsung_pay", "we_chat_pay", "ali_pay",
        "klarna", "affirm", "afterpay_clearpay",
        "ideal", "sofort", "giropay", "eps", "blik", "trustly",
        "ach", "sepa", "bacs", "becs",
        "crypto_currency", "upi_collect", "boleto", "gift_card",
    });

    catalog.add(category::card_network, {
        "Visa", "Mastercard", "AmericanExpress", "Discover", "JCB",
        "DinersClub", "UnionPay", "Interac", "CartesBancaires", "Maestro",
    });

    catalog.add(category::country, {
        "US", "CA", "MX", "BR", "AR", "CL", "CO", "PE",
        "GB", "IE", "DE", "FR", "NL", "BE", "LU", "AT", "CH", "ES", "PT", "IT",
        "DK", "SE", "NO", "FI", "PL", "CZ", "HU", "RO", "GR",
        "AU", "NZ", "JP", "SG", "HK", "IN", "CN", "MY", "TH", "PH", "ID",
        "AE", "SA", "ZA", "NG", "KE", "KP", "IR",
    });

    catalog.add(category::currency, {
        "USD", "CAD", "MXN", "BRL", "ARS", "CLP", "COP", "PEN",
        "GBP", "EUR", "CHF", "DKK", "SEK", "NOK", "PLN", "CZK", "HUF", "RON",
        "AUD", "NZD", "JPY", "SGD", "HKD", "INR", "CNY", "MYR", "THB", "PHP", "IDR",
        "AED", "SAR", "ZAR", "NGN", "KES",
    });

    catalog.add(category::capture_method, {
        "automatic", "manual", "manual_multiple", "scheduled",
    });

    catalog.add(category::connector, {
        "stripe", "adyen", "checkout", "braintree", "paypal", "klarna",
        "cybersource", "worldpay", "nuvei", "trustpay", "bluesnap", "airwallex",
        "razorpay", "shift4", "mollie", "globalpay",
    });

    catalog.add(category::authentication_type, { "three_ds", "no_three_ds" });
    catalog.add(category::setup_future_usage,  { "on_session", "off_session" });

    return catalog;
}

} // namespace kgraph
