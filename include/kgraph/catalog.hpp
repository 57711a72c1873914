#pragma once

#include "kgraph/types.hpp"

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace kgraph {

/**
 * DomainCatalog
 *
 * The set of recognized (category, value) pairs. Rules may only reference
 * values found here or declared as custom values by their configuration.
 * Read-only once built, so a single catalog may back any number of
 * concurrent compilations.
 */
class DomainCatalog {
public:
    void add(const std::string& category, const std::vector<std::string>& values);

    bool contains(const DomainValue& value) const;
    bool has_category(const std::string& category) const;

    std::vector<std::string> categories() const;
    std::size_t size() const { return size_; }

private:
    std::unordered_map<std::string, std::unordered_set<std::string>> values_;
    std::size_t size_ = 0;
};

// ── Built-in catalog ─────────────────────────────────────────────────────────

namespace category {
inline const std::string payment_method      = "payment_method";
inline const std::string payment_method_type = "payment_method_type";
inline const std::string card_network        = "card_network";
inline const std::string country             = "country";
inline const std::string currency            = "currency";
inline const std::string capture_method      = "capture_method";
inline const std::string connector           = "connector";
inline const std::string authentication_type = "authentication_type";
inline const std::string setup_future_usage  = "setup_future_usage";
} // namespace category

/// Payment methods, method types, card networks, countries, currencies,
/// capture methods, connectors and authentication/usage flags.
DomainCatalog default_payment_catalog();

} // namespace kgraph
