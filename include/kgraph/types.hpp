#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <tuple>
#include <vector>

namespace kgraph {

struct DomainValue {
    std::string category;   // "payment_method", "country", "currency", ...
    std::string value;      // "card", "US", "EUR", ...
};

inline bool operator==(const DomainValue& a, const DomainValue& b) {
    return a.category == b.category && a.value == b.value;
}

inline bool operator!=(const DomainValue& a, const DomainValue& b) {
    return !(a == b);
}

inline bool operator<(const DomainValue& a, const DomainValue& b) {
    return std::tie(a.category, a.value) < std::tie(b.category, b.value);
}

inline std::ostream& operator<<(std::ostream& os, const DomainValue& v) {
    return os << v.category << "=" << v.value;
}

inline std::string to_string(const DomainValue& v) {
    return v.category + "=" + v.value;
}

struct DomainValueHash {
    std::size_t operator()(const DomainValue& v) const {
        std::size_t h = std::hash<std::string>{}(v.category);
        return h ^ (std::hash<std::string>{}(v.value) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};

/// A proposed combination of domain values. Owned by the caller.
using CandidateAssignment = std::vector<DomainValue>;

enum class ValueOrigin { Catalog, Configuration };

// ── Rules ────────────────────────────────────────────────────────────────────

enum class ConsequenceKind { Require, Exclude, OneOf };

// Weak requirements also pass when the candidate carries no value in any of
// the target's categories.
enum class Strength { Strong, Weak };

inline std::ostream& operator<<(std::ostream& os, ConsequenceKind k) {
    switch (k) {
        case ConsequenceKind::Require: return os << "Require";
        case ConsequenceKind::Exclude: return os << "Exclude";
        case ConsequenceKind::OneOf:   return os << "OneOf";
        default:                       return os << "Unknown";
    }
}

struct Rule {
    std::string              name;
    std::vector<DomainValue> when;            // all must be present
    std::vector<DomainValue> unless;          // rule is void if any is present
    bool                     unconditional = false;
    ConsequenceKind          kind = ConsequenceKind::Require;
    std::vector<DomainValue> then;
    Strength                 strength = Strength::Strong;
};

/// "when all of `when` hold, every value in `then` must hold".
Rule require_rule(std::string name, std::vector<DomainValue> when,
                  std::vector<DomainValue> then,
                  Strength strength = Strength::Strong);

/// "when all of `when` hold, none of `then` may be present".
Rule exclude_rule(std::string name, std::vector<DomainValue> when,
                  std::vector<DomainValue> then);

/// "when all of `when` hold, at least one of `then` must hold".
Rule one_of_rule(std::string name, std::vector<DomainValue> when,
                 std::vector<DomainValue> then,
                 Strength strength = Strength::Strong);

/// A rule whose precondition is always true.
Rule unconditional_rule(std::string name, ConsequenceKind kind,
                        std::vector<DomainValue> then);

// ── Configuration ────────────────────────────────────────────────────────────

struct ConfigurationIdentity {
    std::string merchant_id;
    std::string connector;

    std::string to_string() const { return merchant_id + "/" + connector; }
};

inline bool operator==(const ConfigurationIdentity& a, const ConfigurationIdentity& b) {
    return a.merchant_id == b.merchant_id && a.connector == b.connector;
}

inline std::ostream& operator<<(std::ostream& os, const ConfigurationIdentity& id) {
    return os << id.to_string();
}

struct ConfigurationIdentityHash {
    std::size_t operator()(const ConfigurationIdentity& id) const {
        return DomainValueHash{}(DomainValue{ id.merchant_id, id.connector });
    }
};

struct ConfigurationRecord {
    ConfigurationIdentity    identity;
    std::string              version;           // opaque version marker
    std::vector<Rule>        rules;             // configuration order is authoritative
    std::vector<DomainValue> custom_values;     // accepted in addition to the catalog
    std::vector<DomainValue> sensitive_values;  // masked in every rendering
};

/// FNV-1a 64 over a canonical encoding of the record's content.
std::uint64_t fingerprint(const ConfigurationRecord& record);

} // namespace kgraph
