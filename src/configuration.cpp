#include "kgraph/types.hpp"

#include <string>

namespace kgraph {

// ── Rule helpers ─────────────────────────────────────────────────────────────

Rule require_rule(std::string name, std::vector<DomainValue> when,
                  std::vector<DomainValue> then, Strength strength) {
    Rule r;
    r.name     = std::move(name);
    r.when     = std::move(when);
    r.kind     = ConsequenceKind::Require;
    r.then     = std::move(then);
    r.strength = strength;
    return r;
}

Rule exclude_rule(std::string name, std::vector<DomainValue> when,
                  std::vector<DomainValue> then) {
    Rule r;
    r.name = std::move(name);
    r.when = std::move(when);
    r.kind = ConsequenceKind::Exclude;
    r.then = std::move(then);
    return r;
}

Rule one_of_rule(std::string name, std::vector<DomainValue> when,
                 std::vector<DomainValue> then, Strength strength) {
    Rule r;
    r.name     = std::move(name);
    r.when     = std::move(when);
    r.kind     = ConsequenceKind::OneOf;
    r.then     = std::move(then);
    r.strength = strength;
    return r;
}

Rule unconditional_rule(std::string name, ConsequenceKind kind,
                        std::vector<DomainValue> then) {
    Rule r;
    r.name          = std::move(name);
    r.unconditional = true;
    r.kind          = kind;
    r.then          = std::move(then);
    return r;
}

// ── Fingerprint ──────────────────────────────────────────────────────────────

namespace {

constexpr std::uint64_t fnv_offset = 0xcbf29ce484222325ULL;
constexpr std::uint64_t fnv_prime  = 0x100000001b3ULL;

class Fnv1a {
public:
    void bytes(const std::string& s) {
        for (unsigned char c : s) {
            hash_ ^= c;
            hash_ *= fnv_prime;
        }
        // Field separator, so ("ab","c") and ("a","bc") differ.
        hash_ ^= 0x1f;
        hash_ *= fnv_prime;
    }

    void number(std::uint64_t n) { bytes(std::to_string(n)); }

    void values(const std::vector<DomainValue>& vs) {
        number(vs.size());
        for (const auto& v : vs) {
            bytes(v.category);
            bytes(v.value);
        }
    }

    std::uint64_t digest() const { return hash_; }

private:
    std::uint64_t hash_ = fnv_offset;
};

} // namespace

std::uint64_t fingerprint(const ConfigurationRecord& record) {
    Fnv1a h;
    h.bytes(record.version);
    h.number(record.rules.size());
    for (const auto& rule : record.rules) {
        h.bytes(rule.name);
        h.values(rule.when);
        h.values(rule.unless);
        h.number(rule.unconditional ? 1 : 0);
        h.number(static_cast<std::uint64_t>(rule.kind));
        h.values(rule.then);
        h.number(static_cast<std::uint64_t>(rule.strength));
    }
    h.values(record.custom_values);
    h.values(record.sensitive_values);
    return h.digest();
}

} // namespace kgraph
