#pragma once

#include "kgraph/types.hpp"

#include <cstddef>
#include <limits>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

namespace kgraph {

enum class CompileErrorKind {
    UnknownDomainValue,
    UnsatisfiableConstraint,
    MalformedRule,
    UnknownConfiguration,
};

inline std::ostream& operator<<(std::ostream& os, CompileErrorKind k) {
    switch (k) {
        case CompileErrorKind::UnknownDomainValue:      return os << "UnknownDomainValue";
        case CompileErrorKind::UnsatisfiableConstraint: return os << "UnsatisfiableConstraint";
        case CompileErrorKind::MalformedRule:           return os << "MalformedRule";
        case CompileErrorKind::UnknownConfiguration:    return os << "UnknownConfiguration";
        default:                                        return os << "Unknown";
    }
}

/**
 * CompileError
 *
 * Raised when a configuration record cannot be turned into a usable graph.
 * Carries the offending rule (position and name) and value, when there is
 * one, so the defect can be located without recompiling.
 */
class CompileError : public std::runtime_error {
public:
    static constexpr std::size_t no_rule = std::numeric_limits<std::size_t>::max();

    CompileError(CompileErrorKind kind, std::string message,
                 std::size_t rule_index = no_rule, std::string rule_name = {},
                 std::optional<DomainValue> value = std::nullopt)
        : std::runtime_error(std::move(message)),
          kind_(kind),
          rule_index_(rule_index),
          rule_name_(std::move(rule_name)),
          value_(std::move(value)) {}

    CompileErrorKind kind() const { return kind_; }
    std::size_t rule_index() const { return rule_index_; }
    const std::string& rule_name() const { return rule_name_; }
    const std::optional<DomainValue>& value() const { return value_; }

private:
    CompileErrorKind           kind_;
    std::size_t                rule_index_;
    std::string                rule_name_;
    std::optional<DomainValue> value_;
};

} // namespace kgraph
