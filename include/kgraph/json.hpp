#pragma once

#include "kgraph/errors.hpp"
#include "kgraph/evaluator.hpp"
#include "kgraph/graph_cache.hpp"

#include <sstream>
#include <string>

namespace kgraph {

namespace json_detail {

inline std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:   result += c;      break;
        }
    }
    return result;
}

inline std::string quoted(const std::string& s) {
    return "\"" + escape(s) + "\"";
}

template <typename T>
std::string str(const T& v) {
    std::ostringstream os;
    os << v;
    return os.str();
}

} // namespace json_detail

inline std::string to_json(const Violation& v) {
    std::ostringstream os;
    os << "{ \"relation\": " << json_detail::quoted(json_detail::str(v.relation))
       << ", \"rule\": "     << json_detail::quoted(v.rule)
       << ", \"rule_index\": " << v.rule_index
       << ", \"source\": "   << json_detail::quoted(v.source)
       << ", \"target\": "   << json_detail::quoted(v.target)
       << ", \"involved\": [";
    for (std::size_t i = 0; i < v.involved.size(); ++i) {
        if (i > 0) os << ", ";
        os << json_detail::quoted(v.involved[i]);
    }
    os << "], \"reason\": " << json_detail::quoted(v.reason)
       << " }";
    return os.str();
}

inline std::string to_json(const EligibilityResult& result) {
    std::ostringstream os;
    os << "{\n"
       << "  \"decision\": "          << json_detail::quoted(json_detail::str(result.decision)) << ",\n"
       << "  \"identity\": "          << json_detail::quoted(result.identity) << ",\n"
       << "  \"version\": "           << json_detail::quoted(result.version) << ",\n"
       << "  \"relations_checked\": " << result.relations_checked << ",\n"
       << "  \"reasons\": [";
    for (std::size_t i = 0; i < result.reasons.size(); ++i) {
        os << "\n    " << to_json(result.reasons[i]);
        if (i + 1 < result.reasons.size()) os << ",";
    }
    os << (result.reasons.empty() ? "]\n" : "\n  ]\n")
       << "}";
    return os.str();
}

inline std::string to_json(const CompileError& e) {
    std::ostringstream os;
    os << "{\n"
       << "  \"kind\": "    << json_detail::quoted(json_detail::str(e.kind())) << ",\n"
       << "  \"message\": " << json_detail::quoted(e.what()) << ",\n"
       << "  \"rule\": "    << json_detail::quoted(e.rule_name()) << ",\n"
       << "  \"rule_index\": ";
    if (e.rule_index() == CompileError::no_rule) os << "null"; else os << e.rule_index();
    os << ",\n  \"value\": ";
    if (e.value()) os << json_detail::quoted(to_string(*e.value())); else os << "null";
    os << "\n}";
    return os.str();
}

inline std::string to_json(const CacheStats& s) {
    std::ostringstream os;
    os << "{ \"hits\": "        << s.hits
       << ", \"misses\": "      << s.misses
       << ", \"compilations\": " << s.compilations
       << ", \"evictions\": "   << s.evictions
       << ", \"invalidations\": " << s.invalidations
       << " }";
    return os.str();
}

} // namespace kgraph
