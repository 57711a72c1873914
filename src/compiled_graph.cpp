#include "kgraph/compiled_graph.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace kgraph {

namespace {

template <typename T>
void sort_unique(std::vector<T>& v) {
    std::sort(v.begin(), v.end());
    v.erase(std::unique(v.begin(), v.end()), v.end());
}

} // namespace

// ── Construction ─────────────────────────────────────────────────────────────

CompiledGraph::CompiledGraph(ConfigurationIdentity identity, std::string version,
                             std::uint64_t fingerprint, std::vector<GraphNode> nodes,
                             std::vector<RelationEdge> edges,
                             std::vector<DomainValue> sensitive_values)
    : identity_(std::move(identity)),
      version_(std::move(version)),
      fingerprint_(fingerprint),
      nodes_(std::move(nodes)),
      edges_(std::move(edges)),
      triggers_(nodes_.size()),
      categories_(nodes_.size()) {
    // Children always precede their aggregation, so one forward pass fills
    // the category table.
    for (NodeId id = 0; id < nodes_.size(); ++id) {
        const auto& n = nodes_[id];
        if (n.kind == NodeKind::Value) {
            if (!index_.emplace(n.value, id).second) {
                throw std::invalid_argument("duplicate value node " + to_string(n.value));
            }
            categories_[id].push_back(n.value.category);
            continue;
        }
        for (NodeId child : n.children) {
            if (child >= id) {
                throw std::invalid_argument("aggregation node " + std::to_string(id) +
                                            " references later node " + std::to_string(child));
            }
            const auto& sub = categories_[child];
            categories_[id].insert(categories_[id].end(), sub.begin(), sub.end());
        }
        sort_unique(categories_[id]);
    }

    for (const auto& v : sensitive_values) {
        if (!v.value.empty()) sensitive_words_.push_back(v.value);
    }
    for (const auto& n : nodes_) {
        if (n.kind == NodeKind::Value && n.sensitive) sensitive_words_.push_back(n.value.value);
    }
    sort_unique(sensitive_words_);
    std::stable_sort(sensitive_words_.begin(), sensitive_words_.end(),
                     [](const std::string& a, const std::string& b) { return a.size() > b.size(); });

    for (EdgeId e = 0; e < edges_.size(); ++e) {
        const auto& edge = edges_[e];
        if (edge.source >= nodes_.size() || edge.target >= nodes_.size()) {
            throw std::invalid_argument("edge " + std::to_string(e) + " references a node outside the graph");
        }
        if (!is_constraint(edge.kind)) continue;

        std::vector<NodeId> activators;
        if (nodes_[edge.source].kind != NodeKind::Always) {
            collect_activators(edge.source, activators);
        }
        if (edge.kind == RelationKind::Excludes) {
            collect_activators(edge.target, activators);
        }
        sort_unique(activators);
        for (NodeId v : activators) triggers_[v].push_back(e);
    }
}

// Value nodes whose presence can make `id` true: descends through All/Any,
// never through Not.
void CompiledGraph::collect_activators(NodeId id, std::vector<NodeId>& out) const {
    const auto& n = nodes_[id];
    switch (n.kind) {
        case NodeKind::Value:
            out.push_back(id);
            break;
        case NodeKind::All:
        case NodeKind::Any:
            for (NodeId child : n.children) collect_activators(child, out);
            break;
        case NodeKind::Not:
        case NodeKind::Always:
            break;
    }
}

// ── Queries ──────────────────────────────────────────────────────────────────

bool CompiledGraph::matches(const ConfigurationRecord& record, std::uint64_t record_fingerprint) const {
    return fingerprint_ == record_fingerprint && version_ == record.version &&
           identity_ == record.identity;
}

std::optional<NodeId> CompiledGraph::find(const DomainValue& value) const {
    auto it = index_.find(value);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

std::size_t CompiledGraph::aggregation_count() const {
    return static_cast<std::size_t>(std::count_if(nodes_.begin(), nodes_.end(), [](const GraphNode& n) {
        return n.kind == NodeKind::All || n.kind == NodeKind::Any || n.kind == NodeKind::Not;
    }));
}

std::size_t CompiledGraph::constraint_count() const {
    return static_cast<std::size_t>(std::count_if(edges_.begin(), edges_.end(), [](const RelationEdge& e) {
        return is_constraint(e.kind);
    }));
}

std::string CompiledGraph::label(NodeId id, const std::string& mask_token) const {
    const auto& n = nodes_.at(id);
    auto join = [&](const std::string& head) {
        std::string out = head + " [";
        for (std::size_t i = 0; i < n.children.size(); ++i) {
            if (i > 0) out += ", ";
            out += label(n.children[i], mask_token);
        }
        return out + "]";
    };

    switch (n.kind) {
        case NodeKind::Value:
            return n.sensitive ? n.value.category + "=" + mask_token : to_string(n.value);
        case NodeKind::All:
            return join("all of");
        case NodeKind::Any:
            return join("any of");
        case NodeKind::Not:
            return "not " + (n.children.empty() ? std::string("[]") : label(n.children.front(), mask_token));
        case NodeKind::Always:
            return "always";
    }
    return "?";
}

std::string CompiledGraph::rule_label(const std::string& rule, const std::string& mask_token) const {
    if (sensitive_words_.empty()) return rule;

    auto word_char = [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
    };
    // `word` occupies [pos, pos + size) and is not glued to a neighbouring word.
    auto stands_alone = [&](const std::string& word, std::size_t pos) {
        std::size_t end = pos + word.size();
        bool open  = pos == 0 || !word_char(rule[pos - 1]) || !word_char(word.front());
        bool close = end == rule.size() || !word_char(rule[end]) || !word_char(word.back());
        return open && close;
    };

    std::string out;
    std::size_t pos = 0;
    while (pos < rule.size()) {
        const std::string* hit = nullptr;
        for (const auto& word : sensitive_words_) {
            if (rule.compare(pos, word.size(), word) == 0 && stands_alone(word, pos)) {
                hit = &word;
                break;
            }
        }
        if (hit) {
            out += mask_token;
            pos += hit->size();
        } else {
            out += rule[pos++];
        }
    }
    return out;
}

} // namespace kgraph
