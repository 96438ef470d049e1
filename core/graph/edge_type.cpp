#include "graph/edge_type.hpp"
#include "common/errors.hpp"

namespace tsdsep {

EdgeType parseEdgeType(const std::string& code) {
    if (code.empty()) return EdgeType::None;
    if (code == "-->") return EdgeType::Directed;
    if (code == "<--") return EdgeType::Reversed;
    if (code == "<->") return EdgeType::Bidirected;
    if (code == "---") return EdgeType::Undirected;
    throw ConfigurationError("Unknown edge code '" + code +
                             "', expected one of '-->', '<--', '<->', '---' or ''");
}

std::string toString(EdgeType type) {
    switch (type) {
        case EdgeType::None:       return "";
        case EdgeType::Directed:   return "-->";
        case EdgeType::Reversed:   return "<--";
        case EdgeType::Bidirected: return "<->";
        case EdgeType::Undirected: return "---";
    }
    return "";
}

EdgeType reverse(EdgeType type) {
    switch (type) {
        case EdgeType::Directed: return EdgeType::Reversed;
        case EdgeType::Reversed: return EdgeType::Directed;
        default:                 return type;
    }
}

} // namespace tsdsep
