#pragma once

#include <string>

namespace tsdsep {

/// Edge marks of a (possibly ancestral) time series graph cell.
enum class EdgeType {
    None,        // ""
    Directed,    // "-->"
    Reversed,    // "<--"
    Bidirected,  // "<->"
    Undirected   // "---"
};

/// Parse a cell code. Throws ConfigurationError on unknown codes.
EdgeType parseEdgeType(const std::string& code);

std::string toString(EdgeType type);

/// The same edge seen from the other endpoint.
EdgeType reverse(EdgeType type);

} // namespace tsdsep
