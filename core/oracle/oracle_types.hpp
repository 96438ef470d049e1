#pragma once

#include "graph/node.hpp"

#include <map>
#include <optional>
#include <vector>

namespace tsdsep {

/// Oracle configuration parameters.
struct OracleConfig {
    std::optional<std::vector<int>> observed_vars;   // default: all variables
    std::optional<std::vector<int>> selection_vars;  // default: none
    int verbosity = 0;                               // 0 warn, 1 debug, 2+ trace
};

/// Outcome of an oracle test in the shape of a statistical test.
struct TestResult {
    double value = 0.0;   // 0 independent, 1 dependent
    double pvalue = 1.0;  // 1 independent, 0 dependent

    bool independent() const { return value == 0.0; }
};

/// Result of a shortest-path query.
struct ShortestPathResult {
    /// Open path from some x to some y, observed variables only,
    /// in external indices. Empty if X and Y are d-separated given Z.
    std::optional<NodeList> path;
    /// Truncation horizon the search ran with.
    int max_lag = 0;
    /// Ancestors down to max_lag per node, in compiled indices
    /// (synthetic variables included). Set only when requested.
    std::optional<std::map<Node, NodeList>> ancestors_x;
    std::optional<std::map<Node, NodeList>> ancestors_y;
    std::optional<std::map<Node, NodeList>> ancestors_z;
};

} // namespace tsdsep
